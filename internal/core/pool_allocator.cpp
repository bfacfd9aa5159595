#include "pool_allocator.hpp"

#include <algorithm>

#include "internal/core/bulk_result.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace credpool::core {

using credpool::model::AssignmentType;

namespace {

std::string Plural(uint32_t n) {
  return n == 1 ? "credential" : "credentials";
}

std::string ClaimMessage(uint32_t requested, uint32_t assigned, AssignmentType pool) {
  if (assigned == 0) {
    return "No available " + std::string(credpool::model::ToString(pool)) + " credentials";
  }
  if (assigned < requested) {
    return "Assigned " + std::to_string(assigned) + " of " + std::to_string(requested) + " requested " + Plural(requested) +
           " (only " + std::to_string(assigned) + " available)";
  }
  return "Assigned " + std::to_string(assigned) + " " + Plural(assigned);
}

} // namespace

PoolAllocator::PoolAllocator(std::shared_ptr<db::Repository> repository, AllocatorOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (options_.max_claim_attempts == 0) options_.max_claim_attempts = 1;
  if (options_.max_request_count == 0) options_.max_request_count = 25;
}

ClaimResult PoolAllocator::Claim(const ClaimRequest& request) {
  if (request.count < 1) {
    ClaimResult result;
    result.message = "Count must be at least 1";
    return result;
  }

  uint32_t count = 1;
  if (request.kind == RequesterKind::kUser) {
    if (!request.requester_id) {
      throw util::InvalidArgument("user claim requires a user id");
    }
    count = std::min(static_cast<uint32_t>(request.count), options_.max_request_count);
  }

  auto result = RunWithRetry(options_.max_claim_attempts, "claim", [&] { return ClaimOnce(request, count); });

  if (result.assigned_count == 0) {
    CREDPOOL_LOG_WARN("Credential pool exhausted", {observability::StringField("pool", credpool::model::ToString(request.pool)),
                                                    observability::IntField("requested", count)});
  } else {
    CREDPOOL_LOG_INFO("Claimed credentials", {observability::StringField("pool", credpool::model::ToString(request.pool)),
                                              observability::IntField("requested", count),
                                              observability::IntField("assigned", result.assigned_count),
                                              observability::StringField("batch_id", result.request_batch_id.value_or(""))});
  }
  return result;
}

ClaimResult PoolAllocator::ClaimOnce(const ClaimRequest& request, uint32_t count) {
  ClaimResult result;
  result.requested_count = count;

  auto tx   = repository_->Begin();
  auto rows = repository_->LockAvailable(*tx, request.pool, count);
  if (rows.empty()) {
    tx->Rollback();
    result.message = ClaimMessage(count, 0, request.pool);
    return result;
  }

  db::model::AssignmentStamp stamp;
  stamp.username       = request.username;
  stamp.assigned_at_ms = util::NowMillis();
  if (request.kind == RequesterKind::kUser) {
    stamp.user_id          = request.requester_id;
    stamp.request_batch_id = util::NewBatchId();
  } else {
    stamp.instance_id = request.requester_id;
  }

  db::model::CredentialUpdate update;
  update.assign           = stamp;
  update.expect_available = true;

  for (auto& row : rows) {
    ThrowIfDbError(repository_->UpdateCredential(*tx, row.id, update), "claim credential " + std::to_string(row.id));
    update.ApplyTo(row, stamp.assigned_at_ms);
  }
  tx->Commit();

  result.assigned_count   = static_cast<uint32_t>(rows.size());
  result.message          = ClaimMessage(count, result.assigned_count, request.pool);
  result.request_batch_id = stamp.request_batch_id;
  result.credentials      = std::move(rows);
  return result;
}

ClaimResult PoolAllocator::RequestForUser(int64_t user_id, const std::string& username, int32_t count) {
  ClaimRequest request;
  request.kind         = RequesterKind::kUser;
  request.requester_id = user_id;
  request.username     = username;
  request.count        = count;
  request.pool         = AssignmentType::kUserRequestable;
  return Claim(request);
}

ClaimResult PoolAllocator::ClaimForInstance(std::optional<int64_t> instance_id) {
  ClaimRequest request;
  request.kind         = RequesterKind::kInstance;
  request.requester_id = instance_id;
  request.count        = 1;
  request.pool         = AssignmentType::kInstanceAutoAssign;
  return Claim(request);
}

db::model::CredentialRecord PoolAllocator::LinkInstance(int64_t credential_id, int64_t instance_id) {
  const auto context = "link credential " + std::to_string(credential_id);

  return RunWithRetry(options_.max_claim_attempts, "link instance", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->LockCredential(*tx, credential_id), context);

    auto record = repository_->GetCredential(*tx, credential_id);
    if (!record) throw util::NotFound(context + ": credential not found");

    if (!record->is_active) {
      throw util::InvalidState(context + ": credential is inactive");
    }
    if (record->is_available) {
      throw util::InvalidState(context + ": credential is not reserved");
    }
    if (record->assigned_to_user_id) {
      throw util::InvalidState(context + ": credential is assigned to user " + std::to_string(*record->assigned_to_user_id));
    }
    if (record->assigned_to_instance_id && *record->assigned_to_instance_id != instance_id) {
      throw util::InvalidState(context + ": credential is linked to instance " +
                               std::to_string(*record->assigned_to_instance_id));
    }

    db::model::CredentialUpdate update;
    update.link_instance_id = instance_id;
    ThrowIfDbError(repository_->UpdateCredential(*tx, credential_id, update), context);
    update.ApplyTo(*record, util::NowMillis());

    tx->Commit();
    return *record;
  });
}

BulkAssignResult PoolAllocator::BulkAssign(const std::vector<BulkAssignTarget>& targets, int32_t count_per_user) {
  BulkAssignResult out;

  for (const auto& target : targets) {
    const auto prefix = "User " + std::to_string(target.user_id) + ": ";
    try {
      auto claimed = RequestForUser(target.user_id, target.username, count_per_user);
      out.total_assigned += claimed.assigned_count;
      if (claimed.assigned_count == 0) {
        out.failed_user_ids.push_back(target.user_id);
        AppendBoundedError(out.errors, prefix + claimed.message);
      }
    } catch (const std::runtime_error& e) {
      out.failed_user_ids.push_back(target.user_id);
      AppendBoundedError(out.errors, prefix + e.what());
    }
  }
  return out;
}

} // namespace credpool::core
