#include "credential_lifecycle.hpp"

#include "internal/core/bulk_result.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credpool::core {

using credpool::model::AssignmentType;

CredentialLifecycle::CredentialLifecycle(std::shared_ptr<db::Repository> repository, uint32_t max_attempts)
    : repository_(std::move(repository)), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
}

db::model::CredentialRecord CredentialLifecycle::Get(int64_t credential_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCredential(*tx, credential_id);
  tx->Commit();
  if (!record) throw util::NotFound("credential " + std::to_string(credential_id) + " not found");
  return *record;
}

db::model::CredentialRecord CredentialLifecycle::Release(int64_t credential_id) {
  const auto context = "release credential " + std::to_string(credential_id);

  return RunWithRetry(max_attempts_, "release", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->LockCredential(*tx, credential_id), context);

    auto record = repository_->GetCredential(*tx, credential_id);
    if (!record) throw util::NotFound(context + ": credential not found");

    if (!record->is_active) {
      throw util::InvalidState(context + ": credential is inactive and cannot return to the pool");
    }
    if (record->is_available) {
      tx->Rollback();
      return *record;
    }

    db::model::CredentialUpdate update;
    update.clear_assignment = true;
    update.expect_available = false;
    ThrowIfDbError(repository_->UpdateCredential(*tx, credential_id, update), context);
    update.ApplyTo(*record, util::NowMillis());

    tx->Commit();
    CREDPOOL_LOG_INFO("Credential released", {observability::IntField("credential_id", credential_id)});
    return *record;
  });
}

DeleteResult CredentialLifecycle::DeleteCredentials(const std::vector<int64_t>& credential_ids) {
  auto out = RunWithRetry(max_attempts_, "delete credentials", [&] {
    DeleteResult result;
    auto         tx = repository_->Begin();
    for (int64_t id : credential_ids) {
      const auto res = repository_->DeleteCredential(*tx, id);
      if (res.code == db::ErrorCode::NotFound) {
        result.failed_ids.push_back(id);
        AppendBoundedError(result.errors, "Credential " + std::to_string(id) + ": Not found");
        continue;
      }
      ThrowIfDbError(res, "delete credential " + std::to_string(id));
      ++result.deleted_count;
    }
    tx->Commit();
    return result;
  });

  CREDPOOL_LOG_INFO("Credentials deleted", {observability::IntField("deleted", out.deleted_count),
                                            observability::IntField("failed", static_cast<int64_t>(out.failed_ids.size()))});
  return out;
}

uint32_t CredentialLifecycle::DeleteAll() {
  std::vector<int64_t> ids;
  {
    auto tx = repository_->Begin();
    for (const auto& r : repository_->ListCredentials(*tx, {})) ids.push_back(r.id);
    tx->Commit();
  }
  return DeleteCredentials(ids).deleted_count;
}

uint32_t CredentialLifecycle::Revoke(const db::model::CredentialFilter& owner, const std::string& what) {
  const auto revoked = RunWithRetry(max_attempts_, "revoke", [&] {
    uint32_t count = 0;
    auto     tx    = repository_->Begin();
    for (const auto& r : repository_->ListCredentials(*tx, owner)) {
      if (!r.is_active && !r.is_available) continue;

      db::model::CredentialUpdate update;
      update.is_available = false;
      update.is_active    = false;
      ThrowIfDbError(repository_->UpdateCredential(*tx, r.id, update), "revoke credential " + std::to_string(r.id));
      ++count;
    }
    tx->Commit();
    return count;
  });

  CREDPOOL_LOG_INFO("Credentials revoked", {observability::StringField("owner", what), observability::IntField("count", revoked)});
  return revoked;
}

uint32_t CredentialLifecycle::RevokeUser(int64_t user_id) {
  db::model::CredentialFilter owner;
  owner.user_id = user_id;
  return Revoke(owner, "user " + std::to_string(user_id));
}

uint32_t CredentialLifecycle::RevokeInstance(int64_t instance_id) {
  db::model::CredentialFilter owner;
  owner.instance_id = instance_id;
  return Revoke(owner, "instance " + std::to_string(instance_id));
}

CredentialStats CredentialLifecycle::Stats() {
  CredentialStats stats;

  auto tx = repository_->Begin();
  for (const auto type : credpool::model::kAllAssignmentTypes) {
    db::model::CredentialFilter f;
    f.assignment_type = type;

    PoolStats pool;
    pool.type  = type;
    pool.total = repository_->CountCredentials(*tx, f);

    f.is_active   = false;
    pool.inactive = repository_->CountCredentials(*tx, f);

    f.is_active    = true;
    f.is_available = true;
    pool.available = repository_->CountCredentials(*tx, f);

    pool.assigned = pool.total - pool.inactive - pool.available;

    stats.total += pool.total;
    stats.pools.push_back(pool);
  }
  tx->Commit();
  return stats;
}

CredentialPage CredentialLifecycle::List(const db::model::CredentialFilter& filter) {
  CredentialPage page;

  auto tx    = repository_->Begin();
  page.items = repository_->ListCredentials(*tx, filter);
  page.total = repository_->CountCredentials(*tx, filter);
  tx->Commit();
  return page;
}

std::vector<db::model::BatchSummary> CredentialLifecycle::ListBatches(int64_t user_id) {
  auto tx      = repository_->Begin();
  auto batches = repository_->ListBatches(*tx, user_id);
  tx->Commit();
  return batches;
}

std::vector<db::model::CredentialRecord> CredentialLifecycle::ListBatch(int64_t user_id, const std::string& batch_id) {
  db::model::CredentialFilter f;
  f.user_id          = user_id;
  f.request_batch_id = batch_id;

  auto tx   = repository_->Begin();
  auto rows = repository_->ListCredentials(*tx, f);
  tx->Commit();
  return rows;
}

std::vector<db::model::CredentialRecord> CredentialLifecycle::ListForUser(int64_t user_id) {
  db::model::CredentialFilter f;
  f.user_id = user_id;

  auto tx   = repository_->Begin();
  auto rows = repository_->ListCredentials(*tx, f);
  tx->Commit();
  return rows;
}

} // namespace credpool::core
