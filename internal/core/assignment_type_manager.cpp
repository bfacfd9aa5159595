#include "assignment_type_manager.hpp"

#include "internal/core/bulk_result.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credpool::core {

using credpool::model::AssignmentType;

AssignmentTypeManager::AssignmentTypeManager(std::shared_ptr<db::Repository> repository, uint32_t max_attempts)
    : repository_(std::move(repository)), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
}

AssignmentType AssignmentTypeManager::ParseOrThrow(std::string_view type_name) {
  auto type = credpool::model::ParseAssignmentType(type_name);
  if (!type) {
    throw util::InvalidArgument("invalid assignment type '" + std::string(type_name) +
                                "'; expected USER_REQUESTABLE, INSTANCE_AUTO_ASSIGN or RESERVED");
  }
  return *type;
}

db::model::CredentialRecord AssignmentTypeManager::SetAssignmentType(int64_t credential_id, std::string_view type_name) {
  return Apply(credential_id, ParseOrThrow(type_name));
}

db::model::CredentialRecord AssignmentTypeManager::Apply(int64_t credential_id, AssignmentType type) {
  const auto context = "credential " + std::to_string(credential_id);

  return RunWithRetry(max_attempts_, "set assignment type", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->LockCredential(*tx, credential_id), context);

    auto record = repository_->GetCredential(*tx, credential_id);
    if (!record) throw util::NotFound(context + " not found");

    if (!record->is_available) {
      throw util::StillAssigned(context + " is assigned; release it before changing its assignment type");
    }
    if (record->assignment_type == type) {
      tx->Rollback();
      return *record;
    }

    db::model::CredentialUpdate update;
    update.assignment_type  = type;
    update.expect_available = true;
    ThrowIfDbError(repository_->UpdateCredential(*tx, credential_id, update), context);
    update.ApplyTo(*record, util::NowMillis());

    tx->Commit();

    CREDPOOL_LOG_INFO("Assignment type changed", {observability::IntField("credential_id", credential_id),
                                                  observability::StringField("assignment_type", credpool::model::ToString(type))});
    return *record;
  });
}

AssignmentTypeBulkResult AssignmentTypeManager::SetAssignmentTypes(const std::vector<int64_t>& credential_ids,
                                                                   std::string_view type_name) {
  const auto type = ParseOrThrow(type_name);

  AssignmentTypeBulkResult out;
  for (int64_t id : credential_ids) {
    try {
      Apply(id, type);
      ++out.success_count;
    } catch (const util::StillAssigned& e) {
      ++out.skipped_count;
      AppendBoundedError(out.errors, e.what());
    } catch (const util::NotFound& e) {
      ++out.skipped_count;
      AppendBoundedError(out.errors, e.what());
    } catch (const util::Unavailable& e) {
      ++out.skipped_count;
      AppendBoundedError(out.errors, e.what());
    }
  }
  return out;
}

} // namespace credpool::core
