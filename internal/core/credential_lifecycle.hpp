#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/assignment_type.hpp"

namespace credpool::core {

struct DeleteResult {
  uint32_t                 deleted_count = 0;
  std::vector<int64_t>     failed_ids;
  std::vector<std::string> errors;
};

struct PoolStats {
  credpool::model::AssignmentType type = credpool::model::AssignmentType::kUserRequestable;

  uint64_t total     = 0;
  uint64_t available = 0; // active and unassigned
  uint64_t assigned  = 0; // active and handed out
  uint64_t inactive  = 0;
};

struct CredentialStats {
  uint64_t               total = 0;
  std::vector<PoolStats> pools; // one per assignment type
};

struct CredentialPage {
  std::vector<db::model::CredentialRecord> items;
  uint64_t                                 total = 0; // matches before paging
};

/*
  Administrative state changes and read-side queries.

  Release returns an assigned credential to its pool and refuses
  inactive ones. Revoke retires every credential of a principal for
  good (is_available = is_active = false) and keeps the reference.
*/
class CredentialLifecycle {
 public:
  explicit CredentialLifecycle(std::shared_ptr<db::Repository> repository, uint32_t max_attempts = 3);

  db::model::CredentialRecord Get(int64_t credential_id);

  db::model::CredentialRecord Release(int64_t credential_id);

  DeleteResult DeleteCredentials(const std::vector<int64_t>& credential_ids);
  uint32_t     DeleteAll();

  uint32_t RevokeUser(int64_t user_id);
  uint32_t RevokeInstance(int64_t instance_id);

  CredentialStats Stats();
  CredentialPage  List(const db::model::CredentialFilter& filter);

  std::vector<db::model::BatchSummary>     ListBatches(int64_t user_id);
  std::vector<db::model::CredentialRecord> ListBatch(int64_t user_id, const std::string& batch_id);
  std::vector<db::model::CredentialRecord> ListForUser(int64_t user_id);

 private:
  uint32_t Revoke(const db::model::CredentialFilter& owner, const std::string& what);

  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_attempts_;
};

} // namespace credpool::core
