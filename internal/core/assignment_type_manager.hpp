#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/assignment_type.hpp"

namespace credpool::core {

struct AssignmentTypeBulkResult {
  uint32_t                 success_count = 0;
  uint32_t                 skipped_count = 0;
  std::vector<std::string> errors;
};

/*
  Moves unassigned credentials between pools.

  The type of a credential can only change while it is available:
    unknown type name -> util::InvalidArgument
    missing id        -> util::NotFound
    assigned          -> util::StillAssigned
*/
class AssignmentTypeManager {
 public:
  explicit AssignmentTypeManager(std::shared_ptr<db::Repository> repository, uint32_t max_attempts = 3);

  db::model::CredentialRecord SetAssignmentType(int64_t credential_id, std::string_view type_name);

  // Validates the type once; every id runs in its own transaction.
  AssignmentTypeBulkResult SetAssignmentTypes(const std::vector<int64_t>& credential_ids, std::string_view type_name);

 private:
  static credpool::model::AssignmentType ParseOrThrow(std::string_view type_name);

  db::model::CredentialRecord Apply(int64_t credential_id, credpool::model::AssignmentType type);

  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_attempts_;
};

} // namespace credpool::core
