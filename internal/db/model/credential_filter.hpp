#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/assignment_type.hpp"

namespace credpool::db::model {

/*
  Read-side selection. Unset members do not filter.
  Results are ordered by id ascending, or by (assigned_at, id) when
  request_batch_id is set.
*/
struct CredentialFilter {
  std::optional<credpool::model::AssignmentType> assignment_type;
  std::optional<bool>                            is_available;
  std::optional<bool>                            is_active;
  std::optional<int64_t>                         user_id;
  std::optional<int64_t>                         instance_id;
  std::optional<std::string>                     request_batch_id;

  // Substring match over ipv4_address and assigned_to_username.
  std::optional<std::string> search;

  uint32_t limit  = 0; // 0 = unbounded
  uint32_t offset = 0;
};

struct BatchSummary {
  std::string request_batch_id;
  int64_t     first_assigned_at_ms = 0;
  uint64_t    credential_count     = 0;
};

} // namespace credpool::db::model
