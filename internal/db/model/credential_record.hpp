#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/assignment_type.hpp"
#include "internal/model/network_material.hpp"

namespace credpool::db::model {

/*
  Persistent credential row.

  IMPORTANT:
  - This is the authoritative availability record; no cache exists.
  - is_available == true  <=>  no user and no instance reference,
    except for an instance reservation awaiting LinkInstance.
  - is_active == false is terminal for allocation.
*/

struct CredentialRecord {
  int64_t id = 0;

  // Lower-case hex SHA-256 of the imported file bytes; nullopt if unknown.
  std::optional<std::string> file_hash;

  credpool::model::NetworkMaterial material;

  credpool::model::AssignmentType assignment_type = credpool::model::AssignmentType::kUserRequestable;

  bool is_available = true;
  bool is_active    = true;

  std::optional<int64_t> assigned_to_user_id;
  std::optional<int64_t> assigned_to_instance_id;
  std::string            assigned_to_username;
  int64_t                assigned_at_ms = 0;

  std::optional<std::string> request_batch_id;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace credpool::db::model
