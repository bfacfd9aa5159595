#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/model/assignment_type.hpp"

namespace credpool::db::model {

/*
  Requester stamp applied by a claim.
  Exactly one of user_id / instance_id may be set; neither is allowed
  for an instance reservation made before the instance exists.
*/
struct AssignmentStamp {
  std::optional<int64_t>     user_id;
  std::optional<int64_t>     instance_id;
  std::string                username;
  int64_t                    assigned_at_ms = 0;
  std::optional<std::string> request_batch_id;
};

/*
  Allow-listed partial update of a credential row.

  Only the fields below can ever be written after insert. Backends
  apply them in this order:

    clear_assignment  -> all assignment fields null, is_available = true
    assign            -> stamp fields, is_available = false
    link_instance_id  -> assigned_to_instance_id only
    assignment_type / is_available / is_active

  expect_available is a compare-and-swap precondition: the update is
  rejected with ErrorCode::Conflict when the stored is_available
  differs.
*/
struct CredentialUpdate {
  std::optional<credpool::model::AssignmentType> assignment_type;
  std::optional<bool>                            is_available;
  std::optional<bool>                            is_active;

  std::optional<AssignmentStamp> assign;
  bool                           clear_assignment = false;
  std::optional<int64_t>         link_instance_id;

  std::optional<bool> expect_available;

  bool Empty() const {
    return !assignment_type && !is_available && !is_active && !assign && !clear_assignment && !link_instance_id;
  }

  Result Validate() const {
    if (Empty()) {
      return Result::Err(ErrorCode::InvalidArgument, "empty credential update");
    }
    if (assign && clear_assignment) {
      return Result::Err(ErrorCode::InvalidArgument, "assign and clear_assignment are exclusive");
    }
    if (assign && assign->user_id && assign->instance_id) {
      return Result::Err(ErrorCode::InvalidArgument, "credential cannot be assigned to a user and an instance");
    }
    if (assign && is_available.value_or(false)) {
      return Result::Err(ErrorCode::InvalidArgument, "assigned credential cannot be available");
    }
    if (clear_assignment && is_available && !*is_available) {
      return Result::Err(ErrorCode::InvalidArgument, "cleared credential must be available");
    }
    if (link_instance_id && (clear_assignment || (assign && assign->user_id))) {
      return Result::Err(ErrorCode::InvalidArgument, "instance link conflicts with the assignment in the same update");
    }
    return Result::Ok();
  }

  // In-process application; SQL backends render the same order as SET clauses.
  void ApplyTo(CredentialRecord& record, int64_t now_ms) const {
    if (clear_assignment) {
      record.assigned_to_user_id.reset();
      record.assigned_to_instance_id.reset();
      record.assigned_to_username.clear();
      record.assigned_at_ms = 0;
      record.request_batch_id.reset();
      record.is_available = true;
    }
    if (assign) {
      record.assigned_to_user_id     = assign->user_id;
      record.assigned_to_instance_id = assign->instance_id;
      record.assigned_to_username    = assign->username;
      record.assigned_at_ms          = assign->assigned_at_ms;
      record.request_batch_id        = assign->request_batch_id;
      record.is_available            = false;
    }
    if (link_instance_id) {
      record.assigned_to_instance_id = link_instance_id;
    }
    if (assignment_type) record.assignment_type = *assignment_type;
    if (is_available) record.is_available = *is_available;
    if (is_active) record.is_active = *is_active;
    record.updated_at_ms = now_ms;
  }
};

} // namespace credpool::db::model
