#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/assignment_type.hpp"

namespace credpool::core {

enum class RequesterKind {
  kUser,
  kInstance,
};

struct ClaimRequest {
  RequesterKind kind = RequesterKind::kUser;

  // User id for user claims; instance id for instance claims, or unset
  // to reserve before the instance exists (see LinkInstance).
  std::optional<int64_t> requester_id;
  std::string            username;

  int32_t                         count = 1;
  credpool::model::AssignmentType pool  = credpool::model::AssignmentType::kUserRequestable;
};

struct ClaimResult {
  uint32_t    requested_count = 0;
  uint32_t    assigned_count  = 0;
  std::string message;

  std::vector<db::model::CredentialRecord> credentials;

  // Shared by every credential of a user claim.
  std::optional<std::string> request_batch_id;
};

struct BulkAssignTarget {
  int64_t     user_id = 0;
  std::string username;
};

struct BulkAssignResult {
  uint32_t                 total_assigned = 0;
  std::vector<int64_t>     failed_user_ids;
  std::vector<std::string> errors;
};

struct AllocatorOptions {
  uint32_t max_claim_attempts = 3;
  uint32_t max_request_count  = 25;
};

/*
  Hands out credentials from a pool.

  One claim = one transaction:
    LockAvailable (random order, skip locked)
    stamp every row with expect_available = true
    commit

  An empty pool is a zero result, never an error. Contention is retried
  up to max_claim_attempts and then raised as util::Unavailable.
*/
class PoolAllocator {
 public:
  explicit PoolAllocator(std::shared_ptr<db::Repository> repository, AllocatorOptions options = {});

  ClaimResult Claim(const ClaimRequest& request);

  // USER_REQUESTABLE claim; counts above max_request_count are truncated.
  ClaimResult RequestForUser(int64_t user_id, const std::string& username, int32_t count);

  // Exactly one INSTANCE_AUTO_ASSIGN credential.
  ClaimResult ClaimForInstance(std::optional<int64_t> instance_id);

  // Attaches the instance to a credential reserved by ClaimForInstance(nullopt).
  db::model::CredentialRecord LinkInstance(int64_t credential_id, int64_t instance_id);

  // One independent claim of count_per_user per target.
  BulkAssignResult BulkAssign(const std::vector<BulkAssignTarget>& targets, int32_t count_per_user);

  const AllocatorOptions& Options() const {
    return options_;
  }

 private:
  ClaimResult ClaimOnce(const ClaimRequest& request, uint32_t count);

  std::shared_ptr<db::Repository> repository_;
  AllocatorOptions                options_;
};

} // namespace credpool::core
