#include "internal/core/pool_allocator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using credpool::core::BulkAssignTarget;
using credpool::core::ClaimRequest;
using credpool::core::PoolAllocator;
using credpool::core::RequesterKind;
using credpool::db::memory::MemoryRepository;
using credpool::db::model::CredentialUpdate;
using credpool::model::AssignmentType;
using credpool::testing::Seed;

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestExhaustionScenario() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 3);
  PoolAllocator allocator(repo);

  auto a = allocator.RequestForUser(1, "alice", 5);
  assert(a.requested_count == 5);
  assert(a.assigned_count == 3);
  assert(a.credentials.size() == 3);
  assert(a.message == "Assigned 3 of 5 requested credentials (only 3 available)");

  auto b = allocator.RequestForUser(2, "bob", 1);
  assert(b.assigned_count == 0);
  assert(b.credentials.empty());
  assert(!b.request_batch_id.has_value());
  assert(b.message == "No available USER_REQUESTABLE credentials");
}

void TestClaimStampsEveryRow() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 4);
  PoolAllocator allocator(repo);

  auto result = allocator.RequestForUser(7, "carol", 2);
  assert(result.assigned_count == 2);
  assert(result.message == "Assigned 2 credentials");
  assert(result.request_batch_id.has_value());

  auto tx = repo->Begin();
  for (const auto& claimed : result.credentials) {
    auto stored = repo->GetCredential(*tx, claimed.id);
    assert(stored.has_value());
    assert(!stored->is_available);
    assert(stored->assigned_to_user_id == 7);
    assert(!stored->assigned_to_instance_id.has_value());
    assert(stored->assigned_to_username == "carol");
    assert(stored->assigned_at_ms > 0);
    assert(stored->request_batch_id == result.request_batch_id);
  }
  tx->Commit();
}

void TestBatchIdentity() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 10);
  PoolAllocator allocator(repo);

  auto first  = allocator.RequestForUser(1, "u", 3);
  auto second = allocator.RequestForUser(1, "u", 3);

  std::set<std::string> first_batches;
  for (const auto& c : first.credentials) first_batches.insert(*c.request_batch_id);
  assert(first_batches.size() == 1);
  assert(*first_batches.begin() == *first.request_batch_id);
  assert(first.request_batch_id->size() == 36);
  assert(*first.request_batch_id != *second.request_batch_id);
}

void TestRequestIsTruncatedToCap() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 200);
  PoolAllocator allocator(repo);

  auto result = allocator.RequestForUser(1, "bulk", 100);
  assert(result.assigned_count <= 25);
  assert(result.assigned_count == 25);
  assert(result.requested_count == 25);
}

void TestInvalidCounts() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 2);
  PoolAllocator allocator(repo);

  auto zero = allocator.RequestForUser(1, "u", 0);
  assert(zero.assigned_count == 0);
  assert(zero.message == "Count must be at least 1");

  ClaimRequest anonymous;
  anonymous.kind  = RequesterKind::kUser;
  anonymous.count = 1;
  assert(Throws<credpool::util::InvalidArgument>([&] { allocator.Claim(anonymous); }));

  // nothing was taken
  assert(allocator.RequestForUser(1, "u", 2).assigned_count == 2);
}

void TestPoolsAreSeparate() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 2, AssignmentType::kUserRequestable);
  Seed(*repo, 10, 1, AssignmentType::kInstanceAutoAssign);
  Seed(*repo, 20, 1, AssignmentType::kReserved);
  PoolAllocator allocator(repo);

  auto instance = allocator.ClaimForInstance(900);
  assert(instance.assigned_count == 1);
  assert(instance.credentials[0].assignment_type == AssignmentType::kInstanceAutoAssign);
  assert(instance.credentials[0].assigned_to_instance_id == 900);
  assert(!instance.request_batch_id.has_value());

  assert(allocator.ClaimForInstance(901).assigned_count == 0);

  auto user = allocator.RequestForUser(1, "u", 5);
  assert(user.assigned_count == 2);
  for (const auto& c : user.credentials) assert(c.assignment_type == AssignmentType::kUserRequestable);
}

void TestInactiveCredentialsAreNeverClaimed() {
  auto repo = std::make_shared<MemoryRepository>();
  const auto last = Seed(*repo, 0, 2);
  {
    auto             tx = repo->Begin();
    CredentialUpdate retire;
    retire.is_active = false;
    assert(repo->UpdateCredential(*tx, last, retire));
    tx->Commit();
  }
  PoolAllocator allocator(repo);

  auto result = allocator.RequestForUser(1, "u", 2);
  assert(result.assigned_count == 1);
  assert(result.credentials[0].id != last);
}

void TestReserveThenLink() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 2, AssignmentType::kInstanceAutoAssign);
  PoolAllocator allocator(repo);

  auto reserved = allocator.ClaimForInstance(std::nullopt);
  assert(reserved.assigned_count == 1);
  const auto id = reserved.credentials[0].id;
  assert(!reserved.credentials[0].is_available);
  assert(!reserved.credentials[0].assigned_to_instance_id.has_value());

  auto linked = allocator.LinkInstance(id, 55);
  assert(linked.assigned_to_instance_id == 55);
  assert(!linked.is_available);

  // relinking to the same instance is a no-op, another instance is refused
  assert(allocator.LinkInstance(id, 55).assigned_to_instance_id == 55);
  assert(Throws<credpool::util::InvalidState>([&] { allocator.LinkInstance(id, 56); }));

  // an unclaimed credential cannot be linked
  auto tx    = repo->Begin();
  auto spare = repo->LockAvailable(*tx, AssignmentType::kInstanceAutoAssign, 1);
  tx->Rollback();
  assert(spare.size() == 1);
  assert(Throws<credpool::util::InvalidState>([&] { allocator.LinkInstance(spare[0].id, 57); }));

  assert(Throws<credpool::util::NotFound>([&] { allocator.LinkInstance(9999, 1); }));
}

void TestLinkRefusesUserCredential() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 1);
  PoolAllocator allocator(repo);

  auto claimed = allocator.RequestForUser(3, "dave", 1);
  assert(Throws<credpool::util::InvalidState>([&] { allocator.LinkInstance(claimed.credentials[0].id, 1); }));
}

void TestBulkAssign() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 5);
  PoolAllocator allocator(repo);

  const std::vector<BulkAssignTarget> targets = {{1, "a"}, {2, "b"}, {3, "c"}, {4, "d"}};
  auto result = allocator.BulkAssign(targets, 2);

  assert(result.total_assigned == 5);
  assert(result.failed_user_ids.size() == 1);
  assert(result.failed_user_ids[0] == 4);
  assert(result.errors.size() == 1);
  assert(result.errors[0] == "User 4: No available USER_REQUESTABLE credentials");
}

} // namespace

int main() {
  TestExhaustionScenario();
  TestClaimStampsEveryRow();
  TestBatchIdentity();
  TestRequestIsTruncatedToCap();
  TestInvalidCounts();
  TestPoolsAreSeparate();
  TestInactiveCredentialsAreNeverClaimed();
  TestReserveThenLink();
  TestLinkRefusesUserCredential();
  TestBulkAssign();

  std::cout << "credpool_unit_pool_allocator: pass\n";
  return 0;
}
