#include "internal/core/assignment_type_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/pool_allocator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using credpool::core::AssignmentTypeManager;
using credpool::core::PoolAllocator;
using credpool::db::memory::MemoryRepository;
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

AssignmentType StoredType(credpool::db::Repository& repo, int64_t id) {
  auto tx     = repo.Begin();
  auto record = repo.GetCredential(*tx, id);
  tx->Commit();
  assert(record.has_value());
  return record->assignment_type;
}

void TestMovesAvailableCredential() {
  auto repo = std::make_shared<MemoryRepository>();
  const auto id = Seed(*repo, 0, 1);
  AssignmentTypeManager manager(repo);

  auto updated = manager.SetAssignmentType(id, "INSTANCE_AUTO_ASSIGN");
  assert(updated.assignment_type == AssignmentType::kInstanceAutoAssign);
  assert(StoredType(*repo, id) == AssignmentType::kInstanceAutoAssign);

  // same type again is accepted unchanged
  assert(manager.SetAssignmentType(id, "INSTANCE_AUTO_ASSIGN").assignment_type == AssignmentType::kInstanceAutoAssign);
}

void TestUnknownTypeIsRejected() {
  auto repo = std::make_shared<MemoryRepository>();
  const auto id = Seed(*repo, 0, 1);
  AssignmentTypeManager manager(repo);

  assert(Throws<credpool::util::InvalidArgument>([&] { manager.SetAssignmentType(id, "user_requestable"); }));
  assert(Throws<credpool::util::InvalidArgument>([&] { manager.SetAssignmentType(id, "EVERYONE"); }));
  assert(StoredType(*repo, id) == AssignmentType::kUserRequestable);
}

void TestMissingCredential() {
  auto                  repo = std::make_shared<MemoryRepository>();
  AssignmentTypeManager manager(repo);
  assert(Throws<credpool::util::NotFound>([&] { manager.SetAssignmentType(404, "RESERVED"); }));
}

void TestAssignedCredentialIsGuarded() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 1);
  PoolAllocator         allocator(repo);
  AssignmentTypeManager manager(repo);

  const auto id = allocator.RequestForUser(1, "u", 1).credentials.at(0).id;

  bool still_assigned = false;
  try {
    manager.SetAssignmentType(id, "RESERVED");
  } catch (const credpool::util::StillAssigned& e) {
    still_assigned = true;
    assert(std::string(e.what()).find("credential " + std::to_string(id)) != std::string::npos);
  }
  assert(still_assigned);
  assert(StoredType(*repo, id) == AssignmentType::kUserRequestable);
}

void TestBulkChange() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 0, 4);
  PoolAllocator         allocator(repo);
  AssignmentTypeManager manager(repo);

  const auto taken = allocator.RequestForUser(1, "u", 1).credentials.at(0).id;

  std::vector<int64_t> ids = {1, 2, 3, 4, 77};
  auto result = manager.SetAssignmentTypes(ids, "RESERVED");
  assert(result.success_count == 3);
  assert(result.skipped_count == 2);
  assert(result.errors.size() == 2);
  assert(StoredType(*repo, taken) == AssignmentType::kUserRequestable);

  // the type is validated before any row is touched
  assert(Throws<credpool::util::InvalidArgument>([&] { manager.SetAssignmentTypes(ids, "NOPE"); }));
}

void TestBulkErrorsAreCapped() {
  auto                  repo = std::make_shared<MemoryRepository>();
  AssignmentTypeManager manager(repo);

  std::vector<int64_t> missing;
  for (int64_t id = 100; id < 120; ++id) missing.push_back(id);

  auto result = manager.SetAssignmentTypes(missing, "RESERVED");
  assert(result.success_count == 0);
  assert(result.skipped_count == 20);
  assert(result.errors.size() == 10);
}

} // namespace

int main() {
  TestMovesAvailableCredential();
  TestUnknownTypeIsRejected();
  TestMissingCredential();
  TestAssignedCredentialIsGuarded();
  TestBulkChange();
  TestBulkErrorsAreCapped();

  std::cout << "credpool_unit_assignment_type_manager: pass\n";
  return 0;
}
