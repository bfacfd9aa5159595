#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "tests/test_support.hpp"

namespace {

using credpool::db::ErrorCode;
using credpool::db::Repository;
using credpool::db::model::AssignmentStamp;
using credpool::db::model::CredentialFilter;
using credpool::db::model::CredentialUpdate;
using credpool::db::model::SettingRecord;
using credpool::model::AssignmentType;
using credpool::runtime::config::RuntimeConfig;
using credpool::testing::MakeCredential;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  std::function<void()>                        cleanup;
  bool                                         durable                        = false;
  bool                                         supports_parallel_transactions = true;
};

void Clear(Repository& repo) {
  auto tx = repo.Begin();
  for (const auto& r : repo.ListCredentials(*tx, {})) {
    auto res = repo.DeleteCredential(*tx, r.id);
    assert(res);
  }
  tx->Commit();
}

int64_t Insert(Repository& repo, int n, AssignmentType type = AssignmentType::kUserRequestable) {
  auto tx     = repo.Begin();
  auto record = MakeCredential(n, type);
  auto res    = repo.InsertCredential(*tx, record);
  assert(res);
  assert(record.id > 0);
  tx->Commit();
  return record.id;
}

void VerifyInsertReadBack(Repository& repo) {
  const auto id = Insert(repo, 1);

  auto tx  = repo.Begin();
  auto got = repo.GetCredential(*tx, id);
  assert(got.has_value());
  assert(got->material == MakeCredential(1).material);
  assert(got->file_hash == MakeCredential(1).file_hash);
  assert(got->assignment_type == AssignmentType::kUserRequestable);
  assert(got->is_available && got->is_active);
  assert(!got->assigned_to_user_id && !got->assigned_to_instance_id);
  assert(got->created_at_ms > 0);

  auto by_hash = repo.FindByFileHash(*tx, *got->file_hash);
  assert(by_hash.has_value() && by_hash->id == id);
  assert(!repo.FindByFileHash(*tx, std::string(64, '0')).has_value());
  assert(!repo.GetCredential(*tx, id + 1000).has_value());
  tx->Commit();
}

void VerifyDuplicateHashIsRejected(Repository& repo) {
  Insert(repo, 2);

  auto tx        = repo.Begin();
  auto duplicate = MakeCredential(2);
  auto res       = repo.InsertCredential(*tx, duplicate);
  assert(res.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  auto check = repo.Begin();
  CredentialFilter f;
  f.search = "10.8.0.4";
  assert(repo.CountCredentials(*check, f) == 1);
  check->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  int64_t id = 0;
  {
    auto tx     = repo.Begin();
    auto record = MakeCredential(3);
    assert(repo.InsertCredential(*tx, record));
    id = record.id;
    assert(repo.GetCredential(*tx, id).has_value());
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx     = repo.Begin();
    auto record = MakeCredential(4);
    assert(repo.InsertCredential(*tx, record));
  }

  auto tx = repo.Begin();
  assert(!repo.GetCredential(*tx, id).has_value());
  assert(!repo.FindByFileHash(*tx, *MakeCredential(4).file_hash).has_value());
  tx->Commit();
}

void VerifyTransactionState(Repository& repo) {
  auto rolled_back = repo.Begin();
  assert(!rolled_back->IsCommitted());
  rolled_back->Rollback();
  assert(!rolled_back->IsCommitted());

  auto committed = repo.Begin();
  committed->Commit();
  assert(committed->IsCommitted());
}

void VerifyStampAndCompareAndSwap(Repository& repo) {
  const auto id = Insert(repo, 5);

  AssignmentStamp stamp;
  stamp.user_id          = 9;
  stamp.username         = "alice";
  stamp.assigned_at_ms   = static_cast<int64_t>(NowMs());
  stamp.request_batch_id = "batch-parity";

  CredentialUpdate claim;
  claim.assign           = stamp;
  claim.expect_available = true;

  {
    auto tx = repo.Begin();
    assert(repo.UpdateCredential(*tx, id, claim));
    tx->Commit();
  }
  {
    auto tx  = repo.Begin();
    auto res = repo.UpdateCredential(*tx, id, claim);
    assert(res.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  auto tx  = repo.Begin();
  auto got = repo.GetCredential(*tx, id);
  assert(got.has_value());
  assert(!got->is_available);
  assert(got->assigned_to_user_id == 9);
  assert(got->assigned_to_username == "alice");
  assert(got->request_batch_id == std::string("batch-parity"));

  CredentialUpdate bad;
  bad.assign           = stamp;
  bad.clear_assignment = true;
  assert(repo.UpdateCredential(*tx, id, bad).code == ErrorCode::InvalidArgument);
  assert(repo.UpdateCredential(*tx, id, CredentialUpdate{}).code == ErrorCode::InvalidArgument);

  CredentialUpdate release;
  release.clear_assignment = true;
  release.expect_available = false;
  assert(repo.UpdateCredential(*tx, id, release));

  got = repo.GetCredential(*tx, id);
  assert(got->is_available);
  assert(!got->assigned_to_user_id && got->assigned_to_username.empty() && !got->request_batch_id);

  assert(repo.UpdateCredential(*tx, id + 1000, release).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyLockAvailableFiltersPool(Repository& repo) {
  Clear(repo);
  Insert(repo, 10);
  Insert(repo, 11);
  const auto instance_id = Insert(repo, 12, AssignmentType::kInstanceAutoAssign);
  const auto inactive    = Insert(repo, 13);

  {
    auto             tx = repo.Begin();
    CredentialUpdate off;
    off.is_available = false;
    off.is_active    = false;
    assert(repo.UpdateCredential(*tx, inactive, off));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.LockAvailable(*tx, AssignmentType::kUserRequestable, 10);
  assert(rows.size() == 2);
  for (const auto& r : rows) {
    assert(r.assignment_type == AssignmentType::kUserRequestable);
    assert(r.id != inactive);
  }

  auto instance_rows = repo.LockAvailable(*tx, AssignmentType::kInstanceAutoAssign, 10);
  assert(instance_rows.size() == 1 && instance_rows[0].id == instance_id);
  assert(repo.LockAvailable(*tx, AssignmentType::kReserved, 10).empty());
  assert(repo.LockAvailable(*tx, AssignmentType::kUserRequestable, 1).size() == 1);
  tx->Rollback();
}

void VerifyLockedRowsAreSkipped(Repository& repo, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  Clear(repo);
  const auto first  = Insert(repo, 20);
  const auto second = Insert(repo, 21);

  auto holder = repo.Begin();
  assert(repo.LockCredential(*holder, first));

  auto other = repo.Begin();
  auto rows  = repo.LockAvailable(*other, AssignmentType::kUserRequestable, 5);
  assert(rows.size() == 1 && rows[0].id == second);
  other->Rollback();

  auto probe = repo.Begin();
  assert(repo.LockCredential(*probe, first).code == ErrorCode::Busy);
  probe->Rollback();

  holder->Rollback();

  auto after = repo.Begin();
  assert(repo.LockCredential(*after, first));
  assert(repo.LockCredential(*after, first + second + 1000).code == ErrorCode::NotFound);
  after->Rollback();
}

void VerifyFiltersAndBatches(Repository& repo) {
  Clear(repo);
  std::vector<int64_t> ids;
  for (int n = 30; n < 36; ++n) ids.push_back(Insert(repo, n));

  auto stamp_batch = [&](int64_t id, const std::string& batch, int64_t at) {
    AssignmentStamp stamp;
    stamp.user_id          = 7;
    stamp.username         = "bob";
    stamp.assigned_at_ms   = at;
    stamp.request_batch_id = batch;

    CredentialUpdate update;
    update.assign = stamp;

    auto tx = repo.Begin();
    assert(repo.UpdateCredential(*tx, id, update));
    tx->Commit();
  };
  stamp_batch(ids[0], "batch-old", 1000);
  stamp_batch(ids[1], "batch-old", 1000);
  stamp_batch(ids[2], "batch-new", 2000);

  auto tx = repo.Begin();

  auto batches = repo.ListBatches(*tx, 7);
  assert(batches.size() == 2);
  assert(batches[0].request_batch_id == "batch-new");
  assert(batches[0].credential_count == 1);
  assert(batches[1].request_batch_id == "batch-old");
  assert(batches[1].credential_count == 2);
  assert(batches[1].first_assigned_at_ms == 1000);
  assert(repo.ListBatches(*tx, 8).empty());

  CredentialFilter batch;
  batch.user_id          = 7;
  batch.request_batch_id = "batch-old";
  auto rows              = repo.ListCredentials(*tx, batch);
  assert(rows.size() == 2);

  CredentialFilter available;
  available.is_available = true;
  assert(repo.CountCredentials(*tx, available) == 3);

  CredentialFilter page;
  page.limit  = 2;
  page.offset = 1;
  rows        = repo.ListCredentials(*tx, page);
  assert(rows.size() == 2);
  assert(rows[0].id == ids[1] && rows[1].id == ids[2]);
  assert(repo.CountCredentials(*tx, {}) == 6);

  CredentialFilter search;
  search.search = "bo";
  assert(repo.CountCredentials(*tx, search) == 3);
  tx->Commit();
}

void VerifyDelete(Repository& repo) {
  const auto id = Insert(repo, 40);

  auto tx = repo.Begin();
  assert(repo.DeleteCredential(*tx, id));
  assert(repo.DeleteCredential(*tx, id).code == ErrorCode::NotFound);
  tx->Commit();

  // a deleted hash can be imported again
  Insert(repo, 40);
}

void VerifySettings(Repository& repo) {
  SettingRecord record;
  record.key         = "naming_pattern";
  record.value       = "{username}_{index}.conf";
  record.description = "pattern";

  auto tx = repo.Begin();
  assert(repo.PutSetting(*tx, record));
  record.value = "{id}.conf";
  assert(repo.PutSetting(*tx, record));
  tx->Commit();

  auto read = repo.Begin();
  auto got  = repo.GetSetting(*read, "naming_pattern");
  assert(got.has_value());
  assert(got->value == "{id}.conf");
  assert(got->description == "pattern");
  assert(!repo.GetSetting(*read, "absent").has_value());
  read->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.durable) {
    return;
  }

  int64_t id = 0;
  {
    auto repo = backend.make_repository();
    id        = Insert(*repo, 50);
  }

  auto repo = backend.make_repository();
  auto tx   = repo->Begin();
  auto got  = repo->GetCredential(*tx, id);
  assert(got.has_value());
  assert(got->material == MakeCredential(50).material);
  tx->Commit();
}

std::shared_ptr<Repository> Open(RuntimeConfig config) {
  credpool::config::ConfigLoader::ApplyDefaults(config);
  return credpool::factory::BuildRepository(config);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() {
        RuntimeConfig config;
        config.mutable_database()->mutable_memory();
        return Open(config);
      },
      .cleanup                        = []() {},
      .durable                        = false,
      .supports_parallel_transactions = true,
  };
}

#if CREDPOOL_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("credpool_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = [db_path]() {
        RuntimeConfig config;
        config.mutable_database()->mutable_sqlite()->set_path(db_path);
        return Open(config);
      },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .durable                        = true,
      .supports_parallel_transactions = false,
  };
}
#endif

#if CREDPOOL_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CREDPOOL_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CREDPOOL_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name            = "postgres",
      .make_repository = [conninfo]() {
        RuntimeConfig config;
        config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
        return Open(config);
      },
      .cleanup                        = []() {},
      .durable                        = true,
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  Clear(*repo);

  VerifyInsertReadBack(*repo);
  VerifyDuplicateHashIsRejected(*repo);
  VerifyRollbackDiscardsWrites(*repo);
  VerifyTransactionState(*repo);
  VerifyStampAndCompareAndSwap(*repo);
  VerifyLockAvailableFiltersPool(*repo);
  VerifyLockedRowsAreSkipped(*repo, backend.supports_parallel_transactions);
  VerifyFiltersAndBatches(*repo);
  VerifyDelete(*repo);
  VerifySettings(*repo);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CREDPOOL_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CREDPOOL_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "credpool_integration_repository_parity: pass\n";
  return 0;
}
