#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace credpool::db::sqlite {

/*
  SQLite credential store.

  SQLite has no row locks. Every transaction already owns the database
  write lock (BEGIN IMMEDIATE), so LockAvailable selects without
  locking, and the allocator's stamp carries an is_available
  compare-and-swap that turns any lost race into ErrorCode::Conflict.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertCredential(Transaction&, model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetCredential(Transaction&, int64_t) override;
  std::optional<model::CredentialRecord> FindByFileHash(Transaction&, const std::string&) override;
  std::vector<model::CredentialRecord> ListCredentials(Transaction&, const model::CredentialFilter&) override;
  uint64_t CountCredentials(Transaction&, const model::CredentialFilter&) override;
  std::vector<model::CredentialRecord> LockAvailable(Transaction&, credpool::model::AssignmentType, uint32_t) override;
  Result LockCredential(Transaction&, int64_t) override;
  Result UpdateCredential(Transaction&, int64_t, const model::CredentialUpdate&) override;
  Result DeleteCredential(Transaction&, int64_t) override;
  std::vector<model::BatchSummary> ListBatches(Transaction&, int64_t) override;

  Result PutSetting(Transaction&, const model::SettingRecord&) override;
  std::optional<model::SettingRecord> GetSetting(Transaction&, const std::string&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Runs a statement that returns no rows; *changes receives sqlite3_changes().
  static Result Execute(sqlite3* db, const sql::Statement& st, int* changes = nullptr);

  static std::vector<model::CredentialRecord> QueryCredentials(sqlite3* db, const sql::Statement& st);

  std::shared_ptr<SqliteDB> db_;
};

}
