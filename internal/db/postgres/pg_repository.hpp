#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace credpool::db::postgres {

/*
  Postgres credential store.

  LockAvailable uses FOR UPDATE SKIP LOCKED and LockCredential uses
  FOR UPDATE NOWAIT, so concurrent claims never wait on each other.
  Any failed statement aborts the pqxx::work; callers roll back.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
  static pqxx::result Run(Transaction& t, const sql::Statement& st);
  static std::vector<model::CredentialRecord> QueryCredentials(Transaction& t, const sql::Statement& st);
};

}
