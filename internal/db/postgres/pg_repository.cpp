#include "pg_repository.hpp"

#include <type_traits>
#include <variant>

#include "internal/db/sql/credential_sql.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/time.hpp"

namespace credpool::db::postgres {

namespace {

class PgRow final : public sql::Row {
public:
  explicit PgRow(const pqxx::row& row) : row_(row) {}

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : row_[col].as<std::string>();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  bool GetBool(int col) const override {
    return row_[col].as<bool>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

private:
  const pqxx::row& row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit([&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::nullptr_t>) {
        out.append(std::optional<std::string>{});
      } else if constexpr (std::is_same_v<T, uint64_t>) {
        out.append(static_cast<int64_t>(v));
      } else {
        out.append(v);
      }
    }, p);
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  try {
    return std::make_unique<PgTransaction>(pool_);
  } catch (const pqxx::broken_connection& e) {
    throw db::TransactionConflict(std::string("postgres connect: ") + e.what());
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }

  if (const auto* se = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = se->sqlstate();
    if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
    if (state == "40P01") return Result::Err(ErrorCode::Conflict, e.what());
    if (state == "55P03") return Result::Err(ErrorCode::Busy, e.what());
    if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }

  return Result::Err(ErrorCode::InternalError, e.what());
}

pqxx::result PgRepository::Run(Transaction& t, const sql::Statement& st) {
  return TX(t).Work().exec_params(st.sql, ToPqxx(st.params));
}

std::vector<model::CredentialRecord> PgRepository::QueryCredentials(Transaction& t, const sql::Statement& st) {
  auto res = Run(t, st);

  std::vector<model::CredentialRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(sql::CredentialFromRow(PgRow(row)));
  }
  return out;
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result PgRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  const auto now = util::NowMillis();
  if (r.created_at_ms == 0) r.created_at_ms = now;
  if (r.updated_at_ms == 0) r.updated_at_ms = now;

  try {
    auto res = Run(t, sql::BuildInsertCredential(sql::Dialect::kPostgres, r));
    if (res.empty()) {
      return Result::Err(ErrorCode::AlreadyExists, "file_hash already imported");
    }
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CredentialRecord> PgRepository::GetCredential(Transaction& t, int64_t id) {
  auto rows = QueryCredentials(t, sql::BuildSelectCredentialById(sql::Dialect::kPostgres, id));
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::CredentialRecord> PgRepository::FindByFileHash(Transaction& t, const std::string& file_hash) {
  auto rows = QueryCredentials(t, sql::BuildSelectCredentialByHash(sql::Dialect::kPostgres, file_hash));
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::CredentialRecord> PgRepository::ListCredentials(Transaction& t, const model::CredentialFilter& filter) {
  return QueryCredentials(t, sql::BuildSelectCredentials(sql::Dialect::kPostgres, filter, false));
}

uint64_t PgRepository::CountCredentials(Transaction& t, const model::CredentialFilter& filter) {
  auto res = Run(t, sql::BuildSelectCredentials(sql::Dialect::kPostgres, filter, true));
  return res[0][0].as<uint64_t>();
}

std::vector<model::CredentialRecord>
PgRepository::LockAvailable(Transaction& t, credpool::model::AssignmentType type, uint32_t limit) {
  if (limit == 0) return {};
  return QueryCredentials(t, sql::BuildLockAvailable(sql::Dialect::kPostgres, type, limit));
}

Result PgRepository::LockCredential(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_params("SELECT id FROM credentials WHERE id=$1 FOR UPDATE NOWAIT;", id);
    if (res.empty()) {
      return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateCredential(Transaction& t, int64_t id, const model::CredentialUpdate& update) {
  if (auto valid = update.Validate(); !valid) return valid;

  try {
    auto res = Run(t, sql::BuildUpdateCredential(sql::Dialect::kPostgres, id, update, util::NowMillis()));
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetCredential(t, id)) {
    return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
  }
  return Result::Err(ErrorCode::Conflict, "credential " + std::to_string(id) + " availability changed");
}

Result PgRepository::DeleteCredential(Transaction& t, int64_t id) {
  try {
    auto res = Run(t, sql::BuildDeleteCredential(sql::Dialect::kPostgres, id));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BatchSummary> PgRepository::ListBatches(Transaction& t, int64_t user_id) {
  auto res = Run(t, sql::BuildSelectBatches(sql::Dialect::kPostgres, user_id));

  std::vector<model::BatchSummary> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::BatchSummary b;
    b.request_batch_id     = row[0].c_str();
    b.first_assigned_at_ms = row[1].as<int64_t>();
    b.credential_count     = row[2].as<uint64_t>();
    out.push_back(std::move(b));
  }
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result PgRepository::PutSetting(Transaction& t, const model::SettingRecord& r) {
  model::SettingRecord stamped = r;
  if (stamped.updated_at_ms == 0) stamped.updated_at_ms = util::NowMillis();

  try {
    Run(t, sql::BuildUpsertSetting(sql::Dialect::kPostgres, stamped));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SettingRecord> PgRepository::GetSetting(Transaction& t, const std::string& key) {
  auto res = Run(t, sql::BuildSelectSetting(sql::Dialect::kPostgres, key));
  if (res.empty()) return std::nullopt;
  return sql::SettingFromRow(PgRow(res[0]));
}

}
