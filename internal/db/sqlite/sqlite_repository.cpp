#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/db/sql/credential_sql.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/time.hpp"

namespace credpool::db::sqlite {

using credpool::db::ErrorCode;
using credpool::db::Result;
using sql::Dialect;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

class SqliteRow final : public sql::Row {
public:
    explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

    std::string GetText(int col) const override {
        const unsigned char* t = sqlite3_column_text(st_, col);
        return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st_, col)) : std::string();
    }

    int64_t GetInt64(int col) const override {
        return sqlite3_column_int64(st_, col);
    }

    bool GetBool(int col) const override {
        return sqlite3_column_int(st_, col) != 0;
    }

    bool IsNull(int col) const override {
        return sqlite3_column_type(st_, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* st_;
};

void BindParam(sqlite3_stmt* st, int idx, const sql::Param& p) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, bool>) {
            sqlite3_bind_int(st, idx, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        }
    }, p);
}

StmtPtr PrepareBound(sqlite3* db, const sql::Statement& st) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, st.sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    StmtPtr stmt(raw, &sqlite3_finalize);
    for (size_t i = 0; i < st.params.size(); ++i) {
        BindParam(raw, static_cast<int>(i + 1), st.params[i]);
    }
    return stmt;
}

[[noreturn]] void ThrowQueryError(sqlite3* db, const char* what) {
    throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Execute(sqlite3* db, const sql::Statement& st, int* changes) {
    auto stmt = PrepareBound(db, st);
    if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE && changes) *changes = sqlite3_changes(db);
    return Translate(db, rc);
}

std::vector<model::CredentialRecord> SqliteRepository::QueryCredentials(sqlite3* db, const sql::Statement& st) {
    auto stmt = PrepareBound(db, st);
    if (!stmt) ThrowQueryError(db, "prepare");

    std::vector<model::CredentialRecord> out;
    SqliteRow row(stmt.get());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(sql::CredentialFromRow(row));
    }
    if (rc != SQLITE_DONE) ThrowQueryError(db, "step");
    return out;
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result SqliteRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
    auto* db = TX(t).Handle();

    const auto now = util::NowMillis();
    if (r.created_at_ms == 0) r.created_at_ms = now;
    if (r.updated_at_ms == 0) r.updated_at_ms = now;

    int changes = 0;
    auto res = Execute(db, sql::BuildInsertCredential(Dialect::kSqlite, r), &changes);
    if (!res) return res;

    if (changes == 0) {
        return Result::Err(ErrorCode::AlreadyExists, "file_hash already imported");
    }

    r.id = sqlite3_last_insert_rowid(db);
    return Result::Ok();
}

std::optional<model::CredentialRecord>
SqliteRepository::GetCredential(Transaction& t, int64_t id) {
    auto rows = QueryCredentials(TX(t).Handle(), sql::BuildSelectCredentialById(Dialect::kSqlite, id));
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<model::CredentialRecord>
SqliteRepository::FindByFileHash(Transaction& t, const std::string& file_hash) {
    auto rows = QueryCredentials(TX(t).Handle(), sql::BuildSelectCredentialByHash(Dialect::kSqlite, file_hash));
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<model::CredentialRecord>
SqliteRepository::ListCredentials(Transaction& t, const model::CredentialFilter& filter) {
    return QueryCredentials(TX(t).Handle(), sql::BuildSelectCredentials(Dialect::kSqlite, filter, false));
}

uint64_t SqliteRepository::CountCredentials(Transaction& t, const model::CredentialFilter& filter) {
    auto* db = TX(t).Handle();

    auto stmt = PrepareBound(db, sql::BuildSelectCredentials(Dialect::kSqlite, filter, true));
    if (!stmt) ThrowQueryError(db, "prepare");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) ThrowQueryError(db, "step");
    return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<model::CredentialRecord>
SqliteRepository::LockAvailable(Transaction& t, credpool::model::AssignmentType type, uint32_t limit) {
    if (limit == 0) return {};
    return QueryCredentials(TX(t).Handle(), sql::BuildLockAvailable(Dialect::kSqlite, type, limit));
}

Result SqliteRepository::LockCredential(Transaction& t, int64_t id) {
    // the transaction's write lock already excludes every other writer
    if (!GetCredential(t, id)) {
        return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
    }
    return Result::Ok();
}

Result SqliteRepository::UpdateCredential(Transaction& t, int64_t id, const model::CredentialUpdate& update) {
    if (auto valid = update.Validate(); !valid) return valid;

    auto* db = TX(t).Handle();

    int changes = 0;
    auto res = Execute(db, sql::BuildUpdateCredential(Dialect::kSqlite, id, update, util::NowMillis()), &changes);
    if (!res) return res;
    if (changes > 0) return Result::Ok();

    if (!GetCredential(t, id)) {
        return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
    }
    return Result::Err(ErrorCode::Conflict, "credential " + std::to_string(id) + " availability changed");
}

Result SqliteRepository::DeleteCredential(Transaction& t, int64_t id) {
    int changes = 0;
    auto res = Execute(TX(t).Handle(), sql::BuildDeleteCredential(Dialect::kSqlite, id), &changes);
    if (!res) return res;
    if (changes == 0) return Result::Err(ErrorCode::NotFound, "credential " + std::to_string(id));
    return Result::Ok();
}

std::vector<model::BatchSummary> SqliteRepository::ListBatches(Transaction& t, int64_t user_id) {
    auto* db = TX(t).Handle();

    auto stmt = PrepareBound(db, sql::BuildSelectBatches(Dialect::kSqlite, user_id));
    if (!stmt) ThrowQueryError(db, "prepare");

    std::vector<model::BatchSummary> out;
    SqliteRow row(stmt.get());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        model::BatchSummary b;
        b.request_batch_id     = row.GetText(0);
        b.first_assigned_at_ms = row.GetInt64(1);
        b.credential_count     = static_cast<uint64_t>(row.GetInt64(2));
        out.push_back(std::move(b));
    }
    if (rc != SQLITE_DONE) ThrowQueryError(db, "step");
    return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result SqliteRepository::PutSetting(Transaction& t, const model::SettingRecord& r) {
    model::SettingRecord stamped = r;
    if (stamped.updated_at_ms == 0) stamped.updated_at_ms = util::NowMillis();
    return Execute(TX(t).Handle(), sql::BuildUpsertSetting(Dialect::kSqlite, stamped));
}

std::optional<model::SettingRecord>
SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto stmt = PrepareBound(db, sql::BuildSelectSetting(Dialect::kSqlite, key));
    if (!stmt) ThrowQueryError(db, "prepare");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowQueryError(db, "step");

    return sql::SettingFromRow(SqliteRow(stmt.get()));
}

} // namespace credpool::db::sqlite
