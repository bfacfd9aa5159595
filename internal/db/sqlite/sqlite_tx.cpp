#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

namespace credpool::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), writer_(db_->WriterMutex(), std::defer_lock) {
  if (!writer_.try_lock_for(db_->BusyTimeout())) {
    throw db::TransactionConflict("sqlite: timed out waiting for the writer lock");
  }

  std::string err;
  const int   rc = db_->TryExec("BEGIN IMMEDIATE;", &err);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw db::TransactionConflict("sqlite: " + err);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite begin: " + err);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    (void)db_->TryExec("ROLLBACK;", nullptr);
  }
}

void SqliteTransaction::Commit() {
  std::string err;
  const int   rc = db_->TryExec("COMMIT;", &err);
  if (rc == SQLITE_BUSY) {
    (void)db_->TryExec("ROLLBACK;", nullptr);
    finished_ = true;
    writer_.unlock();
    throw db::TransactionConflict("sqlite commit: " + err);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite commit: " + err);
  }
  committed_ = true;
  finished_  = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
  writer_.unlock();
}

} // namespace credpool::db::sqlite
