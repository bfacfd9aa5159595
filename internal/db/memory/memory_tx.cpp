#include "memory_tx.hpp"

#include <stdexcept>

namespace credpool::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.CommitLocked(*this);
  repo_.ReleaseLocked(*this);
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  std::scoped_lock lock(repo_.mutex_);
  repo_.ReleaseLocked(*this);
  writes_.clear();
  settings_.clear();
  rolled_back_ = true;
}

} // namespace credpool::db::memory
