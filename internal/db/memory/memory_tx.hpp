#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace credpool::db::memory {

/*
  Transaction = write overlay + row locks

  writes maps id -> new row image (nullopt = deleted). Locks and
  file_hash claims are released on Commit(), Rollback() or destruction.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  friend class MemoryRepository;

  MemoryRepository& repo_;

  std::map<int64_t, std::optional<model::CredentialRecord>> writes_;
  std::map<std::string, model::SettingRecord>               settings_;
  std::set<int64_t>                                         locked_;
  std::set<std::string>                                     claimed_hashes_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace credpool::db::memory
