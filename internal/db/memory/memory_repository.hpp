#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace credpool::db::memory {

class MemoryTransaction;

/*
  In-process credential store.

  Committed rows live here; every transaction keeps its own write
  overlay and row locks (see MemoryTransaction). Reads see committed
  rows plus the reader's own overlay, never another transaction's.
  Writing a row locks it; a row locked by another transaction yields
  ErrorCode::Busy instead of waiting.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::CredentialRecord>      credentials;
    std::unordered_map<std::string, int64_t>        hash_index;
    std::map<std::string, model::SettingRecord>     settings;
    int64_t                                         next_id = 1;
  };

  // All helpers below expect mutex_ to be held.
  std::optional<model::CredentialRecord> VisibleLocked(const MemoryTransaction& tx, int64_t id) const;
  std::vector<model::CredentialRecord>   VisibleRowsLocked(const MemoryTransaction& tx) const;
  bool                                   TryLockRowLocked(MemoryTransaction& tx, int64_t id);
  void                                   CommitLocked(MemoryTransaction& tx);
  void                                   ReleaseLocked(MemoryTransaction& tx);

  std::mutex mutex_;
  State      committed_;

  std::unordered_map<int64_t, const MemoryTransaction*>     row_locks_;
  std::unordered_map<std::string, const MemoryTransaction*> hash_claims_;

  std::mt19937_64 rng_;
};

}
