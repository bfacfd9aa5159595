#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace credpool::db::memory {

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
  return util::ToLower(haystack).find(util::ToLower(needle)) != std::string::npos;
}

bool Matches(const model::CredentialRecord& r, const model::CredentialFilter& f) {
  if (f.assignment_type && r.assignment_type != *f.assignment_type) return false;
  if (f.is_available && r.is_available != *f.is_available) return false;
  if (f.is_active && r.is_active != *f.is_active) return false;
  if (f.user_id && r.assigned_to_user_id != f.user_id) return false;
  if (f.instance_id && r.assigned_to_instance_id != f.instance_id) return false;
  if (f.request_batch_id && r.request_batch_id != f.request_batch_id) return false;
  if (f.search && !f.search->empty()) {
    if (!Contains(r.material.ipv4_address, *f.search) && !Contains(r.assigned_to_username, *f.search)) {
      return false;
    }
  }
  return true;
}

std::string NotFoundMessage(int64_t id) {
  return "credential " + std::to_string(id);
}

} // namespace

MemoryRepository::MemoryRepository() : rng_(std::random_device{}()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Locked helpers
// ------------------------------------------------------------------

std::optional<model::CredentialRecord> MemoryRepository::VisibleLocked(const MemoryTransaction& tx, int64_t id) const {
  if (auto w = tx.writes_.find(id); w != tx.writes_.end()) {
    return w->second;
  }
  auto it = committed_.credentials.find(id);
  if (it == committed_.credentials.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CredentialRecord> MemoryRepository::VisibleRowsLocked(const MemoryTransaction& tx) const {
  std::vector<model::CredentialRecord> out;
  out.reserve(committed_.credentials.size() + tx.writes_.size());

  for (const auto& [id, record] : committed_.credentials) {
    if (tx.writes_.count(id) == 0) out.push_back(record);
  }
  for (const auto& [id, image] : tx.writes_) {
    if (image) out.push_back(*image);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

bool MemoryRepository::TryLockRowLocked(MemoryTransaction& tx, int64_t id) {
  auto [it, inserted] = row_locks_.emplace(id, &tx);
  if (!inserted && it->second != &tx) return false;
  tx.locked_.insert(id);
  return true;
}

void MemoryRepository::CommitLocked(MemoryTransaction& tx) {
  for (auto& [id, image] : tx.writes_) {
    auto existing = committed_.credentials.find(id);
    if (existing != committed_.credentials.end() && existing->second.file_hash) {
      committed_.hash_index.erase(*existing->second.file_hash);
    }

    if (!image) {
      if (existing != committed_.credentials.end()) committed_.credentials.erase(existing);
      continue;
    }

    if (image->file_hash) committed_.hash_index[*image->file_hash] = id;
    committed_.credentials[id] = std::move(*image);
  }

  for (auto& [key, setting] : tx.settings_) {
    committed_.settings[key] = std::move(setting);
  }

  tx.writes_.clear();
  tx.settings_.clear();
}

void MemoryRepository::ReleaseLocked(MemoryTransaction& tx) {
  for (int64_t id : tx.locked_) {
    auto it = row_locks_.find(id);
    if (it != row_locks_.end() && it->second == &tx) row_locks_.erase(it);
  }
  for (const auto& hash : tx.claimed_hashes_) {
    auto it = hash_claims_.find(hash);
    if (it != hash_claims_.end() && it->second == &tx) hash_claims_.erase(it);
  }
  tx.locked_.clear();
  tx.claimed_hashes_.clear();
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result MemoryRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (r.file_hash) {
    // an uncommitted insert of the same hash by any transaction counts as present
    if (hash_claims_.count(*r.file_hash) > 0) {
      return Result::Err(ErrorCode::AlreadyExists, "file_hash already imported");
    }
    if (auto it = committed_.hash_index.find(*r.file_hash); it != committed_.hash_index.end()) {
      if (VisibleLocked(tx, it->second)) {
        return Result::Err(ErrorCode::AlreadyExists, "file_hash already imported");
      }
    }
  }

  const auto now = util::NowMillis();
  if (r.created_at_ms == 0) r.created_at_ms = now;
  if (r.updated_at_ms == 0) r.updated_at_ms = now;

  r.id = committed_.next_id++;
  row_locks_[r.id] = &tx;
  tx.locked_.insert(r.id);
  if (r.file_hash) {
    hash_claims_[*r.file_hash] = &tx;
    tx.claimed_hashes_.insert(*r.file_hash);
  }

  tx.writes_[r.id] = r;
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredential(Transaction& t, int64_t id) {
  std::scoped_lock lock(mutex_);
  return VisibleLocked(TX(t), id);
}

std::optional<model::CredentialRecord> MemoryRepository::FindByFileHash(Transaction& t, const std::string& file_hash) {
  std::scoped_lock lock(mutex_);
  for (auto& r : VisibleRowsLocked(TX(t))) {
    if (r.file_hash == file_hash) return std::move(r);
  }
  return std::nullopt;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentials(Transaction& t, const model::CredentialFilter& filter) {
  std::vector<model::CredentialRecord> out;
  {
    std::scoped_lock lock(mutex_);
    for (auto& r : VisibleRowsLocked(TX(t))) {
      if (Matches(r, filter)) out.push_back(std::move(r));
    }
  }

  if (filter.request_batch_id) {
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
      return a.assigned_at_ms < b.assigned_at_ms;
    });
  }

  if (filter.offset > 0) {
    const auto skip = std::min<size_t>(filter.offset, out.size());
    out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(skip));
  }
  if (filter.limit > 0 && out.size() > filter.limit) {
    out.resize(filter.limit);
  }
  return out;
}

uint64_t MemoryRepository::CountCredentials(Transaction& t, const model::CredentialFilter& filter) {
  std::scoped_lock lock(mutex_);
  uint64_t n = 0;
  for (const auto& r : VisibleRowsLocked(TX(t))) {
    if (Matches(r, filter)) ++n;
  }
  return n;
}

std::vector<model::CredentialRecord>
MemoryRepository::LockAvailable(Transaction& t, credpool::model::AssignmentType type, uint32_t limit) {
  if (limit == 0) return {};

  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  std::vector<model::CredentialRecord> candidates;
  for (auto& r : VisibleRowsLocked(tx)) {
    if (r.assignment_type != type || !r.is_available || !r.is_active) continue;

    // skip locked
    auto held = row_locks_.find(r.id);
    if (held != row_locks_.end() && held->second != &tx) continue;

    candidates.push_back(std::move(r));
  }

  std::shuffle(candidates.begin(), candidates.end(), rng_);
  if (candidates.size() > limit) candidates.resize(limit);

  for (const auto& r : candidates) {
    TryLockRowLocked(tx, r.id);
  }
  return candidates;
}

Result MemoryRepository::LockCredential(Transaction& t, int64_t id) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (!VisibleLocked(tx, id)) return Result::Err(ErrorCode::NotFound, NotFoundMessage(id));
  if (!TryLockRowLocked(tx, id)) {
    return Result::Err(ErrorCode::Busy, "credential " + std::to_string(id) + " is locked by another transaction");
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateCredential(Transaction& t, int64_t id, const model::CredentialUpdate& update) {
  if (auto valid = update.Validate(); !valid) return valid;

  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  auto row = VisibleLocked(tx, id);
  if (!row) return Result::Err(ErrorCode::NotFound, NotFoundMessage(id));

  if (!TryLockRowLocked(tx, id)) {
    return Result::Err(ErrorCode::Busy, "credential " + std::to_string(id) + " is locked by another transaction");
  }

  if (update.expect_available && row->is_available != *update.expect_available) {
    return Result::Err(ErrorCode::Conflict, "credential " + std::to_string(id) + " availability changed");
  }

  update.ApplyTo(*row, util::NowMillis());
  tx.writes_[id] = std::move(*row);
  return Result::Ok();
}

Result MemoryRepository::DeleteCredential(Transaction& t, int64_t id) {
  auto& tx = TX(t);
  std::scoped_lock lock(mutex_);

  if (!VisibleLocked(tx, id)) return Result::Err(ErrorCode::NotFound, NotFoundMessage(id));
  if (!TryLockRowLocked(tx, id)) {
    return Result::Err(ErrorCode::Busy, "credential " + std::to_string(id) + " is locked by another transaction");
  }

  tx.writes_[id] = std::nullopt;
  return Result::Ok();
}

std::vector<model::BatchSummary> MemoryRepository::ListBatches(Transaction& t, int64_t user_id) {
  std::map<std::string, model::BatchSummary> by_batch;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& r : VisibleRowsLocked(TX(t))) {
      if (r.assigned_to_user_id != user_id || !r.request_batch_id) continue;

      auto [it, inserted] = by_batch.try_emplace(*r.request_batch_id);
      auto& b             = it->second;
      if (inserted) {
        b.request_batch_id     = *r.request_batch_id;
        b.first_assigned_at_ms = r.assigned_at_ms;
      }
      b.first_assigned_at_ms = std::min(b.first_assigned_at_ms, r.assigned_at_ms);
      ++b.credential_count;
    }
  }

  std::vector<model::BatchSummary> out;
  out.reserve(by_batch.size());
  for (auto& [_, b] : by_batch) out.push_back(std::move(b));

  // newest first, ties by batch id (matches the SQL backends)
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.first_assigned_at_ms > b.first_assigned_at_ms;
  });
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result MemoryRepository::PutSetting(Transaction& t, const model::SettingRecord& r) {
  auto stamped = r;
  if (stamped.updated_at_ms == 0) stamped.updated_at_ms = util::NowMillis();
  TX(t).settings_[r.key] = std::move(stamped);
  return Result::Ok();
}

std::optional<model::SettingRecord> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  auto& tx = TX(t);
  if (auto it = tx.settings_.find(key); it != tx.settings_.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto it = committed_.settings.find(key);
  if (it == committed_.settings.end()) return std::nullopt;
  return it->second;
}

}
