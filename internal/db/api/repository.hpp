#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/credential_filter.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/credential_update.hpp"
#include "internal/db/model/setting_record.hpp"

namespace credpool::db {

/*
  Repository abstraction (the credential store).

  CRITICAL GUARANTEES:

  - All reads and writes take an explicit Transaction
  - Reads inside a transaction see its writes
  - file_hash is unique across the table; a duplicate insert
    returns AlreadyExists and changes nothing
  - LockAvailable never waits on a row held by another transaction
  - UpdateCredential applies only the allow-listed CredentialUpdate
    fields and only after Validate() succeeds

  The DB is the source of truth for:
    availability / assignment state
    pool classification
    server settings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  // Assigns record.id (and created/updated timestamps when zero).
  virtual Result InsertCredential(Transaction&, model::CredentialRecord& record) = 0;

  virtual std::optional<model::CredentialRecord> GetCredential(Transaction&, int64_t id) = 0;

  virtual std::optional<model::CredentialRecord> FindByFileHash(Transaction&, const std::string& file_hash) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentials(Transaction&, const model::CredentialFilter& filter) = 0;

  virtual uint64_t CountCredentials(Transaction&, const model::CredentialFilter& filter) = 0;

  /*
    Selects up to `limit` active, available rows of the given pool in
    random order and locks them for this transaction. Rows locked by a
    concurrent transaction are skipped, never waited on.
  */
  virtual std::vector<model::CredentialRecord> LockAvailable(Transaction&, credpool::model::AssignmentType type, uint32_t limit) = 0;

  // Locks one row without waiting; Busy if another transaction holds it.
  virtual Result LockCredential(Transaction&, int64_t id) = 0;

  virtual Result UpdateCredential(Transaction&, int64_t id, const model::CredentialUpdate& update) = 0;

  virtual Result DeleteCredential(Transaction&, int64_t id) = 0;

  // Distinct request batches of one user, newest first.
  virtual std::vector<model::BatchSummary> ListBatches(Transaction&, int64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual Result PutSetting(Transaction&, const model::SettingRecord&) = 0;

  virtual std::optional<model::SettingRecord> GetSetting(Transaction&, const std::string& key) = 0;
};

} // namespace credpool::db
