#pragma once

#include <cstdint>

#include "internal/db/model/credential_filter.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/credential_update.hpp"
#include "internal/db/model/setting_record.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace credpool::db::sql {

/*
  Statement builders shared by the SQL backends.

  Every builder renders placeholders for the requested dialect and
  returns the ordered parameter list; backends only bind and step.
*/

// INSERT of every column except id. file_hash conflicts are ignored
// (ON CONFLICT DO NOTHING); the caller detects them by affected rows.
Statement BuildInsertCredential(Dialect dialect, const model::CredentialRecord& record);

Statement BuildSelectCredentialById(Dialect dialect, int64_t id);

Statement BuildSelectCredentialByHash(Dialect dialect, const std::string& file_hash);

// count == true renders SELECT COUNT(*) and ignores ordering/paging.
Statement BuildSelectCredentials(Dialect dialect, const model::CredentialFilter& filter, bool count);

/*
  Pool candidates. Postgres appends FOR UPDATE SKIP LOCKED; SQLite
  relies on the write lock BEGIN IMMEDIATE already holds.
*/
Statement BuildLockAvailable(Dialect dialect, credpool::model::AssignmentType type, uint32_t limit);

// UPDATE ... SET <allow-listed fields> WHERE id=? [AND is_available=?]
Statement BuildUpdateCredential(Dialect dialect, int64_t id, const model::CredentialUpdate& update, int64_t now_ms);

Statement BuildDeleteCredential(Dialect dialect, int64_t id);

Statement BuildSelectBatches(Dialect dialect, int64_t user_id);

Statement BuildUpsertSetting(Dialect dialect, const model::SettingRecord& record);

Statement BuildSelectSetting(Dialect dialect, const std::string& key);

model::CredentialRecord CredentialFromRow(const Row& row);

model::SettingRecord SettingFromRow(const Row& row);

} // namespace credpool::db::sql
