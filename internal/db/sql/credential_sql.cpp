#include "credential_sql.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"

namespace credpool::db::sql {

namespace {

using credpool::model::AssignmentType;

Param OptText(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return Param{std::string(*v)};
}

Param OptInt(const std::optional<int64_t>& v) {
  if (!v) return nullptr;
  return Param{*v};
}

Param TypeName(AssignmentType type) {
  return Param{std::string(credpool::model::ToString(type))};
}

std::string SelectFrom() {
  return std::string("SELECT ") + CREDENTIAL_COLUMNS + " FROM credentials";
}

// Column -> value pairs, last write wins, first-insertion order kept.
class SetList {
 public:
  void Set(const std::string& column, Param value) {
    for (auto& [c, v] : entries_) {
      if (c == column) {
        v = std::move(value);
        return;
      }
    }
    entries_.emplace_back(column, std::move(value));
  }

  void Render(Dialect dialect, Statement& st) const {
    bool first = true;
    for (const auto& [column, value] : entries_) {
      st.sql += first ? " " : ",";
      first = false;
      st.sql += column + "=" + st.Bind(dialect, value);
    }
  }

 private:
  std::vector<std::pair<std::string, Param>> entries_;
};

void AppendSearch(Dialect dialect, const std::string& needle, Statement& st) {
  const auto fn = dialect == Dialect::kPostgres ? std::string("strpos") : std::string("instr");
  st.sql += " AND (" + fn + "(lower(ipv4_address),lower(" + st.Bind(dialect, std::string(needle)) + "))>0";
  st.sql += " OR " + fn + "(lower(assigned_to_username),lower(" + st.Bind(dialect, std::string(needle)) + "))>0)";
}

} // namespace

Statement BuildInsertCredential(Dialect dialect, const model::CredentialRecord& r) {
  const auto& m = r.material;

  Statement st;
  std::string values;
  auto add = [&](Param p) {
    if (!values.empty()) values += ",";
    values += st.Bind(dialect, std::move(p));
  };

  add(OptText(r.file_hash));
  add(std::string(m.private_key));
  add(std::string(m.interface_ip));
  add(std::string(m.ipv4_address));
  add(std::string(m.ipv6_local));
  add(std::string(m.ipv6_global));
  add(std::string(m.endpoint));
  add(OptText(m.public_key));
  add(OptText(m.preshared_key));
  add(OptText(m.dns));
  add(OptText(m.mtu));
  add(OptText(m.allowed_ips));
  add(OptText(m.persistent_keepalive));
  add(OptText(m.table));
  add(OptText(m.save_config));
  add(OptText(m.fwmark));
  add(TypeName(r.assignment_type));
  add(r.is_available);
  add(r.is_active);
  add(OptInt(r.assigned_to_user_id));
  add(OptInt(r.assigned_to_instance_id));
  add(std::string(r.assigned_to_username));
  add(r.assigned_at_ms);
  add(OptText(r.request_batch_id));
  add(r.created_at_ms);
  add(r.updated_at_ms);

  st.sql = std::string("INSERT INTO credentials(") + CREDENTIAL_INSERT_COLUMNS + ") VALUES(" + values + ")" +
           " ON CONFLICT(file_hash) DO NOTHING";
  if (dialect == Dialect::kPostgres) {
    st.sql += " RETURNING id";
  }
  st.sql += ";";
  return st;
}

Statement BuildSelectCredentialById(Dialect dialect, int64_t id) {
  Statement st;
  st.sql = SelectFrom() + " WHERE id=" + st.Bind(dialect, id) + ";";
  return st;
}

Statement BuildSelectCredentialByHash(Dialect dialect, const std::string& file_hash) {
  Statement st;
  st.sql = SelectFrom() + " WHERE file_hash=" + st.Bind(dialect, std::string(file_hash)) + ";";
  return st;
}

Statement BuildSelectCredentials(Dialect dialect, const model::CredentialFilter& f, bool count) {
  Statement st;
  st.sql = count ? std::string("SELECT COUNT(*) FROM credentials") : SelectFrom();
  st.sql += " WHERE 1=1";

  if (f.assignment_type) st.sql += " AND assignment_type=" + st.Bind(dialect, TypeName(*f.assignment_type));
  if (f.is_available) st.sql += " AND is_available=" + st.Bind(dialect, *f.is_available);
  if (f.is_active) st.sql += " AND is_active=" + st.Bind(dialect, *f.is_active);
  if (f.user_id) st.sql += " AND assigned_to_user_id=" + st.Bind(dialect, *f.user_id);
  if (f.instance_id) st.sql += " AND assigned_to_instance_id=" + st.Bind(dialect, *f.instance_id);
  if (f.request_batch_id) st.sql += " AND request_batch_id=" + st.Bind(dialect, std::string(*f.request_batch_id));
  if (f.search && !f.search->empty()) AppendSearch(dialect, *f.search, st);

  if (count) {
    st.sql += ";";
    return st;
  }

  st.sql += f.request_batch_id ? " ORDER BY assigned_at_ms, id" : " ORDER BY id";

  if (f.limit > 0) {
    st.sql += " LIMIT " + st.Bind(dialect, static_cast<int64_t>(f.limit));
  } else if (f.offset > 0 && dialect == Dialect::kSqlite) {
    st.sql += " LIMIT -1";
  }
  if (f.offset > 0) {
    st.sql += " OFFSET " + st.Bind(dialect, static_cast<int64_t>(f.offset));
  }
  st.sql += ";";
  return st;
}

Statement BuildLockAvailable(Dialect dialect, AssignmentType type, uint32_t limit) {
  Statement st;
  st.sql = SelectFrom() + " WHERE assignment_type=" + st.Bind(dialect, TypeName(type));
  st.sql += " AND is_available=" + st.Bind(dialect, true);
  st.sql += " AND is_active=" + st.Bind(dialect, true);
  st.sql += " ORDER BY RANDOM() LIMIT " + st.Bind(dialect, static_cast<int64_t>(limit));
  if (dialect == Dialect::kPostgres) {
    st.sql += " FOR UPDATE SKIP LOCKED";
  }
  st.sql += ";";
  return st;
}

Statement BuildUpdateCredential(Dialect dialect, int64_t id, const model::CredentialUpdate& u, int64_t now_ms) {
  SetList sets;

  if (u.clear_assignment) {
    sets.Set("assigned_to_user_id", nullptr);
    sets.Set("assigned_to_instance_id", nullptr);
    sets.Set("assigned_to_username", std::string());
    sets.Set("assigned_at_ms", int64_t{0});
    sets.Set("request_batch_id", nullptr);
    sets.Set("is_available", true);
  }
  if (u.assign) {
    sets.Set("assigned_to_user_id", OptInt(u.assign->user_id));
    sets.Set("assigned_to_instance_id", OptInt(u.assign->instance_id));
    sets.Set("assigned_to_username", std::string(u.assign->username));
    sets.Set("assigned_at_ms", u.assign->assigned_at_ms);
    sets.Set("request_batch_id", OptText(u.assign->request_batch_id));
    sets.Set("is_available", false);
  }
  if (u.link_instance_id) sets.Set("assigned_to_instance_id", *u.link_instance_id);
  if (u.assignment_type) sets.Set("assignment_type", TypeName(*u.assignment_type));
  if (u.is_available) sets.Set("is_available", *u.is_available);
  if (u.is_active) sets.Set("is_active", *u.is_active);
  sets.Set("updated_at_ms", now_ms);

  Statement st;
  st.sql = "UPDATE credentials SET";
  sets.Render(dialect, st);
  st.sql += " WHERE id=" + st.Bind(dialect, id);
  if (u.expect_available) {
    st.sql += " AND is_available=" + st.Bind(dialect, *u.expect_available);
  }
  st.sql += ";";
  return st;
}

Statement BuildDeleteCredential(Dialect dialect, int64_t id) {
  Statement st;
  st.sql = "DELETE FROM credentials WHERE id=" + st.Bind(dialect, id) + ";";
  return st;
}

Statement BuildSelectBatches(Dialect dialect, int64_t user_id) {
  Statement st;
  st.sql = "SELECT request_batch_id,MIN(assigned_at_ms),COUNT(*) FROM credentials WHERE assigned_to_user_id=" +
           st.Bind(dialect, user_id) + SELECT_BATCHES_FOR_USER_TAIL;
  return st;
}

Statement BuildUpsertSetting(Dialect dialect, const model::SettingRecord& r) {
  Statement st;
  st.sql = std::string("INSERT INTO settings(") + SELECT_SETTING_COLUMNS + ") VALUES(";
  st.sql += st.Bind(dialect, std::string(r.key)) + ",";
  st.sql += st.Bind(dialect, std::string(r.value)) + ",";
  st.sql += st.Bind(dialect, std::string(r.description)) + ",";
  st.sql += st.Bind(dialect, r.updated_at_ms) + ")";
  st.sql += UPSERT_SETTING_TAIL;
  return st;
}

Statement BuildSelectSetting(Dialect dialect, const std::string& key) {
  Statement st;
  st.sql = std::string("SELECT ") + SELECT_SETTING_COLUMNS + " FROM settings WHERE setting_key=" +
           st.Bind(dialect, std::string(key)) + ";";
  return st;
}

model::CredentialRecord CredentialFromRow(const Row& row) {
  model::CredentialRecord r;
  auto&                   m = r.material;

  r.id        = row.GetInt64(0);
  r.file_hash = row.GetOptionalText(1);

  m.private_key          = row.GetText(2);
  m.interface_ip         = row.GetText(3);
  m.ipv4_address         = row.GetText(4);
  m.ipv6_local           = row.GetText(5);
  m.ipv6_global          = row.GetText(6);
  m.endpoint             = row.GetText(7);
  m.public_key           = row.GetOptionalText(8);
  m.preshared_key        = row.GetOptionalText(9);
  m.dns                  = row.GetOptionalText(10);
  m.mtu                  = row.GetOptionalText(11);
  m.allowed_ips          = row.GetOptionalText(12);
  m.persistent_keepalive = row.GetOptionalText(13);
  m.table                = row.GetOptionalText(14);
  m.save_config          = row.GetOptionalText(15);
  m.fwmark               = row.GetOptionalText(16);

  const auto type_name = row.GetText(17);
  const auto type      = credpool::model::ParseAssignmentType(type_name);
  if (!type) {
    throw std::runtime_error("credential " + std::to_string(r.id) + " has unknown assignment_type '" + type_name + "'");
  }
  r.assignment_type = *type;

  r.is_available            = row.GetBool(18);
  r.is_active               = row.GetBool(19);
  r.assigned_to_user_id     = row.GetOptionalInt64(20);
  r.assigned_to_instance_id = row.GetOptionalInt64(21);
  r.assigned_to_username    = row.IsNull(22) ? std::string() : row.GetText(22);
  r.assigned_at_ms          = row.IsNull(23) ? 0 : row.GetInt64(23);
  r.request_batch_id        = row.GetOptionalText(24);
  r.created_at_ms           = row.GetInt64(25);
  r.updated_at_ms           = row.GetInt64(26);
  return r;
}

model::SettingRecord SettingFromRow(const Row& row) {
  model::SettingRecord r;
  r.key           = row.GetText(0);
  r.value         = row.GetText(1);
  r.description   = row.IsNull(2) ? std::string() : row.GetText(2);
  r.updated_at_ms = row.GetInt64(3);
  return r;
}

} // namespace credpool::db::sql
