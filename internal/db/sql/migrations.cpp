#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace credpool::db::sql {

namespace {

std::vector<Migration> BuildSqlite() {
  return {
      {1,
       "credentials and settings",
       {"CREATE TABLE IF NOT EXISTS credentials ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " file_hash TEXT UNIQUE,"
        " private_key TEXT NOT NULL,"
        " interface_ip TEXT NOT NULL,"
        " ipv4_address TEXT NOT NULL DEFAULT '',"
        " ipv6_local TEXT NOT NULL DEFAULT '',"
        " ipv6_global TEXT NOT NULL DEFAULT '',"
        " endpoint TEXT NOT NULL,"
        " public_key TEXT, preshared_key TEXT, dns TEXT, mtu TEXT, allowed_ips TEXT,"
        " persistent_keepalive TEXT, route_table TEXT, save_config TEXT, fwmark TEXT,"
        " assignment_type TEXT NOT NULL DEFAULT 'USER_REQUESTABLE',"
        " is_available INTEGER NOT NULL DEFAULT 1,"
        " is_active INTEGER NOT NULL DEFAULT 1,"
        " assigned_to_user_id INTEGER,"
        " assigned_to_instance_id INTEGER,"
        " assigned_to_username TEXT NOT NULL DEFAULT '',"
        " assigned_at_ms INTEGER NOT NULL DEFAULT 0,"
        " request_batch_id TEXT,"
        " created_at_ms INTEGER NOT NULL,"
        " updated_at_ms INTEGER NOT NULL,"
        " CHECK (assigned_to_user_id IS NULL OR assigned_to_instance_id IS NULL));",
        "CREATE TABLE IF NOT EXISTS settings ("
        "setting_key TEXT PRIMARY KEY,"
        " value TEXT NOT NULL,"
        " description TEXT,"
        " updated_at_ms INTEGER NOT NULL);"}},
      {2,
       "pool and owner indexes",
       {"CREATE INDEX IF NOT EXISTS idx_credentials_pool ON credentials(assignment_type, is_available, is_active);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_user ON credentials(assigned_to_user_id);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_instance ON credentials(assigned_to_instance_id);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_batch ON credentials(request_batch_id);"}},
  };
}

std::vector<Migration> BuildPostgres() {
  return {
      {1,
       "credentials and settings",
       {"CREATE TABLE IF NOT EXISTS credentials ("
        "id BIGSERIAL PRIMARY KEY,"
        " file_hash TEXT UNIQUE,"
        " private_key TEXT NOT NULL,"
        " interface_ip TEXT NOT NULL,"
        " ipv4_address TEXT NOT NULL DEFAULT '',"
        " ipv6_local TEXT NOT NULL DEFAULT '',"
        " ipv6_global TEXT NOT NULL DEFAULT '',"
        " endpoint TEXT NOT NULL,"
        " public_key TEXT, preshared_key TEXT, dns TEXT, mtu TEXT, allowed_ips TEXT,"
        " persistent_keepalive TEXT, route_table TEXT, save_config TEXT, fwmark TEXT,"
        " assignment_type TEXT NOT NULL DEFAULT 'USER_REQUESTABLE',"
        " is_available BOOLEAN NOT NULL DEFAULT TRUE,"
        " is_active BOOLEAN NOT NULL DEFAULT TRUE,"
        " assigned_to_user_id BIGINT,"
        " assigned_to_instance_id BIGINT,"
        " assigned_to_username TEXT NOT NULL DEFAULT '',"
        " assigned_at_ms BIGINT NOT NULL DEFAULT 0,"
        " request_batch_id TEXT,"
        " created_at_ms BIGINT NOT NULL,"
        " updated_at_ms BIGINT NOT NULL,"
        " CHECK (assigned_to_user_id IS NULL OR assigned_to_instance_id IS NULL));",
        "CREATE TABLE IF NOT EXISTS settings ("
        "setting_key TEXT PRIMARY KEY,"
        " value TEXT NOT NULL,"
        " description TEXT,"
        " updated_at_ms BIGINT NOT NULL);"}},
      {2,
       "pool and owner indexes",
       {"CREATE INDEX IF NOT EXISTS idx_credentials_pool ON credentials(assignment_type, is_available, is_active);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_user ON credentials(assigned_to_user_id);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_instance ON credentials(assigned_to_instance_id);",
        "CREATE INDEX IF NOT EXISTS idx_credentials_batch ON credentials(request_batch_id);"}},
  };
}

} // namespace

const std::vector<Migration>& SchemaMigrations(Dialect dialect) {
  static const std::vector<Migration> kSqlite   = BuildSqlite();
  static const std::vector<Migration> kPostgres = BuildPostgres();
  return dialect == Dialect::kPostgres ? kPostgres : kSqlite;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS credpool_schema_migrations ("
      "version BIGINT PRIMARY KEY, description TEXT NOT NULL, applied_at_ms BIGINT NOT NULL);");

  const auto current = executor.AppliedVersion();
  int        applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) {
      continue;
    }

    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }

    // descriptions are fixed literals
    executor.ExecuteSQL("INSERT INTO credpool_schema_migrations(version,description,applied_at_ms) VALUES(" +
                        std::to_string(migration.version) + ",'" + migration.description + "'," +
                        std::to_string(util::NowMillis()) + ");");
    ++applied;

    CREDPOOL_LOG_INFO("Applied schema migration", {observability::IntField("version", migration.version),
                                                   observability::StringField("description", migration.description)});
  }

  return applied;
}

} // namespace credpool::db::sql
