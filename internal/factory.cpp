#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/assignment_type_manager.hpp"
#include "internal/core/credential_lifecycle.hpp"
#include "internal/core/pool_allocator.hpp"
#include "internal/core/settings_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/importer/import_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if CREDPOOL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CREDPOOL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace credpool::factory {

namespace {

#if CREDPOOL_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int64_t AppliedVersion() override {
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(
        db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM credpool_schema_migrations;"), &sqlite3_finalize);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
      throw std::runtime_error(std::string("sqlite migrations: ") + sqlite3_errmsg(db_.Handle()));
    }
    return sqlite3_column_int64(stmt.get(), 0);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void MigrateSqlite(db::sqlite::SqliteDB& sqlite_db) {
  // one writer at a time across processes
  sqlite_db.Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SchemaMigrations(db::sql::Dialect::kSqlite));
    sqlite_db.Exec("COMMIT;");
  } catch (const std::exception&) {
    std::string ignored;
    (void)sqlite_db.TryExec("ROLLBACK;", &ignored);
    throw;
  }
}
#endif

#if CREDPOOL_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  int64_t AppliedVersion() override {
    return tx_.query_value<int64_t>("SELECT COALESCE(MAX(version), 0) FROM credpool_schema_migrations;");
  }

 private:
  pqxx::work& tx_;
};

void MigratePostgres(db::postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  // serialises concurrent migrators until commit
  tx.exec("SELECT pg_advisory_xact_lock(7340021);");

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::SchemaMigrations(db::sql::Dialect::kPostgres));
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const credpool::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CREDPOOL_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(),
                                                            static_cast<int>(database.sqlite().busy_timeout_ms()));
    MigrateSqlite(*sqlite_db);
    CREDPOOL_LOG_INFO("Opened credential store", {observability::StringField("backend", "sqlite"),
                                                  observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CREDPOOL_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections());
    MigratePostgres(*pool);
    CREDPOOL_LOG_INFO("Opened credential store", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CREDPOOL_LOG_INFO("Opened credential store", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const credpool::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);

  core::AllocatorOptions allocator_options;
  allocator_options.max_claim_attempts = config.allocator().max_claim_attempts();
  allocator_options.max_request_count  = config.allocator().max_request_count();

  importer::ImportOptions import_options;
  import_options.max_archive_bytes   = config.importer().max_archive_bytes();
  import_options.max_entry_bytes     = config.importer().max_entry_bytes();
  import_options.max_reported_errors = config.importer().max_reported_errors();
  import_options.max_attempts        = allocator_options.max_claim_attempts;

  credpool::model::ServerDefaults defaults;
  const auto&                     configured = config.server_defaults();
  defaults.public_key  = configured.public_key();
  defaults.dns_servers = configured.dns_servers();
  defaults.allowed_ips = configured.allowed_ips();
  if (configured.mtu() != 0) defaults.mtu = std::to_string(configured.mtu());
  if (configured.persistent_keepalive() != 0) {
    defaults.persistent_keepalive = std::to_string(configured.persistent_keepalive());
  }

  const auto attempts = allocator_options.max_claim_attempts;

  service::ServiceContext ctx;
  ctx.allocator        = std::make_shared<core::PoolAllocator>(app.repository, allocator_options);
  ctx.assignment_types = std::make_shared<core::AssignmentTypeManager>(app.repository, attempts);
  ctx.lifecycle        = std::make_shared<core::CredentialLifecycle>(app.repository, attempts);
  ctx.settings         = std::make_shared<core::SettingsStore>(app.repository, std::move(defaults),
                                                               config.naming().default_pattern());
  ctx.importer         = std::make_shared<importer::ImportPipeline>(app.repository, import_options);

  app.pool_service = std::make_shared<service::PoolService>(std::move(ctx));
  return app;
}

} // namespace credpool::factory
