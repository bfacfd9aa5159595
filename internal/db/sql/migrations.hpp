#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace credpool::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports the highest
  version already recorded in credpool_schema_migrations.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 when the migrations table is empty.
  virtual int64_t AppliedVersion() = 0;
};

struct Migration {
  int64_t                  version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

// Ordered schema for the given dialect.
const std::vector<Migration>& SchemaMigrations(Dialect dialect);

/*
  Runs pending migrations in order and records each version.
  Returns the number of migrations applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace credpool::db::sql
