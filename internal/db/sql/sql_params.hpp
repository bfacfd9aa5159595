#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace credpool::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding → one builder serves both.

  NOTE: construct text params as std::string explicitly; a bare
  string literal would select the bool alternative.
*/

using Param = std::variant<
    std::nullptr_t,
    bool,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

enum class Dialect {
  kSqlite,
  kPostgres,
};

// n is 1-based.
inline std::string Placeholder(Dialect dialect, size_t n) {
  return dialect == Dialect::kPostgres ? "$" + std::to_string(n) : std::string("?");
}

struct Statement {
  std::string sql;
  Params      params;

  // Appends a parameter and returns its placeholder.
  std::string Bind(Dialect dialect, Param p) {
    params.push_back(std::move(p));
    return Placeholder(dialect, params.size());
  }
};

}
