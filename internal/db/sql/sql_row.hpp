#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace credpool::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into repository logic.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual bool GetBool(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  std::optional<std::string> GetOptionalText(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetText(col);
  }

  std::optional<int64_t> GetOptionalInt64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetInt64(col);
  }
};

}
