#pragma once

#include <cstdint>
#include <string>

namespace credpool::db::model {

struct SettingRecord {
  std::string key;
  std::string value;
  std::string description;
  int64_t     updated_at_ms = 0;
};

} // namespace credpool::db::model
