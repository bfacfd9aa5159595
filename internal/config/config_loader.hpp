#pragma once

#include <string>

#include "config/config.pb.h"

namespace credpool::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys
  are rejected. Unset numeric limits are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static credpool::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every zero/empty field that has a built-in default.
  // A config without a database section gets the memory backend.
  static void ApplyDefaults(credpool::runtime::config::RuntimeConfig& config);
};

} // namespace credpool::config
