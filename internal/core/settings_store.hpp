#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/model/network_material.hpp"

namespace credpool::core {

// Persisted setting keys.
inline constexpr std::string_view kNamingPatternKey       = "naming_pattern";
inline constexpr std::string_view kServerPublicKeyKey     = "server_public_key";
inline constexpr std::string_view kDnsServersKey          = "dns_servers";
inline constexpr std::string_view kAllowedIpsKey          = "allowed_ips";
inline constexpr std::string_view kMtuKey                 = "mtu";
inline constexpr std::string_view kPersistentKeepaliveKey = "persistent_keepalive";

// Non-empty fields of over replace those of base.
credpool::model::ServerDefaults Overlay(const credpool::model::ServerDefaults& base,
                                        const credpool::model::ServerDefaults& over);

/*
  Server-wide settings.

  Resolution order for server defaults:
    runtime config  <  persisted settings  <  per-call overrides
*/
class SettingsStore {
 public:
  SettingsStore(std::shared_ptr<db::Repository> repository, credpool::model::ServerDefaults configured,
                std::string default_naming_pattern);

  std::string NamingPattern();

  // Throws util::InvalidArgument for a blank pattern.
  void SetNamingPattern(const std::string& pattern);

  // Configured defaults overlaid with the persisted ones.
  credpool::model::ServerDefaults ResolvedServerDefaults();

  // key must be one of the server default keys above.
  void SetServerDefault(std::string_view key, const std::string& value);

  std::optional<std::string> Get(std::string_view key);

 private:
  void Put(std::string_view key, const std::string& value, const std::string& description);

  std::shared_ptr<db::Repository> repository_;
  credpool::model::ServerDefaults configured_;
  std::string                     default_naming_pattern_;
};

} // namespace credpool::core
