#include "settings_store.hpp"

#include <array>
#include <utility>

#include "internal/core/db_errors.hpp"
#include "internal/naming/naming_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace credpool::core {

using credpool::model::ServerDefaults;

namespace {

template <typename Defaults>
auto Field(Defaults& d, std::string_view key) -> decltype(&d.public_key) {
  if (key == kServerPublicKeyKey) return &d.public_key;
  if (key == kDnsServersKey) return &d.dns_servers;
  if (key == kAllowedIpsKey) return &d.allowed_ips;
  if (key == kMtuKey) return &d.mtu;
  if (key == kPersistentKeepaliveKey) return &d.persistent_keepalive;
  return nullptr;
}

constexpr std::array<std::string_view, 5> kServerDefaultKeys = {
    kServerPublicKeyKey, kDnsServersKey, kAllowedIpsKey, kMtuKey, kPersistentKeepaliveKey,
};

} // namespace

ServerDefaults Overlay(const ServerDefaults& base, const ServerDefaults& over) {
  ServerDefaults out = base;
  for (const auto key : kServerDefaultKeys) {
    const auto* value = Field(over, key);
    if (!value->empty()) *Field(out, key) = *value;
  }
  return out;
}

SettingsStore::SettingsStore(std::shared_ptr<db::Repository> repository, ServerDefaults configured,
                             std::string default_naming_pattern)
    : repository_(std::move(repository)),
      configured_(std::move(configured)),
      default_naming_pattern_(default_naming_pattern.empty() ? std::string(naming::kDefaultNamingPattern)
                                                             : std::move(default_naming_pattern)) {
}

std::optional<std::string> SettingsStore::Get(std::string_view key) {
  auto tx      = repository_->Begin();
  auto setting = repository_->GetSetting(*tx, std::string(key));
  tx->Commit();
  if (!setting) return std::nullopt;
  return setting->value;
}

void SettingsStore::Put(std::string_view key, const std::string& value, const std::string& description) {
  db::model::SettingRecord record;
  record.key         = std::string(key);
  record.value       = value;
  record.description = description;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutSetting(*tx, record), "store setting " + record.key);
  tx->Commit();
}

std::string SettingsStore::NamingPattern() {
  auto stored = Get(kNamingPatternKey);
  return stored && !stored->empty() ? *stored : default_naming_pattern_;
}

void SettingsStore::SetNamingPattern(const std::string& pattern) {
  if (util::Trim(pattern).empty()) {
    throw util::InvalidArgument("naming pattern must not be empty");
  }
  Put(kNamingPatternKey, pattern, "Default filename pattern for config downloads");
}

ServerDefaults SettingsStore::ResolvedServerDefaults() {
  ServerDefaults persisted;
  for (const auto key : kServerDefaultKeys) {
    if (auto value = Get(key)) *Field(persisted, key) = *value;
  }
  return Overlay(configured_, persisted);
}

void SettingsStore::SetServerDefault(std::string_view key, const std::string& value) {
  ServerDefaults probe;
  if (!Field(probe, key)) {
    throw util::InvalidArgument("unknown server setting '" + std::string(key) + "'");
  }
  Put(key, std::string(util::Trim(value)), "Server default for generated configs");
}

} // namespace credpool::core
