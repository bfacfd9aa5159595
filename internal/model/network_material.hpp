#pragma once

#include <optional>
#include <string>

namespace credpool::model {

/*
  WireGuard material carried by one credential.

  Optional fields are std::nullopt when the imported source did not
  contain the key; an empty string means the key was present with no
  value. Only the former is filled from server defaults on output.
*/
struct NetworkMaterial {
  std::string private_key;

  // Comma-joined CIDR list, no spaces.
  std::string interface_ip;

  // Derived from interface_ip; empty when no address of that family.
  std::string ipv4_address;
  std::string ipv6_local;
  std::string ipv6_global;

  std::string endpoint;

  std::optional<std::string> public_key;
  std::optional<std::string> preshared_key;

  std::optional<std::string> dns;
  std::optional<std::string> mtu;
  std::optional<std::string> allowed_ips;
  std::optional<std::string> persistent_keepalive;
  std::optional<std::string> table;
  std::optional<std::string> save_config;
  std::optional<std::string> fwmark;

  bool operator==(const NetworkMaterial&) const = default;
};

/*
  Server-wide fallbacks for fields a credential does not carry.
  Empty string = no default.
*/
struct ServerDefaults {
  std::string public_key;
  std::string dns_servers;
  std::string allowed_ips;
  std::string mtu;
  std::string persistent_keepalive;
};

} // namespace credpool::model
