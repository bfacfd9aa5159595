#include "wireguard_config.hpp"

#include <optional>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace credpool::codec {

using credpool::model::NetworkMaterial;
using credpool::model::ServerDefaults;

namespace {

enum class Section {
  kNone,
  kInterface,
  kPeer,
  kSkipped,
};

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

void ClassifyAddresses(const std::vector<std::string>& addresses, NetworkMaterial& m) {
  for (const auto& addr : addresses) {
    const std::string bare = addr.substr(0, addr.find('/'));
    const std::string ip   = util::ToLower(bare);

    if (ip.find(':') == std::string::npos) {
      if (m.ipv4_address.empty() && ip.find('.') != std::string::npos) m.ipv4_address = bare;
    } else if (StartsWith(ip, "fd00:") || StartsWith(ip, "fe80:")) {
      if (m.ipv6_local.empty()) m.ipv6_local = bare;
    } else if (m.ipv6_global.empty()) {
      m.ipv6_global = bare;
    }
  }
}

std::optional<std::string> Resolve(const std::optional<std::string>& own, const std::string& fallback) {
  if (own) return own;
  if (!fallback.empty()) return fallback;
  return std::nullopt;
}

void AppendLine(std::string& out, std::string_view key, const std::optional<std::string>& value) {
  if (!value) return;
  out.append(key);
  if (value->empty()) {
    out.append(" =");
  } else {
    out.append(" = ");
    out.append(*value);
  }
  out.push_back('\n');
}

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

NetworkMaterial ParseWireGuardConfig(std::string_view text, std::string_view endpoint_override) {
  NetworkMaterial          m;
  std::vector<std::string> addresses;
  std::string              parsed_endpoint;
  bool                     seen_peer = false;
  Section                  section   = Section::kNone;

  if (StartsWith(text, kUtf8Bom)) text.remove_prefix(kUtf8Bom.size());

  for (const auto& raw : util::Split(text, '\n')) {
    const auto line = util::Trim(raw);
    if (line.empty() || line.front() == '#' || line.front() == ';') continue;

    if (line.front() == '[') {
      // anything after the closing bracket is a comment
      const auto name = util::ToLower(line.substr(0, line.find(']') + 1));
      if (name == "[interface]") {
        section = Section::kInterface;
      } else if (name == "[peer]") {
        section   = seen_peer ? Section::kSkipped : Section::kPeer;
        seen_peer = true;
      } else {
        section = Section::kSkipped;
      }
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string_view::npos) continue;

    const auto key   = util::ToLower(util::Trim(line.substr(0, eq)));
    const auto value = std::string(util::Trim(line.substr(eq + 1)));

    if (section == Section::kInterface) {
      if (key == "privatekey") {
        m.private_key = value;
      } else if (key == "address") {
        for (const auto& part : util::Split(value, ',')) {
          const auto addr = util::Trim(part);
          if (!addr.empty()) addresses.emplace_back(addr);
        }
      } else if (key == "dns") {
        m.dns = value;
      } else if (key == "mtu") {
        m.mtu = value;
      } else if (key == "table") {
        m.table = value;
      } else if (key == "saveconfig") {
        m.save_config = value;
      } else if (key == "fwmark") {
        m.fwmark = value;
      }
    } else if (section == Section::kPeer) {
      if (key == "publickey") {
        m.public_key = value;
      } else if (key == "presharedkey") {
        m.preshared_key = value;
      } else if (key == "endpoint") {
        parsed_endpoint = value;
      } else if (key == "allowedips") {
        m.allowed_ips = value;
      } else if (key == "persistentkeepalive") {
        m.persistent_keepalive = value;
      }
    }
  }

  const auto override_value = util::Trim(endpoint_override);
  m.endpoint = override_value.empty() ? parsed_endpoint : std::string(override_value);

  std::string missing;
  auto        note_missing = [&missing](std::string_view field) {
    if (!missing.empty()) missing += ", ";
    missing += field;
  };
  if (m.private_key.empty()) note_missing("PrivateKey");
  if (addresses.empty()) note_missing("Address");
  if (m.endpoint.empty()) note_missing("Endpoint");
  if (!missing.empty()) {
    throw util::MalformedConfig("Invalid WireGuard config - missing required fields: " + missing);
  }

  for (const auto& addr : addresses) {
    if (!m.interface_ip.empty()) m.interface_ip += ",";
    m.interface_ip += addr;
  }
  ClassifyAddresses(addresses, m);

  return m;
}

std::string GenerateWireGuardConfig(const NetworkMaterial& m, const ServerDefaults& defaults) {
  std::string out;
  out.reserve(256);

  out += "[Interface]\n";
  AppendLine(out, "PrivateKey", m.private_key);
  AppendLine(out, "Address", m.interface_ip);
  AppendLine(out, "DNS", Resolve(m.dns, defaults.dns_servers));
  AppendLine(out, "MTU", Resolve(m.mtu, defaults.mtu));
  AppendLine(out, "Table", m.table);
  AppendLine(out, "SaveConfig", m.save_config);
  AppendLine(out, "FwMark", m.fwmark);

  out += "\n[Peer]\n";
  AppendLine(out, "PublicKey", Resolve(m.public_key, defaults.public_key));
  AppendLine(out, "PresharedKey", m.preshared_key);
  AppendLine(out, "Endpoint", m.endpoint);
  AppendLine(out, "AllowedIPs", Resolve(m.allowed_ips, defaults.allowed_ips));

  auto keepalive = Resolve(m.persistent_keepalive, defaults.persistent_keepalive);
  AppendLine(out, "PersistentKeepalive", keepalive ? *keepalive : std::string(kDefaultPersistentKeepalive));

  return out;
}

} // namespace credpool::codec
