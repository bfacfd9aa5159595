#include "internal/codec/wireguard_config.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using credpool::codec::GenerateWireGuardConfig;
using credpool::codec::ParseWireGuardConfig;
using credpool::model::ServerDefaults;

const std::string kCanonical =
    "[Interface]\n"
    "PrivateKey = aGVsbG8td29ybGQ=\n"
    "Address = 10.8.0.2/32,fd00::2/128,2001:db8::2/128\n"
    "DNS = 1.1.1.1\n"
    "MTU = 1420\n"
    "Table = off\n"
    "SaveConfig = false\n"
    "FwMark = 0x1\n"
    "\n"
    "[Peer]\n"
    "PublicKey = c2VydmVy\n"
    "PresharedKey = cHNr\n"
    "Endpoint = vpn.example.net:51820\n"
    "AllowedIPs = 0.0.0.0/0,::/0\n"
    "PersistentKeepalive = 15\n";

void TestCanonicalTextRoundTrips() {
  const auto material = ParseWireGuardConfig(kCanonical);
  assert(GenerateWireGuardConfig(material) == kCanonical);

  // a fully specified config ignores the server defaults
  ServerDefaults defaults;
  defaults.public_key           = "other";
  defaults.dns_servers          = "9.9.9.9";
  defaults.allowed_ips          = "10.0.0.0/8";
  defaults.mtu                  = "1280";
  defaults.persistent_keepalive = "60";
  assert(GenerateWireGuardConfig(material, defaults) == kCanonical);
}

void TestAddressesAreClassified() {
  const auto m = ParseWireGuardConfig(kCanonical);
  assert(m.interface_ip == "10.8.0.2/32,fd00::2/128,2001:db8::2/128");
  assert(m.ipv4_address == "10.8.0.2");
  assert(m.ipv6_local == "fd00::2");
  assert(m.ipv6_global == "2001:db8::2");
}

void TestKeysAreCaseInsensitiveAndCommentsSkipped() {
  const auto m = ParseWireGuardConfig("# exported by the provider\n"
                                      "[interface]\n"
                                      "  privatekey =  a2V5  \r\n"
                                      "; inline note\n"
                                      "ADDRESS = 10.0.0.7/32\n"
                                      "address = fd00::7/128\n"
                                      "[PEER]\n"
                                      "endPoint = 203.0.113.5:51820\n");
  assert(m.private_key == "a2V5");
  assert(m.interface_ip == "10.0.0.7/32,fd00::7/128");
  assert(m.endpoint == "203.0.113.5:51820");
  assert(!m.public_key.has_value());
  assert(!m.dns.has_value());
}

void TestOnlyFirstPeerIsRead() {
  const auto m = ParseWireGuardConfig("[Interface]\nPrivateKey = a\nAddress = 10.0.0.1/32\n"
                                      "[Peer]\nPublicKey = first\nEndpoint = one:1\n"
                                      "[Peer]\nPublicKey = second\nEndpoint = two:2\n");
  assert(m.public_key == std::string("first"));
  assert(m.endpoint == "one:1");
}

void TestEndpointOverrideWins() {
  const auto m = ParseWireGuardConfig(kCanonical, " gw.internal:443 ");
  assert(m.endpoint == "gw.internal:443");

  // the override also satisfies a missing Endpoint
  const auto bare = ParseWireGuardConfig("[Interface]\nPrivateKey = a\nAddress = 10.0.0.1/32\n", "gw:1");
  assert(bare.endpoint == "gw:1");
}

void TestMissingFieldsAreNamedInOrder() {
  bool threw = false;
  try {
    ParseWireGuardConfig("[Interface]\nDNS = 1.1.1.1\n[Peer]\nPublicKey = x\n");
  } catch (const credpool::util::MalformedConfig& e) {
    threw = true;
    assert(std::string(e.what()) ==
           "Invalid WireGuard config - missing required fields: PrivateKey, Address, Endpoint");
  }
  assert(threw);

  threw = false;
  try {
    ParseWireGuardConfig("[Interface]\nPrivateKey = a\nAddress = 10.0.0.1/32\n");
  } catch (const credpool::util::MalformedConfig& e) {
    threw = true;
    assert(std::string(e.what()) == "Invalid WireGuard config - missing required fields: Endpoint");
  }
  assert(threw);
}

void TestDefaultsFillOnlyAbsentFields() {
  const auto m = ParseWireGuardConfig("[Interface]\nPrivateKey = a\nAddress = 10.0.0.1/32\nMTU = 1380\n"
                                      "[Peer]\nEndpoint = vpn:51820\n");

  ServerDefaults defaults;
  defaults.public_key  = "c2VydmVy";
  defaults.dns_servers = "10.0.0.53";
  defaults.mtu         = "1280";

  const std::string expected =
      "[Interface]\n"
      "PrivateKey = a\n"
      "Address = 10.0.0.1/32\n"
      "DNS = 10.0.0.53\n"
      "MTU = 1380\n"
      "\n"
      "[Peer]\n"
      "PublicKey = c2VydmVy\n"
      "Endpoint = vpn:51820\n"
      "PersistentKeepalive = 25\n";
  assert(GenerateWireGuardConfig(m, defaults) == expected);
}

void TestMinimalConfigGetsDefaultKeepalive() {
  const auto m = ParseWireGuardConfig("[Interface]\nPrivateKey = a\nAddress = 10.0.0.1/32\n[Peer]\nEndpoint = vpn:1\n");
  const std::string expected =
      "[Interface]\n"
      "PrivateKey = a\n"
      "Address = 10.0.0.1/32\n"
      "\n"
      "[Peer]\n"
      "Endpoint = vpn:1\n"
      "PersistentKeepalive = 25\n";
  assert(GenerateWireGuardConfig(m) == expected);
}

void TestByteOrderMarkIsIgnored() {
  const auto m = ParseWireGuardConfig("\xEF\xBB\xBF" + kCanonical);
  assert(m.private_key == "aGVsbG8td29ybGQ=");
  assert(m.interface_ip == "10.8.0.2/32,fd00::2/128,2001:db8::2/128");
  assert(m.dns == std::string("1.1.1.1"));
  assert(GenerateWireGuardConfig(m) == kCanonical);
}

void TestSectionHeadersMayCarryComments() {
  const auto m = ParseWireGuardConfig("[Interface] # client\n"
                                      "PrivateKey = a\n"
                                      "Address = 10.0.0.1/32\n"
                                      "[Peer] ; srv\n"
                                      "PublicKey = c2VydmVy\n"
                                      "Endpoint = vpn:51820\n"
                                      "[Peer]# backup\n"
                                      "Endpoint = other:1\n");
  assert(m.private_key == "a");
  assert(m.interface_ip == "10.0.0.1/32");
  assert(m.public_key == std::string("c2VydmVy"));
  assert(m.endpoint == "vpn:51820");
}

void TestEmptyValuesRoundTrip() {
  const std::string text =
      "[Interface]\n"
      "PrivateKey = a\n"
      "Address = 10.0.0.1/32\n"
      "DNS =\n"
      "\n"
      "[Peer]\n"
      "Endpoint = vpn:1\n"
      "AllowedIPs =\n"
      "PersistentKeepalive = 25\n";

  const auto m = ParseWireGuardConfig(text);
  assert(m.dns == std::string());
  assert(m.allowed_ips == std::string());

  // present-but-empty is not filled from defaults
  ServerDefaults defaults;
  defaults.dns_servers = "9.9.9.9";
  assert(GenerateWireGuardConfig(m, defaults) == text);
}

} // namespace

int main() {
  TestCanonicalTextRoundTrips();
  TestAddressesAreClassified();
  TestKeysAreCaseInsensitiveAndCommentsSkipped();
  TestOnlyFirstPeerIsRead();
  TestEndpointOverrideWins();
  TestMissingFieldsAreNamedInOrder();
  TestDefaultsFillOnlyAbsentFields();
  TestMinimalConfigGetsDefaultKeepalive();
  TestByteOrderMarkIsIgnored();
  TestSectionHeadersMayCarryComments();
  TestEmptyValuesRoundTrip();

  std::cout << "credpool_unit_wireguard_config: pass\n";
  return 0;
}
