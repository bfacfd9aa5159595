#pragma once

#include <string>
#include <string_view>

#include "internal/model/network_material.hpp"

namespace credpool::codec {

/*
  WireGuard .conf text <-> NetworkMaterial.

  Parse:
    - keys match case-insensitively, values are trimmed
    - blank lines and '#' / ';' comments are skipped
    - repeated Address lines accumulate
    - only the first [Peer] section is read
    - a non-empty endpoint_override replaces the parsed Endpoint

  Throws util::MalformedConfig naming the missing required fields
  (PrivateKey, Address, Endpoint) in that order.

  Generate renders the canonical layout:

    [Interface]
    PrivateKey = ...
    Address = ...
    (DNS, MTU, Table, SaveConfig, FwMark when resolved)

    [Peer]
    (PublicKey, PresharedKey when resolved)
    Endpoint = ...
    (AllowedIPs when resolved)
    PersistentKeepalive = ...

  Generate(Parse(x), {}) == x for text already in that layout.
*/

credpool::model::NetworkMaterial ParseWireGuardConfig(std::string_view text, std::string_view endpoint_override = {});

std::string GenerateWireGuardConfig(const credpool::model::NetworkMaterial& material,
                                    const credpool::model::ServerDefaults& defaults = {});

// Keepalive written when neither the credential nor the server sets one.
inline constexpr std::string_view kDefaultPersistentKeepalive = "25";

} // namespace credpool::codec
