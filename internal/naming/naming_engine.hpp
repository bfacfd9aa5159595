#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/credential_record.hpp"

namespace credpool::naming {

inline constexpr std::string_view kDefaultNamingPattern = "simnet_{ipv4_address}.conf";

// Principal a bundle is rendered for.
struct Requester {
  int64_t     user_id = 0;
  std::string username;
};

/*
  Renders a download filename from a pattern.

  Placeholders, substituted in this order:
    {id} {ipv4_address} {endpoint} {batch_id} {username} {user_id} {index}

  Unknown values render as "unknown"; {index} defaults to 1. Every byte
  outside [A-Za-z0-9._-{}] then becomes '_' and ".conf" is appended
  unless already present.
*/
std::string FormatFilename(std::string_view pattern,
                           const db::model::CredentialRecord& credential,
                           const std::optional<Requester>& requester = std::nullopt,
                           std::optional<uint32_t> index = std::nullopt);

} // namespace credpool::naming
