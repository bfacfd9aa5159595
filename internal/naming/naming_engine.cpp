#include "naming_engine.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace credpool::naming {

namespace {

constexpr std::string_view kUnknown   = "unknown";
constexpr std::string_view kExtension = ".conf";

void ReplaceAll(std::string& s, std::string_view token, std::string_view value) {
  size_t pos = 0;
  while ((pos = s.find(token, pos)) != std::string::npos) {
    s.replace(pos, token.size(), value);
    pos += value.size();
  }
}

bool IsFilenameChar(unsigned char c) {
  return std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '{' || c == '}';
}

} // namespace

std::string FormatFilename(std::string_view pattern,
                           const db::model::CredentialRecord& credential,
                           const std::optional<Requester>& requester,
                           std::optional<uint32_t> index) {
  const auto& m = credential.material;

  std::string endpoint(kUnknown);
  if (!m.endpoint.empty()) {
    endpoint = m.endpoint;
    for (auto& c : endpoint) {
      if (c == ':') c = '_';
    }
  }

  std::string username(kUnknown);
  std::string user_id(kUnknown);
  if (requester) {
    username = requester->username.empty() ? "user" + std::to_string(requester->user_id) : requester->username;
    user_id  = std::to_string(requester->user_id);
  }

  std::string batch(kUnknown);
  if (credential.request_batch_id && !credential.request_batch_id->empty()) {
    batch = credential.request_batch_id->substr(0, 8);
  }

  const std::vector<std::pair<std::string_view, std::string>> replacements = {
      {"{id}", std::to_string(credential.id)},
      {"{ipv4_address}", m.ipv4_address.empty() ? std::string(kUnknown) : m.ipv4_address},
      {"{endpoint}", endpoint},
      {"{batch_id}", batch},
      {"{username}", username},
      {"{user_id}", user_id},
      {"{index}", std::to_string(index.value_or(1))},
  };

  std::string name(pattern);
  for (const auto& [token, value] : replacements) {
    ReplaceAll(name, token, value);
  }

  for (auto& c : name) {
    if (!IsFilenameChar(static_cast<unsigned char>(c))) c = '_';
  }

  if (name.size() < kExtension.size() || name.compare(name.size() - kExtension.size(), kExtension.size(), kExtension) != 0) {
    name += kExtension;
  }
  return name;
}

} // namespace credpool::naming
