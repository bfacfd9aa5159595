#include "bundle_exporter.hpp"

#include <unordered_set>

#include "internal/archive/zip_writer.hpp"
#include "internal/codec/wireguard_config.hpp"

namespace credpool::exporter {

namespace {

constexpr std::string_view kConfSuffix = ".conf";

std::string Disambiguate(const std::string& name, std::unordered_set<std::string>& used) {
  if (used.insert(name).second) {
    return name;
  }

  std::string_view stem = name;
  if (stem.size() >= kConfSuffix.size() && stem.substr(stem.size() - kConfSuffix.size()) == kConfSuffix) {
    stem.remove_suffix(kConfSuffix.size());
  }

  for (uint32_t n = 2;; ++n) {
    auto candidate = std::string(stem) + "_" + std::to_string(n) + std::string(kConfSuffix);
    if (used.insert(candidate).second) {
      return candidate;
    }
  }
}

} // namespace

ExportBundle BuildBundle(const std::vector<db::model::CredentialRecord>& credentials,
                         std::string_view pattern,
                         const std::optional<naming::Requester>& requester,
                         const credpool::model::ServerDefaults& defaults) {
  ExportBundle                    bundle;
  archive::ZipWriter              writer;
  std::unordered_set<std::string> used{std::string(kManifestName)};
  std::string                     manifest;

  uint32_t index = 1;
  for (const auto& credential : credentials) {
    auto name = Disambiguate(naming::FormatFilename(pattern, credential, requester, index++), used);

    writer.Add(name, codec::GenerateWireGuardConfig(credential.material, defaults));
    if (credential.file_hash && !credential.file_hash->empty()) {
      manifest += *credential.file_hash + "  " + name + "\n";
    }
    bundle.filenames.push_back(std::move(name));
  }

  if (!manifest.empty()) {
    writer.Add(std::string(kManifestName), manifest);
    bundle.has_manifest = true;
  }

  bundle.archive = writer.Finish();
  return bundle;
}

} // namespace credpool::exporter
