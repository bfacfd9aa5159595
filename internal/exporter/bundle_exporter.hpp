#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/credential_record.hpp"
#include "internal/model/network_material.hpp"
#include "internal/naming/naming_engine.hpp"

namespace credpool::exporter {

inline constexpr std::string_view kManifestName = "SHA256SUMS";

struct ExportBundle {
  std::string              archive;   // ZIP bytes
  std::vector<std::string> filenames; // one per credential, in input order
  bool                     has_manifest = false;
};

/*
  Packs credentials into one ZIP, a rendered .conf per credential.

  Names come from naming::FormatFilename with a 1-based index; a name
  already used in the bundle gets "_2", "_3", ... before ".conf".
  When any credential carries a file_hash, a SHA256SUMS entry lists
  "<hash>  <filename>" for each of them.
*/
ExportBundle BuildBundle(const std::vector<db::model::CredentialRecord>& credentials,
                         std::string_view pattern,
                         const std::optional<naming::Requester>& requester,
                         const credpool::model::ServerDefaults& defaults);

} // namespace credpool::exporter
