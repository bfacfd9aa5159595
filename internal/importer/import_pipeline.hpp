#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/assignment_type.hpp"

namespace credpool::importer {

struct ImportOptions {
  uint64_t max_archive_bytes   = 50ull * 1024 * 1024;
  uint64_t max_entry_bytes     = 1ull * 1024 * 1024;
  uint32_t max_reported_errors = 10;
  uint32_t max_attempts        = 3;
};

struct ImportResult {
  uint32_t imported = 0;
  uint32_t skipped  = 0; // content already in the store
  uint32_t failed   = 0; // unreadable or not a WireGuard config
  uint32_t ignored  = 0; // not UTF-8 text

  // "<entry>: <reason>", first max_reported_errors only
  std::vector<std::string> errors;
};

/*
  ZIP archive -> credentials.

  Directory entries and hidden entries (basename starting with "." or
  "__") are passed over. Each remaining entry is decoded, parsed and
  deduplicated on the SHA-256 of its raw bytes. Every insert commits in
  one transaction; a structurally invalid archive imports nothing and
  reports "Invalid ZIP file".
*/
class ImportPipeline {
 public:
  explicit ImportPipeline(std::shared_ptr<db::Repository> repository, ImportOptions options = {});

  // Throws util::InvalidArgument when the archive exceeds max_archive_bytes.
  ImportResult ImportArchive(std::string_view archive, std::string_view endpoint_override = {},
                             credpool::model::AssignmentType type = credpool::model::AssignmentType::kUserRequestable);

 private:
  std::shared_ptr<db::Repository> repository_;
  ImportOptions                   options_;
};

} // namespace credpool::importer
