#include "import_pipeline.hpp"

#include "internal/archive/zip_reader.hpp"
#include "internal/codec/wireguard_config.hpp"
#include "internal/core/bulk_result.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/text.hpp"

namespace credpool::importer {

namespace {

bool IsHidden(std::string_view name) {
  const auto base = util::Basename(name);
  return base.empty() || base.front() == '.' || base.substr(0, 2) == "__";
}

} // namespace

ImportPipeline::ImportPipeline(std::shared_ptr<db::Repository> repository, ImportOptions options)
    : repository_(std::move(repository)), options_(options) {
}

ImportResult ImportPipeline::ImportArchive(std::string_view archive, std::string_view endpoint_override,
                                           credpool::model::AssignmentType type) {
  if (archive.size() > options_.max_archive_bytes) {
    throw util::InvalidArgument("archive is " + std::to_string(archive.size()) + " bytes; the limit is " +
                                std::to_string(options_.max_archive_bytes));
  }

  std::unique_ptr<archive::ZipReader> reader;
  try {
    reader = std::make_unique<archive::ZipReader>(archive);
  } catch (const util::ArchiveError& e) {
    CREDPOOL_LOG_WARN("Rejected archive", {observability::StringField("error", e.what())});
    ImportResult rejected;
    rejected.errors.push_back("Invalid ZIP file");
    return rejected;
  }

  auto result = core::RunWithRetry(options_.max_attempts, "import archive", [&] {
    ImportResult out;
    auto         fail = [&](const std::string& name, const std::string& reason) {
      ++out.failed;
      core::AppendBoundedError(out.errors, name + ": " + reason, options_.max_reported_errors);
    };

    auto tx = repository_->Begin();
    for (const auto& entry : reader->Entries()) {
      if (entry.is_directory || IsHidden(entry.name)) continue;

      std::string bytes;
      try {
        bytes = reader->Read(entry, options_.max_entry_bytes);
      } catch (const util::ArchiveError& e) {
        fail(entry.name, e.what());
        continue;
      }

      if (!util::IsValidUtf8(bytes)) {
        ++out.ignored;
        continue;
      }

      db::model::CredentialRecord record;
      try {
        record.material = codec::ParseWireGuardConfig(bytes, endpoint_override);
      } catch (const util::MalformedConfig& e) {
        fail(entry.name, e.what());
        continue;
      }

      record.file_hash       = util::Sha256Hex(bytes);
      record.assignment_type = type;
      record.is_available    = true;
      record.is_active       = true;

      const auto res = repository_->InsertCredential(*tx, record);
      if (res.code == db::ErrorCode::AlreadyExists) {
        ++out.skipped;
        continue;
      }
      core::ThrowIfDbError(res, "import " + entry.name);
      ++out.imported;
    }
    tx->Commit();
    return out;
  });

  CREDPOOL_LOG_INFO("Imported archive", {observability::IntField("imported", result.imported),
                                         observability::IntField("skipped", result.skipped),
                                         observability::IntField("failed", result.failed),
                                         observability::IntField("ignored", result.ignored),
                                         observability::StringField("assignment_type", credpool::model::ToString(type))});
  return result;
}

} // namespace credpool::importer
