#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace credpool::archive {

struct ZipEntry {
  std::string name;
  bool        is_directory = false;

  uint16_t flags  = 0;
  uint16_t method = 0;
  uint32_t crc32  = 0;

  uint64_t compressed_size     = 0;
  uint64_t uncompressed_size   = 0;
  uint64_t local_header_offset = 0;

  // Sizes or offset were escaped to a zip64 extra field.
  bool zip64 = false;
};

/*
  Read-only view of a ZIP archive held in memory.

  Construction parses the end-of-central-directory record and the
  central directory; a structurally invalid archive throws
  util::ArchiveError. Entry payloads are only touched by Read(), whose
  failures (encrypted, zip64, unsupported method, bad CRC, too large)
  also throw util::ArchiveError and concern that entry alone.

  The viewed bytes must outlive the reader.
*/
class ZipReader {
 public:
  explicit ZipReader(std::string_view data);

  const std::vector<ZipEntry>& Entries() const {
    return entries_;
  }

  // Stored and deflate entries only.
  std::string Read(const ZipEntry& entry, uint64_t max_bytes) const;

 private:
  std::string_view      data_;
  std::vector<ZipEntry> entries_;
};

} // namespace credpool::archive
