#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace credpool::archive {

/*
  Builds a ZIP archive in memory.

  Entries are deflated, or stored when deflate does not shrink them.
  Names are flagged UTF-8. Finish() appends the central directory and
  returns the archive bytes; the writer is empty afterwards.
*/
class ZipWriter {
 public:
  // Throws util::ArchiveError past 65535 entries or 4 GiB.
  void Add(const std::string& name, std::string_view data);

  std::string Finish();

  size_t EntryCount() const {
    return count_;
  }

 private:
  std::string body_;
  std::string central_;
  size_t      count_ = 0;
};

} // namespace credpool::archive
