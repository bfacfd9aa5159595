#include <cassert>
#include <iostream>
#include <string>

#include "internal/archive/zip_reader.hpp"
#include "internal/archive/zip_writer.hpp"
#include "internal/util/errors.hpp"

namespace {

using credpool::archive::ZipReader;
using credpool::archive::ZipWriter;
using credpool::util::ArchiveError;

template <typename Fn>
bool ThrowsArchiveError(Fn&& fn) {
  try {
    fn();
  } catch (const ArchiveError&) {
    return true;
  }
  return false;
}

void TestWrittenArchiveReadsBack() {
  const std::string small = "hello world";
  const std::string large(64 * 1024, 'w');

  ZipWriter writer;
  writer.Add("a/b/small.conf", small);
  writer.Add("large.conf", large);
  writer.Add("empty.conf", "");
  assert(writer.EntryCount() == 3);
  const auto bytes = writer.Finish();
  assert(writer.EntryCount() == 0);

  // the repetitive entry is deflated well below its size
  assert(bytes.size() < large.size() / 4);

  ZipReader reader(bytes);
  const auto& entries = reader.Entries();
  assert(entries.size() == 3);
  assert(entries[0].name == "a/b/small.conf");
  assert(!entries[0].is_directory);
  assert(reader.Read(entries[0], 1024) == small);
  assert(reader.Read(entries[1], large.size()) == large);
  assert(reader.Read(entries[2], 1024).empty());
}

void TestDirectoryEntriesAreFlagged() {
  ZipWriter writer;
  writer.Add("configs/", "");
  writer.Add("configs/one.conf", "x");
  const auto bytes = writer.Finish();

  ZipReader reader(bytes);
  assert(reader.Entries().size() == 2);
  assert(reader.Entries()[0].is_directory);
  assert(!reader.Entries()[1].is_directory);
}

void TestEntryLimitIsEnforced() {
  ZipWriter writer;
  writer.Add("big.conf", std::string(4096, 'z'));
  const auto bytes = writer.Finish();

  ZipReader reader(bytes);
  assert(ThrowsArchiveError([&] { reader.Read(reader.Entries()[0], 1024); }));
  assert(reader.Read(reader.Entries()[0], 4096).size() == 4096);
}

void TestCorruptPayloadFailsCrc() {
  ZipWriter writer;
  writer.Add("peer.conf", "hello world");
  auto bytes = writer.Finish();

  const auto pos = bytes.find("hello world");
  assert(pos != std::string::npos);
  bytes[pos] = 'j';

  ZipReader reader(bytes);
  assert(ThrowsArchiveError([&] { reader.Read(reader.Entries()[0], 1024); }));
}

void TestStructurallyInvalidArchivesAreRejected() {
  assert(ThrowsArchiveError([] { ZipReader reader(""); }));
  assert(ThrowsArchiveError([] { ZipReader reader("definitely not a zip archive, just some text bytes"); }));

  ZipWriter writer;
  writer.Add("peer.conf", "data");
  const auto bytes = writer.Finish();

  // cut into the central directory
  const std::string truncated = bytes.substr(0, bytes.size() - 30);
  assert(ThrowsArchiveError([&] { ZipReader reader(truncated); }));
}

void TestEmptyArchiveHasNoEntries() {
  ZipWriter  writer;
  const auto bytes = writer.Finish();
  ZipReader  reader(bytes);
  assert(reader.Entries().empty());
}

} // namespace

int main() {
  TestWrittenArchiveReadsBack();
  TestDirectoryEntriesAreFlagged();
  TestEntryLimitIsEnforced();
  TestCorruptPayloadFailsCrc();
  TestStructurallyInvalidArchivesAreRejected();
  TestEmptyArchiveHasNoEntries();

  std::cout << "credpool_unit_zip_archive: pass\n";
  return 0;
}
