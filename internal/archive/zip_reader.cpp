#include "zip_reader.hpp"

#include <zlib.h>

#include "internal/archive/zip_format.hpp"
#include "internal/util/errors.hpp"

namespace credpool::archive {

using namespace format;

namespace {

size_t FindEndOfCentralDirectory(std::string_view data) {
  if (data.size() < kEndOfCentralSize) {
    throw util::ArchiveError("archive too small");
  }

  const size_t last  = data.size() - kEndOfCentralSize;
  const size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
  for (size_t pos = last + 1; pos-- > first;) {
    if (U32(data, pos) != kEndOfCentralSig) continue;
    // the comment must run exactly to the end of the data
    if (pos + kEndOfCentralSize + U16(data, pos + 20) == data.size()) return pos;
  }
  throw util::ArchiveError("end of central directory not found");
}

struct Inflater {
  z_stream zs{};
  bool     ready = false;

  Inflater() {
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
      throw util::ArchiveError("inflate init failed");
    }
    ready = true;
  }

  ~Inflater() {
    if (ready) inflateEnd(&zs);
  }

  Inflater(const Inflater&)            = delete;
  Inflater& operator=(const Inflater&) = delete;
};

std::string Inflate(std::string_view compressed, uint64_t max_bytes) {
  Inflater inf;
  inf.zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  inf.zs.avail_in = static_cast<uInt>(compressed.size());

  std::string out;
  char        chunk[64 * 1024];
  for (;;) {
    inf.zs.next_out  = reinterpret_cast<Bytef*>(chunk);
    inf.zs.avail_out = sizeof(chunk);

    const int rc = inflate(&inf.zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      throw util::ArchiveError(std::string("corrupt deflate stream: ") + (inf.zs.msg ? inf.zs.msg : "unknown"));
    }

    out.append(chunk, sizeof(chunk) - inf.zs.avail_out);
    if (out.size() > max_bytes) {
      throw util::ArchiveError("entry exceeds " + std::to_string(max_bytes) + " bytes");
    }

    if (rc == Z_STREAM_END) return out;
    if (inf.zs.avail_in == 0 && inf.zs.avail_out != 0) {
      throw util::ArchiveError("truncated deflate stream");
    }
  }
}

} // namespace

ZipReader::ZipReader(std::string_view data) : data_(data) {
  const size_t eocd = FindEndOfCentralDirectory(data_);

  const uint16_t disk      = U16(data_, eocd + 4);
  const uint16_t cd_disk   = U16(data_, eocd + 6);
  const uint16_t count     = U16(data_, eocd + 10);
  const uint32_t cd_size   = U32(data_, eocd + 12);
  const uint32_t cd_offset = U32(data_, eocd + 16);

  if (disk != 0 || cd_disk != 0) {
    throw util::ArchiveError("multi-disk archives are not supported");
  }
  if (count == 0xFFFF || cd_offset == 0xFFFFFFFF) {
    throw util::ArchiveError("zip64 archives are not supported");
  }
  if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
    throw util::ArchiveError("central directory out of range");
  }

  entries_.reserve(count);
  size_t pos = cd_offset;
  for (uint16_t i = 0; i < count; ++i) {
    if (pos + kCentralHeaderSize > eocd || U32(data_, pos) != kCentralHeaderSig) {
      throw util::ArchiveError("bad central directory header");
    }

    ZipEntry e;
    e.flags               = U16(data_, pos + 8);
    e.method              = U16(data_, pos + 10);
    e.crc32               = U32(data_, pos + 16);
    e.compressed_size     = U32(data_, pos + 20);
    e.uncompressed_size   = U32(data_, pos + 24);
    e.local_header_offset = U32(data_, pos + 42);

    const uint16_t name_len    = U16(data_, pos + 28);
    const uint16_t extra_len   = U16(data_, pos + 30);
    const uint16_t comment_len = U16(data_, pos + 32);

    const size_t next = pos + kCentralHeaderSize + name_len + extra_len + comment_len;
    if (next > eocd) {
      throw util::ArchiveError("bad central directory header");
    }

    e.name         = std::string(data_.substr(pos + kCentralHeaderSize, name_len));
    e.is_directory = !e.name.empty() && e.name.back() == '/';
    e.zip64        = e.compressed_size == 0xFFFFFFFF || e.uncompressed_size == 0xFFFFFFFF ||
              e.local_header_offset == 0xFFFFFFFF;

    entries_.push_back(std::move(e));
    pos = next;
  }
}

std::string ZipReader::Read(const ZipEntry& entry, uint64_t max_bytes) const {
  if (entry.flags & kFlagEncrypted) {
    throw util::ArchiveError("encrypted entries are not supported");
  }
  if (entry.zip64) {
    throw util::ArchiveError("zip64 entries are not supported");
  }
  if (entry.uncompressed_size > max_bytes) {
    throw util::ArchiveError("entry exceeds " + std::to_string(max_bytes) + " bytes");
  }

  const size_t local = entry.local_header_offset;
  if (local + kLocalHeaderSize > data_.size() || U32(data_, local) != kLocalHeaderSig) {
    throw util::ArchiveError("bad local header");
  }

  const size_t begin = local + kLocalHeaderSize + U16(data_, local + 26) + U16(data_, local + 28);
  if (begin + entry.compressed_size > data_.size()) {
    throw util::ArchiveError("entry data out of range");
  }
  const auto payload = data_.substr(begin, entry.compressed_size);

  std::string out;
  switch (entry.method) {
    case kMethodStored:
      out = std::string(payload);
      break;
    case kMethodDeflate:
      out = Inflate(payload, max_bytes);
      break;
    default:
      throw util::ArchiveError("unsupported compression method " + std::to_string(entry.method));
  }

  if (out.size() != entry.uncompressed_size) {
    throw util::ArchiveError("size mismatch");
  }
  const auto crc = crc32(0L, reinterpret_cast<const Bytef*>(out.data()), static_cast<uInt>(out.size()));
  if (crc != entry.crc32) {
    throw util::ArchiveError("CRC mismatch");
  }
  return out;
}

} // namespace credpool::archive
