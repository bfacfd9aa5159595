#include "zip_writer.hpp"

#include <zlib.h>

#include <ctime>
#include <limits>

#include "internal/archive/zip_format.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credpool::archive {

using namespace format;

namespace {

struct DosTime {
  uint16_t time = 0;
  uint16_t date = (1 << 5) | 1; // 1980-01-01
};

DosTime NowDos() {
  const std::time_t now = util::Clock::to_time_t(util::Now());
  std::tm           tm{};
  if (!localtime_r(&now, &tm) || tm.tm_year < 80) return {};

  DosTime d;
  d.time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  d.date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
  return d;
}

std::string Deflate(std::string_view data) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw util::ArchiveError("deflate init failed");
  }

  std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
  zs.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in  = static_cast<uInt>(data.size());
  zs.next_out  = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&zs, Z_FINISH);
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw util::ArchiveError("deflate failed");
  }

  out.resize(zs.total_out);
  return out;
}

} // namespace

void ZipWriter::Add(const std::string& name, std::string_view data) {
  constexpr auto kMax32 = std::numeric_limits<uint32_t>::max();

  if (count_ >= 0xFFFF) {
    throw util::ArchiveError("too many entries");
  }
  if (data.size() >= kMax32 || body_.size() >= kMax32 || name.size() > 0xFFFF) {
    throw util::ArchiveError("entry too large: " + name);
  }

  const uint32_t crc = static_cast<uint32_t>(
      crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));

  std::string payload = Deflate(data);
  uint16_t    method  = kMethodDeflate;
  if (payload.size() >= data.size()) {
    payload = std::string(data);
    method  = kMethodStored;
  }

  const DosTime  stamp  = NowDos();
  const uint32_t offset = static_cast<uint32_t>(body_.size());

  PutU32(body_, kLocalHeaderSig);
  PutU16(body_, kVersionNeeded);
  PutU16(body_, kFlagUtf8Name);
  PutU16(body_, method);
  PutU16(body_, stamp.time);
  PutU16(body_, stamp.date);
  PutU32(body_, crc);
  PutU32(body_, static_cast<uint32_t>(payload.size()));
  PutU32(body_, static_cast<uint32_t>(data.size()));
  PutU16(body_, static_cast<uint16_t>(name.size()));
  PutU16(body_, 0);
  body_ += name;
  body_ += payload;

  PutU32(central_, kCentralHeaderSig);
  PutU16(central_, kVersionNeeded); // made by
  PutU16(central_, kVersionNeeded);
  PutU16(central_, kFlagUtf8Name);
  PutU16(central_, method);
  PutU16(central_, stamp.time);
  PutU16(central_, stamp.date);
  PutU32(central_, crc);
  PutU32(central_, static_cast<uint32_t>(payload.size()));
  PutU32(central_, static_cast<uint32_t>(data.size()));
  PutU16(central_, static_cast<uint16_t>(name.size()));
  PutU16(central_, 0); // extra
  PutU16(central_, 0); // comment
  PutU16(central_, 0); // disk
  PutU16(central_, 0); // internal attributes
  PutU32(central_, 0); // external attributes
  PutU32(central_, offset);
  central_ += name;

  ++count_;
}

std::string ZipWriter::Finish() {
  std::string out = std::move(body_);
  const auto  cd_offset = static_cast<uint32_t>(out.size());
  out += central_;

  PutU32(out, kEndOfCentralSig);
  PutU16(out, 0);
  PutU16(out, 0);
  PutU16(out, static_cast<uint16_t>(count_));
  PutU16(out, static_cast<uint16_t>(count_));
  PutU32(out, static_cast<uint32_t>(central_.size()));
  PutU32(out, cd_offset);
  PutU16(out, 0);

  body_.clear();
  central_.clear();
  count_ = 0;
  return out;
}

} // namespace credpool::archive
