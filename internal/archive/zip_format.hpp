#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace credpool::archive::format {

/*
  PKWARE APPNOTE constants and little-endian field access shared by
  the reader and writer.
*/

inline constexpr uint32_t kLocalHeaderSig   = 0x04034b50;
inline constexpr uint32_t kCentralHeaderSig = 0x02014b50;
inline constexpr uint32_t kEndOfCentralSig  = 0x06054b50;

inline constexpr size_t kLocalHeaderSize   = 30;
inline constexpr size_t kCentralHeaderSize = 46;
inline constexpr size_t kEndOfCentralSize  = 22;
inline constexpr size_t kMaxCommentSize    = 0xFFFF;

inline constexpr uint16_t kMethodStored  = 0;
inline constexpr uint16_t kMethodDeflate = 8;

inline constexpr uint16_t kFlagEncrypted = 0x0001;
inline constexpr uint16_t kFlagUtf8Name  = 0x0800;

inline constexpr uint16_t kVersionNeeded = 20;

inline uint16_t U16(std::string_view data, size_t pos) {
  if (pos + 2 > data.size()) throw util::ArchiveError("truncated archive");
  const auto* p = reinterpret_cast<const unsigned char*>(data.data() + pos);
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t U32(std::string_view data, size_t pos) {
  if (pos + 4 > data.size()) throw util::ArchiveError("truncated archive");
  const auto* p = reinterpret_cast<const unsigned char*>(data.data() + pos);
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

inline void PutU16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void PutU32(std::string& out, uint32_t v) {
  PutU16(out, static_cast<uint16_t>(v & 0xFFFF));
  PutU16(out, static_cast<uint16_t>((v >> 16) & 0xFFFF));
}

} // namespace credpool::archive::format
