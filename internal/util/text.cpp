#include "text.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace credpool::util {

std::string_view Trim(std::string_view s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;

  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;

  return s.substr(begin, end - begin);
}

std::optional<int64_t> ParseInt(std::string_view s, int64_t min, int64_t max) {
  int64_t     value = 0;
  const auto* end   = s.data() + s.size();
  const auto  res   = std::from_chars(s.data(), end, value);
  if (s.empty() || res.ec != std::errc() || res.ptr != end) return std::nullopt;
  if (value < min || value > max) return std::nullopt;
  return value;
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::vector<std::string> Split(std::string_view s, char delim) {
  std::vector<std::string> parts;
  size_t                   start = 0;
  for (;;) {
    const auto pos = s.find(delim, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(s.substr(start));
      return parts;
    }
    parts.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

bool IsValidUtf8(std::string_view s) {
  const auto* p   = reinterpret_cast<const uint8_t*>(s.data());
  const auto* end = p + s.size();

  while (p < end) {
    const uint8_t c = *p;
    if (c < 0x80) {
      ++p;
      continue;
    }

    size_t   len = 0;
    uint32_t cp  = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp  = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp  = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp  = c & 0x07;
    } else {
      return false;
    }

    if (static_cast<size_t>(end - p) < len) return false;
    for (size_t i = 1; i < len; ++i) {
      if ((p[i] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (p[i] & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;

    p += len;
  }
  return true;
}

std::string_view Basename(std::string_view path) {
  while (!path.empty() && path.back() == '/') path.remove_suffix(1);
  const auto pos = path.find_last_of('/');
  return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace credpool::util
