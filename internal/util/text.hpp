#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credpool::util {

/*
  Small string helpers shared by the codec, importer and naming engine.
*/

std::string_view Trim(std::string_view s);

std::string ToLower(std::string_view s);

std::vector<std::string> Split(std::string_view s, char delim);

// Strict UTF-8 check: rejects overlongs, surrogates, and code points above U+10FFFF.
bool IsValidUtf8(std::string_view s);

// Whole-string base-10 integer within [min, max]; nullopt otherwise.
std::optional<int64_t> ParseInt(std::string_view s, int64_t min, int64_t max);

// Last path component of an archive entry name ("a/b/c.conf" -> "c.conf").
std::string_view Basename(std::string_view path);

} // namespace credpool::util
