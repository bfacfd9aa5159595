#pragma once

#include <string>
#include <string_view>

namespace credpool::util {

// Lower-case hex SHA-256 digest of the given bytes.
std::string Sha256Hex(std::string_view data);

} // namespace credpool::util
