#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace credpool::util {

/*
  UUID helpers

  Request batch ids are RFC4122 v4 UUIDs kept in canonical
  36-character string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewBatchId() {
  return ToString(GenerateUUID());
}

} // namespace credpool::util
