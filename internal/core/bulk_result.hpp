#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace credpool::core {

// Bulk operations report at most this many per-item errors.
inline constexpr size_t kMaxReportedErrors = 10;

inline void AppendBoundedError(std::vector<std::string>& errors, std::string message, size_t cap = kMaxReportedErrors) {
  if (errors.size() < cap) {
    errors.push_back(std::move(message));
  }
}

} // namespace credpool::core
