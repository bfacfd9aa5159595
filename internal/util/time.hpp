#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace credpool::util {

/*
  Time utilities. Every timestamp in the store is unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t NowMillis();

// ISO-8601 UTC, second precision ("2024-05-01T12:00:00Z"); empty for 0.
std::string FormatUnixMillis(int64_t ms);

} // namespace credpool::util
