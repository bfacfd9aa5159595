#include "time.hpp"

#include <ctime>

namespace credpool::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::string FormatUnixMillis(int64_t ms) {
  if (ms == 0) {
    return {};
  }

  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buf, n);
}

} // namespace credpool::util
