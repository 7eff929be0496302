#include "snowid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace snowid::core {

Timestamp generation_time(const SnowflakeId id) noexcept {
  return from_unix_millis(decompose(id).timestamp_ms + kEpochMillis);
}

std::string format_iso8601_millis(const Timestamp ts) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  const auto millis = (ts - seconds).count();
  const std::time_t time_t_value = Clock::to_time_t(seconds);

  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << millis << 'Z';
  return oss.str();
}

}  // namespace snowid::core
