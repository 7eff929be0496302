#pragma once

#include "snowid/core/id.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace snowid::core {

using Clock = std::chrono::system_clock;

// Timestamp carries millisecond precision; IDs cannot resolve anything finer.
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp from_unix_millis(const std::int64_t unix_millis) {
  return Timestamp{std::chrono::milliseconds{unix_millis}};
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return ts.time_since_epoch().count();
}

// generation_time returns the creation instant embedded in an ID:
// the 42-bit timestamp field plus kEpochMillis. Total; never fails.
[[nodiscard]] Timestamp generation_time(SnowflakeId id) noexcept;

// format_iso8601_millis renders ts in UTC as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string format_iso8601_millis(Timestamp ts);

}  // namespace snowid::core
