#include "snowid/core/id.h"

#include <charconv>
#include <system_error>

namespace snowid::core {

SnowflakeId compose(const IdFields& fields) noexcept {
  const auto timestamp = static_cast<std::uint64_t>(fields.timestamp_ms) &
                         static_cast<std::uint64_t>(kMaxTimestamp);
  const auto node = static_cast<std::uint64_t>(fields.node_id) & kMaxNodeId;
  const auto sequence = static_cast<std::uint64_t>(fields.sequence) & kMaxSequence;

  // The timestamp occupies the sign bit once it passes 2^41; the conversion back
  // to int64 is modular in C++20 so the bit pattern is preserved.
  const std::uint64_t bits =
      (timestamp << kTimestampShift) | (node << kNodeIdShift) | sequence;
  return SnowflakeId{static_cast<std::int64_t>(bits)};
}

IdFields decompose(const SnowflakeId id) noexcept {
  const auto bits = static_cast<std::uint64_t>(id.value);
  return IdFields{
      .timestamp_ms = static_cast<std::int64_t>(bits >> kTimestampShift),
      .node_id = static_cast<int>((bits >> kNodeIdShift) & kMaxNodeId),
      .sequence = static_cast<int>(bits & kMaxSequence),
  };
}

std::optional<SnowflakeId> parse_id(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return SnowflakeId{value};
}

}  // namespace snowid::core
