#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

namespace snowid::core {

// Bit layout of a snowflake ID, most- to least-significant:
//
//   [ 42 bits timestamp ][ 10 bits node id ][ 12 bits sequence ]
//
// timestamp is milliseconds elapsed since kEpochMillis (itself milliseconds
// since the Unix epoch). The layout and the epoch are fixed; changing either
// breaks ordering against every ID already issued.
constexpr std::int64_t kEpochMillis = 1288834974657;

constexpr int kTimestampBits = 42;
constexpr int kNodeIdBits = 10;
constexpr int kSequenceBits = 12;

constexpr int kNodeIdShift = kSequenceBits;
constexpr int kTimestampShift = kSequenceBits + kNodeIdBits;

constexpr std::int64_t kMaxTimestamp = (std::int64_t{1} << kTimestampBits) - 1;
constexpr int kMaxNodeId = (1 << kNodeIdBits) - 1;
constexpr int kMaxSequence = (1 << kSequenceBits) - 1;

// SnowflakeId is the vocabulary type for a generated identifier.
// Ordering is plain integer ordering of value, which for IDs from one node is
// creation order (timestamp-major, sequence-minor).
struct SnowflakeId {
  std::int64_t value{0};  // NOLINT(readability-identifier-naming)
  auto operator<=>(const SnowflakeId&) const = default;
};

// IdFields is the decomposed form of a SnowflakeId.
// timestamp_ms is relative to kEpochMillis, not to the Unix epoch.
struct IdFields {
  std::int64_t timestamp_ms{0};  // NOLINT(readability-identifier-naming)
  int node_id{0};                // NOLINT(readability-identifier-naming)
  int sequence{0};               // NOLINT(readability-identifier-naming)
  auto operator<=>(const IdFields&) const = default;
};

[[nodiscard]] constexpr bool is_valid_node_id(const int node_id) noexcept {
  return node_id >= 0 && node_id <= kMaxNodeId;
}

// compose packs fields into an ID. Each field is masked to its bit width, so
// out-of-range inputs lose their high bits rather than bleeding into a
// neighbouring field.
[[nodiscard]] SnowflakeId compose(const IdFields& fields) noexcept;

// decompose is the inverse of compose for in-range fields.
[[nodiscard]] IdFields decompose(SnowflakeId id) noexcept;

// parse_id reads a base-10 signed 64-bit integer.
// Returns nullopt on empty input, trailing characters, or overflow.
[[nodiscard]] std::optional<SnowflakeId> parse_id(std::string_view text);

}  // namespace snowid::core
