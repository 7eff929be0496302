#include "snowid/generator/snowflake_generator.h"

#include <cstdlib>
#include <iostream>
#include <thread>

namespace snowid::generator {

SnowflakeGenerator::SnowflakeGenerator() : clock_(core::system_millis_clock()) {}

SnowflakeGenerator::SnowflakeGenerator(core::IMillisClock& clock) : clock_(clock) {}

std::int64_t SnowflakeGenerator::epoch_millis_now() {
  return clock_.now_unix_millis() - core::kEpochMillis;
}

// Polls the clock until it reads strictly later than last_ts.
std::int64_t SnowflakeGenerator::wait_past(const std::int64_t last_ts) {
  std::int64_t timestamp = epoch_millis_now();
  while (timestamp <= last_ts) {
    std::this_thread::yield();
    timestamp = epoch_millis_now();
  }
  return timestamp;
}

core::SnowflakeId SnowflakeGenerator::generate(const int node_id) {
  if (!core::is_valid_node_id(node_id)) {
    std::cerr << "FATAL: snowid node_id " << node_id << " outside [0, " << core::kMaxNodeId
              << "]\n";
    std::abort();
  }

  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t timestamp = epoch_millis_now();

  if (timestamp > last_timestamp_) {
    sequence_ = 0;
  } else {
    // Same millisecond, or the clock stepped back: continue from the last
    // recorded millisecond so the (timestamp, sequence) pair keeps increasing.
    timestamp = last_timestamp_;
    sequence_ = (sequence_ + 1) & core::kMaxSequence;
    if (sequence_ == 0) {
      timestamp = wait_past(last_timestamp_);
    }
  }

  last_timestamp_ = timestamp;

  return core::compose(core::IdFields{
      .timestamp_ms = timestamp,
      .node_id = node_id,
      .sequence = sequence_,
  });
}

}  // namespace snowid::generator
