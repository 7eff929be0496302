#pragma once

#include "snowid/core/clock.h"
#include "snowid/core/id.h"
#include "snowid/generator/id_generator.h"

#include <cstdint>
#include <mutex>

namespace snowid::generator {

// SnowflakeGenerator issues 42/10/12-bit snowflake IDs.
//
// Thread-safety: every generate() call is serialized through one mutex, so
// IDs returned for a given node_id are strictly increasing in return order.
//
// State: (last_timestamp, sequence), initialized to (0, 0) and owned by the
// instance. Independent instances never share state; two instances issuing
// for the same node_id in the same process CAN collide.
//
// Blocking: when more than 4096 IDs are requested within one millisecond the
// call waits for the clock to advance. The wait has no timeout and cannot be
// cancelled; callers needing bounded latency must apply their own deadline.
//
// Clock steps backwards are absorbed: the generator keeps issuing from the
// last recorded millisecond until the clock catches up.
class SnowflakeGenerator final : public IIdGenerator {
 public:
  // Reads core::system_millis_clock().
  SnowflakeGenerator();
  // clock must outlive the generator.
  explicit SnowflakeGenerator(core::IMillisClock& clock);
  ~SnowflakeGenerator() override = default;

  // Disable copy/move (mutex not copyable)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  core::SnowflakeId generate(int node_id) override;

 private:
  std::int64_t epoch_millis_now();
  std::int64_t wait_past(std::int64_t last_ts);

  core::IMillisClock& clock_;

  std::mutex mutex_;
  std::int64_t last_timestamp_{0};
  int sequence_{0};
};

}  // namespace snowid::generator
