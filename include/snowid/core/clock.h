#pragma once

#include <atomic>
#include <cstdint>

namespace snowid::core {

// Abstract millisecond clock for timestamp injection.
// Production code reads the system clock; tests drive time by hand so that
// same-millisecond and sequence-overflow paths are reproducible.
class IMillisClock {
 public:
  virtual ~IMillisClock() = default;

  // Milliseconds since the Unix epoch.
  // Contract: safe to call concurrently from any thread.
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IMillisClock() = default;
  IMillisClock(const IMillisClock&) = default;
  IMillisClock& operator=(const IMillisClock&) = default;
  IMillisClock(IMillisClock&&) = default;
  IMillisClock& operator=(IMillisClock&&) = default;
};

// Production clock: wall-clock time from std::chrono::system_clock.
class SystemMillisClock final : public IMillisClock {
 public:
  SystemMillisClock() = default;
  ~SystemMillisClock() override = default;

  SystemMillisClock(const SystemMillisClock&) = default;
  SystemMillisClock& operator=(const SystemMillisClock&) = default;
  SystemMillisClock(SystemMillisClock&&) = default;
  SystemMillisClock& operator=(SystemMillisClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// Manual clock: returns whatever was last set. Time only moves through
// set()/advance(), which may be called from another thread while a generator
// is waiting on this clock.
class ManualClock final : public IMillisClock {
 public:
  explicit ManualClock(std::int64_t start_unix_millis) : now_(start_unix_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_unix_millis() override;

  void set(std::int64_t unix_millis);
  void advance(std::int64_t millis);

 private:
  std::atomic<std::int64_t> now_;
};

// Process-wide SystemMillisClock used by default-constructed generators.
IMillisClock& system_millis_clock();

}  // namespace snowid::core
