#include "snowid/core/clock.h"

#include <chrono>

namespace snowid::core {

std::int64_t SystemMillisClock::now_unix_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::int64_t ManualClock::now_unix_millis() {
  return now_.load(std::memory_order_acquire);
}

void ManualClock::set(const std::int64_t unix_millis) {
  now_.store(unix_millis, std::memory_order_release);
}

void ManualClock::advance(const std::int64_t millis) {
  now_.fetch_add(millis, std::memory_order_acq_rel);
}

IMillisClock& system_millis_clock() {
  static SystemMillisClock clock;
  return clock;
}

}  // namespace snowid::core
