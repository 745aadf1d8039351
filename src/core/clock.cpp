#include "flakeid/core/clock.h"

#include <thread>

namespace flakeid::core {

Timestamp SystemClock::now() {
  return now_utc();
}

void SystemClock::sleep_for(const Duration duration) {
  std::this_thread::sleep_for(duration);
}

Timestamp ManualClock::now() {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::sleep_for(const Duration duration) {
  if (duration <= Duration::zero()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += duration;
  slept_ += duration;
}

void ManualClock::set(const Timestamp ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = ts;
}

void ManualClock::advance(const Duration duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += duration;
}

Duration ManualClock::total_slept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slept_;
}

SystemClock& system_clock() {
  static SystemClock clock;
  return clock;
}

}  // namespace flakeid::core
