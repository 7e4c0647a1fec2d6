#include "idforge/core/clock.h"

namespace idforge::core {

Timestamp SystemClock::now() {
  return Clock::now();
}

IClock& system_clock() {
  static SystemClock instance;
  return instance;
}

Timestamp ManualClock::now() {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp result = current_;
  current_ += auto_step_;
  ++reads_;
  return result;
}

void ManualClock::set(const Timestamp ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = ts;
}

void ManualClock::advance(const Clock::duration delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ += delta;
}

void ManualClock::set_auto_step(const Clock::duration step) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_step_ = step;
}

long long ManualClock::reads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reads_;
}

}  // namespace idforge::core
