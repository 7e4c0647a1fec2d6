#pragma once

#include "idforge/core/time.h"

#include <chrono>
#include <mutex>

namespace idforge::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests drive time by hand
// (clock regression, bucket exhaustion, spin-wait release).
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock instant.
  // Implementations must be safe to call from multiple threads.
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// system_clock returns a process-lifetime SystemClock for callers that do not inject one.
[[nodiscard]] IClock& system_clock();

// Manual clock: returns a caller-controlled instant.
// When auto_step is non-zero every now() call returns the current value and then
// advances it by auto_step, so spin-waits on a ManualClock terminate.
// Thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start, Clock::duration auto_step = Clock::duration::zero())
      : current_(start), auto_step_(auto_step) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains mutex)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;

  void set(Timestamp ts);
  void advance(Clock::duration delta);
  void set_auto_step(Clock::duration step);

  // Number of now() calls served so far.
  [[nodiscard]] long long reads() const;

 private:
  mutable std::mutex mutex_;
  Timestamp current_;
  Clock::duration auto_step_;
  long long reads_{0};
};

}  // namespace idforge::core
