#pragma once

#include "idforge/core/clock.h"
#include "idforge/flow/random_source.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace idforge::flow {

// Layout: PREFIX + YYYYMMDDHHMMSS + HH + SSS + RRR, no separators.
//   HH  = milliseconds-of-second / 10, two digits
//   SSS = sequence within the current 100 ms period, three digits
//   RRR = uniform random suffix, three digits
inline constexpr std::size_t kFlowNumberBodyLength = 22;
inline constexpr std::int64_t kFlowSequenceLimit = 1000;
inline constexpr std::int64_t kFlowPeriodNanos = 100'000'000;
inline constexpr std::uint32_t kFlowRandomBound = 1000;

// FlowSequenceState is the counter shared by every prefix and every caller.
// It is deliberately not partitioned by prefix: unrelated prefixes serialize
// on the same mutex. Share one instance per process through shared_ptr.
//
// Invariant: within one 100 ms period, issued sequence values strictly
// increase; a new period resets the counter to 0.
struct FlowSequenceState {
  std::mutex mutex;                  // NOLINT(readability-identifier-naming)
  std::int64_t sequence_counter{0};  // NOLINT(readability-identifier-naming) [0, 999]
  std::int64_t last_period{-1};      // NOLINT(readability-identifier-naming)
};

// FlowNumberGenerator produces sortable, human-readable flow numbers.
//
// Uniqueness within one process and one 100 ms period comes from the sequence
// alone (up to 1000 numbers). The random suffix adds entropy against
// collisions across processes or restarts but guarantees nothing.
//
// Thread-safe. When a period is exhausted the caller spins, holding the state
// mutex, until the clock reaches the next period.
class FlowNumberGenerator {
 public:
  // clock and random must outlive the generator.
  FlowNumberGenerator(std::shared_ptr<FlowSequenceState> state, core::IClock& clock,
                      IRandomSource& random);
  ~FlowNumberGenerator() = default;

  FlowNumberGenerator(const FlowNumberGenerator&) = delete;
  FlowNumberGenerator& operator=(const FlowNumberGenerator&) = delete;
  FlowNumberGenerator(FlowNumberGenerator&&) = delete;
  FlowNumberGenerator& operator=(FlowNumberGenerator&&) = delete;

  // Returns upper-cased prefix followed by 22 digits. Never fails.
  [[nodiscard]] std::string generate(std::string_view prefix);

  [[nodiscard]] const std::shared_ptr<FlowSequenceState>& state() const { return state_; }

 private:
  std::shared_ptr<FlowSequenceState> state_;
  core::IClock& clock_;
  IRandomSource& random_;
};

// shared_flow_sequence returns the process-wide sequence state.
[[nodiscard]] std::shared_ptr<FlowSequenceState> shared_flow_sequence();

// generate_flow_no uses the process-wide state, system clock and system random source.
[[nodiscard]] std::string generate_flow_no(std::string_view prefix);

}  // namespace idforge::flow
