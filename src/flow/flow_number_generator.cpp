#include "idforge/flow/flow_number_generator.h"

#include "idforge/core/normalization.h"
#include "idforge/core/time.h"

#include <iomanip>
#include <sstream>
#include <utility>

namespace idforge::flow {

namespace {

std::int64_t period_of(const core::Timestamp ts) {
  return core::to_unix_nanos(ts) / kFlowPeriodNanos;
}

}  // namespace

FlowNumberGenerator::FlowNumberGenerator(std::shared_ptr<FlowSequenceState> state,
                                         core::IClock& clock, IRandomSource& random)
    : state_(std::move(state)), clock_(clock), random_(random) {}

std::string FlowNumberGenerator::generate(const std::string_view prefix) {
  core::Timestamp now;
  std::int64_t sequence = 0;
  {
    // Time is read under the lock so a thread that observed an older period
    // cannot reset the counter after a newer period has started.
    std::lock_guard<std::mutex> lock(state_->mutex);

    now = clock_.now();
    std::int64_t period = period_of(now);

    if (period != state_->last_period) {
      state_->sequence_counter = 0;
    } else {
      ++state_->sequence_counter;
      if (state_->sequence_counter >= kFlowSequenceLimit) {
        // Period exhausted: spin until the clock reaches the next one.
        while (period_of(now) <= period) {
          now = clock_.now();
        }
        period = period_of(now);
        state_->sequence_counter = 0;
      }
    }
    state_->last_period = period;
    sequence = state_->sequence_counter;
  }

  const std::uint32_t suffix = uniform_below(kFlowRandomBound, random_, clock_);

  std::ostringstream oss;
  oss << core::normalize_ascii_upper(prefix) << core::format_compact_local(now) << std::setfill('0')
      << std::setw(2) << (core::millis_of_second(now) / 10) << std::setw(3) << sequence
      << std::setw(3) << suffix;
  return oss.str();
}

std::shared_ptr<FlowSequenceState> shared_flow_sequence() {
  static const auto state = std::make_shared<FlowSequenceState>();
  return state;
}

std::string generate_flow_no(const std::string_view prefix) {
  static FlowNumberGenerator generator(shared_flow_sequence(), core::system_clock(),
                                       system_random());
  return generator.generate(prefix);
}

}  // namespace idforge::flow
