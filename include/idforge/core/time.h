#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace idforge::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline std::int64_t to_unix_nanos(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
}

// format_compact_local renders ts as YYYYMMDDHHMMSS in the process local time zone.
// Sub-second precision is dropped (truncated, never rounded).
[[nodiscard]] std::string format_compact_local(Timestamp ts);

// millis_of_second returns the millisecond component of ts in [0, 999].
[[nodiscard]] int millis_of_second(Timestamp ts);

}  // namespace idforge::core
