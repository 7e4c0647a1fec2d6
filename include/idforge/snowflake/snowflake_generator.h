#pragma once

#include "idforge/core/clock.h"
#include "idforge/core/result.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace idforge::snowflake {

// Bit layout, most significant first:
//   1 bit  sign (reserved, zero)
//  41 bits milliseconds since kSnowflakeEpochMs
//   5 bits datacenter id
//   5 bits worker id
//  12 bits per-millisecond sequence
inline constexpr std::int64_t kSnowflakeEpochMs = 1463834116272;  // 2016-05-21T12:35:16.272Z

inline constexpr unsigned kTimestampBits = 41;
inline constexpr unsigned kDatacenterIdBits = 5;
inline constexpr unsigned kWorkerIdBits = 5;
inline constexpr unsigned kSequenceBits = 12;

inline constexpr unsigned kWorkerIdShift = kSequenceBits;
inline constexpr unsigned kDatacenterIdShift = kWorkerIdShift + kWorkerIdBits;
inline constexpr unsigned kTimestampShift = kDatacenterIdShift + kDatacenterIdBits;

inline constexpr std::int64_t kMaxWorkerId = (std::int64_t{1} << kWorkerIdBits) - 1;
inline constexpr std::int64_t kMaxDatacenterId = (std::int64_t{1} << kDatacenterIdBits) - 1;
inline constexpr std::int64_t kSequenceMask = (std::int64_t{1} << kSequenceBits) - 1;

static_assert(1 + kTimestampBits + kDatacenterIdBits + kWorkerIdBits + kSequenceBits == 64);

// compose_snowflake packs the fields into one id.
//
// The timestamp delta is not masked to 41 bits. If the packed value comes out
// negative (delta at or above 2^41, or a timestamp before the epoch) its
// absolute value is returned instead, with two's complement wraparound for
// INT64_MIN. Ids already persisted depend on this exact behaviour; do not mask
// or clamp here.
[[nodiscard]] std::int64_t compose_snowflake(std::int64_t timestamp_ms, std::int64_t datacenter_id,
                                             std::int64_t worker_id,
                                             std::int64_t sequence) noexcept;

// SnowflakeFields is the decoded form of an id produced without the sign quirk.
struct SnowflakeFields {
  std::int64_t timestamp_ms;   // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id;  // NOLINT(readability-identifier-naming)
  std::int64_t worker_id;      // NOLINT(readability-identifier-naming)
  std::int64_t sequence;       // NOLINT(readability-identifier-naming)

  bool operator==(const SnowflakeFields&) const = default;
};

[[nodiscard]] SnowflakeFields decompose_snowflake(std::int64_t id) noexcept;

// validate_worker_identity checks both ids against [0, 31].
// The worker id is checked first; its error wins when both are invalid.
[[nodiscard]] core::Status<core::ConfigError> validate_worker_identity(std::int64_t worker_id,
                                                                       std::int64_t datacenter_id);

// SnowflakeGenerator issues 64-bit ids for one (datacenter, worker) address.
//
// Thread-safe: every next_id() call serializes on one mutex per instance, held
// for the whole body including the spin-wait on sequence exhaustion. There is
// no timeout on that spin; callers needing bounded latency must wrap calls.
//
// For a fixed (datacenter, worker) pair no two returned ids are equal, and ids
// issued by one instance are strictly increasing in issue order.
class SnowflakeGenerator {
 public:
  // Validates the ids and builds a generator reading time from clock.
  // The clock must outlive the generator.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> create(
      std::int64_t worker_id, std::int64_t datacenter_id, core::IClock& clock);

  // Same as above with the process-wide system clock.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> create(
      std::int64_t worker_id, std::int64_t datacenter_id);

  ~SnowflakeGenerator() = default;

  // Not copyable or movable (contains mutex)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  // Returns the next id, or ClockError when the clock reads earlier than the
  // last millisecond an id was issued for. Generator state is left untouched
  // on error, so a later call succeeds once the clock catches up.
  [[nodiscard]] core::Result<std::int64_t, core::ClockError> next_id();

  // next_id() rendered with core::encode_base62.
  [[nodiscard]] core::Result<std::string, core::ClockError> next_short_id();

  [[nodiscard]] std::int64_t worker_id() const { return worker_id_; }
  [[nodiscard]] std::int64_t datacenter_id() const { return datacenter_id_; }

 private:
  SnowflakeGenerator(std::int64_t worker_id, std::int64_t datacenter_id, core::IClock& clock);

  std::int64_t current_millis();
  std::int64_t wait_until_after(std::int64_t last_ms);

  const std::int64_t worker_id_;
  const std::int64_t datacenter_id_;
  core::IClock& clock_;

  std::mutex mutex_;
  std::int64_t sequence_{0};
  std::int64_t last_timestamp_{-1};
};

}  // namespace idforge::snowflake
