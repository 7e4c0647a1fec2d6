#include "idforge/snowflake/snowflake_generator.h"

#include "idforge/core/base62.h"
#include "idforge/core/time.h"

namespace idforge::snowflake {

std::int64_t compose_snowflake(const std::int64_t timestamp_ms, const std::int64_t datacenter_id,
                               const std::int64_t worker_id, const std::int64_t sequence) noexcept {
  // Pack in unsigned arithmetic so both the subtraction and shifts past bit 63 wrap.
  const std::uint64_t delta =
      static_cast<std::uint64_t>(timestamp_ms) - static_cast<std::uint64_t>(kSnowflakeEpochMs);
  const std::uint64_t packed = (delta << kTimestampShift) |
                               (static_cast<std::uint64_t>(datacenter_id) << kDatacenterIdShift) |
                               (static_cast<std::uint64_t>(worker_id) << kWorkerIdShift) |
                               static_cast<std::uint64_t>(sequence);

  const auto id = static_cast<std::int64_t>(packed);
  if (id < 0) {
    return static_cast<std::int64_t>(std::uint64_t{0} - packed);
  }
  return id;
}

SnowflakeFields decompose_snowflake(const std::int64_t id) noexcept {
  return SnowflakeFields{
      (id >> kTimestampShift) + kSnowflakeEpochMs,
      (id >> kDatacenterIdShift) & kMaxDatacenterId,
      (id >> kWorkerIdShift) & kMaxWorkerId,
      id & kSequenceMask,
  };
}

core::Status<core::ConfigError> validate_worker_identity(const std::int64_t worker_id,
                                                         const std::int64_t datacenter_id) {
  using core::ConfigError;
  using core::ConfigErrorCode;

  if (worker_id < 0 || worker_id > kMaxWorkerId) {
    return core::Status<ConfigError>::err(
        ConfigError{ConfigErrorCode::kWorkerIdOutOfRange,
                    "worker id " + std::to_string(worker_id) + " is outside [0, " +
                        std::to_string(kMaxWorkerId) + "]"});
  }
  if (datacenter_id < 0 || datacenter_id > kMaxDatacenterId) {
    return core::Status<ConfigError>::err(
        ConfigError{ConfigErrorCode::kDatacenterIdOutOfRange,
                    "datacenter id " + std::to_string(datacenter_id) + " is outside [0, " +
                        std::to_string(kMaxDatacenterId) + "]"});
  }
  return core::ok_status<ConfigError>();
}

SnowflakeGenerator::SnowflakeGenerator(const std::int64_t worker_id,
                                       const std::int64_t datacenter_id, core::IClock& clock)
    : worker_id_(worker_id), datacenter_id_(datacenter_id), clock_(clock) {}

core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> SnowflakeGenerator::create(
    const std::int64_t worker_id, const std::int64_t datacenter_id, core::IClock& clock) {
  using CreateResult = core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError>;

  const auto valid = validate_worker_identity(worker_id, datacenter_id);
  if (!valid.has_value()) {
    return CreateResult::err(valid.error());
  }
  // Private constructor: std::make_unique cannot reach it.
  return CreateResult::ok(
      std::unique_ptr<SnowflakeGenerator>(new SnowflakeGenerator(worker_id, datacenter_id, clock)));
}

core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> SnowflakeGenerator::create(
    const std::int64_t worker_id, const std::int64_t datacenter_id) {
  return create(worker_id, datacenter_id, core::system_clock());
}

std::int64_t SnowflakeGenerator::current_millis() {
  return core::to_unix_millis(clock_.now());
}

std::int64_t SnowflakeGenerator::wait_until_after(const std::int64_t last_ms) {
  std::int64_t timestamp = current_millis();
  while (timestamp <= last_ms) {
    timestamp = current_millis();
  }
  return timestamp;
}

core::Result<std::int64_t, core::ClockError> SnowflakeGenerator::next_id() {
  using NextResult = core::Result<std::int64_t, core::ClockError>;

  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t timestamp = current_millis();
  if (timestamp < last_timestamp_) {
    return NextResult::err(core::ClockError{last_timestamp_ - timestamp});
  }

  if (timestamp == last_timestamp_) {
    sequence_ = (sequence_ + 1) & kSequenceMask;
    if (sequence_ == 0) {
      // 4096 ids issued this millisecond: spin into the next one.
      timestamp = wait_until_after(last_timestamp_);
    }
  } else {
    sequence_ = 0;
  }

  last_timestamp_ = timestamp;
  return NextResult::ok(compose_snowflake(timestamp, datacenter_id_, worker_id_, sequence_));
}

core::Result<std::string, core::ClockError> SnowflakeGenerator::next_short_id() {
  using ShortResult = core::Result<std::string, core::ClockError>;

  const auto id = next_id();
  if (!id.has_value()) {
    return ShortResult::err(id.error());
  }
  return ShortResult::ok(core::encode_base62(id.value()));
}

}  // namespace idforge::snowflake
