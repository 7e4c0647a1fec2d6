#pragma once

#include "idforge/core/clock.h"
#include "idforge/core/result.h"
#include "idforge/snowflake/snowflake_generator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace idforge::snowflake {

inline constexpr const char* kWorkerIdEnvVar = "IDWORKER_WORKER_ID";
inline constexpr const char* kDatacenterIdEnvVar = "IDWORKER_DATACENTER_ID";

// Suffixes appended to the fingerprint so the two derived ids are decorrelated.
inline constexpr std::string_view kWorkerSuffix = "_worker";
inline constexpr std::string_view kDatacenterSuffix = "_datacenter";

// IdSource records where a worker or datacenter id came from, for startup diagnostics.
enum class IdSource : std::uint8_t {
  kExplicit,     // passed on the command line or by the caller
  kEnvironment,  // IDWORKER_WORKER_ID / IDWORKER_DATACENTER_ID
  kMachine,      // derived from the machine fingerprint; not coordinated
};

[[nodiscard]] std::string_view to_string(IdSource source);

// EnvLookup returns the value of an environment-style variable, or nullopt when unset.
// Injected so tests never mutate the process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// process_env reads the real process environment via std::getenv.
[[nodiscard]] EnvLookup process_env();

// parse_id_value parses a decimal id and checks it against [0, max_id].
// A single leading '+' is accepted. An empty value counts as unset.
[[nodiscard]] core::Result<std::int64_t, core::ConfigError> parse_id_value(
    std::string_view name, const std::optional<std::string>& raw, std::int64_t max_id,
    core::ConfigErrorCode out_of_range_code);

// Reads IDWORKER_WORKER_ID. Errors: kNotSet, kInvalidFormat, kWorkerIdOutOfRange.
[[nodiscard]] core::Result<std::int64_t, core::ConfigError> worker_id_from_env(
    const EnvLookup& env);

// Reads IDWORKER_DATACENTER_ID. Errors: kNotSet, kInvalidFormat, kDatacenterIdOutOfRange.
[[nodiscard]] core::Result<std::int64_t, core::ConfigError> datacenter_id_from_env(
    const EnvLookup& env);

// MachineFingerprint holds the locally observable machine characteristics.
// Any probe that fails leaves its field empty.
struct MachineFingerprint {
  std::string hostname;     // NOLINT(readability-identifier-naming)
  std::string mac_address;  // NOLINT(readability-identifier-naming) first non-loopback, up iface
  std::string local_ip;     // NOLINT(readability-identifier-naming) source of the default route
  std::string platform;     // NOLINT(readability-identifier-naming) e.g. "linuxx86_64"
  std::string process_id;   // NOLINT(readability-identifier-naming)

  // Concatenation of all fields in declaration order.
  [[nodiscard]] std::string to_string() const;
};

// collect_machine_fingerprint performs the one-time local system calls
// (gethostname, getifaddrs, a UDP connect that sends nothing, uname, getpid).
// Never fails; unavailable facts are left empty.
[[nodiscard]] MachineFingerprint collect_machine_fingerprint();

// derive_machine_id hashes fingerprint + suffix with SHA-256 and keeps the low
// 5 bits of the first digest byte. An empty fingerprint is replaced by the
// current time in nanoseconds.
//
// Earlier MD5-based deployments derived different ids from the same
// fingerprint; the two schemes are not interchangeable.
//
// Best effort only: two machines can land in the same bucket. Operators who
// need strict uniqueness must assign ids out of band.
[[nodiscard]] std::int64_t derive_machine_id(std::string_view fingerprint,
                                             std::string_view suffix);

[[nodiscard]] std::int64_t machine_worker_id(const MachineFingerprint& fingerprint);
[[nodiscard]] std::int64_t machine_datacenter_id(const MachineFingerprint& fingerprint);

// WorkerIdentity is a resolved (worker, datacenter) pair plus provenance.
struct WorkerIdentity {
  std::int64_t worker_id{0};                     // NOLINT(readability-identifier-naming)
  std::int64_t datacenter_id{0};                 // NOLINT(readability-identifier-naming)
  IdSource worker_source{IdSource::kExplicit};      // NOLINT(readability-identifier-naming)
  IdSource datacenter_source{IdSource::kExplicit};  // NOLINT(readability-identifier-naming)
};

// WorkerIdentityOverrides carries ids supplied directly by the caller.
struct WorkerIdentityOverrides {
  std::optional<std::int64_t> worker_id;      // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> datacenter_id;  // NOLINT(readability-identifier-naming)
};

// resolve_worker_identity resolves each id independently, first match wins:
// - override present                     -> kExplicit (range checked at create())
// - environment variable set and valid   -> kEnvironment
// - environment variable unset or empty  -> derived from fingerprint, kMachine
// - environment variable set but invalid -> ConfigError (startup must stop)
[[nodiscard]] core::Result<WorkerIdentity, core::ConfigError> resolve_worker_identity(
    const EnvLookup& env, const MachineFingerprint& fingerprint,
    const WorkerIdentityOverrides& overrides = {});

// machine_worker_identity derives both ids from the fingerprint, ignoring the environment.
[[nodiscard]] WorkerIdentity machine_worker_identity(const MachineFingerprint& fingerprint);

// create_from_env builds a generator from resolve_worker_identity(env, ...) with
// the local machine fingerprint. A set but invalid variable is a ConfigError.
[[nodiscard]] core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError> create_from_env(
    core::IClock& clock, const EnvLookup& env = process_env());

// create_with_machine_identity builds a generator from the machine fingerprint only.
[[nodiscard]] core::Result<std::unique_ptr<SnowflakeGenerator>, core::ConfigError>
create_with_machine_identity(core::IClock& clock);

}  // namespace idforge::snowflake
