#pragma once

#include "idforge/core/result.h"
#include "idforge/snowflake/snowflake_generator.h"
#include "idforge/snowflake/worker_identity.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// SnowflakeCliConfig holds the parsed flags of the `snowflake` subcommand.
// Unset ids fall back to the environment, then to the machine fingerprint.
struct SnowflakeCliConfig {
  std::optional<std::int64_t> worker_id;      // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> datacenter_id;  // NOLINT(readability-identifier-naming)
  std::int64_t count{1};                      // NOLINT(readability-identifier-naming)
  bool short_form{false};                     // NOLINT(readability-identifier-naming)
  bool explain{false};                        // NOLINT(readability-identifier-naming)
};

inline constexpr std::int64_t kMaxBatchCount = 100000;

// validate_snowflake_cli_config returns "" on success, an error message otherwise.
// --short and --explain are mutually exclusive.
[[nodiscard]] std::string validate_snowflake_cli_config(const SnowflakeCliConfig& config);

// worker_identity_to_json renders ids plus provenance.
[[nodiscard]] nlohmann::json worker_identity_to_json(
    const idforge::snowflake::WorkerIdentity& identity);

// fingerprint_to_json renders every probe result, empty when the probe failed.
[[nodiscard]] nlohmann::json fingerprint_to_json(
    const idforge::snowflake::MachineFingerprint& fingerprint);

// identity_warnings returns one WARNING line per machine-derived id.
[[nodiscard]] std::vector<std::string> identity_warnings(
    const idforge::snowflake::WorkerIdentity& identity);

// build_snowflake_batch draws config.count ids from generator.
// A clock regression aborts the batch and is returned as the error message.
[[nodiscard]] idforge::core::Result<nlohmann::json, std::string> build_snowflake_batch(
    idforge::snowflake::SnowflakeGenerator& generator,
    const idforge::snowflake::WorkerIdentity& identity, const SnowflakeCliConfig& config);
