#include "snowflake_logic.h"

#include "idforge/core/base62.h"

#include <utility>

using idforge::snowflake::IdSource;
using idforge::snowflake::WorkerIdentity;

std::string validate_snowflake_cli_config(const SnowflakeCliConfig& config) {
  if (config.count < 1 || config.count > kMaxBatchCount) {
    return "Error: --count must be between 1 and " + std::to_string(kMaxBatchCount) + ", got " +
           std::to_string(config.count);
  }
  if (config.short_form && config.explain) {
    return "Error: --short and --explain cannot be combined";
  }
  return "";
}

nlohmann::json worker_identity_to_json(const WorkerIdentity& identity) {
  nlohmann::json out;
  out["worker_id"] = identity.worker_id;
  out["worker_source"] = std::string{idforge::snowflake::to_string(identity.worker_source)};
  out["datacenter_id"] = identity.datacenter_id;
  out["datacenter_source"] =
      std::string{idforge::snowflake::to_string(identity.datacenter_source)};
  return out;
}

nlohmann::json fingerprint_to_json(const idforge::snowflake::MachineFingerprint& fingerprint) {
  return {
      {"hostname", fingerprint.hostname},
      {"mac_address", fingerprint.mac_address},
      {"local_ip", fingerprint.local_ip},
      {"platform", fingerprint.platform},
      {"process_id", fingerprint.process_id},
  };
}

std::vector<std::string> identity_warnings(const WorkerIdentity& identity) {
  std::vector<std::string> warnings;
  if (identity.worker_source == IdSource::kMachine) {
    warnings.push_back("WARNING: worker id " + std::to_string(identity.worker_id) +
                       " was derived from the machine fingerprint.\n"
                       "         Derived ids are not coordinated; set " +
                       std::string{idforge::snowflake::kWorkerIdEnvVar} +
                       " to guarantee uniqueness.");
  }
  if (identity.datacenter_source == IdSource::kMachine) {
    warnings.push_back("WARNING: datacenter id " + std::to_string(identity.datacenter_id) +
                       " was derived from the machine fingerprint.\n"
                       "         Derived ids are not coordinated; set " +
                       std::string{idforge::snowflake::kDatacenterIdEnvVar} +
                       " to guarantee uniqueness.");
  }
  return warnings;
}

idforge::core::Result<nlohmann::json, std::string> build_snowflake_batch(
    idforge::snowflake::SnowflakeGenerator& generator, const WorkerIdentity& identity,
    const SnowflakeCliConfig& config) {
  using BatchResult = idforge::core::Result<nlohmann::json, std::string>;

  nlohmann::json out = worker_identity_to_json(identity);
  out["ids"] = nlohmann::json::array();

  for (std::int64_t i = 0; i < config.count; ++i) {
    const auto id = generator.next_id();
    if (!id.has_value()) {
      return BatchResult::err(id.error().message());
    }

    if (config.short_form) {
      out["ids"].push_back(idforge::core::encode_base62(id.value()));
    } else if (config.explain) {
      const auto fields = idforge::snowflake::decompose_snowflake(id.value());
      out["ids"].push_back({
          {"id", id.value()},
          {"timestamp_ms", fields.timestamp_ms},
          {"datacenter_id", fields.datacenter_id},
          {"worker_id", fields.worker_id},
          {"sequence", fields.sequence},
      });
    } else {
      out["ids"].push_back(id.value());
    }
  }

  return BatchResult::ok(std::move(out));
}
