#include "snowflake.h"

#include "idforge/core/clock.h"
#include "idforge/snowflake/snowflake_generator.h"
#include "idforge/snowflake/worker_identity.h"

#include "shared/arg_parser.h"
#include "snowflake_logic.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

using idforge::apps::parse_int64;

std::vector<idforge::apps::Option<SnowflakeCliConfig>> identity_options() {
  return {
      {"--worker-id", true, "Worker id in [0, 31]; overrides IDWORKER_WORKER_ID",
       [](SnowflakeCliConfig& c, const std::string& v) {
         c.worker_id = parse_int64(v);
         if (!c.worker_id.has_value()) {
           std::cerr << "Invalid --worker-id: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--datacenter-id", true, "Datacenter id in [0, 31]; overrides IDWORKER_DATACENTER_ID",
       [](SnowflakeCliConfig& c, const std::string& v) {
         c.datacenter_id = parse_int64(v);
         if (!c.datacenter_id.has_value()) {
           std::cerr << "Invalid --datacenter-id: " << v << "\n";
           return false;
         }
         return true;
       }},
  };
}

// Resolve ids and print where each one came from. Returns false after
// printing the error when the environment holds an invalid value.
bool resolve_identity(const SnowflakeCliConfig& config,
                      const idforge::snowflake::MachineFingerprint& fingerprint,
                      idforge::snowflake::WorkerIdentity& identity) {
  const idforge::snowflake::WorkerIdentityOverrides overrides{config.worker_id,
                                                              config.datacenter_id};
  auto resolved =
      idforge::snowflake::resolve_worker_identity(idforge::snowflake::process_env(), fingerprint,
                                                  overrides);
  if (!resolved.has_value()) {
    std::cerr << "Error: " << resolved.error().message << "\n";
    return false;
  }
  identity = resolved.value();

  std::cerr << "Worker identity: worker_id=" << identity.worker_id << " ("
            << idforge::snowflake::to_string(identity.worker_source)
            << "), datacenter_id=" << identity.datacenter_id << " ("
            << idforge::snowflake::to_string(identity.datacenter_source) << ")\n";
  for (const auto& warning : identity_warnings(identity)) {
    std::cerr << warning << "\n";
  }
  return true;
}

}  // namespace

int cmd_snowflake(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = identity_options();
  options.push_back({"--count", true, "Number of ids to generate (default 1)",
                     [](SnowflakeCliConfig& c, const std::string& v) {
                       const auto count = parse_int64(v);
                       if (!count.has_value()) {
                         std::cerr << "Invalid --count: " << v << "\n";
                         return false;
                       }
                       c.count = count.value();
                       return true;
                     }});
  options.push_back({"--short", false, "Print ids in base62 form",
                     [](SnowflakeCliConfig& c, const std::string& /*v*/) {
                       c.short_form = true;
                       return true;
                     }});
  options.push_back({"--explain", false, "Print each id with its decoded fields",
                     [](SnowflakeCliConfig& c, const std::string& /*v*/) {
                       c.explain = true;
                       return true;
                     }});

  const auto parsed = idforge::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positional.empty()) {
    idforge::apps::print_usage(std::cerr, "idforge_cli snowflake [options]", options);
    return 1;
  }
  const SnowflakeCliConfig& config = parsed.config;

  const std::string config_error = validate_snowflake_cli_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  idforge::snowflake::WorkerIdentity identity;
  if (!resolve_identity(config, idforge::snowflake::collect_machine_fingerprint(), identity)) {
    return 1;
  }

  auto generator = idforge::snowflake::SnowflakeGenerator::create(
      identity.worker_id, identity.datacenter_id, idforge::core::system_clock());
  if (!generator.has_value()) {
    std::cerr << "Error: " << generator.error().message << "\n";
    return 1;
  }

  const auto batch = build_snowflake_batch(*generator.value(), identity, config);
  if (!batch.has_value()) {
    std::cerr << "Error: " << batch.error() << "\n";
    return 1;
  }

  std::cout << batch.value().dump(2) << "\n";
  return 0;
}

int cmd_worker_identity(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = identity_options();
  const auto parsed = idforge::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positional.empty()) {
    idforge::apps::print_usage(std::cerr, "idforge_cli worker-identity [options]", options);
    return 1;
  }

  const auto fingerprint = idforge::snowflake::collect_machine_fingerprint();
  idforge::snowflake::WorkerIdentity identity;
  if (!resolve_identity(parsed.config, fingerprint, identity)) {
    return 1;
  }

  // Explicit overrides are only range checked here; env values already were.
  const auto status =
      idforge::snowflake::validate_worker_identity(identity.worker_id, identity.datacenter_id);
  if (!status.has_value()) {
    std::cerr << "Error: " << status.error().message << "\n";
    return 1;
  }

  nlohmann::json out = worker_identity_to_json(identity);
  out["fingerprint"] = fingerprint_to_json(fingerprint);
  std::cout << out.dump(2) << "\n";
  return 0;
}
