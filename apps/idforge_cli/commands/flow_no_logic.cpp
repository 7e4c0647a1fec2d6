#include "flow_no_logic.h"

#include "idforge/core/normalization.h"

std::string validate_flow_no_cli_config(const FlowNoCliConfig& config) {
  if (config.count < 1 || config.count > kMaxFlowNoCount) {
    return "Error: --count must be between 1 and " + std::to_string(kMaxFlowNoCount) + ", got " +
           std::to_string(config.count);
  }
  return "";
}

nlohmann::json build_flow_numbers(idforge::flow::FlowNumberGenerator& generator,
                                  const FlowNoCliConfig& config) {
  nlohmann::json out;
  out["prefix"] = idforge::core::normalize_ascii_upper(config.prefix);
  out["flow_numbers"] = nlohmann::json::array();
  for (std::int64_t i = 0; i < config.count; ++i) {
    out["flow_numbers"].push_back(generator.generate(config.prefix));
  }
  return out;
}
