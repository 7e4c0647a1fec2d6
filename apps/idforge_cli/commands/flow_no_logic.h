#pragma once

#include "idforge/flow/flow_number_generator.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

struct FlowNoCliConfig {
  std::string prefix;       // NOLINT(readability-identifier-naming)
  std::int64_t count{1};    // NOLINT(readability-identifier-naming)
};

inline constexpr std::int64_t kMaxFlowNoCount = 100000;

// validate_flow_no_cli_config returns "" on success, an error message otherwise.
// An empty prefix is allowed.
[[nodiscard]] std::string validate_flow_no_cli_config(const FlowNoCliConfig& config);

// build_flow_numbers draws config.count flow numbers from generator:
//   {"prefix": "SF", "flow_numbers": ["SF2024...", ...]}
// The prefix is reported upper-cased, as it appears in the numbers.
[[nodiscard]] nlohmann::json build_flow_numbers(idforge::flow::FlowNumberGenerator& generator,
                                                const FlowNoCliConfig& config);
