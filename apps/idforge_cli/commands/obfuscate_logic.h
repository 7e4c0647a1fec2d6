#pragma once

#include "idforge/core/result.h"
#include "idforge/obfuscation/int_obfuscator.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ObfuscateCliConfig {
  std::int64_t key{0};  // NOLINT(readability-identifier-naming) 0 selects the default key
};

// parse_obfuscation_key accepts a signed decimal int64 or a 0x-prefixed hex
// bit pattern of up to 16 digits (0xffffffffffffffff is -1).
[[nodiscard]] std::optional<std::int64_t> parse_obfuscation_key(const std::string& text);

// format_key_hex renders the key as its 64-bit pattern, "0x" + 16 lowercase digits.
[[nodiscard]] std::string format_key_hex(std::int64_t key);

enum class ObfuscationDirection : std::uint8_t {
  kObfuscate,
  kDeobfuscate,
};

// build_obfuscation_output maps each positional value in the given direction:
//   {"key": "0x5a5a...", "results": [{"input": 1, "output": 7273261929008452528}]}
// Fails on the first value that is not an int64.
[[nodiscard]] idforge::core::Result<nlohmann::json, std::string> build_obfuscation_output(
    const idforge::obfuscation::IntObfuscator& obfuscator, ObfuscationDirection direction,
    const std::vector<std::string>& values);
