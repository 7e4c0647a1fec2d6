#include "obfuscate_logic.h"

#include "shared/arg_parser.h"

#include <array>
#include <charconv>
#include <cstdio>
#include <system_error>
#include <utility>

std::optional<std::int64_t> parse_obfuscation_key(const std::string& text) {
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    const std::string digits = text.substr(2);
    if (digits.size() > 16) {
      return std::nullopt;
    }
    std::uint64_t bits = 0;
    const char* last = digits.data() + digits.size();
    const auto [end, ec] = std::from_chars(digits.data(), last, bits, 16);
    if (ec != std::errc{} || end != last) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(bits);
  }
  return idforge::apps::parse_int64(text);
}

std::string format_key_hex(const std::int64_t key) {
  std::array<char, 19> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "0x%016llx",
                static_cast<unsigned long long>(static_cast<std::uint64_t>(key)));
  return std::string{buffer.data()};
}

idforge::core::Result<nlohmann::json, std::string> build_obfuscation_output(
    const idforge::obfuscation::IntObfuscator& obfuscator, const ObfuscationDirection direction,
    const std::vector<std::string>& values) {
  using OutputResult = idforge::core::Result<nlohmann::json, std::string>;

  nlohmann::json out;
  out["key"] = format_key_hex(obfuscator.key());
  out["results"] = nlohmann::json::array();

  for (const auto& text : values) {
    const auto input = idforge::apps::parse_int64(text);
    if (!input.has_value()) {
      return OutputResult::err("not a 64-bit signed integer: '" + text + "'");
    }
    const std::int64_t output = direction == ObfuscationDirection::kObfuscate
                                    ? obfuscator.obfuscate(input.value())
                                    : obfuscator.deobfuscate(input.value());
    out["results"].push_back({{"input", input.value()}, {"output", output}});
  }
  return OutputResult::ok(std::move(out));
}
