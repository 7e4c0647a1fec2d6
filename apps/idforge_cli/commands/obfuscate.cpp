#include "obfuscate.h"

#include "idforge/obfuscation/int_obfuscator.h"

#include "obfuscate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

int run_obfuscation(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                    const ObfuscationDirection direction, const std::string& usage) {
  const std::vector<idforge::apps::Option<ObfuscateCliConfig>> options = {
      {"--key", true, "Obfuscation key, decimal or 0x-prefixed hex (0 or omitted: default key)",
       [](ObfuscateCliConfig& c, const std::string& v) {
         const auto key = parse_obfuscation_key(v);
         if (!key.has_value()) {
           std::cerr << "Invalid --key: " << v << "\n";
           return false;
         }
         c.key = key.value();
         return true;
       }},
  };

  const auto parsed = idforge::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.positional.empty()) {
    idforge::apps::print_usage(std::cerr, usage, options);
    return 1;
  }

  const idforge::obfuscation::IntObfuscator obfuscator(parsed.config.key);
  const auto out = build_obfuscation_output(obfuscator, direction, parsed.positional);
  if (!out.has_value()) {
    std::cerr << "Error: " << out.error() << "\n";
    return 1;
  }

  std::cout << out.value().dump(2) << "\n";
  return 0;
}

}  // namespace

int cmd_obfuscate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_obfuscation(argc, argv, ObfuscationDirection::kObfuscate,
                         "idforge_cli obfuscate [--key <key>] <id>...");
}

int cmd_deobfuscate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_obfuscation(argc, argv, ObfuscationDirection::kDeobfuscate,
                         "idforge_cli deobfuscate [--key <key>] <code>...");
}
