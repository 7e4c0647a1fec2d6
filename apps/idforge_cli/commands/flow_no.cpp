#include "flow_no.h"

#include "idforge/core/clock.h"
#include "idforge/flow/flow_number_generator.h"
#include "idforge/flow/random_source.h"

#include "flow_no_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_flow_no(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<idforge::apps::Option<FlowNoCliConfig>> options = {
      {"--prefix", true, "Business prefix, upper-cased in the output (default empty)",
       [](FlowNoCliConfig& c, const std::string& v) {
         c.prefix = v;
         return true;
       }},
      {"--count", true, "Number of flow numbers to generate (default 1)",
       [](FlowNoCliConfig& c, const std::string& v) {
         const auto count = idforge::apps::parse_int64(v);
         if (!count.has_value()) {
           std::cerr << "Invalid --count: " << v << "\n";
           return false;
         }
         c.count = count.value();
         return true;
       }},
  };

  const auto parsed = idforge::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positional.empty()) {
    idforge::apps::print_usage(std::cerr, "idforge_cli flow-no [options]", options);
    return 1;
  }

  const std::string config_error = validate_flow_no_cli_config(parsed.config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  idforge::flow::FlowNumberGenerator generator(idforge::flow::shared_flow_sequence(),
                                               idforge::core::system_clock(),
                                               idforge::flow::system_random());
  std::cout << build_flow_numbers(generator, parsed.config).dump(2) << "\n";
  return 0;
}
