#include "commands/flow_no.h"
#include "commands/obfuscate.h"
#include "commands/snowflake.h"

#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cerr << "idforge_cli v0.1\n"
            << "Usage: idforge_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  snowflake        Generate snowflake ids "
               "[--worker-id N] [--datacenter-id N] [--count N] [--short | --explain]\n"
            << "  flow-no          Generate flow numbers [--prefix P] [--count N]\n"
            << "  obfuscate        Mask integer ids [--key K] <id>...\n"
            << "  deobfuscate      Unmask integer ids [--key K] <code>...\n"
            << "  worker-identity  Show the resolved worker identity and machine fingerprint\n\n"
            << "Environment:\n"
            << "  IDWORKER_WORKER_ID, IDWORKER_DATACENTER_ID  worker identity in [0, 31]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "snowflake") {
    return cmd_snowflake(argc, argv);
  }
  if (subcommand == "flow-no") {
    return cmd_flow_no(argc, argv);
  }
  if (subcommand == "obfuscate") {
    return cmd_obfuscate(argc, argv);
  }
  if (subcommand == "deobfuscate") {
    return cmd_deobfuscate(argc, argv);
  }
  if (subcommand == "worker-identity") {
    return cmd_worker_identity(argc, argv);
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
