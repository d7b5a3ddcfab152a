#include "commands/generate.h"
#include "commands/inspect.h"
#include "commands/redis_health.h"
#include "commands/verify.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: uidgen_cli <command> [options]\n"
               "\n"
               "Commands:\n"
               "  generate       Generate identifiers (see 'uidgen_cli generate --help')\n"
               "  verify         Check ordering of ids recorded in an audit log\n"
               "  parse <id>     Print the fields of a canonical id\n"
               "  node-address   Print the host-derived default node address\n"
               "  redis-health   PING a Redis endpoint\n"
               "  version        Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "verify") {
    return cmd_verify(argc, argv);
  }
  if (subcommand == "parse") {
    return cmd_parse(argc, argv);
  }
  if (subcommand == "node-address") {
    return cmd_node_address();
  }
  if (subcommand == "redis-health") {
    return cmd_redis_health(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    return cmd_version();
  }
  if (subcommand == "help" || subcommand == "--help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
