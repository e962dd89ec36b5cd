#include "flakeid/core/version.h"

#include "commands/boundary.h"
#include "commands/decode.h"
#include "commands/generator_flags.h"
#include "commands/next.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& out) {
  out << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
      << "Usage: flakeid_cli <command> [arguments] [options]\n"
      << "\n"
      << "Commands:\n"
      << "  next                 Generate new ids (see --count)\n"
      << "  first-at <timestamp> Smallest id at a unix-ms or ISO 8601 timestamp\n"
      << "  last-at <timestamp>  Largest id at a unix-ms or ISO 8601 timestamp\n"
      << "  decode <id>          Decode an id into timestamp, machine id and sequence\n"
      << "\n"
      << "Options:\n";
  flakeid::apps::print_options(out, flakeid::cli::next_option_registry());
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "next") {
    return cmd_next(argc, argv);
  }
  if (subcommand == "first-at") {
    return cmd_first_at(argc, argv);
  }
  if (subcommand == "last-at") {
    return cmd_last_at(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage(std::cout);
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << flakeid::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return 2;
}
