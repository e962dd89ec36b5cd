#include "next.h"

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/machine/machine_id_provider.h"

#include "generator_flags.h"
#include "id_logic.h"
#include <iostream>

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = flakeid::cli::parse_next_flags(argc, argv);
  if (!parsed.ok) {
    return 2;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Usage: flakeid_cli next [--count N] [generator options]\n";
    return 2;
  }

  flakeid::core::SystemClock clock;
  flakeid::machine::NetworkInterfaceMachineIdProvider machine_ids;
  auto generator = flakeid::cli::build_generator(parsed.config, clock, machine_ids);
  if (!generator.has_value()) {
    std::cerr << flakeid::core::to_string(generator.error().kind) << ": "
              << generator.error().message << "\n";
    return 1;
  }

  return flakeid::cli::execute_next(*generator.value(), parsed.config.count, std::cout,
                                    std::cerr);
}
