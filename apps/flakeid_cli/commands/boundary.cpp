#include "boundary.h"

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/machine/machine_id_provider.h"

#include "generator_flags.h"
#include "id_logic.h"
#include <iostream>

namespace {

int run_boundary(int argc, char* argv[], const bool last) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = flakeid::cli::parse_generator_flags(argc, argv);
  if (!parsed.ok) {
    return 2;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: flakeid_cli " << (last ? "last-at" : "first-at")
              << " <timestamp> [generator options]\n";
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

  return flakeid::cli::execute_boundary(*generator.value(), parsed.positionals.front(), last,
                                        std::cout, std::cerr);
}

}  // namespace

int cmd_first_at(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_boundary(argc, argv, false);
}

int cmd_last_at(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_boundary(argc, argv, true);
}
