#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/machine/machine_id_provider.h"
#include "flakeid/snowflake/generator_options.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include "shared/arg_parser.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::cli {

// GeneratorCliConfig holds the generator flags shared by every subcommand.
// Flag values override the same settings read from --config.
struct GeneratorCliConfig {
  snowflake::GeneratorOptions options;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;  // NOLINT(readability-identifier-naming)
  bool verbose{false};                     // NOLINT(readability-identifier-naming)
  int count{1};                            // NOLINT(readability-identifier-naming)
};

// Option registry for the generator flags shared by every subcommand.
[[nodiscard]] std::vector<apps::Option<GeneratorCliConfig>> generator_option_registry();

// generator_option_registry() plus --count, accepted by `next` only.
[[nodiscard]] std::vector<apps::Option<GeneratorCliConfig>> next_option_registry();

// parse_generator_flags parses argv[2..] (argv[1] is the subcommand) against
// generator_option_registry(); parse_next_flags uses next_option_registry().
[[nodiscard]] apps::ParsedOptions<GeneratorCliConfig> parse_generator_flags(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
[[nodiscard]] apps::ParsedOptions<GeneratorCliConfig> parse_next_flags(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// build_generator loads --config (if any), overlays flag values, resolves defaults and
// constructs the generator. With verbose set, a startup block is written to stderr.
[[nodiscard]] core::Result<std::unique_ptr<snowflake::SnowflakeGenerator>, core::Error>
build_generator(const GeneratorCliConfig& config, core::IClock& clock,
                machine::IMachineIdProvider& machine_ids);

}  // namespace flakeid::cli
