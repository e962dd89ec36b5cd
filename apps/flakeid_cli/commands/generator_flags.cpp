#include "generator_flags.h"

#include "flakeid/core/time.h"
#include "flakeid/snowflake/snowflake_json.h"

#include <charconv>
#include <iostream>
#include <limits>
#include <string_view>

namespace flakeid::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::optional<std::int64_t> parse_int(std::string_view text) {
  std::int64_t value = 0;
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> parse_small_int(const std::string& flag, const std::string& value) {
  const auto parsed = parse_int(value);
  if (!parsed.has_value() || parsed.value() < std::numeric_limits<int>::min() ||
      parsed.value() > std::numeric_limits<int>::max()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected an integer)\n";
    return std::nullopt;
  }
  return static_cast<int>(parsed.value());
}

bool handle_machine_id_bits(GeneratorCliConfig& config, const std::string& value) {
  const auto bits = parse_small_int("--machine-id-bits", value);
  if (!bits.has_value()) {
    return false;
  }
  config.options.machine_id_bits = bits;
  return true;
}

bool handle_sequence_bits(GeneratorCliConfig& config, const std::string& value) {
  const auto bits = parse_small_int("--sequence-bits", value);
  if (!bits.has_value()) {
    return false;
  }
  config.options.sequence_bits = bits;
  return true;
}

bool handle_machine_id(GeneratorCliConfig& config, const std::string& value) {
  const auto id = parse_int(value);
  if (!id.has_value()) {
    std::cerr << "Invalid --machine-id: " << value << " (expected an integer)\n";
    return false;
  }
  config.options.machine_id = id;
  return true;
}

bool handle_epoch(GeneratorCliConfig& config, const std::string& value) {
  const auto epoch = core::parse_timestamp(value);
  if (!epoch.has_value()) {
    std::cerr << "Invalid --epoch: " << value << " (expected unix milliseconds or ISO 8601)\n";
    return false;
  }
  config.options.epoch = epoch;
  return true;
}

bool handle_config(GeneratorCliConfig& config, const std::string& value) {
  config.config_path = value;
  return true;
}

bool handle_verbose(GeneratorCliConfig& config, const std::string& /*value*/) {
  config.verbose = true;
  return true;
}

bool handle_count(GeneratorCliConfig& config, const std::string& value) {
  const auto count = parse_small_int("--count", value);
  if (!count.has_value()) {
    return false;
  }
  if (count.value() < 1) {
    std::cerr << "Invalid --count: " << value << " (expected a positive integer)\n";
    return false;
  }
  config.count = count.value();
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<GeneratorCliConfig>> generator_option_registry() {
  return {
      {"--machine-id-bits", true, "Bits for the machine id field (default 10)",
       handle_machine_id_bits},
      {"--sequence-bits", true, "Bits for the sequence field (default 12)", handle_sequence_bits},
      {"--machine-id", true, "Machine id (default: derived from the network interface)",
       handle_machine_id},
      {"--epoch", true, "Epoch as unix ms or ISO 8601 (default 2024-01-01T00:00:00.000Z)",
       handle_epoch},
      {"--config", true, "JSON file with machine_id_bits, sequence_bits, machine_id, epoch",
       handle_config},
      {"--verbose", false, "Print the effective generator configuration to stderr",
       handle_verbose},
  };
}

std::vector<apps::Option<GeneratorCliConfig>> next_option_registry() {
  auto options = generator_option_registry();
  options.push_back({"--count", true, "Number of ids to generate (next only)", handle_count});
  return options;
}

apps::ParsedOptions<GeneratorCliConfig> parse_generator_flags(
    int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options(argc, argv, generator_option_registry(), 2);
}

apps::ParsedOptions<GeneratorCliConfig> parse_next_flags(
    int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options(argc, argv, next_option_registry(), 2);
}

core::Result<std::unique_ptr<snowflake::SnowflakeGenerator>, core::Error> build_generator(
    const GeneratorCliConfig& config, core::IClock& clock,
    machine::IMachineIdProvider& machine_ids) {
  using R = core::Result<std::unique_ptr<snowflake::SnowflakeGenerator>, core::Error>;

  snowflake::GeneratorOptions options;
  if (config.config_path.has_value()) {
    const auto loaded = snowflake::load_generator_options_file(config.config_path.value());
    if (!loaded.has_value()) {
      return R::err(loaded.error());
    }
    options = loaded.value();
  }
  options = snowflake::merge_generator_options(options, config.options);

  const auto resolved = snowflake::resolve_generator_options(options, clock);
  if (!resolved.has_value()) {
    return R::err(resolved.error());
  }

  auto generator = snowflake::SnowflakeGenerator::create(resolved.value(), clock, machine_ids);
  if (!generator.has_value()) {
    return generator;
  }

  if (config.verbose) {
    // ── Startup diagnostic block ──────────────────────────────────────────────
    std::cerr << "flakeid snowflake generator\n";
    if (config.config_path.has_value()) {
      std::cerr << "Config:     " << config.config_path.value() << "\n";
    }
    if (resolved.value().machine_id.has_value()) {
      std::cerr << "Machine id: " << generator.value()->machine_id() << " (configured)\n";
    } else {
      std::cerr << "Machine id: " << generator.value()->machine_id()
                << " (derived from network interface)\n";
    }
    std::cerr << "Layout:     " << snowflake::generator_to_json(*generator.value()).dump() << "\n";
  }

  return generator;
}

}  // namespace flakeid::cli
