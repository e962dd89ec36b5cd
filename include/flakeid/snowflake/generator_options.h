#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::snowflake {

// GeneratorOptions holds raw, user-supplied generator settings before validation.
// Every field is optional; absent fields take defaults during resolution.
struct GeneratorOptions {
  std::optional<int> machine_id_bits;        // NOLINT(readability-identifier-naming)
  std::optional<int> sequence_bits;          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> machine_id;    // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> epoch;      // NOLINT(readability-identifier-naming)
};

// resolve_generator_options applies defaults and validates options into a GeneratorConfig.
//
// Rules (first failure is returned, all as kConfiguration):
// - Defaults: machine_id_bits = 10, sequence_bits = 12, epoch = 2024-01-01T00:00:00.000Z
// - If only one width is given, the other is derived as 22 - given
// - Both widths must be > 0 and sum to 22
// - machine_id, if given, must lie in [0, 2^machine_id_bits - 1]; absent means auto-derive
// - epoch must lie in [1970-01-01T00:00:00.000Z, clock.now()]
[[nodiscard]] core::Result<GeneratorConfig, core::Error> resolve_generator_options(
    const GeneratorOptions& options, core::IClock& clock);

// merge_generator_options overlays every field present in `overrides` onto `base`.
[[nodiscard]] GeneratorOptions merge_generator_options(const GeneratorOptions& base,
                                                       const GeneratorOptions& overrides);

// parse_generator_options_json reads a JSON object of the form
//   {"machine_id_bits": 10, "sequence_bits": 12, "machine_id": 5, "epoch": "2024-01-01T00:00:00Z"}
// where epoch is either unix milliseconds or an ISO 8601 string.
// Fails with kConfiguration on non-object input, unknown keys, null values or wrong types.
[[nodiscard]] core::Result<GeneratorOptions, core::Error> parse_generator_options_json(
    const nlohmann::json& j);

// load_generator_options_file parses a JSON config file with parse_generator_options_json.
// Fails with kConfiguration if the file cannot be read or is not valid JSON.
[[nodiscard]] core::Result<GeneratorOptions, core::Error> load_generator_options_file(
    const std::string& path);

}  // namespace flakeid::snowflake
