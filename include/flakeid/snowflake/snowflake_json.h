#pragma once

#include "flakeid/snowflake/snowflake_generator.h"

#include <nlohmann/json.hpp>

namespace flakeid::snowflake {

// Serialize a decoded identifier.
// Keys: machine_id, sequence, timestamp (ISO 8601), timestamp_ms (unix millis).
[[nodiscard]] nlohmann::json decoded_id_to_json(const DecodedId& decoded);

// Describe a generator's effective configuration for startup diagnostics.
// Keys: epoch, machine_id, machine_id_bits, max_machine_id, max_sequence, sequence_bits,
// timestamp_bits.
[[nodiscard]] nlohmann::json generator_to_json(const SnowflakeGenerator& generator);

}  // namespace flakeid::snowflake
