#pragma once

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace flakeid::snowflake {

// default_generator returns the process-wide generator, built on first use with
// machine_id_bits = 10, sequence_bits = 12, the 2024-01-01 epoch, the system clock and a
// machine id derived from the host's first non-loopback IPv4 interface.
//
// Initialisation is thread-safe (function-local static). Throws std::runtime_error if the
// generator cannot be built.
[[nodiscard]] SnowflakeGenerator& default_generator();

// Free-function facade over default_generator().
[[nodiscard]] std::string new_id();
[[nodiscard]] core::Result<std::string, core::Error> first_id_at(core::Timestamp timestamp);
[[nodiscard]] core::Result<std::string, core::Error> first_id_at(std::int64_t unix_millis);
[[nodiscard]] core::Result<std::string, core::Error> last_id_at(core::Timestamp timestamp);
[[nodiscard]] core::Result<std::string, core::Error> last_id_at(std::int64_t unix_millis);
[[nodiscard]] core::Result<DecodedId, core::Error> parse_id(std::string_view id);

}  // namespace flakeid::snowflake
