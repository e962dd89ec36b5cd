#include "flakeid/snowflake/snowflake_json.h"

#include "flakeid/core/time.h"

namespace flakeid::snowflake {

nlohmann::json decoded_id_to_json(const DecodedId& decoded) {
  // nlohmann::json default container is std::map, so keys sort alphabetically.
  nlohmann::json j;
  j["machine_id"] = decoded.machine_id;
  j["sequence"] = decoded.sequence;
  j["timestamp"] = core::format_iso8601(decoded.timestamp);
  j["timestamp_ms"] = core::to_unix_millis(decoded.timestamp);
  return j;
}

nlohmann::json generator_to_json(const SnowflakeGenerator& generator) {
  const BitLayout& layout = generator.layout();

  nlohmann::json j;
  j["epoch"] = core::format_iso8601(generator.epoch());
  j["machine_id"] = generator.machine_id();
  j["machine_id_bits"] = layout.machine_id_bits;
  j["max_machine_id"] = layout.max_machine_id();
  j["max_sequence"] = layout.max_sequence();
  j["sequence_bits"] = layout.sequence_bits;
  j["timestamp_bits"] = kTimestampBits;
  return j;
}

}  // namespace flakeid::snowflake
