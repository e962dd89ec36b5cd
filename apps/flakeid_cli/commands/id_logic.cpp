#include "id_logic.h"

#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/snowflake_json.h"

#include <stdexcept>

namespace flakeid::cli {

int execute_next(snowflake::SnowflakeGenerator& generator, const int count, std::ostream& out,
                 std::ostream& err) {
  for (int i = 0; i < count; ++i) {
    try {
      out << generator.next_id() << "\n";
    } catch (const std::overflow_error& e) {
      err << core::to_string(core::ErrorKind::kInvalidTimestamp) << ": " << e.what() << "\n";
      return 1;
    }
  }
  return 0;
}

int execute_boundary(const snowflake::SnowflakeGenerator& generator, const std::string& timestamp,
                     const bool last, std::ostream& out, std::ostream& err) {
  const auto parsed = core::parse_timestamp(timestamp);
  if (!parsed.has_value()) {
    err << core::to_string(core::ErrorKind::kInvalidTimestamp)
        << ": Timestamp must be unix milliseconds or ISO 8601 (got '" << timestamp << "')\n";
    return 1;
  }

  const auto id = last ? generator.last_id_at(parsed.value())
                       : generator.first_id_at(parsed.value());
  if (!id.has_value()) {
    err << core::to_string(id.error().kind) << ": " << id.error().message << "\n";
    return 1;
  }

  out << id.value() << "\n";
  return 0;
}

int execute_decode(const snowflake::SnowflakeGenerator& generator, const std::string& id,
                   std::ostream& out, std::ostream& err) {
  const auto decoded = generator.decode_id(id);
  if (!decoded.has_value()) {
    err << core::to_string(decoded.error().kind) << ": " << decoded.error().message << "\n";
    return 1;
  }

  out << snowflake::decoded_id_to_json(decoded.value()).dump(2) << "\n";
  return 0;
}

}  // namespace flakeid::cli
