#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp now_utc() { return std::chrono::floor<std::chrono::milliseconds>(Clock::now()); }

inline std::int64_t to_unix_millis(const Timestamp ts) { return ts.time_since_epoch().count(); }

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// Format as ISO 8601 UTC with millisecond precision: "2024-01-01T00:00:00.000Z".
[[nodiscard]] std::string format_iso8601(Timestamp ts);

// Parse an ISO 8601 UTC timestamp.
// Accepts: "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SSZ", "YYYY-MM-DDTHH:MM:SS.fffZ"
// (1 to 3 fractional digits). Returns nullopt on any other shape or an invalid date.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

// Parse either a decimal unix-millisecond count (optionally negative) or an ISO 8601 string.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

}  // namespace flakeid::core
