#include "flakeid/core/time.h"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

namespace {

// Reads exactly `width` decimal digits starting at `pos`.
std::optional<int> read_fixed(std::string_view text, std::size_t pos, std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

std::string format_iso8601(const Timestamp ts) {
  using namespace std::chrono;

  const auto day_point = floor<days>(ts);
  const year_month_day ymd{day_point};
  const hh_mm_ss<milliseconds> tod{ts - day_point};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << '.' << std::setw(3) << tod.subseconds().count() << 'Z';
  return oss.str();
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
  using namespace std::chrono;

  // YYYY-MM-DD
  const auto y = read_fixed(text, 0, 4);
  const auto mo = read_fixed(text, 5, 2);
  const auto d = read_fixed(text, 8, 2);
  if (!y || !mo || !d || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                           day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  Timestamp ts = time_point_cast<milliseconds>(sys_days{ymd});

  if (text.size() == 10) {
    return ts;
  }

  // THH:MM:SS
  if (text[10] != 'T') {
    return std::nullopt;
  }
  const auto h = read_fixed(text, 11, 2);
  const auto mi = read_fixed(text, 14, 2);
  const auto s = read_fixed(text, 17, 2);
  if (!h || !mi || !s || text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }
  if (*h > 23 || *mi > 59 || *s > 59) {
    return std::nullopt;
  }
  ts += hours{*h} + minutes{*mi} + seconds{*s};

  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int millis = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits == 3) {
        return std::nullopt;
      }
      millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      millis *= 10;
    }
    ts += milliseconds{millis};
  }

  if (pos + 1 != text.size() || text[pos] != 'Z') {
    return std::nullopt;
  }
  return ts;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  // Integer forms never contain '-' past the sign position, ISO dates always do.
  if (text.find('-', 1) == std::string_view::npos) {
    std::int64_t millis = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, millis);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    return from_unix_millis(millis);
  }

  return parse_iso8601(text);
}

}  // namespace flakeid::core
