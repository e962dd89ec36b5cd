#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::core;

// ── format_iso8601 ──────────────────────────────────────────────────────────

TEST_CASE("format_iso8601: unix epoch", "[time]") {
  CHECK(format_iso8601(from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("format_iso8601: millisecond precision", "[time]") {
  CHECK(format_iso8601(from_unix_millis(1704067200000)) == "2024-01-01T00:00:00.000Z");
  CHECK(format_iso8601(from_unix_millis(1704067199999)) == "2023-12-31T23:59:59.999Z");
  CHECK(format_iso8601(from_unix_millis(1709210096789)) == "2024-02-29T12:34:56.789Z");
}

TEST_CASE("format_iso8601: every field is zero-padded", "[time]") {
  CHECK(format_iso8601(from_unix_millis(1000000005)) == "1970-01-12T13:46:40.005Z");
  CHECK(format_iso8601(from_unix_millis(1704164645050)) == "2024-01-02T03:04:05.050Z");
}

// ── parse_iso8601 ───────────────────────────────────────────────────────────

TEST_CASE("parse_iso8601: accepted shapes", "[time]") {
  const auto full = parse_iso8601("2024-01-01T00:00:00.000Z");
  REQUIRE(full.has_value());
  CHECK(to_unix_millis(*full) == 1704067200000);

  const auto no_fraction = parse_iso8601("2024-01-01T00:00:01Z");
  REQUIRE(no_fraction.has_value());
  CHECK(to_unix_millis(*no_fraction) == 1704067201000);

  const auto short_fraction = parse_iso8601("2024-01-01T00:00:00.5Z");
  REQUIRE(short_fraction.has_value());
  CHECK(to_unix_millis(*short_fraction) == 1704067200500);

  const auto date_only = parse_iso8601("2024-01-01");
  REQUIRE(date_only.has_value());
  CHECK(to_unix_millis(*date_only) == 1704067200000);
}

TEST_CASE("parse_iso8601: round-trips through format_iso8601", "[time]") {
  const auto ts = from_unix_millis(1735689600123);
  const auto parsed = parse_iso8601(format_iso8601(ts));
  REQUIRE(parsed.has_value());
  CHECK(*parsed == ts);
}

TEST_CASE("parse_iso8601: rejected shapes", "[time]") {
  CHECK_FALSE(parse_iso8601("").has_value());
  CHECK_FALSE(parse_iso8601("2024").has_value());
  CHECK_FALSE(parse_iso8601("2024-13-01").has_value());
  CHECK_FALSE(parse_iso8601("2023-02-29").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T24:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00.Z").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00.1234Z").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00+01:00").has_value());
  CHECK_FALSE(parse_iso8601("2024/01/01").has_value());
}

// ── parse_timestamp ─────────────────────────────────────────────────────────

TEST_CASE("parse_timestamp: unix milliseconds", "[time]") {
  const auto ts = parse_timestamp("1704067200001");
  REQUIRE(ts.has_value());
  CHECK(to_unix_millis(*ts) == 1704067200001);

  const auto negative = parse_timestamp("-5");
  REQUIRE(negative.has_value());
  CHECK(to_unix_millis(*negative) == -5);
}

TEST_CASE("parse_timestamp: ISO 8601", "[time]") {
  const auto ts = parse_timestamp("2023-12-31T23:59:59.999Z");
  REQUIRE(ts.has_value());
  CHECK(to_unix_millis(*ts) == 1704067199999);
}

TEST_CASE("parse_timestamp: garbage is rejected", "[time]") {
  CHECK_FALSE(parse_timestamp("").has_value());
  CHECK_FALSE(parse_timestamp("yesterday").has_value());
  CHECK_FALSE(parse_timestamp("12ms").has_value());
  CHECK_FALSE(parse_timestamp("1-2").has_value());
}

// ── clocks ──────────────────────────────────────────────────────────────────

TEST_CASE("ManualClock: set and advance", "[time][clock]") {
  ManualClock clock(from_unix_millis(1000));
  CHECK(to_unix_millis(clock.now()) == 1000);

  clock.advance(5);
  CHECK(to_unix_millis(clock.now()) == 1005);

  clock.set(from_unix_millis(42));
  CHECK(to_unix_millis(clock.now()) == 42);
}

TEST_CASE("SystemClock: reads are close to now_utc", "[time][clock]") {
  SystemClock clock;
  const auto before = now_utc();
  const auto reading = clock.now();
  const auto after = now_utc();
  CHECK(reading >= before);
  CHECK(reading <= after);
}
