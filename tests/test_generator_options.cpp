#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/generator_options.h"

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace flakeid;
using snowflake::GeneratorOptions;

namespace {

// 2026-01-01T00:00:00.000Z
constexpr std::int64_t kNow = 1767225600000;

}  // namespace

// ── resolve_generator_options: defaults and derivation ──────────────────────

TEST_CASE("resolve_generator_options: empty options take defaults", "[options]") {
  core::ManualClock clock(core::from_unix_millis(kNow));

  const auto config = snowflake::resolve_generator_options(GeneratorOptions{}, clock);
  REQUIRE(config.has_value());
  CHECK(config.value().layout == snowflake::BitLayout{10, 12});
  CHECK_FALSE(config.value().machine_id.has_value());
  CHECK(core::format_iso8601(config.value().epoch) == "2024-01-01T00:00:00.000Z");
}

TEST_CASE("resolve_generator_options: one width derives the other", "[options]") {
  core::ManualClock clock(core::from_unix_millis(kNow));

  GeneratorOptions machine_only;
  machine_only.machine_id_bits = 5;
  const auto a = snowflake::resolve_generator_options(machine_only, clock);
  REQUIRE(a.has_value());
  CHECK(a.value().layout == snowflake::BitLayout{5, 17});

  GeneratorOptions sequence_only;
  sequence_only.sequence_bits = 8;
  const auto b = snowflake::resolve_generator_options(sequence_only, clock);
  REQUIRE(b.has_value());
  CHECK(b.value().layout == snowflake::BitLayout{14, 8});
}

TEST_CASE("resolve_generator_options: invalid widths", "[options]") {
  core::ManualClock clock(core::from_unix_millis(kNow));

  SECTION("sum is not 22") {
    GeneratorOptions options;
    options.machine_id_bits = 10;
    options.sequence_bits = 10;
    const auto result = snowflake::resolve_generator_options(options, clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ErrorKind::kConfiguration);
  }

  SECTION("zero width") {
    GeneratorOptions options;
    options.machine_id_bits = 0;
    CHECK_FALSE(snowflake::resolve_generator_options(options, clock).has_value());
  }

  SECTION("derived width would be zero") {
    GeneratorOptions options;
    options.sequence_bits = 22;
    CHECK_FALSE(snowflake::resolve_generator_options(options, clock).has_value());
  }

  SECTION("negative width") {
    GeneratorOptions options;
    options.sequence_bits = -3;
    CHECK_FALSE(snowflake::resolve_generator_options(options, clock).has_value());
  }
}

TEST_CASE("resolve_generator_options: machine id range", "[options]") {
  core::ManualClock clock(core::from_unix_millis(kNow));

  GeneratorOptions options;
  options.machine_id_bits = 4;

  options.machine_id = 15;
  const auto ok = snowflake::resolve_generator_options(options, clock);
  REQUIRE(ok.has_value());
  REQUIRE(ok.value().machine_id.has_value());
  CHECK(ok.value().machine_id.value() == 15);

  options.machine_id = 16;
  const auto too_big = snowflake::resolve_generator_options(options, clock);
  REQUIRE_FALSE(too_big.has_value());
  CHECK(too_big.error().kind == core::ErrorKind::kConfiguration);

  options.machine_id = -1;
  CHECK_FALSE(snowflake::resolve_generator_options(options, clock).has_value());
}

TEST_CASE("resolve_generator_options: epoch must lie between 1970 and now", "[options]") {
  core::ManualClock clock(core::from_unix_millis(kNow));
  GeneratorOptions options;

  options.epoch = core::from_unix_millis(0);
  const auto unix_epoch = snowflake::resolve_generator_options(options, clock);
  REQUIRE(unix_epoch.has_value());
  CHECK(core::to_unix_millis(unix_epoch.value().epoch) == 0);

  options.epoch = core::from_unix_millis(kNow);
  CHECK(snowflake::resolve_generator_options(options, clock).has_value());

  options.epoch = core::from_unix_millis(kNow + 1);
  const auto future = snowflake::resolve_generator_options(options, clock);
  REQUIRE_FALSE(future.has_value());
  CHECK(future.error().kind == core::ErrorKind::kConfiguration);

  options.epoch = core::from_unix_millis(-1);
  CHECK_FALSE(snowflake::resolve_generator_options(options, clock).has_value());
}

// ── merge_generator_options ─────────────────────────────────────────────────

TEST_CASE("merge_generator_options: overrides win field by field", "[options]") {
  GeneratorOptions base;
  base.machine_id_bits = 8;
  base.machine_id = 3;

  GeneratorOptions overrides;
  overrides.machine_id = 9;
  overrides.epoch = core::from_unix_millis(1000);

  const auto merged = snowflake::merge_generator_options(base, overrides);
  CHECK(merged.machine_id_bits == 8);
  CHECK_FALSE(merged.sequence_bits.has_value());
  CHECK(merged.machine_id == 9);
  CHECK(merged.epoch == core::from_unix_millis(1000));
}

// ── parse_generator_options_json ────────────────────────────────────────────

TEST_CASE("parse_generator_options_json: full object", "[options][json]") {
  const auto j = nlohmann::json::parse(R"({
    "machine_id_bits": 10,
    "sequence_bits": 12,
    "machine_id": 5,
    "epoch": "2024-01-01T00:00:00.000Z"
  })");

  const auto options = snowflake::parse_generator_options_json(j);
  REQUIRE(options.has_value());
  CHECK(options.value().machine_id_bits == 10);
  CHECK(options.value().sequence_bits == 12);
  CHECK(options.value().machine_id == 5);
  CHECK(options.value().epoch == core::from_unix_millis(1704067200000));
}

TEST_CASE("parse_generator_options_json: epoch as unix milliseconds", "[options][json]") {
  const auto options =
      snowflake::parse_generator_options_json(nlohmann::json{{"epoch", 1735689600000}});
  REQUIRE(options.has_value());
  CHECK(options.value().epoch == core::from_unix_millis(1735689600000));
}

TEST_CASE("parse_generator_options_json: empty object leaves every field unset",
          "[options][json]") {
  const auto options = snowflake::parse_generator_options_json(nlohmann::json::object());
  REQUIRE(options.has_value());
  CHECK_FALSE(options.value().machine_id_bits.has_value());
  CHECK_FALSE(options.value().sequence_bits.has_value());
  CHECK_FALSE(options.value().machine_id.has_value());
  CHECK_FALSE(options.value().epoch.has_value());
}

TEST_CASE("parse_generator_options_json: rejected inputs", "[options][json]") {
  const auto rejects = [](const nlohmann::json& j) {
    const auto result = snowflake::parse_generator_options_json(j);
    return !result.has_value() && result.error().kind == core::ErrorKind::kConfiguration;
  };

  CHECK(rejects(nlohmann::json::array({1, 2})));
  CHECK(rejects(nlohmann::json("machine_id_bits")));
  CHECK(rejects(nlohmann::json(nullptr)));
  CHECK(rejects(nlohmann::json{{"worker_id", 3}}));
  CHECK(rejects(nlohmann::json{{"machine_id", nullptr}}));
  CHECK(rejects(nlohmann::json{{"machine_id", "5"}}));
  CHECK(rejects(nlohmann::json{{"machine_id_bits", 10.5}}));
  CHECK(rejects(nlohmann::json{{"sequence_bits", true}}));
  CHECK(rejects(nlohmann::json{{"epoch", "last tuesday"}}));
  CHECK(rejects(nlohmann::json{{"epoch", nlohmann::json::array()}}));
  CHECK(rejects(nlohmann::json{{"machine_id_bits", 4294967296LL}}));
  CHECK(rejects(nlohmann::json{{"machine_id", 18446744073709551615ULL}}));
}

// ── load_generator_options_file ─────────────────────────────────────────────

TEST_CASE("load_generator_options_file: reads a JSON file", "[options][json]") {
  const auto path = std::filesystem::temp_directory_path() / "flakeid_options_test.json";
  {
    std::ofstream out(path);
    out << R"({"machine_id_bits": 6, "machine_id": 63})";
  }

  const auto options = snowflake::load_generator_options_file(path.string());
  std::filesystem::remove(path);

  REQUIRE(options.has_value());
  CHECK(options.value().machine_id_bits == 6);
  CHECK(options.value().machine_id == 63);
}

TEST_CASE("load_generator_options_file: missing or malformed files fail", "[options][json]") {
  const auto missing = snowflake::load_generator_options_file("/nonexistent/flakeid.json");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == core::ErrorKind::kConfiguration);

  const auto path = std::filesystem::temp_directory_path() / "flakeid_options_bad.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  const auto malformed = snowflake::load_generator_options_file(path.string());
  std::filesystem::remove(path);
  REQUIRE_FALSE(malformed.has_value());
  CHECK(malformed.error().kind == core::ErrorKind::kConfiguration);
}
