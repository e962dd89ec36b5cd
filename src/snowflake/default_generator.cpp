#include "flakeid/snowflake/default_generator.h"

#include "flakeid/core/clock.h"
#include "flakeid/machine/machine_id_provider.h"

#include <memory>
#include <stdexcept>

namespace flakeid::snowflake {

namespace {

std::unique_ptr<SnowflakeGenerator> build_default_generator() {
  // Process-lifetime dependencies; the generator holds a reference to the clock.
  static core::SystemClock clock;
  machine::NetworkInterfaceMachineIdProvider machine_ids;

  auto result = SnowflakeGenerator::create(GeneratorConfig{}, clock, machine_ids);
  if (!result.has_value()) {
    throw std::runtime_error("default snowflake generator is not initialized: " +
                             result.error().message);
  }
  return std::move(result.value());
}

}  // namespace

SnowflakeGenerator& default_generator() {
  static const std::unique_ptr<SnowflakeGenerator> generator = build_default_generator();
  return *generator;
}

std::string new_id() {
  return default_generator().next_id();
}

core::Result<std::string, core::Error> first_id_at(const core::Timestamp timestamp) {
  return default_generator().first_id_at(timestamp);
}

core::Result<std::string, core::Error> first_id_at(const std::int64_t unix_millis) {
  return default_generator().first_id_at(unix_millis);
}

core::Result<std::string, core::Error> last_id_at(const core::Timestamp timestamp) {
  return default_generator().last_id_at(timestamp);
}

core::Result<std::string, core::Error> last_id_at(const std::int64_t unix_millis) {
  return default_generator().last_id_at(unix_millis);
}

core::Result<DecodedId, core::Error> parse_id(std::string_view id) {
  return default_generator().decode_id(id);
}

}  // namespace flakeid::snowflake
