#include "flakeid/snowflake/generator_options.h"

#include <array>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>

namespace flakeid::snowflake {

namespace {

constexpr std::array<std::string_view, 4> kValidKeys = {"machine_id_bits", "sequence_bits",
                                                        "machine_id", "epoch"};

core::Error config_error(std::string message) {
  return core::Error{core::ErrorKind::kConfiguration, std::move(message)};
}

core::Result<std::int64_t, core::Error> read_integer(const nlohmann::json& j,
                                                     const std::string& key) {
  const auto& v = j.at(key);
  if (!v.is_number_integer()) {
    return core::Result<std::int64_t, core::Error>::err(
        config_error(key + " must be an integer"));
  }
  if (v.is_number_unsigned() &&
      v.get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return core::Result<std::int64_t, core::Error>::err(config_error(key + " is out of range"));
  }
  return core::Result<std::int64_t, core::Error>::ok(v.get<std::int64_t>());
}

core::Result<int, core::Error> read_width(const nlohmann::json& j, const std::string& key) {
  const auto value = read_integer(j, key);
  if (!value.has_value()) {
    return core::Result<int, core::Error>::err(value.error());
  }
  if (value.value() < std::numeric_limits<int>::min() ||
      value.value() > std::numeric_limits<int>::max()) {
    return core::Result<int, core::Error>::err(config_error(key + " is out of range"));
  }
  return core::Result<int, core::Error>::ok(static_cast<int>(value.value()));
}

}  // namespace

core::Result<GeneratorConfig, core::Error> resolve_generator_options(
    const GeneratorOptions& options, core::IClock& clock) {
  using R = core::Result<GeneratorConfig, core::Error>;

  for (const auto& width : {options.machine_id_bits, options.sequence_bits}) {
    if (width.has_value() && width.value() <= 0) {
      return R::err(config_error("machine_id_bits and sequence_bits must be greater than 0"));
    }
    if (width.has_value() && width.value() >= kPayloadBits) {
      return R::err(config_error(
          "Sum of machine_id_bits and sequence_bits must be equal to 22 because the id is 64-bit "
          "and the timestamp is 41-bit"));
    }
  }

  // One width given derives the other; neither given takes the 10/12 default.
  BitLayout layout;
  if (options.machine_id_bits.has_value() && options.sequence_bits.has_value()) {
    layout.machine_id_bits = options.machine_id_bits.value();
    layout.sequence_bits = options.sequence_bits.value();
  } else if (options.machine_id_bits.has_value()) {
    layout.machine_id_bits = options.machine_id_bits.value();
    layout.sequence_bits = kPayloadBits - layout.machine_id_bits;
  } else if (options.sequence_bits.has_value()) {
    layout.sequence_bits = options.sequence_bits.value();
    layout.machine_id_bits = kPayloadBits - layout.sequence_bits;
  }

  if (layout.machine_id_bits + layout.sequence_bits != kPayloadBits) {
    return R::err(config_error(
        "Sum of machine_id_bits and sequence_bits must be equal to 22 because the id is 64-bit "
        "and the timestamp is 41-bit"));
  }

  GeneratorConfig config;
  config.layout = layout;

  if (options.machine_id.has_value()) {
    const std::int64_t machine_id = options.machine_id.value();
    if (machine_id < 0 || static_cast<std::uint64_t>(machine_id) > layout.max_machine_id()) {
      return R::err(config_error("machine_id must be between 0 and " +
                                 std::to_string(layout.max_machine_id())));
    }
    config.machine_id = static_cast<std::uint64_t>(machine_id);
  }

  if (options.epoch.has_value()) {
    const core::Timestamp epoch = options.epoch.value();
    if (core::to_unix_millis(epoch) < 0 || epoch > clock.now()) {
      return R::err(config_error("epoch must be between 1970-01-01T00:00:00.000Z and the "
                                 "current time (got " +
                                 core::format_iso8601(epoch) + ")"));
    }
    config.epoch = epoch;
  }

  return R::ok(config);
}

GeneratorOptions merge_generator_options(const GeneratorOptions& base,
                                         const GeneratorOptions& overrides) {
  GeneratorOptions merged = base;
  if (overrides.machine_id_bits.has_value()) {
    merged.machine_id_bits = overrides.machine_id_bits;
  }
  if (overrides.sequence_bits.has_value()) {
    merged.sequence_bits = overrides.sequence_bits;
  }
  if (overrides.machine_id.has_value()) {
    merged.machine_id = overrides.machine_id;
  }
  if (overrides.epoch.has_value()) {
    merged.epoch = overrides.epoch;
  }
  return merged;
}

core::Result<GeneratorOptions, core::Error> parse_generator_options_json(const nlohmann::json& j) {
  using R = core::Result<GeneratorOptions, core::Error>;

  if (!j.is_object()) {
    return R::err(config_error("options must be a JSON object"));
  }

  for (const auto& item : j.items()) {
    bool known = false;
    for (const auto key : kValidKeys) {
      if (item.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      return R::err(config_error("Invalid option parameter '" + item.key() + "'"));
    }
    if (item.value().is_null()) {
      return R::err(config_error(item.key() + " must not be null"));
    }
  }

  GeneratorOptions options;

  if (j.contains("machine_id_bits")) {
    const auto bits = read_width(j, "machine_id_bits");
    if (!bits.has_value()) {
      return R::err(bits.error());
    }
    options.machine_id_bits = bits.value();
  }

  if (j.contains("sequence_bits")) {
    const auto bits = read_width(j, "sequence_bits");
    if (!bits.has_value()) {
      return R::err(bits.error());
    }
    options.sequence_bits = bits.value();
  }

  if (j.contains("machine_id")) {
    const auto id = read_integer(j, "machine_id");
    if (!id.has_value()) {
      return R::err(id.error());
    }
    options.machine_id = id.value();
  }

  if (j.contains("epoch")) {
    const auto& epoch = j.at("epoch");
    if (epoch.is_number_integer()) {
      const auto millis = read_integer(j, "epoch");
      if (!millis.has_value()) {
        return R::err(millis.error());
      }
      options.epoch = core::from_unix_millis(millis.value());
    } else if (epoch.is_string()) {
      const auto parsed = core::parse_iso8601(epoch.get<std::string>());
      if (!parsed.has_value()) {
        return R::err(config_error("epoch must be an ISO 8601 UTC timestamp (got '" +
                                   epoch.get<std::string>() + "')"));
      }
      options.epoch = parsed.value();
    } else {
      return R::err(config_error("epoch must be unix milliseconds or an ISO 8601 string"));
    }
  }

  return R::ok(options);
}

core::Result<GeneratorOptions, core::Error> load_generator_options_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<GeneratorOptions, core::Error>::err(
        config_error("cannot open config file: " + path));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto j = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return core::Result<GeneratorOptions, core::Error>::err(
        config_error("config file is not valid JSON: " + path));
  }
  return parse_generator_options_json(j);
}

}  // namespace flakeid::snowflake
