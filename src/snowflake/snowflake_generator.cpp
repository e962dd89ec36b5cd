#include "flakeid/snowflake/snowflake_generator.h"

#include <charconv>
#include <stdexcept>
#include <thread>

namespace flakeid::snowflake {

core::Result<std::unique_ptr<SnowflakeGenerator>, core::Error> SnowflakeGenerator::create(
    const GeneratorConfig& config, core::IClock& clock, machine::IMachineIdProvider& machine_ids) {
  using R = std::unique_ptr<SnowflakeGenerator>;

  const BitLayout& layout = config.layout;
  if (layout.machine_id_bits <= 0 || layout.sequence_bits <= 0) {
    return core::fail<R>(core::ErrorKind::kConfiguration,
                         "machine_id_bits and sequence_bits must be greater than 0");
  }
  if (!layout.is_valid()) {
    return core::fail<R>(core::ErrorKind::kConfiguration,
                         "Sum of machine_id_bits and sequence_bits must be equal to 22 (got " +
                             std::to_string(layout.machine_id_bits) + " + " +
                             std::to_string(layout.sequence_bits) + ")");
  }

  std::uint64_t machine_id = 0;
  if (config.machine_id.has_value()) {
    machine_id = config.machine_id.value();
    if (machine_id > layout.max_machine_id()) {
      return core::fail<R>(core::ErrorKind::kConfiguration,
                           "machine_id must be between 0 and " +
                               std::to_string(layout.max_machine_id()) + " (got " +
                               std::to_string(machine_id) + ")");
    }
  } else {
    machine_id = machine_ids.machine_id() & layout.max_machine_id();
  }

  const auto now = clock.now();
  if (now > config.epoch &&
      static_cast<std::uint64_t>((now - config.epoch).count()) > kMaxTimestamp) {
    return core::fail<R>(core::ErrorKind::kConfiguration,
                         "epoch " + core::format_iso8601(config.epoch) +
                             " is too far in the past for a 41-bit timestamp");
  }

  return core::Result<R, core::Error>::ok(
      R(new SnowflakeGenerator(layout, machine_id, config.epoch, clock)));
}

SnowflakeGenerator::SnowflakeGenerator(const BitLayout& layout, const std::uint64_t machine_id,
                                       const core::Timestamp epoch, core::IClock& clock)
    : layout_(layout),
      machine_id_(machine_id),
      epoch_(epoch),
      clock_(clock),
      last_timestamp_(epoch) {}

std::string SnowflakeGenerator::next_id() {
  return std::to_string(next_id_value());
}

std::uint64_t SnowflakeGenerator::next_id_value() {
  std::lock_guard<std::mutex> lock(mutex_);

  // The timestamp field never moves backwards.
  core::Timestamp now = wait_until(last_timestamp_);

  std::uint64_t sequence = 0;
  if (now == last_timestamp_) {
    sequence = (sequence_ + 1) & layout_.max_sequence();
    if (sequence == 0) {
      // Sequence space for this millisecond is exhausted.
      now = wait_until(last_timestamp_ + std::chrono::milliseconds{1});
    }
  }

  const auto relative = static_cast<std::uint64_t>((now - epoch_).count());
  if (relative > kMaxTimestamp) {
    const auto limit = epoch_ + std::chrono::milliseconds{static_cast<std::int64_t>(kMaxTimestamp)};
    throw std::overflow_error("clock reads " + core::format_iso8601(now) +
                              ", past the last representable timestamp " +
                              core::format_iso8601(limit));
  }

  last_timestamp_ = now;
  sequence_ = sequence;
  return compose(layout_, IdFields{relative, machine_id_, sequence_});
}

core::Timestamp SnowflakeGenerator::wait_until(const core::Timestamp target) {
  core::Timestamp now = clock_.now();
  while (now < target) {
    std::this_thread::yield();
    now = clock_.now();
  }
  return now;
}

core::Result<std::uint64_t, core::Error> SnowflakeGenerator::boundary_value(
    const core::Timestamp timestamp, const bool last) const {
  if (timestamp < epoch_) {
    return core::fail<std::uint64_t>(
        core::ErrorKind::kInvalidTimestamp,
        "Timestamp must be greater than or equal to " + core::format_iso8601(epoch_));
  }

  const auto relative = static_cast<std::uint64_t>((timestamp - epoch_).count());
  if (relative > kMaxTimestamp) {
    const auto limit = epoch_ + std::chrono::milliseconds{static_cast<std::int64_t>(kMaxTimestamp)};
    return core::fail<std::uint64_t>(
        core::ErrorKind::kInvalidTimestamp,
        "Timestamp must be less than or equal to " + core::format_iso8601(limit));
  }

  IdFields fields{relative, 0, 0};
  if (last) {
    fields.machine_id = layout_.max_machine_id();
    fields.sequence = layout_.max_sequence();
  }
  return core::Result<std::uint64_t, core::Error>::ok(compose(layout_, fields));
}

core::Result<std::uint64_t, core::Error> SnowflakeGenerator::first_id_value_at(
    const core::Timestamp timestamp) const {
  return boundary_value(timestamp, false);
}

core::Result<std::uint64_t, core::Error> SnowflakeGenerator::last_id_value_at(
    const core::Timestamp timestamp) const {
  return boundary_value(timestamp, true);
}

core::Result<std::string, core::Error> SnowflakeGenerator::first_id_at(
    const core::Timestamp timestamp) const {
  const auto value = first_id_value_at(timestamp);
  if (!value.has_value()) {
    return core::Result<std::string, core::Error>::err(value.error());
  }
  return core::Result<std::string, core::Error>::ok(std::to_string(value.value()));
}

core::Result<std::string, core::Error> SnowflakeGenerator::first_id_at(
    const std::int64_t unix_millis) const {
  return first_id_at(core::from_unix_millis(unix_millis));
}

core::Result<std::string, core::Error> SnowflakeGenerator::last_id_at(
    const core::Timestamp timestamp) const {
  const auto value = last_id_value_at(timestamp);
  if (!value.has_value()) {
    return core::Result<std::string, core::Error>::err(value.error());
  }
  return core::Result<std::string, core::Error>::ok(std::to_string(value.value()));
}

core::Result<std::string, core::Error> SnowflakeGenerator::last_id_at(
    const std::int64_t unix_millis) const {
  return last_id_at(core::from_unix_millis(unix_millis));
}

core::Result<DecodedId, core::Error> SnowflakeGenerator::decode_id(std::string_view id) const {
  // from_chars on an unsigned type rejects signs, whitespace and overflow.
  std::uint64_t value = 0;
  const char* first = id.data();
  const char* last = id.data() + id.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (id.empty() || ec != std::errc{} || ptr != last) {
    return core::fail<DecodedId>(core::ErrorKind::kInvalidId,
                                 "snowflake id must be a valid numeric string: '" +
                                     std::string(id) + "'");
  }
  return core::Result<DecodedId, core::Error>::ok(decode_id_value(value));
}

DecodedId SnowflakeGenerator::decode_id_value(const std::uint64_t id) const {
  const IdFields fields = decompose(layout_, id);
  return DecodedId{
      .timestamp = epoch_ + std::chrono::milliseconds{static_cast<std::int64_t>(
                                fields.relative_millis)},
      .machine_id = static_cast<std::uint32_t>(fields.machine_id),
      .sequence = static_cast<std::uint32_t>(fields.sequence),
  };
}

}  // namespace flakeid::snowflake
