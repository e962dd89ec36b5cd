#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/machine/machine_id_provider.h"
#include "flakeid/snowflake/bit_layout.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::snowflake {

// 2024-01-01T00:00:00.000Z
constexpr std::int64_t kDefaultEpochMillis = 1704067200000;

// GeneratorConfig is the already-resolved construction input of a SnowflakeGenerator.
// machine_id == nullopt means "ask the machine id provider".
struct GeneratorConfig {
  BitLayout layout;                          // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> machine_id;   // NOLINT(readability-identifier-naming)
  core::Timestamp epoch{core::from_unix_millis(kDefaultEpochMillis)};  // NOLINT
};

// DecodedId is the field view of an identifier with the timestamp made absolute.
struct DecodedId {
  core::Timestamp timestamp;  // NOLINT(readability-identifier-naming)
  std::uint32_t machine_id;   // NOLINT(readability-identifier-naming)
  std::uint32_t sequence;     // NOLINT(readability-identifier-naming)

  bool operator==(const DecodedId&) const = default;
};

// SnowflakeGenerator issues unique, strictly increasing 64-bit identifiers composed of a
// 41-bit millisecond timestamp relative to the epoch, a machine id and a per-millisecond
// sequence counter.
//
// Design:
// - Identifiers are returned as base-10 strings; *_value() variants return the raw integer
// - At most 2^sequence_bits ids per millisecond; further calls wait for the next tick
// - The timestamp field never decreases: if the clock reads earlier than the last issued
//   tick, next_id() waits until it catches up
// - Clock regression across process restarts is not detected
// - Once the clock passes epoch + 2^41 - 1 ms, next_id() throws std::overflow_error and
//   leaves the generator state unchanged; ids never wrap around to small values
//
// Thread-safety: next_id() holds a mutex for the whole read-modify-write cycle.
// Boundary and decode operations only read immutable configuration.
//
// The clock passed to create() must outlive the generator.
class SnowflakeGenerator {
 public:
  // Validate config and build a generator.
  // Errors (kConfiguration): widths not positive or not summing to 22, machine id outside
  // [0, 2^machine_id_bits - 1], epoch more than 2^41 - 1 ms before the clock's current time.
  // When config.machine_id is absent the provider's value is masked to the machine id width.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeGenerator>, core::Error> create(
      const GeneratorConfig& config, core::IClock& clock,
      machine::IMachineIdProvider& machine_ids);

  ~SnowflakeGenerator() = default;

  // Not copyable or movable (owns mutable sequence state and a mutex)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  // Throws std::overflow_error when the timestamp no longer fits in 41 bits.
  [[nodiscard]] std::string next_id();
  [[nodiscard]] std::uint64_t next_id_value();

  // Smallest identifier at `timestamp`: machine id and sequence fields are zero.
  // Errors (kInvalidTimestamp): timestamp before the epoch or past the 41-bit range.
  [[nodiscard]] core::Result<std::string, core::Error> first_id_at(core::Timestamp timestamp) const;
  [[nodiscard]] core::Result<std::string, core::Error> first_id_at(std::int64_t unix_millis) const;
  [[nodiscard]] core::Result<std::uint64_t, core::Error> first_id_value_at(
      core::Timestamp timestamp) const;

  // Largest identifier at `timestamp`: machine id and sequence fields at their maxima.
  [[nodiscard]] core::Result<std::string, core::Error> last_id_at(core::Timestamp timestamp) const;
  [[nodiscard]] core::Result<std::string, core::Error> last_id_at(std::int64_t unix_millis) const;
  [[nodiscard]] core::Result<std::uint64_t, core::Error> last_id_value_at(
      core::Timestamp timestamp) const;

  // Errors (kInvalidId): anything other than 1+ decimal digits fitting in 64 bits.
  [[nodiscard]] core::Result<DecodedId, core::Error> decode_id(std::string_view id) const;
  [[nodiscard]] DecodedId decode_id_value(std::uint64_t id) const;

  [[nodiscard]] const BitLayout& layout() const { return layout_; }
  [[nodiscard]] std::uint64_t machine_id() const { return machine_id_; }
  [[nodiscard]] core::Timestamp epoch() const { return epoch_; }

 private:
  SnowflakeGenerator(const BitLayout& layout, std::uint64_t machine_id, core::Timestamp epoch,
                     core::IClock& clock);

  [[nodiscard]] core::Result<std::uint64_t, core::Error> boundary_value(core::Timestamp timestamp,
                                                                        bool last) const;

  // Poll the clock until it reads at least `target`; returns the reading.
  core::Timestamp wait_until(core::Timestamp target);

  const BitLayout layout_;
  const std::uint64_t machine_id_;
  const core::Timestamp epoch_;
  core::IClock& clock_;

  std::mutex mutex_;
  core::Timestamp last_timestamp_;
  std::uint64_t sequence_{0};
};

}  // namespace flakeid::snowflake
