#pragma once

#include <cstdint>

namespace flakeid::snowflake {

// Identifier bit layout, most significant bit first:
//
//   | 1 unused sign bit | 41-bit timestamp | machine_id_bits | sequence_bits |
//
// machine_id_bits + sequence_bits must equal kPayloadBits so that the
// non-sign payload is exactly 63 bits.
constexpr int kTimestampBits = 41;
constexpr int kPayloadBits = 22;
constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << kTimestampBits) - 1;

struct BitLayout {
  int machine_id_bits{10};  // NOLINT(readability-identifier-naming)
  int sequence_bits{12};    // NOLINT(readability-identifier-naming)

  [[nodiscard]] constexpr bool is_valid() const {
    return machine_id_bits > 0 && sequence_bits > 0 && machine_id_bits < kPayloadBits &&
           sequence_bits < kPayloadBits &&
           machine_id_bits + sequence_bits == kPayloadBits;
  }

  // Derived constants. Only meaningful when is_valid() holds.
  [[nodiscard]] constexpr std::uint64_t max_machine_id() const {
    return (std::uint64_t{1} << machine_id_bits) - 1;
  }
  [[nodiscard]] constexpr std::uint64_t max_sequence() const {
    return (std::uint64_t{1} << sequence_bits) - 1;
  }
  [[nodiscard]] constexpr int timestamp_shift() const { return machine_id_bits + sequence_bits; }

  bool operator==(const BitLayout&) const = default;
};

// Raw identifier fields, timestamp relative to the generator epoch.
struct IdFields {
  std::uint64_t relative_millis{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t machine_id{0};       // NOLINT(readability-identifier-naming)
  std::uint64_t sequence{0};         // NOLINT(readability-identifier-naming)

  bool operator==(const IdFields&) const = default;
};

// Pack fields into an identifier. Fields wider than their slot are masked.
[[nodiscard]] constexpr std::uint64_t compose(const BitLayout& layout, const IdFields& fields) {
  return ((fields.relative_millis & kMaxTimestamp) << layout.timestamp_shift()) |
         ((fields.machine_id & layout.max_machine_id()) << layout.sequence_bits) |
         (fields.sequence & layout.max_sequence());
}

// Inverse of compose(). Bits above the 41-bit timestamp field (the sign bit) are carried into
// relative_millis so that decoding never silently drops information.
[[nodiscard]] constexpr IdFields decompose(const BitLayout& layout, const std::uint64_t id) {
  return IdFields{
      .relative_millis = id >> layout.timestamp_shift(),
      .machine_id = (id >> layout.sequence_bits) & layout.max_machine_id(),
      .sequence = id & layout.max_sequence(),
  };
}

}  // namespace flakeid::snowflake
