#pragma once

#include "flakeid/core/time.h"

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests drive time explicitly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock time truncated to milliseconds.
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Manual clock: returns a caller-controlled timestamp for deterministic tests.
// Thread-safe: the current value is held in an atomic so another thread may advance it
// while a generator is waiting on it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start) : millis_(to_unix_millis(start)) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;

  void set(Timestamp ts);
  void advance(std::int64_t millis);

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace flakeid::core
