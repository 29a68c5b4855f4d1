#pragma once

#include <taskd/internal.hpp>

#include <cstdint>

namespace taskd {

/**
 * Wall-clock source for task timestamps.
 * Production code uses SystemClock; tests inject testing::FakeClock.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t WallClockMicros() const = 0;
};

class SystemClock : public Clock {
 public:
  uint64_t WallClockMicros() const override {
    return internal::WallClockMicros();
  }
};

/** Process-wide SystemClock instance. */
inline const Clock* DefaultClock() {
  static const SystemClock clock;
  return &clock;
}

}  // namespace taskd
