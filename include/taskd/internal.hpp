#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <random>
#include <string>
#include <thread>

namespace taskd::internal {

// Monotonic timestamp helper for metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp (microseconds since epoch).
// Use this for task timestamps, not NowMicros(), which is not tied to real time.
inline uint64_t WallClockMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

inline std::array<uint8_t, 16> RandomId128() {
  thread_local std::mt19937_64 rng([]{
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    seed ^= static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return seed;
  }());

  std::array<uint8_t, 16> id{};
  uint64_t a = rng();
  uint64_t b = rng();
  std::memcpy(id.data() + 0, &a, 8);
  std::memcpy(id.data() + 8, &b, 8);
  return id;
}

// Formats 16 random bytes as an RFC 4122 version-4 UUID:
//   xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx  (y in [89ab])
inline std::string FormatUuidV4(std::array<uint8_t, 16> bytes) {
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

inline std::string NewTaskId() { return FormatUuidV4(RandomId128()); }

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-18T09:30:00.123Z.
// Fixed width, so lexical order matches chronological order.
inline std::string FormatIso8601(uint64_t wall_micros) {
  std::time_t secs = static_cast<std::time_t>(wall_micros / 1000000ULL);
  unsigned millis = static_cast<unsigned>((wall_micros / 1000ULL) % 1000ULL);

  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
  return buf;
}

}  // namespace taskd::internal
