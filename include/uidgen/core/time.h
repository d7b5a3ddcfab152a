#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace uidgen::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// One tick is 100 nanoseconds.
inline constexpr std::int64_t kTicksPerSecond = 10'000'000;
inline constexpr std::int64_t kNanosPerTick = 100;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// to_ticks converts an instant to 100ns ticks since the Unix epoch.
//
// The instant is split into whole seconds (floored) and a non-negative sub-second
// nanosecond remainder; the remainder is truncated to ticks, never rounded.
[[nodiscard]] inline std::int64_t to_ticks(const Timestamp ts) {
  const auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch());
  const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto subsecond_nanos = (since_epoch - seconds).count();
  return seconds.count() * kTicksPerSecond + subsecond_nanos / kNanosPerTick;
}

// to_iso8601 formats an instant as UTC "YYYY-MM-DDTHH:MM:SSZ" (sub-second part dropped).
[[nodiscard]] std::string to_iso8601(Timestamp ts);

}  // namespace uidgen::core
