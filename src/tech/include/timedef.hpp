#pragma once

#include <chrono>
#include <cstdint>

namespace tnc {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// It is not monotonic, but a nonce only needs the wall-clock instant.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

using seconds = std::chrono::seconds;
using milliseconds = std::chrono::milliseconds;
using nanoseconds = std::chrono::nanoseconds;

template <class T>
constexpr T GetTimeDiff(TimePoint tp1, TimePoint tp2) {
  return std::chrono::duration_cast<T>(tp2 - tp1);
}

/// Whole seconds since epoch, rounded towards negative infinity so that the sub-second part is never negative.
constexpr int64_t TimestampToSecondsSinceEpoch(TimePoint tp) {
  return std::chrono::floor<seconds>(tp.time_since_epoch()).count();
}

/// Nanoseconds elapsed since the last whole second, in [0, 1e9).
constexpr uint32_t TimestampToSubSecondNanoseconds(TimePoint tp) {
  const auto sinceEpoch = tp.time_since_epoch();
  return static_cast<uint32_t>(
      std::chrono::duration_cast<nanoseconds>(sinceEpoch - std::chrono::floor<seconds>(sinceEpoch)).count());
}

}  // namespace tnc
