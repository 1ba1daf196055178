#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace shepherd {

using TimePoint = std::chrono::system_clock::time_point;

// Source of "now" for the control loop; tests substitute a manual clock.
using NowFn = std::function<TimePoint()>;

[[nodiscard]] inline auto system_now() -> NowFn {
  return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

}  // namespace shepherd
