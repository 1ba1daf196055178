#pragma once

#include "shepherd/model/task.hpp"
#include "shepherd/util/clock.hpp"

#include <algorithm>
#include <chrono>
#include <optional>

namespace shepherd {

// Unset or non-positive selects the default; anything above the cap is
// clamped to it.
[[nodiscard]] inline auto effective_timeout(const TaskSpec& spec)
    -> std::chrono::seconds {
  if (spec.runner.timeout.count() <= 0) {
    return kDefaultTaskTimeout;
  }
  return std::min(spec.runner.timeout, kMaxTaskTimeout);
}

// False until a start time has been recorded.
[[nodiscard]] inline auto is_expired(const std::optional<TimePoint>& start,
                                     std::chrono::seconds timeout,
                                     TimePoint now) -> bool {
  return start && now > *start + timeout;
}

[[nodiscard]] inline auto remaining(const std::optional<TimePoint>& start,
                                    std::chrono::seconds timeout,
                                    TimePoint now)
    -> std::chrono::milliseconds {
  if (!start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
  }
  auto left = *start + timeout - now;
  if (left <= TimePoint::duration::zero()) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(left);
}

}  // namespace shepherd
