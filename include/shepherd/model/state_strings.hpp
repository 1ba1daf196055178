#pragma once

#include "shepherd/model/task.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace shepherd {

namespace detail {

constexpr std::array<std::string_view, 6> kReasonNames = {
    "Pending", "Running", "Succeeded", "Failed", "TimedOut", "Cancelled",
};

constexpr std::array<std::string_view, 3> kConditionStatusNames = {
    "Unknown",
    "True",
    "False",
};

}  // namespace detail

[[nodiscard]] constexpr auto reason_name(Reason reason) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(reason);
  return idx < detail::kReasonNames.size() ? detail::kReasonNames[idx]
                                           : "Unknown";
}

[[nodiscard]] inline auto parse_reason(std::string_view name) noexcept
    -> std::optional<Reason> {
  auto it = std::ranges::find(detail::kReasonNames, name);
  if (it == detail::kReasonNames.end()) {
    return std::nullopt;
  }
  return static_cast<Reason>(
      std::ranges::distance(detail::kReasonNames.begin(), it));
}

[[nodiscard]] constexpr auto condition_status_name(
    ConditionStatus status) noexcept -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < detail::kConditionStatusNames.size()
             ? detail::kConditionStatusNames[idx]
             : "Unknown";
}

[[nodiscard]] inline auto parse_condition_status(std::string_view name) noexcept
    -> ConditionStatus {
  auto it = std::ranges::find(detail::kConditionStatusNames, name);
  if (it == detail::kConditionStatusNames.end()) {
    return ConditionStatus::Unknown;
  }
  return static_cast<ConditionStatus>(
      std::ranges::distance(detail::kConditionStatusNames.begin(), it));
}

}  // namespace shepherd

template <>
struct std::formatter<shepherd::Reason> : std::formatter<std::string_view> {
  auto format(shepherd::Reason reason, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        shepherd::reason_name(reason), ctx);
  }
};

template <>
struct std::formatter<shepherd::ConditionStatus>
    : std::formatter<std::string_view> {
  auto format(shepherd::ConditionStatus status, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        shepherd::condition_status_name(status), ctx);
  }
};
