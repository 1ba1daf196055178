#pragma once

#include "shepherd/model/claim.hpp"
#include "shepherd/model/task.hpp"

#include <optional>
#include <string>

namespace shepherd {

struct Classification {
  Reason reason{Reason::Failed};
  std::string message;

  auto operator==(const Classification&) const -> bool = default;
};

// Maps a terminated claim's readiness condition to a terminal reason. Only
// lifetime expiry is distinguished; every other cause is Failed.
[[nodiscard]] auto classify_termination(
    const std::optional<ReadinessCondition>& ready, bool was_running)
    -> Classification;

[[nodiscard]] auto is_expiry_reason(std::string_view reason) noexcept -> bool;

}  // namespace shepherd
