#include "shepherd/controller/failure_classifier.hpp"

#include <format>

namespace shepherd {

auto is_expiry_reason(std::string_view reason) noexcept -> bool {
  return reason == kReasonSandboxExpired || reason == kReasonClaimExpired;
}

auto classify_termination(const std::optional<ReadinessCondition>& ready,
                          bool was_running) -> Classification {
  if (!ready) {
    return {Reason::Failed, "Sandbox claim status unavailable"};
  }
  if (is_expiry_reason(ready->reason)) {
    return {Reason::TimedOut, "Sandbox expired"};
  }

  std::string detail = ready->message.empty() ? ready->reason : ready->message;
  if (!was_running) {
    return {Reason::Failed,
            std::format("Sandbox terminated before the task started: {}",
                        detail)};
  }
  return {Reason::Failed, std::format("Sandbox terminated: {}", detail)};
}

}  // namespace shepherd
