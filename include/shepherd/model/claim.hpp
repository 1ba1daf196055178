#pragma once

#include "shepherd/model/task.hpp"
#include "shepherd/util/clock.hpp"
#include "shepherd/util/id.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace shepherd {

inline constexpr std::string_view kTaskLabel = "shepherd.io/task";

// Readiness reasons the orchestration system reports when a lifetime ends.
inline constexpr std::string_view kReasonSandboxExpired = "SandboxExpired";
inline constexpr std::string_view kReasonClaimExpired = "ClaimExpired";

struct ClaimSpec {
  ClaimName name;
  TaskId owner;
  std::string template_name;
  ResourceOverrides resources;
  std::map<std::string, std::string> labels;

  auto operator==(const ClaimSpec&) const -> bool = default;
};

struct ReadinessCondition {
  ConditionStatus status{ConditionStatus::Unknown};
  std::string reason;
  std::string message;

  auto operator==(const ReadinessCondition&) const -> bool = default;
};

struct SandboxClaim {
  ClaimSpec spec;
  TimePoint created_at{};
  std::optional<ReadinessCondition> ready;
  std::string sandbox_name;
  std::string service_fqdn;
};

struct TokenSecret {
  SecretName name;
  TaskId owner;
  std::string token;
  TimePoint created_at{};
};

}  // namespace shepherd
