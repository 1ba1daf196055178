#pragma once

#include "shepherd/util/clock.hpp"
#include "shepherd/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shepherd {

inline constexpr std::chrono::seconds kDefaultTaskTimeout{30 * 60};
// Longer requested timeouts are capped so deadlines stay representable.
inline constexpr std::chrono::seconds kMaxTaskTimeout{30 * 24 * 60 * 60};

enum class ConditionStatus : std::uint8_t {
  Unknown,
  True,
  False,
};

// Closed set of reasons for the primary Succeeded condition.
enum class Reason : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  TimedOut,
  Cancelled,
};

struct Condition {
  ConditionStatus status{ConditionStatus::Unknown};
  Reason reason{Reason::Pending};
  std::string message;
  TimePoint last_transition{};

  auto operator==(const Condition&) const -> bool = default;
};

struct RepoSpec {
  std::string url;
  std::string ref;

  auto operator==(const RepoSpec&) const -> bool = default;
};

// Opaque to the controller; carried for the runner and the API.
struct TaskInstructions {
  std::string description;
  std::string context;
  std::string context_encoding;
  std::string source_url;
  std::string source_type;
  std::string source_id;

  auto operator==(const TaskInstructions&) const -> bool = default;
};

struct CallbackSpec {
  std::string url;

  auto operator==(const CallbackSpec&) const -> bool = default;
};

struct ResourceList {
  std::string cpu;
  std::string memory;

  [[nodiscard]] auto empty() const -> bool {
    return cpu.empty() && memory.empty();
  }
  auto operator==(const ResourceList&) const -> bool = default;
};

struct ResourceOverrides {
  ResourceList requests;
  ResourceList limits;

  [[nodiscard]] auto empty() const -> bool {
    return requests.empty() && limits.empty();
  }
  auto operator==(const ResourceOverrides&) const -> bool = default;
};

struct RunnerSpec {
  std::string sandbox_template;
  std::chrono::seconds timeout{0};  // zero selects kDefaultTaskTimeout
  std::string service_account;
  ResourceOverrides resources;

  auto operator==(const RunnerSpec&) const -> bool = default;
};

struct TaskSpec {
  RepoSpec repo;
  TaskInstructions task;
  CallbackSpec callback;
  RunnerSpec runner;

  auto operator==(const TaskSpec&) const -> bool = default;
};

// Written only by the external API when the runner reports back.
struct TaskResult {
  std::string pr_url;
  std::string error;

  auto operator==(const TaskResult&) const -> bool = default;
};

struct TaskStatus {
  std::optional<Condition> succeeded;
  std::optional<TimePoint> start_time;
  std::optional<TimePoint> completion_time;

  // Ownership manifest: children the controller must delete explicitly.
  std::string claim_name;
  std::string secret_name;

  bool assigned{false};
  std::optional<TimePoint> grace_deadline;
  bool cleaned_up{false};

  TaskResult result;

  auto operator==(const TaskStatus&) const -> bool = default;
};

struct TaskRecord {
  TaskId id;
  std::uint64_t version{0};
  TimePoint created_at{};
  TaskSpec spec;
  TaskStatus status;
  std::optional<TimePoint> deletion_requested_at;
};

[[nodiscard]] inline auto is_terminal(const TaskStatus& status) noexcept
    -> bool {
  return status.succeeded &&
         status.succeeded->status != ConditionStatus::Unknown;
}

[[nodiscard]] inline auto is_terminal(const TaskRecord& record) noexcept
    -> bool {
  return is_terminal(record.status);
}

[[nodiscard]] inline auto has_reason(const TaskStatus& status,
                                     Reason reason) noexcept -> bool {
  return status.succeeded && status.succeeded->reason == reason;
}

}  // namespace shepherd
