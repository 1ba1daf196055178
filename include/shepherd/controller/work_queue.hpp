#pragma once

#include "shepherd/util/id.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace shepherd {

struct WorkQueueConfig {
  std::chrono::milliseconds base_delay{5};
  std::chrono::milliseconds max_delay{60000};
};

// Keyed work queue with single-flight delivery. A key is handed to at most one
// worker at a time; adding it while it is being processed re-queues it once
// done() is called. Duplicate adds while queued collapse into one.
class WorkQueue {
public:
  using Clock = std::chrono::steady_clock;

  explicit WorkQueue(WorkQueueConfig config = {});
  ~WorkQueue();

  WorkQueue(const WorkQueue&) = delete;
  auto operator=(const WorkQueue&) -> WorkQueue& = delete;

  auto add(const TaskId& key) -> void;
  auto add_after(const TaskId& key, std::chrono::milliseconds delay) -> void;
  // Backs off exponentially per key until forget() is called.
  auto add_rate_limited(const TaskId& key) -> void;
  auto forget(const TaskId& key) -> void;
  [[nodiscard]] auto num_requeues(const TaskId& key) const -> int;

  // Blocks until a key is due. nullopt once shut down and drained.
  [[nodiscard]] auto get() -> std::optional<TaskId>;
  auto done(const TaskId& key) -> void;

  auto shut_down() -> void;
  [[nodiscard]] auto is_shutting_down() const -> bool;

  // Keys ready for a worker; excludes delayed and in-flight keys.
  [[nodiscard]] auto len() const -> std::size_t;

private:
  auto add_locked(const TaskId& key) -> void;
  // Moves due delayed keys to the ready queue and returns the next deadline.
  auto promote_due_locked(Clock::time_point now)
      -> std::optional<Clock::time_point>;
  [[nodiscard]] auto backoff_for(int failures) const
      -> std::chrono::milliseconds;

  WorkQueueConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<TaskId> queue_;
  std::unordered_set<TaskId> dirty_;
  std::unordered_set<TaskId> processing_;
  std::multimap<Clock::time_point, TaskId> delayed_;
  std::unordered_map<TaskId, Clock::time_point> delayed_at_;
  std::unordered_map<TaskId, int> failures_;
  bool shutting_down_{false};
};

}  // namespace shepherd
