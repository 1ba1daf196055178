#pragma once

#include "shepherd/core/error.hpp"
#include "shepherd/model/task.hpp"
#include "shepherd/util/id.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace shepherd {

// Invoked with the id of every record that changed.
using TaskChangeFn = std::function<void(const TaskId&)>;

// Task Record store with optimistic concurrency on status writes.
class TaskStore {
public:
  virtual ~TaskStore() = default;

  // Stamps version 1. AlreadyExists if the id is taken.
  [[nodiscard]] virtual auto create(TaskRecord record) -> Result<TaskRecord> = 0;

  [[nodiscard]] virtual auto get(const TaskId& id) -> Result<TaskRecord> = 0;

  [[nodiscard]] virtual auto list() -> Result<std::vector<TaskRecord>> = 0;

  // Writes status only if the stored version equals expected_version.
  // Conflict on a stale version, NotFound when the record is gone.
  [[nodiscard]] virtual auto update_status(const TaskId& id,
                                           std::uint64_t expected_version,
                                           const TaskStatus& status)
      -> Result<TaskRecord> = 0;

  // Marks the record for deletion; its children are cleaned up before it is
  // purged.
  [[nodiscard]] virtual auto request_deletion(const TaskId& id, TimePoint now)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto purge(const TaskId& id,
                                   std::uint64_t expected_version)
      -> Result<void> = 0;

  // Returns a handle for unsubscribe().
  virtual auto subscribe(TaskChangeFn fn) -> std::size_t = 0;
  virtual auto unsubscribe(std::size_t handle) -> void = 0;
};

}  // namespace shepherd
