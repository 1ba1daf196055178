#pragma once

#include "shepherd/client/sandbox/sandbox_client.hpp"
#include "shepherd/controller/assignment_client.hpp"
#include "shepherd/core/error.hpp"
#include "shepherd/model/task.hpp"
#include "shepherd/storage/secret_store.hpp"
#include "shepherd/storage/task_store.hpp"
#include "shepherd/util/clock.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace shepherd {

struct ReconcilerConfig {
  std::chrono::milliseconds initial_requeue{1000};
  std::chrono::milliseconds pending_poll{5000};
  std::chrono::milliseconds running_poll{60000};
  std::chrono::milliseconds assign_retry{5000};
  std::chrono::milliseconds address_poll{2000};
  // Zero classifies a terminated sandbox immediately.
  std::chrono::milliseconds termination_grace{30000};
  int max_conflict_retries{5};
};

struct ReconcileResult {
  std::optional<std::chrono::milliseconds> requeue_after;

  [[nodiscard]] static auto done() -> ReconcileResult { return {}; }
  [[nodiscard]] static auto after(std::chrono::milliseconds delay)
      -> ReconcileResult {
    return {delay};
  }

  auto operator==(const ReconcileResult&) const -> bool = default;
};

using TokenFn = std::function<Result<std::string>()>;

// Drives one task toward its declared end state. Every call re-reads the
// record and acts on what it finds, so repeated or interleaved calls for the
// same key converge without duplicating side effects.
class Reconciler {
public:
  Reconciler(TaskStore& tasks, sandbox::SandboxOrchestrator& sandboxes,
             SecretStore& secrets, AssignmentClient& assigner,
             ReconcilerConfig config = {}, NowFn now = system_now(),
             TokenFn token = nullptr);

  // Errors are transient and the caller should requeue with backoff.
  [[nodiscard]] auto reconcile(const TaskId& id) -> Result<ReconcileResult>;

  [[nodiscard]] auto config() const noexcept -> const ReconcilerConfig& {
    return config_;
  }

private:
  // Per-call state that survives a conflict re-fetch.
  struct Pass {
    bool delivered{false};
  };

  [[nodiscard]] auto reconcile_once(const TaskId& id, Pass& pass)
      -> Result<ReconcileResult>;

  [[nodiscard]] auto handle_missing(const TaskId& id)
      -> Result<ReconcileResult>;
  [[nodiscard]] auto handle_deletion(const TaskRecord& record)
      -> Result<ReconcileResult>;
  [[nodiscard]] auto handle_terminal(const TaskRecord& record)
      -> Result<ReconcileResult>;
  [[nodiscard]] auto handle_unclaimed(const TaskRecord& record)
      -> Result<ReconcileResult>;
  [[nodiscard]] auto handle_ready(TaskRecord record, const SandboxClaim& claim,
                                  Pass& pass) -> Result<ReconcileResult>;
  [[nodiscard]] auto handle_termination(const TaskRecord& record)
      -> Result<ReconcileResult>;

  // Writes a False condition and runs cleanup on the new record. Children
  // are only deleted once that write has landed.
  [[nodiscard]] auto finish(const TaskRecord& record, Reason reason,
                            std::string message) -> Result<ReconcileResult>;

  [[nodiscard]] auto write_status(const TaskRecord& record,
                                  const TaskStatus& status)
      -> Result<TaskRecord>;

  [[nodiscard]] auto delete_children(const TaskId& id,
                                     const TaskStatus& status)
      -> Result<void>;
  [[nodiscard]] auto delete_claim(const ClaimName& name) -> Result<void>;
  [[nodiscard]] auto delete_secret(const SecretName& name) -> Result<void>;

  [[nodiscard]] auto until_deadline(const TaskRecord& record) const
      -> std::chrono::milliseconds;

  TaskStore& tasks_;
  sandbox::SandboxOrchestrator& sandboxes_;
  SecretStore& secrets_;
  AssignmentClient& assigner_;
  ReconcilerConfig config_;
  NowFn now_;
  TokenFn token_;
};

}  // namespace shepherd
