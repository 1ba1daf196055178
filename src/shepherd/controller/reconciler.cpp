#include "shepherd/controller/reconciler.hpp"

#include "shepherd/controller/claim_builder.hpp"
#include "shepherd/controller/failure_classifier.hpp"
#include "shepherd/controller/timeout.hpp"
#include "shepherd/model/state_strings.hpp"
#include "shepherd/util/log.hpp"
#include "shepherd/util/token.hpp"

#include <algorithm>
#include <format>

namespace shepherd {

using std::chrono::milliseconds;

Reconciler::Reconciler(TaskStore& tasks,
                       sandbox::SandboxOrchestrator& sandboxes,
                       SecretStore& secrets, AssignmentClient& assigner,
                       ReconcilerConfig config, NowFn now, TokenFn token)
    : tasks_(tasks),
      sandboxes_(sandboxes),
      secrets_(secrets),
      assigner_(assigner),
      config_(config),
      now_(now ? std::move(now) : system_now()),
      token_(token ? std::move(token)
                   : TokenFn{[] { return generate_token(); }}) {
}

auto Reconciler::reconcile(const TaskId& id) -> Result<ReconcileResult> {
  Pass pass;
  int attempts = std::max(config_.max_conflict_retries, 1);
  for (int i = 1; i <= attempts; ++i) {
    auto result = reconcile_once(id, pass);
    if (result || !is_error(result.error(), Error::Conflict)) {
      return result;
    }
    log::debug("Task {} changed during reconcile, re-fetching ({}/{})", id, i,
               attempts);
  }
  return fail(Error::Conflict);
}

auto Reconciler::reconcile_once(const TaskId& id, Pass& pass)
    -> Result<ReconcileResult> {
  auto fetched = tasks_.get(id);
  if (!fetched) {
    if (is_error(fetched.error(), Error::NotFound)) {
      return handle_missing(id);
    }
    return fail(fetched.error());
  }
  auto record = std::move(*fetched);

  if (record.deletion_requested_at) {
    return handle_deletion(record);
  }
  if (is_terminal(record)) {
    return handle_terminal(record);
  }

  auto now = now_();
  if (!record.status.succeeded) {
    auto status = record.status;
    status.succeeded = Condition{
        .status = ConditionStatus::Unknown,
        .reason = Reason::Pending,
        .message = "Waiting for sandbox to start",
        .last_transition = now,
    };
    if (auto written = write_status(record, status); !written) {
      return fail(written.error());
    }
    log::info("Task {} accepted, waiting for sandbox", id);
    return ReconcileResult::after(config_.initial_requeue);
  }

  auto timeout = effective_timeout(record.spec);
  if (is_expired(record.status.start_time, timeout, now)) {
    log::info("Task {} exceeded its timeout of {}s", id, timeout.count());
    return finish(record, Reason::TimedOut,
                  std::format("Task exceeded timeout of {}s", timeout.count()));
  }

  if (record.status.claim_name.empty()) {
    return handle_unclaimed(record);
  }

  bool running = has_reason(record.status, Reason::Running);
  ClaimName claim_name{record.status.claim_name};

  auto claim = sandboxes_.get_claim(claim_name);
  if (!claim) {
    if (!is_error(claim.error(), Error::NotFound)) {
      return fail(claim.error());
    }
    if (running) {
      log::warn("Sandbox claim {} of running task {} is gone", claim_name, id);
      return handle_termination(record);
    }
    // Same deterministic name, so there is never more than one live claim.
    auto spec = build_claim(record);
    if (!spec) {
      return fail(spec.error());
    }
    if (auto r = sandboxes_.create_claim(*spec);
        !r && !is_error(r.error(), Error::AlreadyExists)) {
      return fail(r.error());
    }
    log::info("Re-created missing sandbox claim {} for task {}", claim_name,
              id);
    return ReconcileResult::after(config_.pending_poll);
  }

  const auto& ready = claim->ready;
  if (ready && ready->status == ConditionStatus::True) {
    return handle_ready(std::move(record), *claim, pass);
  }

  if (ready && ready->status == ConditionStatus::False) {
    if (running) {
      log::info("Sandbox for task {} terminated while running (reason: {})",
                id, ready->reason);
      return handle_termination(record);
    }
    auto classification = classify_termination(ready, false);
    if (classification.reason == Reason::TimedOut) {
      return finish(record, classification.reason,
                    std::move(classification.message));
    }
    log::debug("Sandbox claim {} not ready yet: {}", claim_name,
               ready->message);
  }

  return ReconcileResult::after(config_.pending_poll);
}

auto Reconciler::handle_missing(const TaskId& id) -> Result<ReconcileResult> {
  log::debug("Task {} no longer exists, removing leftovers", id);
  if (auto r = delete_children(id, TaskStatus{}); !r) {
    return fail(r.error());
  }
  return ReconcileResult::done();
}

auto Reconciler::handle_deletion(const TaskRecord& record)
    -> Result<ReconcileResult> {
  if (auto r = delete_children(record.id, record.status); !r) {
    return fail(r.error());
  }
  if (auto r = tasks_.purge(record.id, record.version); !r) {
    if (is_error(r.error(), Error::NotFound)) {
      return ReconcileResult::done();
    }
    return fail(r.error());
  }
  log::info("Task {} deleted", record.id);
  return ReconcileResult::done();
}

auto Reconciler::handle_terminal(const TaskRecord& record)
    -> Result<ReconcileResult> {
  if (record.status.cleaned_up) {
    return ReconcileResult::done();
  }
  if (auto r = delete_children(record.id, record.status); !r) {
    return fail(r.error());
  }

  auto status = record.status;
  status.cleaned_up = true;
  if (auto written = write_status(record, status); !written) {
    return fail(written.error());
  }
  log::info("Released sandbox resources of task {} ({})", record.id,
            record.status.succeeded->reason);
  return ReconcileResult::done();
}

auto Reconciler::handle_unclaimed(const TaskRecord& record)
    -> Result<ReconcileResult> {
  std::string invalid_reason;
  auto spec = build_claim(record, &invalid_reason);
  if (!spec) {
    if (is_error(spec.error(), Error::InvalidArgument)) {
      log::warn("Task {} cannot be scheduled: {}", record.id, invalid_reason);
      return finish(record, Reason::Failed,
                    std::format("Invalid task: {}", invalid_reason));
    }
    return fail(spec.error());
  }

  if (auto r = sandboxes_.create_claim(*spec); !r) {
    if (!is_error(r.error(), Error::AlreadyExists)) {
      log::error("Failed to create sandbox claim {}: {}", spec->name,
                 r.error().message());
      return fail(r.error());
    }
    log::debug("Sandbox claim {} already exists", spec->name);
  } else {
    log::info("Created sandbox claim {} for task {}", spec->name, record.id);
  }

  auto status = record.status;
  status.claim_name = spec->name.str();
  if (!status.start_time) {
    status.start_time = now_();
  }
  if (auto written = write_status(record, status); !written) {
    return fail(written.error());
  }
  return ReconcileResult::after(config_.pending_poll);
}

auto Reconciler::handle_ready(TaskRecord record, const SandboxClaim& claim,
                              Pass& pass) -> Result<ReconcileResult> {
  if (record.status.grace_deadline) {
    // The sandbox came back before the grace period ran out.
    auto status = record.status;
    status.grace_deadline.reset();
    auto written = write_status(record, status);
    if (!written) {
      return fail(written.error());
    }
    record = std::move(*written);
  }

  bool running = has_reason(record.status, Reason::Running);
  if (running && record.status.assigned) {
    return ReconcileResult::after(until_deadline(record));
  }

  const auto& address = claim.service_fqdn;
  if (address.empty()) {
    log::debug("Sandbox {} is ready but has no address yet",
               claim.sandbox_name);
    return ReconcileResult::after(config_.address_poll);
  }

  SecretName secret_name = record.status.secret_name.empty()
                               ? secret_name_for(record.id)
                               : SecretName{record.status.secret_name};

  if (!running) {
    auto status = record.status;
    status.succeeded = Condition{
        .status = ConditionStatus::Unknown,
        .reason = Reason::Running,
        .message = "Sandbox is ready, assigning task",
        .last_transition = now_(),
    };
    status.secret_name = secret_name.str();
    auto written = write_status(record, status);
    if (!written) {
      return fail(written.error());
    }
    record = std::move(*written);
    log::info("Task {} is running in sandbox {}", record.id,
              claim.sandbox_name);
  }

  if (!pass.delivered) {
    auto token = token_();
    if (!token) {
      log::error("Failed to generate token for task {}: {}", record.id,
                 token.error().message());
      return fail(token.error());
    }

    auto stored = secrets_.put(TokenSecret{
        .name = secret_name,
        .owner = record.id,
        .token = *token,
        .created_at = now_(),
    });
    if (!stored) {
      return fail(stored.error());
    }

    if (auto r = assigner_.assign(address, record.id, *token); !r) {
      log::warn("Task {} not yet delivered to {}, retrying in {}ms",
                record.id, address, config_.assign_retry.count());
      return ReconcileResult::after(config_.assign_retry);
    }
    pass.delivered = true;
  }

  auto status = record.status;
  status.assigned = true;
  status.secret_name = secret_name.str();
  status.succeeded->message = "Sandbox is ready, task assigned to runner";
  auto written = write_status(record, status);
  if (!written) {
    return fail(written.error());
  }
  return ReconcileResult::after(until_deadline(*written));
}

auto Reconciler::handle_termination(const TaskRecord& record)
    -> Result<ReconcileResult> {
  auto now = now_();
  if (config_.termination_grace.count() > 0) {
    if (!record.status.grace_deadline) {
      auto status = record.status;
      status.grace_deadline = now + config_.termination_grace;
      if (auto written = write_status(record, status); !written) {
        return fail(written.error());
      }
      log::info("Waiting {}ms for a completion report of task {}",
                config_.termination_grace.count(), record.id);
      return ReconcileResult::after(config_.termination_grace);
    }
    if (now < *record.status.grace_deadline) {
      auto left = std::chrono::ceil<milliseconds>(
          *record.status.grace_deadline - now);
      return ReconcileResult::after(std::max(left, milliseconds{1}));
    }
  }

  // A completion report may have landed in the meantime; it wins.
  auto fresh = tasks_.get(record.id);
  if (!fresh) {
    return fail(fresh.error());
  }
  if (fresh->deletion_requested_at) {
    return handle_deletion(*fresh);
  }
  if (is_terminal(*fresh)) {
    return handle_terminal(*fresh);
  }

  std::optional<ReadinessCondition> ready;
  ClaimName claim_name = fresh->status.claim_name.empty()
                             ? claim_name_for(fresh->id)
                             : ClaimName{fresh->status.claim_name};
  if (auto claim = sandboxes_.get_claim(claim_name); claim) {
    ready = claim->ready;
  } else if (!is_error(claim.error(), Error::NotFound)) {
    return fail(claim.error());
  }

  auto classification = classify_termination(ready, true);
  return finish(*fresh, classification.reason,
                std::move(classification.message));
}

auto Reconciler::finish(const TaskRecord& record, Reason reason,
                        std::string message) -> Result<ReconcileResult> {
  auto now = now_();
  auto status = record.status;
  status.succeeded = Condition{
      .status = ConditionStatus::False,
      .reason = reason,
      .message = message,
      .last_transition = now,
  };
  status.completion_time = now;
  status.result.error = message;
  status.grace_deadline.reset();

  auto written = write_status(record, status);
  if (!written) {
    return fail(written.error());
  }
  log::info("Task {} finished: {} ({})", record.id, reason, message);
  return handle_terminal(*written);
}

auto Reconciler::write_status(const TaskRecord& record,
                              const TaskStatus& status) -> Result<TaskRecord> {
  auto written = tasks_.update_status(record.id, record.version, status);
  if (!written && !is_error(written.error(), Error::Conflict)) {
    log::error("Failed to update status of task {}: {}", record.id,
               written.error().message());
  }
  return written;
}

auto Reconciler::delete_children(const TaskId& id, const TaskStatus& status)
    -> Result<void> {
  auto claim = status.claim_name.empty() ? claim_name_for(id)
                                         : ClaimName{status.claim_name};
  auto secret = status.secret_name.empty() ? secret_name_for(id)
                                           : SecretName{status.secret_name};
  if (auto r = delete_claim(claim); !r) {
    return r;
  }
  return delete_secret(secret);
}

auto Reconciler::delete_claim(const ClaimName& name) -> Result<void> {
  auto r = sandboxes_.delete_claim(name);
  if (r) {
    log::info("Deleted sandbox claim {}", name);
    return ok();
  }
  if (is_error(r.error(), Error::NotFound)) {
    return ok();
  }
  log::warn("Failed to delete sandbox claim {}: {}", name,
            r.error().message());
  return r;
}

auto Reconciler::delete_secret(const SecretName& name) -> Result<void> {
  auto r = secrets_.remove(name);
  if (r) {
    log::debug("Deleted token secret {}", name);
    return ok();
  }
  if (is_error(r.error(), Error::NotFound)) {
    return ok();
  }
  log::warn("Failed to delete token secret {}: {}", name,
            r.error().message());
  return r;
}

auto Reconciler::until_deadline(const TaskRecord& record) const
    -> milliseconds {
  auto left = remaining(record.status.start_time,
                        effective_timeout(record.spec), now_());
  return std::min(std::max(left, milliseconds{1000}), config_.running_poll);
}

}  // namespace shepherd
