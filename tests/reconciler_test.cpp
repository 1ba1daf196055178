#include "shepherd/controller/reconciler.hpp"
#include "shepherd/storage/sqlite_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <string>

using namespace shepherd;
using namespace shepherd::test;
using namespace std::chrono_literals;

class ReconcilerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<SqliteStore>(":memory:");
    ASSERT_TRUE(store_->open().has_value());

    transport_ = std::make_shared<RecordingTransport>();
    assigner_ = std::make_unique<AssignmentClient>(
        transport_, AssignmentConfig{.api_url = "http://api.shepherd:8080"});
    assigner_->set_sleep([](std::chrono::milliseconds) {});

    reconciler_ = make_reconciler(*store_);
  }

  [[nodiscard]] virtual auto config() const -> ReconcilerConfig {
    ReconcilerConfig c;
    c.termination_grace = 0ms;
    return c;
  }

  [[nodiscard]] auto make_reconciler(TaskStore& tasks)
      -> std::unique_ptr<Reconciler> {
    return std::make_unique<Reconciler>(
        tasks, sandboxes_, *store_, *assigner_, config(), clock_.fn(),
        [this]() -> Result<std::string> {
          return std::format("token-{}", ++tokens_issued_);
        });
  }

  auto create(TaskRecord record) -> TaskId {
    auto id = record.id;
    EXPECT_TRUE(store_->create(std::move(record)).has_value());
    return id;
  }

  auto reconcile(const TaskId& id) -> ReconcileResult {
    auto r = reconciler_->reconcile(id);
    EXPECT_TRUE(r.has_value()) << r.error().message();
    return r.value_or(ReconcileResult::done());
  }

  [[nodiscard]] auto record(const TaskId& id) -> TaskRecord {
    auto r = store_->get(id);
    EXPECT_TRUE(r.has_value());
    return r.value_or(TaskRecord{});
  }

  [[nodiscard]] auto reason(const TaskId& id) -> std::optional<Reason> {
    auto status = record(id).status;
    if (!status.succeeded) {
      return std::nullopt;
    }
    return status.succeeded->reason;
  }

  [[nodiscard]] auto has_secret(const TaskId& id) -> bool {
    return store_->get(secret_name_for(id)).has_value();
  }

  // Accepted, claimed, ready and assigned.
  auto drive_to_assigned(const TaskId& id) -> void {
    reconcile(id);
    reconcile(id);
    sandboxes_.set_ready(claim_name_for(id),
                         std::format("{}.sandboxes.svc", id));
    reconcile(id);
    ASSERT_TRUE(record(id).status.assigned);
  }

  ManualClock clock_;
  FakeSandboxOrchestrator sandboxes_;
  std::unique_ptr<SqliteStore> store_;
  std::shared_ptr<RecordingTransport> transport_;
  std::unique_ptr<AssignmentClient> assigner_;
  std::unique_ptr<Reconciler> reconciler_;
  int tokens_issued_{0};
};

TEST_F(ReconcilerTest, NewTaskBecomesPending) {
  auto id = create(make_task("task-1"));

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(1000ms));
  auto status = record(id).status;
  ASSERT_TRUE(status.succeeded.has_value());
  EXPECT_EQ(status.succeeded->status, ConditionStatus::Unknown);
  EXPECT_EQ(status.succeeded->reason, Reason::Pending);
  EXPECT_EQ(status.succeeded->message, "Waiting for sandbox to start");
  EXPECT_EQ(sandboxes_.create_calls.load(), 0);
}

TEST_F(ReconcilerTest, PendingTaskGetsClaimAndStartTime) {
  auto id = create(make_task("task-1", "python-sandbox"));
  reconcile(id);

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(5000ms));
  auto status = record(id).status;
  EXPECT_EQ(status.claim_name, "task-1");
  EXPECT_EQ(status.start_time, clock_.now());
  auto claim = sandboxes_.claim(ClaimName{"task-1"});
  ASSERT_TRUE(claim.has_value());
  EXPECT_EQ(claim->spec.template_name, "python-sandbox");
  EXPECT_EQ(claim->spec.owner, id);
}

TEST_F(ReconcilerTest, WaitsWhileClaimIsNotReady) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxNotReady", "pulling image");

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(5000ms));
  EXPECT_EQ(reason(id), Reason::Pending);
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ReconcilerTest, ReadySandboxIsAssignedOnce) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(60000ms));
  auto status = record(id).status;
  ASSERT_TRUE(status.succeeded.has_value());
  EXPECT_EQ(status.succeeded->reason, Reason::Running);
  EXPECT_EQ(status.succeeded->message,
            "Sandbox is ready, task assigned to runner");
  EXPECT_TRUE(status.assigned);
  EXPECT_EQ(status.secret_name, "task-1-token");

  auto secret = store_->get(SecretName{"task-1-token"});
  ASSERT_TRUE(secret.has_value());
  EXPECT_EQ(secret->token, "token-1");
  EXPECT_EQ(secret->owner, id);

  auto calls = transport_->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].endpoint.host, "task-1.sandboxes.svc");
  EXPECT_EQ(calls[0].endpoint.port, 8888);
  EXPECT_EQ(calls[0].request.header("Authorization"), "Bearer token-1");
  auto body = nlohmann::json::parse(calls[0].request.body);
  EXPECT_EQ(body["taskID"], "task-1");
  EXPECT_EQ(body["apiURL"], "http://api.shepherd:8080");

  // Level-triggered re-runs do not deliver again.
  EXPECT_EQ(reconcile(id), ReconcileResult::after(60000ms));
  EXPECT_EQ(reconcile(id), ReconcileResult::after(60000ms));
  EXPECT_EQ(transport_->call_count(), 1u);
  EXPECT_EQ(tokens_issued_, 1);
}

TEST_F(ReconcilerTest, ReadyWithoutAddressWaits) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "");

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(2000ms));
  EXPECT_EQ(reason(id), Reason::Pending);
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ReconcilerTest, FailedDeliveryIsRetriedLater) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");
  transport_->set_fallback(fail(Error::ConnectionFailed));

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(5000ms));
  EXPECT_EQ(transport_->call_count(), 5u);
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Running);
  EXPECT_FALSE(status.assigned);

  transport_->set_fallback(RecordingTransport::response(http::HttpStatus::Ok));
  reconcile(id);

  EXPECT_TRUE(record(id).status.assigned);
  EXPECT_EQ(store_->get(SecretName{"task-1-token"})->token, "token-2");
}

TEST_F(ReconcilerTest, RunnerConflictCountsAsDelivered) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");
  transport_->push_status(http::HttpStatus::Conflict);

  reconcile(id);

  EXPECT_TRUE(record(id).status.assigned);
  EXPECT_EQ(transport_->call_count(), 1u);
}

TEST_F(ReconcilerTest, RequeueTracksRemainingTimeout) {
  auto id = create(make_task("task-1", "python", 60s));
  drive_to_assigned(id);

  clock_.advance(45s);

  EXPECT_EQ(reconcile(id), ReconcileResult::after(15000ms));

  clock_.advance(14'500ms);
  // Never poll faster than once a second.
  EXPECT_EQ(reconcile(id), ReconcileResult::after(1000ms));
}

TEST_F(ReconcilerTest, CompletionReportCleansUpChildren) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  ASSERT_TRUE(report_completion(*store_, id, Reason::Succeeded, "PR opened",
                                "https://github.com/acme/widgets/pull/7")
                  .has_value());

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::done());
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_FALSE(has_secret(id));
  auto status = record(id).status;
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_EQ(status.succeeded->status, ConditionStatus::True);
  EXPECT_EQ(status.succeeded->reason, Reason::Succeeded);
  EXPECT_EQ(status.result.pr_url, "https://github.com/acme/widgets/pull/7");
}

TEST_F(ReconcilerTest, TerminalCleanupRunsOnce) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  ASSERT_TRUE(
      report_completion(*store_, id, Reason::Failed, "tests failed")
          .has_value());
  reconcile(id);
  auto deletes = sandboxes_.delete_calls.load();
  auto version = record(id).version;

  EXPECT_EQ(reconcile(id), ReconcileResult::done());
  EXPECT_EQ(reconcile(id), ReconcileResult::done());

  EXPECT_EQ(sandboxes_.delete_calls.load(), deletes);
  EXPECT_EQ(record(id).version, version);
  EXPECT_EQ(reason(id), Reason::Failed);
}

TEST_F(ReconcilerTest, CleanupFailureIsRetried) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  ASSERT_TRUE(report_completion(*store_, id, Reason::Succeeded, "done")
                  .has_value());
  sandboxes_.delete_error = Error::ApiError;

  auto failed = reconciler_->reconcile(id);

  ASSERT_FALSE(failed.has_value());
  EXPECT_FALSE(record(id).status.cleaned_up);

  sandboxes_.delete_error.reset();
  EXPECT_EQ(reconcile(id), ReconcileResult::done());
  EXPECT_TRUE(record(id).status.cleaned_up);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
}

TEST_F(ReconcilerTest, RunningTaskTimesOut) {
  auto id = create(make_task("task-1", "python", 60s));
  drive_to_assigned(id);

  clock_.advance(61s);
  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::done());
  auto status = record(id).status;
  ASSERT_TRUE(status.succeeded.has_value());
  EXPECT_EQ(status.succeeded->status, ConditionStatus::False);
  EXPECT_EQ(status.succeeded->reason, Reason::TimedOut);
  EXPECT_EQ(status.succeeded->message, "Task exceeded timeout of 60s");
  EXPECT_EQ(status.result.error, "Task exceeded timeout of 60s");
  EXPECT_EQ(status.completion_time, clock_.now());
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_FALSE(has_secret(id));
}

TEST_F(ReconcilerTest, PendingTaskTimesOutToo) {
  auto id = create(make_task("task-1", "python", 30s));
  reconcile(id);
  reconcile(id);

  clock_.advance(31s);
  reconcile(id);

  EXPECT_EQ(reason(id), Reason::TimedOut);
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ReconcilerTest, DefaultTimeoutAppliesWhenUnset) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);

  clock_.advance(29min);
  reconcile(id);
  EXPECT_EQ(reason(id), Reason::Running);

  clock_.advance(1min + 1s);
  reconcile(id);
  EXPECT_EQ(reason(id), Reason::TimedOut);
  EXPECT_EQ(record(id).status.succeeded->message,
            "Task exceeded timeout of 1800s");
}

TEST_F(ReconcilerTest, HugeTimeoutKeepsTaskRunning) {
  auto id = create(
      make_task("task-1", "python", std::chrono::seconds{INT64_MAX / 2}));
  drive_to_assigned(id);

  clock_.advance(24h);
  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(60000ms));
  EXPECT_EQ(reason(id), Reason::Running);
}

TEST_F(ReconcilerTest, SandboxTerminationWhileRunningFails) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxFailed", "OOMKilled");

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Failed);
  EXPECT_EQ(status.succeeded->message, "Sandbox terminated: OOMKilled");
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
}

TEST_F(ReconcilerTest, SandboxExpiryWhileRunningTimesOut) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxExpired", "shutdown time reached");

  reconcile(id);

  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::TimedOut);
  EXPECT_EQ(status.succeeded->message, "Sandbox expired");
}

TEST_F(ReconcilerTest, VanishedClaimWhileRunningFails) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.vanish(ClaimName{"task-1"});

  reconcile(id);

  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Failed);
  EXPECT_EQ(status.succeeded->message, "Sandbox claim status unavailable");
  EXPECT_FALSE(has_secret(id));
}

TEST_F(ReconcilerTest, SandboxExpiryWhilePendingTimesOut) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "ClaimExpired", "");

  reconcile(id);

  EXPECT_EQ(reason(id), Reason::TimedOut);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
}

TEST_F(ReconcilerTest, VanishedClaimWhilePendingIsRecreated) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.vanish(ClaimName{"task-1"});

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(5000ms));
  EXPECT_TRUE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_EQ(sandboxes_.create_calls.load(), 2);
  EXPECT_EQ(reason(id), Reason::Pending);
}

TEST_F(ReconcilerTest, ExistingClaimIsAdopted) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  ClaimSpec leftover;
  leftover.name = ClaimName{"task-1"};
  leftover.owner = id;
  leftover.template_name = "python";
  ASSERT_TRUE(sandboxes_.create_claim(leftover).has_value());

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::after(5000ms));
  EXPECT_EQ(record(id).status.claim_name, "task-1");
  EXPECT_EQ(sandboxes_.size(), 1u);
}

TEST_F(ReconcilerTest, ClaimApiErrorIsTransient) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  sandboxes_.create_error = Error::ConnectionFailed;

  auto r = reconciler_->reconcile(id);

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(is_error(r.error(), Error::ConnectionFailed));
  EXPECT_TRUE(record(id).status.claim_name.empty());
}

TEST_F(ReconcilerTest, InvalidTemplateFailsWithoutClaim) {
  auto id = create(make_task("task-1", ""));
  reconcile(id);

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->status, ConditionStatus::False);
  EXPECT_EQ(status.succeeded->reason, Reason::Failed);
  EXPECT_EQ(status.succeeded->message,
            "Invalid task: sandbox template name is empty");
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_EQ(sandboxes_.create_calls.load(), 0);
}

TEST_F(ReconcilerTest, DeletionCascadesToChildren) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  ASSERT_TRUE(store_->request_deletion(id, clock_.now()).has_value());

  auto result = reconcile(id);

  EXPECT_EQ(result, ReconcileResult::done());
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_FALSE(has_secret(id));
  auto gone = store_->get(id);
  ASSERT_FALSE(gone.has_value());
  EXPECT_TRUE(is_error(gone.error(), Error::NotFound));
}

TEST_F(ReconcilerTest, DeletionOfTerminalTaskPurgesRecord) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  ASSERT_TRUE(report_completion(*store_, id, Reason::Succeeded, "done")
                  .has_value());
  reconcile(id);
  ASSERT_TRUE(store_->request_deletion(id, clock_.now()).has_value());

  EXPECT_EQ(reconcile(id), ReconcileResult::done());

  EXPECT_FALSE(store_->get(id).has_value());
}

TEST_F(ReconcilerTest, MissingRecordRemovesOrphans) {
  ClaimSpec orphan;
  orphan.name = ClaimName{"ghost"};
  orphan.owner = task_id("ghost");
  orphan.template_name = "python";
  ASSERT_TRUE(sandboxes_.create_claim(orphan).has_value());
  ASSERT_TRUE(store_
                  ->put(TokenSecret{.name = SecretName{"ghost-token"},
                                    .owner = task_id("ghost"),
                                    .token = "t",
                                    .created_at = clock_.now()})
                  .has_value());

  auto result = reconcile(task_id("ghost"));

  EXPECT_EQ(result, ReconcileResult::done());
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"ghost"}));
  EXPECT_FALSE(store_->get(SecretName{"ghost-token"}).has_value());
}

TEST_F(ReconcilerTest, MissingRecordWithNothingLeftIsDone) {
  EXPECT_EQ(reconcile(task_id("never-existed")), ReconcileResult::done());
}

TEST_F(ReconcilerTest, ConcurrentCompletionWinsOverRunningWrite) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");

  InterceptingTaskStore tasks(*store_);
  auto reconciler = make_reconciler(tasks);
  tasks.before_update = [&](const TaskId& target) {
    ASSERT_TRUE(report_completion(*store_, target, Reason::Failed,
                                  "runner crashed")
                    .has_value());
  };

  auto result = reconciler->reconcile(id);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Failed);
  EXPECT_EQ(status.succeeded->message, "runner crashed");
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(ReconcilerTest, ConflictAfterDeliveryDoesNotDeliverAgain) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");

  InterceptingTaskStore tasks(*store_);
  auto reconciler = make_reconciler(tasks);
  // Let the Running write through, then race the assigned write with an
  // unrelated status change.
  tasks.before_update = [&](const TaskId&) {
    tasks.before_update = [&](const TaskId& target) {
      auto current = store_->get(target);
      ASSERT_TRUE(current.has_value());
      auto status = current->status;
      status.result.pr_url = "https://github.com/acme/widgets/pull/9";
      ASSERT_TRUE(
          store_->update_status(target, current->version, status).has_value());
    };
  };

  auto result = reconciler->reconcile(id);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(transport_->call_count(), 1u);
  EXPECT_EQ(tokens_issued_, 1);
  auto status = record(id).status;
  EXPECT_TRUE(status.assigned);
  EXPECT_EQ(status.result.pr_url, "https://github.com/acme/widgets/pull/9");
}

namespace {

// Rewrites the current status unchanged, which only bumps the version.
auto bump_version(SqliteStore& store, const TaskId& id) -> void {
  auto current = store.get(id);
  ASSERT_TRUE(current.has_value());
  ASSERT_TRUE(
      store.update_status(id, current->version, current->status).has_value());
}

}  // namespace

TEST_F(ReconcilerTest, ConflictOnExpiryWriteStillTimesOut) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxExpired", "shutdown time reached");

  InterceptingTaskStore tasks(*store_);
  auto reconciler = make_reconciler(tasks);
  tasks.before_update = [&](const TaskId& target) {
    bump_version(*store_, target);
  };

  auto result = reconciler->reconcile(id);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::TimedOut);
  EXPECT_EQ(status.succeeded->message, "Sandbox expired");
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_FALSE(has_secret(id));
}

TEST_F(ReconcilerTest, ConflictOnPendingExpiryWriteDoesNotRecreateClaim) {
  auto id = create(make_task("task-1"));
  reconcile(id);
  reconcile(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "ClaimExpired", "");

  InterceptingTaskStore tasks(*store_);
  auto reconciler = make_reconciler(tasks);
  tasks.before_update = [&](const TaskId& target) {
    bump_version(*store_, target);
  };

  ASSERT_TRUE(reconciler->reconcile(id).has_value());

  EXPECT_EQ(reason(id), Reason::TimedOut);
  EXPECT_EQ(sandboxes_.create_calls.load(), 1);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
}

TEST_F(ReconcilerTest, SuccessReportRacingTerminationWins) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxFailed", "container exited");

  InterceptingTaskStore tasks(*store_);
  auto reconciler = make_reconciler(tasks);
  // The report lands after the termination is classified but before the
  // Failed condition is written.
  tasks.before_update = [&](const TaskId& target) {
    ASSERT_TRUE(report_completion(*store_, target, Reason::Succeeded,
                                  "PR opened",
                                  "https://github.com/acme/widgets/pull/5")
                    .has_value());
  };

  auto result = reconciler->reconcile(id);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->status, ConditionStatus::True);
  EXPECT_EQ(status.succeeded->reason, Reason::Succeeded);
  EXPECT_EQ(status.succeeded->message, "PR opened");
  EXPECT_EQ(status.result.pr_url, "https://github.com/acme/widgets/pull/5");
  EXPECT_TRUE(status.result.error.empty());
  EXPECT_TRUE(status.cleaned_up);
  EXPECT_FALSE(sandboxes_.has_claim(ClaimName{"task-1"}));
  EXPECT_FALSE(has_secret(id));
}

class GracefulReconcilerTest : public ReconcilerTest {
protected:
  [[nodiscard]] auto config() const -> ReconcilerConfig override {
    ReconcilerConfig c;
    c.termination_grace = 30s;
    return c;
  }
};

TEST_F(GracefulReconcilerTest, TerminationWaitsForGracePeriod) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxFailed", "container exited");

  EXPECT_EQ(reconcile(id), ReconcileResult::after(30000ms));
  EXPECT_EQ(record(id).status.grace_deadline, clock_.now() + 30s);
  EXPECT_EQ(reason(id), Reason::Running);

  clock_.advance(10s);
  EXPECT_EQ(reconcile(id), ReconcileResult::after(20000ms));
  EXPECT_EQ(reason(id), Reason::Running);

  clock_.advance(20s);
  EXPECT_EQ(reconcile(id), ReconcileResult::done());
  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Failed);
  EXPECT_EQ(status.succeeded->message, "Sandbox terminated: container exited");
  EXPECT_FALSE(status.grace_deadline.has_value());
}

TEST_F(GracefulReconcilerTest, CompletionDuringGraceWins) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxFailed", "container exited");
  reconcile(id);

  ASSERT_TRUE(report_completion(*store_, id, Reason::Succeeded, "PR opened",
                                "https://github.com/acme/widgets/pull/3")
                  .has_value());
  clock_.advance(5s);
  reconcile(id);

  auto status = record(id).status;
  EXPECT_EQ(status.succeeded->reason, Reason::Succeeded);
  EXPECT_EQ(status.result.pr_url, "https://github.com/acme/widgets/pull/3");
  EXPECT_TRUE(status.cleaned_up);
}

TEST_F(GracefulReconcilerTest, RecoveredSandboxClearsDeadline) {
  auto id = create(make_task("task-1"));
  drive_to_assigned(id);
  sandboxes_.set_condition(ClaimName{"task-1"}, ConditionStatus::False,
                           "SandboxFailed", "node drained");
  reconcile(id);
  ASSERT_TRUE(record(id).status.grace_deadline.has_value());

  sandboxes_.set_ready(ClaimName{"task-1"}, "task-1.sandboxes.svc");
  reconcile(id);

  auto status = record(id).status;
  EXPECT_FALSE(status.grace_deadline.has_value());
  EXPECT_EQ(status.succeeded->reason, Reason::Running);
  EXPECT_EQ(transport_->call_count(), 1u);
}
