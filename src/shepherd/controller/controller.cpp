#include "shepherd/controller/controller.hpp"

#include "shepherd/util/log.hpp"

#include <algorithm>

namespace shepherd {

Controller::Controller(TaskStore& store, Reconciler& reconciler,
                       ControllerConfig config)
    : store_(store), reconciler_(reconciler), config_(config) {
  subscription_ = store_.subscribe([this](const TaskId& id) {
    if (running_.load()) {
      enqueue(id);
    }
  });
}

Controller::~Controller() {
  stop();
  store_.unsubscribe(subscription_);
}

auto Controller::start() -> void {
  if (running_.exchange(true)) {
    return;
  }

  auto queue = std::make_shared<WorkQueue>(config_.queue);
  {
    std::lock_guard lock(queue_mutex_);
    queue_ = queue;
  }

  int workers = std::max(config_.workers, 1);
  workers_.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back([this, queue] { worker_loop(*queue); });
  }

  // Initial sync: every record is reconciled at least once after a restart or
  // a leadership change.
  enqueue_all();

  resync_thread_ =
      std::jthread([this](std::stop_token st) { resync_loop(std::move(st)); });

  log::info("Controller started with {} workers", workers);
}

auto Controller::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  std::shared_ptr<WorkQueue> queue;
  {
    std::lock_guard lock(queue_mutex_);
    queue = std::move(queue_);
  }
  if (queue) {
    queue->shut_down();
  }

  if (resync_thread_.joinable()) {
    resync_thread_.request_stop();
    resync_cv_.notify_all();
    resync_thread_.join();
  }

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  log::info("Controller stopped");
}

auto Controller::is_running() const noexcept -> bool {
  return running_.load();
}

auto Controller::enqueue(const TaskId& id) -> void {
  std::lock_guard lock(queue_mutex_);
  if (queue_) {
    queue_->add(id);
  }
}

auto Controller::enqueue_all() -> void {
  auto records = store_.list();
  if (!records) {
    log::warn("Failed to list tasks for resync: {}",
              records.error().message());
    return;
  }
  for (const auto& record : *records) {
    enqueue(record.id);
  }
  log::debug("Resync queued {} tasks", records->size());
}

auto Controller::resync_loop(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    {
      std::unique_lock lock(resync_mutex_);
      resync_cv_.wait_for(lock, st, config_.resync_interval,
                          [] { return false; });
    }
    if (st.stop_requested()) {
      break;
    }
    enqueue_all();
  }
}

auto Controller::worker_loop(WorkQueue& queue) -> void {
  while (auto id = queue.get()) {
    process(queue, *id);
  }
}

auto Controller::process(WorkQueue& queue, const TaskId& id) -> void {
  reconcile_count_.fetch_add(1, std::memory_order_relaxed);
  auto result = reconciler_.reconcile(id);
  if (!result) {
    log::warn("Reconcile of task {} failed: {} (retry {})", id,
              result.error().message(), queue.num_requeues(id) + 1);
    queue.add_rate_limited(id);
  } else if (result->requeue_after) {
    queue.forget(id);
    queue.add_after(id, *result->requeue_after);
  } else {
    queue.forget(id);
  }
  queue.done(id);
}

}  // namespace shepherd
