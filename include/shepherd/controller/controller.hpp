#pragma once

#include "shepherd/controller/reconciler.hpp"
#include "shepherd/controller/work_queue.hpp"
#include "shepherd/storage/task_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace shepherd {

struct ControllerConfig {
  int workers{4};
  std::chrono::milliseconds resync_interval{30000};
  WorkQueueConfig queue;
};

// Feeds task keys from the store into a work queue and runs the Reconciler
// on a fixed pool of worker threads. Can be started again after stop(), which
// is how leadership changes are handled.
class Controller {
public:
  Controller(TaskStore& store, Reconciler& reconciler,
             ControllerConfig config = {});
  ~Controller();

  Controller(const Controller&) = delete;
  auto operator=(const Controller&) -> Controller& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  auto enqueue(const TaskId& id) -> void;

  // Number of reconcile calls made since construction.
  [[nodiscard]] auto reconcile_count() const noexcept -> std::uint64_t {
    return reconcile_count_.load(std::memory_order_relaxed);
  }

private:
  auto worker_loop(WorkQueue& queue) -> void;
  auto resync_loop(std::stop_token st) -> void;
  auto process(WorkQueue& queue, const TaskId& id) -> void;
  auto enqueue_all() -> void;

  TaskStore& store_;
  Reconciler& reconciler_;
  ControllerConfig config_;
  std::size_t subscription_{0};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> reconcile_count_{0};

  std::mutex queue_mutex_;
  std::shared_ptr<WorkQueue> queue_;

  std::vector<std::jthread> workers_;
  std::jthread resync_thread_;
  std::mutex resync_mutex_;
  std::condition_variable_any resync_cv_;
};

}  // namespace shepherd
