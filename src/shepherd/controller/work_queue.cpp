#include "shepherd/controller/work_queue.hpp"

#include <algorithm>

namespace shepherd {

WorkQueue::WorkQueue(WorkQueueConfig config) : config_(config) {}

WorkQueue::~WorkQueue() {
  shut_down();
}

auto WorkQueue::add(const TaskId& key) -> void {
  {
    std::lock_guard lock(mutex_);
    add_locked(key);
  }
  cv_.notify_one();
}

auto WorkQueue::add_locked(const TaskId& key) -> void {
  if (shutting_down_ || dirty_.contains(key)) {
    return;
  }
  dirty_.insert(key);
  if (processing_.contains(key)) {
    return;
  }
  queue_.push_back(key);
}

auto WorkQueue::add_after(const TaskId& key, std::chrono::milliseconds delay)
    -> void {
  if (delay.count() <= 0) {
    add(key);
    return;
  }
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      return;
    }
    auto when = Clock::now() + delay;
    // Keep only the earliest pending deadline per key.
    if (auto it = delayed_at_.find(key);
        it != delayed_at_.end() && it->second <= when) {
      return;
    }
    delayed_at_[key] = when;
    delayed_.emplace(when, key);
  }
  cv_.notify_all();
}

auto WorkQueue::backoff_for(int failures) const -> std::chrono::milliseconds {
  auto delay = config_.base_delay;
  for (int i = 1; i < failures && delay < config_.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.max_delay);
}

auto WorkQueue::add_rate_limited(const TaskId& key) -> void {
  int failures;
  {
    std::lock_guard lock(mutex_);
    failures = ++failures_[key];
  }
  add_after(key, backoff_for(failures));
}

auto WorkQueue::forget(const TaskId& key) -> void {
  std::lock_guard lock(mutex_);
  failures_.erase(key);
}

auto WorkQueue::num_requeues(const TaskId& key) const -> int {
  std::lock_guard lock(mutex_);
  auto it = failures_.find(key);
  return it == failures_.end() ? 0 : it->second;
}

auto WorkQueue::promote_due_locked(Clock::time_point now)
    -> std::optional<Clock::time_point> {
  while (!delayed_.empty()) {
    auto it = delayed_.begin();
    if (it->first > now) {
      return it->first;
    }
    auto key = std::move(it->second);
    auto when = it->first;
    delayed_.erase(it);

    // Stale entry superseded by an earlier deadline.
    auto idx = delayed_at_.find(key);
    if (idx == delayed_at_.end() || idx->second != when) {
      continue;
    }
    delayed_at_.erase(idx);
    add_locked(key);
  }
  return std::nullopt;
}

auto WorkQueue::get() -> std::optional<TaskId> {
  std::unique_lock lock(mutex_);
  while (true) {
    auto next = promote_due_locked(Clock::now());

    if (!queue_.empty()) {
      auto key = std::move(queue_.front());
      queue_.pop_front();
      dirty_.erase(key);
      processing_.insert(key);
      return key;
    }

    if (shutting_down_) {
      return std::nullopt;
    }

    if (next) {
      cv_.wait_until(lock, *next);
    } else {
      cv_.wait(lock);
    }
  }
}

auto WorkQueue::done(const TaskId& key) -> void {
  bool requeued = false;
  {
    std::lock_guard lock(mutex_);
    processing_.erase(key);
    if (dirty_.contains(key)) {
      queue_.push_back(key);
      requeued = true;
    }
  }
  if (requeued) {
    cv_.notify_one();
  }
}

auto WorkQueue::shut_down() -> void {
  {
    std::lock_guard lock(mutex_);
    shutting_down_ = true;
    delayed_.clear();
    delayed_at_.clear();
  }
  cv_.notify_all();
}

auto WorkQueue::is_shutting_down() const -> bool {
  std::lock_guard lock(mutex_);
  return shutting_down_;
}

auto WorkQueue::len() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

}  // namespace shepherd
