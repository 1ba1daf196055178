#pragma once

#include "shepherd/storage/lease_store.hpp"
#include "shepherd/util/clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace shepherd {

struct LeaderElectionConfig {
  std::string lease_name{"shepherd-operator"};
  std::string identity;
  std::chrono::milliseconds lease_duration{15000};
  std::chrono::milliseconds renew_deadline{10000};
  std::chrono::milliseconds retry_period{2000};
};

// "<hostname>-<pid>"
[[nodiscard]] auto default_identity() -> std::string;

// Keeps at most one active controller by holding a renewable lease.
class LeaderElector {
public:
  using Callback = std::function<void()>;

  LeaderElector(LeaseStore& leases, LeaderElectionConfig config,
                NowFn now = system_now());
  ~LeaderElector();

  LeaderElector(const LeaderElector&) = delete;
  auto operator=(const LeaderElector&) -> LeaderElector& = delete;

  auto set_on_started_leading(Callback cb) -> void;
  auto set_on_stopped_leading(Callback cb) -> void;

  auto start() -> void;
  // Gives up leadership and releases the lease.
  auto stop() -> void;

  // One acquire-or-renew round.
  auto tick() -> void;

  [[nodiscard]] auto is_leader() const noexcept -> bool;
  [[nodiscard]] auto identity() const -> const std::string& {
    return config_.identity;
  }

private:
  auto run(std::stop_token st) -> void;

  LeaseStore& leases_;
  LeaderElectionConfig config_;
  NowFn now_;

  Callback on_started_leading_;
  Callback on_stopped_leading_;

  std::atomic<bool> leader_{false};
  TimePoint last_renew_{};

  std::jthread thread_;
  std::mutex wait_mutex_;
  std::condition_variable_any wait_cv_;
};

}  // namespace shepherd
