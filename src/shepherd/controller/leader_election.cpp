#include "shepherd/controller/leader_election.hpp"

#include "shepherd/util/log.hpp"

#include <unistd.h>

#include <array>
#include <format>

namespace shepherd {

auto default_identity() -> std::string {
  std::array<char, 256> host{};
  if (::gethostname(host.data(), host.size() - 1) != 0) {
    return std::format("shepherd-{}", ::getpid());
  }
  return std::format("{}-{}", host.data(), ::getpid());
}

LeaderElector::LeaderElector(LeaseStore& leases, LeaderElectionConfig config,
                             NowFn now)
    : leases_(leases), config_(std::move(config)), now_(std::move(now)) {
  if (config_.identity.empty()) {
    config_.identity = default_identity();
  }
}

LeaderElector::~LeaderElector() {
  stop();
}

auto LeaderElector::set_on_started_leading(Callback cb) -> void {
  on_started_leading_ = std::move(cb);
}

auto LeaderElector::set_on_stopped_leading(Callback cb) -> void {
  on_stopped_leading_ = std::move(cb);
}

auto LeaderElector::start() -> void {
  if (thread_.joinable()) {
    return;
  }
  log::info("Leader election started for lease {} as {}", config_.lease_name,
            config_.identity);
  thread_ = std::jthread([this](std::stop_token st) { run(std::move(st)); });
}

auto LeaderElector::stop() -> void {
  if (thread_.joinable()) {
    thread_.request_stop();
    wait_cv_.notify_all();
    thread_.join();
  }

  if (leader_.exchange(false)) {
    log::info("Giving up leadership of lease {}", config_.lease_name);
    if (on_stopped_leading_) {
      on_stopped_leading_();
    }
    if (auto r = leases_.release(config_.lease_name, config_.identity); !r) {
      log::warn("Failed to release lease {}: {}", config_.lease_name,
                r.error().message());
    }
  }
}

auto LeaderElector::is_leader() const noexcept -> bool {
  return leader_.load();
}

auto LeaderElector::tick() -> void {
  auto now = now_();
  auto acquired = leases_.try_acquire(config_.lease_name, config_.identity,
                                      config_.lease_duration, now);
  if (!acquired) {
    log::warn("Lease {} renewal failed: {}", config_.lease_name,
              acquired.error().message());
  }

  if (acquired && *acquired) {
    last_renew_ = now;
    if (!leader_.exchange(true)) {
      log::info("Acquired lease {}, now leading", config_.lease_name);
      if (on_started_leading_) {
        on_started_leading_();
      }
    }
    return;
  }

  if (leader_.load() && now - last_renew_ > config_.renew_deadline) {
    leader_.store(false);
    log::warn("Lost lease {}: not renewed within {}ms", config_.lease_name,
              config_.renew_deadline.count());
    if (on_stopped_leading_) {
      on_stopped_leading_();
    }
  }
}

auto LeaderElector::run(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    tick();
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, st, config_.retry_period, [] { return false; });
  }
}

}  // namespace shepherd
