#include "shepherd/app/application.hpp"

#include "shepherd/client/http/transport.hpp"
#include "shepherd/client/sandbox/sandbox_client.hpp"
#include "shepherd/controller/assignment_client.hpp"
#include "shepherd/controller/controller.hpp"
#include "shepherd/controller/leader_election.hpp"
#include "shepherd/controller/reconciler.hpp"
#include "shepherd/storage/sqlite_store.hpp"
#include "shepherd/util/log.hpp"

namespace shepherd {

namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

auto to_reconciler_config(const ControllerSection& c) -> ReconcilerConfig {
  ReconcilerConfig r;
  r.pending_poll = milliseconds{c.pending_poll_ms};
  r.running_poll = milliseconds{c.running_poll_ms};
  r.assign_retry = milliseconds{c.assign_retry_ms};
  r.termination_grace = seconds{c.termination_grace_sec};
  return r;
}

auto to_controller_config(const ControllerSection& c) -> ControllerConfig {
  return ControllerConfig{
      .workers = c.workers,
      .resync_interval = seconds{c.resync_interval_sec},
      .queue =
          {
              .base_delay = milliseconds{c.backoff_base_ms},
              .max_delay = milliseconds{c.backoff_max_ms},
          },
  };
}

auto to_assignment_config(const AssignmentSection& a) -> AssignmentConfig {
  return AssignmentConfig{
      .api_url = a.api_url,
      .runner_port = a.runner_port,
      .path = a.path,
      .max_attempts = a.max_attempts,
      .retry_delay = milliseconds{a.retry_delay_ms},
  };
}

auto to_election_config(const LeaderElectionSection& l)
    -> LeaderElectionConfig {
  return LeaderElectionConfig{
      .lease_name = l.lease_name,
      .identity = l.identity,
      .lease_duration = seconds{l.lease_duration_sec},
      .renew_deadline = seconds{l.renew_deadline_sec},
      .retry_period = seconds{l.retry_period_sec},
  };
}

}  // namespace

Application::Application() = default;

Application::Application(SystemConfig config) : config_(std::move(config)) {}

Application::~Application() {
  stop();
}

auto Application::load_config(std::string_view path) -> Result<void> {
  auto result = ConfigLoader::load_from_file(path);
  if (!result) {
    return fail(result.error());
  }
  config_ = std::move(*result);
  return ok();
}

auto Application::load_config_string(std::string_view yaml) -> Result<void> {
  auto result = ConfigLoader::load_from_string(yaml);
  if (!result) {
    return fail(result.error());
  }
  config_ = std::move(*result);
  return ok();
}

auto Application::config() const noexcept -> const Config& {
  return config_;
}

auto Application::config() noexcept -> Config& {
  return config_;
}

auto Application::init() -> Result<void> {
  if (store_) {
    return ok();
  }
  if (auto r = ConfigLoader::validate(config_); !r) {
    return r;
  }

  auto store = std::make_unique<SqliteStore>(config_.storage.db_file);
  if (auto r = store->open(); !r) {
    return r;
  }
  store_ = std::move(store);

  if (config_.assignment.api_url.empty()) {
    log::warn("assignment.api_url is not set; runners cannot report back");
  }

  sandbox_transport_ = std::make_shared<http::TcpTransport>(
      http::HttpClientConfig{
          .connect_timeout = milliseconds{config_.sandbox.connect_timeout_ms},
          .read_timeout = milliseconds{config_.sandbox.read_timeout_ms},
      });
  runner_transport_ = std::make_shared<http::TcpTransport>(
      http::HttpClientConfig{
          .connect_timeout =
              milliseconds{config_.assignment.connect_timeout_ms},
          .read_timeout = milliseconds{config_.assignment.read_timeout_ms},
      });

  sandboxes_ = std::make_unique<sandbox::HttpSandboxClient>(
      sandbox_transport_, sandbox::SandboxClientConfig{
                              .host = config_.sandbox.host,
                              .port = config_.sandbox.port,
                              .api_version = config_.sandbox.api_version,
                          });
  assigner_ = std::make_unique<AssignmentClient>(
      runner_transport_, to_assignment_config(config_.assignment));
  reconciler_ = std::make_unique<Reconciler>(
      *store_, *sandboxes_, *store_, *assigner_,
      to_reconciler_config(config_.controller));
  controller_ = std::make_unique<Controller>(
      *store_, *reconciler_, to_controller_config(config_.controller));

  if (config_.leader_election.enabled) {
    elector_ = std::make_unique<LeaderElector>(
        *store_, to_election_config(config_.leader_election));
    elector_->set_on_started_leading([this] { controller_->start(); });
    elector_->set_on_stopped_leading([this] { controller_->stop(); });
  }
  return ok();
}

auto Application::start() -> Result<void> {
  if (running_.load()) {
    return ok();
  }
  if (auto r = init(); !r) {
    return r;
  }

  running_.store(true);
  if (elector_) {
    elector_->start();
  } else {
    log::info("Leader election disabled, starting controller");
    controller_->start();
  }
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  if (elector_) {
    elector_->stop();
  }
  if (controller_) {
    controller_->stop();
  }
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::store() -> SqliteStore* {
  return store_.get();
}

auto Application::controller() -> Controller* {
  return controller_.get();
}

auto Application::leader_elector() -> LeaderElector* {
  return elector_.get();
}

}  // namespace shepherd
