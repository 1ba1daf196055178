#pragma once

#include "shepherd/config/config.hpp"
#include "shepherd/core/error.hpp"

#include <atomic>
#include <memory>
#include <string_view>

namespace shepherd {

namespace http {
class Transport;
}
namespace sandbox {
class SandboxOrchestrator;
}

class AssignmentClient;
class Controller;
class LeaderElector;
class Reconciler;
class SqliteStore;

// Wires the store, the remote clients, the Reconciler and the controller
// harness together from one SystemConfig.
class Application {
public:
  Application();
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto load_config_string(std::string_view yaml)
      -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const Config&;
  [[nodiscard]] auto config() noexcept -> Config&;

  // Opens the store and builds every component. Called by start() if needed.
  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto store() -> SqliteStore*;
  [[nodiscard]] auto controller() -> Controller*;
  [[nodiscard]] auto leader_elector() -> LeaderElector*;

private:
  std::atomic<bool> running_{false};
  Config config_;

  std::unique_ptr<SqliteStore> store_;
  std::shared_ptr<http::Transport> sandbox_transport_;
  std::shared_ptr<http::Transport> runner_transport_;
  std::unique_ptr<sandbox::SandboxOrchestrator> sandboxes_;
  std::unique_ptr<AssignmentClient> assigner_;
  std::unique_ptr<Reconciler> reconciler_;
  std::unique_ptr<Controller> controller_;
  std::unique_ptr<LeaderElector> elector_;
};

}  // namespace shepherd
