#include "shepherd/app/application.hpp"
#include "shepherd/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("Shepherd - reconciles coding-agent tasks onto sandboxes");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (default: shepherd.db)");
  std::println("  --log-level <level>   trace, debug, info, warn or error");
  std::println("  --no-leader-elect     Run the controller without a lease");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -c shepherd.yaml", prog);
  std::println("  {} --db /var/lib/shepherd.db --no-leader-elect", prog);
}

void print_version() {
  std::println("Shepherd v0.1.0");
}

struct Options {
  std::string config_file;
  std::string db_file;
  std::string log_level;
  bool no_leader_elect = false;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--db") {
      if (++i >= argc) {
        std::println(stderr, "Error: --db requires an argument");
        std::exit(1);
      }
      opts.db_file = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg == "--no-leader-elect") {
      opts.no_leader_elect = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto setup_logging(const shepherd::LoggingConfig& cfg) -> bool {
  shepherd::log::set_level(cfg.log_level);
  if (!cfg.log_file.empty() && !shepherd::log::set_file(cfg.log_file)) {
    std::println(stderr, "Error: Cannot open log file: {}", cfg.log_file);
    return false;
  }
  shepherd::log::start();
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  shepherd::Application app;

  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return 1;
    }
    if (auto r = app.load_config(opts.config_file); !r) {
      std::println(stderr, "Error: Failed to load config: {}",
                   r.error().message());
      return 1;
    }
  }

  if (!opts.db_file.empty()) {
    app.config().storage.db_file = opts.db_file;
  }
  if (!opts.log_level.empty()) {
    app.config().logging.log_level = opts.log_level;
  }
  if (opts.no_leader_elect) {
    app.config().leader_election.enabled = false;
  }

  if (!setup_logging(app.config().logging)) {
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  shepherd::log::info("Shepherd controller starting, database {}",
                      app.config().storage.db_file);
  if (auto r = app.start(); !r) {
    shepherd::log::error("Failed to start: {}", r.error().message());
    shepherd::log::stop();
    return 1;
  }

  while (app.is_running() &&
         !g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    shepherd::log::info("Received shutdown signal, stopping...");
  }

  app.stop();
  shepherd::log::info("Shepherd stopped.");
  shepherd::log::stop();
  return 0;
}
