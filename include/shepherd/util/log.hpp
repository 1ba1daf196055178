#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace shepherd::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Async logger: producers append formatted lines to a pending batch, a single
// writer thread swaps the batch out and writes it.
class Logger {
  static constexpr std::size_t kMaxPending = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::string> pending_;
  std::FILE* out_{stdout};
  bool owns_out_{false};
  bool colored_{true};
  std::thread writer_;

  auto write_batch(const std::vector<std::string>& batch) -> void {
    for (const auto& line : batch) {
      std::print(out_, "{}", line);
    }
    if (!batch.empty()) {
      std::fflush(out_);
    }
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (true) {
      {
        std::unique_lock lock(mu_);
        cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
          return !pending_.empty() ||
                 !running_.load(std::memory_order_acquire);
        });
        batch.swap(pending_);
      }
      write_batch(batch);
      batch.clear();
      if (!running_.load(std::memory_order_acquire)) {
        break;
      }
    }

    // accepting_ is already false here, so nothing new can be queued.
    std::scoped_lock lock(mu_);
    write_batch(pending_);
    pending_.clear();
  }

  auto format_line(Level level, std::string_view msg) const -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (!colored_) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                         level_name(level), tid, msg);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                       level_color(level), level_name(level), "\033[0m", tid,
                       msg);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_out_ && out_ != nullptr) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    if (!running_.exchange(false))
      return;
    cv_.notify_one();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Redirects output to an append-mode file. Colors are dropped for files.
  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::scoped_lock lock(mu_);
    if (owns_out_ && out_ != nullptr) {
      std::fclose(out_);
    }
    out_ = f;
    owns_out_ = true;
    colored_ = false;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    if (!accepting_.load(std::memory_order_acquire)) {
      std::scoped_lock lock(mu_);
      std::print(out_, "{}", line);
      return;
    }

    std::unique_lock lock(mu_);
    if (pending_.size() >= kMaxPending) {
      std::print(out_, "{}", line);
      return;
    }
    pending_.push_back(std::move(line));
    lock.unlock();
    cv_.notify_one();
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace shepherd::log
