#pragma once

#include "shepherd/client/http/transport.hpp"
#include "shepherd/core/error.hpp"
#include "shepherd/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace shepherd {

struct AssignmentConfig {
  std::string api_url;
  uint16_t runner_port{8888};
  std::string path{"/task"};
  int max_attempts{5};
  std::chrono::milliseconds retry_delay{2000};
};

struct Assignment {
  TaskId task_id;
  std::string api_url;
  std::string token;
};

// Delivers a task to the runner inside a ready sandbox. A runner that already
// holds the task answers 409, which counts as delivered.
class AssignmentClient {
public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  AssignmentClient(std::shared_ptr<http::Transport> transport,
                   AssignmentConfig config = {});

  // Tests replace the wait between attempts.
  auto set_sleep(SleepFn sleep) -> void { sleep_ = std::move(sleep); }

  [[nodiscard]] auto config() const noexcept -> const AssignmentConfig& {
    return config_;
  }

  // Retries up to max_attempts. AssignmentFailed once they are exhausted.
  [[nodiscard]] auto assign(std::string_view address, const TaskId& task_id,
                            std::string_view token) -> Result<void>;

  [[nodiscard]] static auto encode(const Assignment& assignment)
      -> std::string;

private:
  [[nodiscard]] auto attempt(const http::Endpoint& endpoint,
                             const std::string& body, std::string_view token)
      -> Result<void>;

  std::shared_ptr<http::Transport> transport_;
  AssignmentConfig config_;
  SleepFn sleep_;
};

}  // namespace shepherd
