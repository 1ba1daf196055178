#include "shepherd/controller/assignment_client.hpp"

#include "shepherd/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace shepherd {

using json = nlohmann::json;

AssignmentClient::AssignmentClient(std::shared_ptr<http::Transport> transport,
                                   AssignmentConfig config)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      sleep_([](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
      }) {}

auto AssignmentClient::encode(const Assignment& assignment) -> std::string {
  json body;
  body["taskID"] = assignment.task_id.str();
  body["apiURL"] = assignment.api_url;
  body["token"] = assignment.token;
  return body.dump();
}

auto AssignmentClient::attempt(const http::Endpoint& endpoint,
                               const std::string& body,
                               std::string_view token) -> Result<void> {
  auto req = http::HttpRequest::json(config_.path, body);
  req.headers["Authorization"] = std::format("Bearer {}", token);

  auto response = transport_->send(endpoint, std::move(req));
  if (!response) {
    return fail(response.error());
  }
  if (response->is_success()) {
    return ok();
  }
  if (response->status == http::HttpStatus::Conflict) {
    log::debug("Runner at {} already holds the task (409)", endpoint.host);
    return ok();
  }
  log::warn("Runner at {}:{} returned {}", endpoint.host, endpoint.port,
            response->status);
  return fail(Error::ApiError);
}

auto AssignmentClient::assign(std::string_view address, const TaskId& task_id,
                              std::string_view token) -> Result<void> {
  auto endpoint = http::parse_endpoint(address, config_.runner_port);
  if (!endpoint) {
    log::error("Invalid runner address for task {}: {}", task_id, address);
    return fail(Error::AssignmentFailed);
  }

  auto body = encode(Assignment{
      .task_id = task_id,
      .api_url = config_.api_url,
      .token = std::string(token),
  });

  int attempts = std::max(config_.max_attempts, 1);
  for (int i = 1; i <= attempts; ++i) {
    auto r = attempt(*endpoint, body, token);
    if (r) {
      log::info("Assigned task {} to runner at {}:{} (attempt {})", task_id,
                endpoint->host, endpoint->port, i);
      return ok();
    }
    log::warn("Assignment of task {} failed (attempt {}/{}): {}", task_id, i,
              attempts, r.error().message());
    if (i < attempts && config_.retry_delay.count() > 0) {
      sleep_(config_.retry_delay);
    }
  }
  return fail(Error::AssignmentFailed);
}

}  // namespace shepherd
