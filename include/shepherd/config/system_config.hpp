#pragma once

#include <cstdint>
#include <string>

namespace shepherd {

struct StorageConfig {
  std::string db_file{"shepherd.db"};
};

struct LoggingConfig {
  std::string log_level{"info"};
  std::string log_file;
};

struct ControllerSection {
  int workers{4};
  int resync_interval_sec{30};
  int pending_poll_ms{5000};
  int running_poll_ms{60000};
  int assign_retry_ms{5000};
  int termination_grace_sec{30};
  int backoff_base_ms{5};
  int backoff_max_ms{60000};
};

struct AssignmentSection {
  // Base URL the runner reports back to.
  std::string api_url;
  uint16_t runner_port{8888};
  std::string path{"/task"};
  int max_attempts{5};
  int retry_delay_ms{2000};
  int connect_timeout_ms{5000};
  int read_timeout_ms{30000};
};

struct SandboxSection {
  std::string host{"127.0.0.1"};
  uint16_t port{8090};
  std::string api_version{"v1alpha1"};
  int connect_timeout_ms{5000};
  int read_timeout_ms{30000};
};

struct LeaderElectionSection {
  bool enabled{true};
  std::string lease_name{"shepherd-operator"};
  std::string identity;
  int lease_duration_sec{15};
  int renew_deadline_sec{10};
  int retry_period_sec{2};
};

struct SystemConfig {
  StorageConfig storage;
  LoggingConfig logging;
  ControllerSection controller;
  AssignmentSection assignment;
  SandboxSection sandbox;
  LeaderElectionSection leader_election;
};

}  // namespace shepherd
