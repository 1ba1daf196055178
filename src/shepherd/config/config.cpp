#include "shepherd/config/config.hpp"

#include "shepherd/config/yaml_utils.hpp"
#include "shepherd/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<shepherd::StorageConfig> {
  static bool decode(const Node& node, shepherd::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file =
        shepherd::yaml_get_or<std::string>(node, "db_file", "shepherd.db");
    return true;
  }
};

template <>
struct convert<shepherd::LoggingConfig> {
  static bool decode(const Node& node, shepherd::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.log_level = shepherd::yaml_get_or<std::string>(node, "log_level", "info");
    l.log_file = shepherd::yaml_get_or<std::string>(node, "log_file", "");
    return true;
  }
};

template <>
struct convert<shepherd::ControllerSection> {
  static bool decode(const Node& node, shepherd::ControllerSection& c) {
    if (!node.IsMap()) {
      return false;
    }
    shepherd::ControllerSection d;
    c.workers = shepherd::yaml_get_or(node, "workers", d.workers);
    c.resync_interval_sec = shepherd::yaml_get_or(node, "resync_interval_sec",
                                                  d.resync_interval_sec);
    c.pending_poll_ms =
        shepherd::yaml_get_or(node, "pending_poll_ms", d.pending_poll_ms);
    c.running_poll_ms =
        shepherd::yaml_get_or(node, "running_poll_ms", d.running_poll_ms);
    c.assign_retry_ms =
        shepherd::yaml_get_or(node, "assign_retry_ms", d.assign_retry_ms);
    c.termination_grace_sec = shepherd::yaml_get_or(
        node, "termination_grace_sec", d.termination_grace_sec);
    c.backoff_base_ms =
        shepherd::yaml_get_or(node, "backoff_base_ms", d.backoff_base_ms);
    c.backoff_max_ms =
        shepherd::yaml_get_or(node, "backoff_max_ms", d.backoff_max_ms);
    return true;
  }
};

template <>
struct convert<shepherd::AssignmentSection> {
  static bool decode(const Node& node, shepherd::AssignmentSection& a) {
    if (!node.IsMap()) {
      return false;
    }
    shepherd::AssignmentSection d;
    a.api_url = shepherd::yaml_get_or<std::string>(node, "api_url", "");
    a.runner_port =
        shepherd::yaml_get_or<uint16_t>(node, "runner_port", d.runner_port);
    a.path = shepherd::yaml_get_or<std::string>(node, "path", d.path);
    a.max_attempts = shepherd::yaml_get_or(node, "max_attempts", d.max_attempts);
    a.retry_delay_ms =
        shepherd::yaml_get_or(node, "retry_delay_ms", d.retry_delay_ms);
    a.connect_timeout_ms = shepherd::yaml_get_or(node, "connect_timeout_ms",
                                                 d.connect_timeout_ms);
    a.read_timeout_ms =
        shepherd::yaml_get_or(node, "read_timeout_ms", d.read_timeout_ms);
    return true;
  }
};

template <>
struct convert<shepherd::SandboxSection> {
  static bool decode(const Node& node, shepherd::SandboxSection& s) {
    if (!node.IsMap()) {
      return false;
    }
    shepherd::SandboxSection d;
    s.host = shepherd::yaml_get_or<std::string>(node, "host", d.host);
    s.port = shepherd::yaml_get_or<uint16_t>(node, "port", d.port);
    s.api_version =
        shepherd::yaml_get_or<std::string>(node, "api_version", d.api_version);
    s.connect_timeout_ms = shepherd::yaml_get_or(node, "connect_timeout_ms",
                                                 d.connect_timeout_ms);
    s.read_timeout_ms =
        shepherd::yaml_get_or(node, "read_timeout_ms", d.read_timeout_ms);
    return true;
  }
};

template <>
struct convert<shepherd::LeaderElectionSection> {
  static bool decode(const Node& node, shepherd::LeaderElectionSection& l) {
    if (!node.IsMap()) {
      return false;
    }
    shepherd::LeaderElectionSection d;
    l.enabled = shepherd::yaml_get_or(node, "enabled", d.enabled);
    l.lease_name =
        shepherd::yaml_get_or<std::string>(node, "lease_name", d.lease_name);
    l.identity = shepherd::yaml_get_or<std::string>(node, "identity", "");
    l.lease_duration_sec = shepherd::yaml_get_or(node, "lease_duration_sec",
                                                 d.lease_duration_sec);
    l.renew_deadline_sec = shepherd::yaml_get_or(node, "renew_deadline_sec",
                                                 d.renew_deadline_sec);
    l.retry_period_sec =
        shepherd::yaml_get_or(node, "retry_period_sec", d.retry_period_sec);
    return true;
  }
};

template <>
struct convert<shepherd::SystemConfig> {
  static bool decode(const Node& node, shepherd::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    shepherd::yaml_read_section(node, "storage", c.storage);
    shepherd::yaml_read_section(node, "logging", c.logging);
    shepherd::yaml_read_section(node, "controller", c.controller);
    shepherd::yaml_read_section(node, "assignment", c.assignment);
    shepherd::yaml_read_section(node, "sandbox", c.sandbox);
    shepherd::yaml_read_section(node, "leader_election", c.leader_election);
    return true;
  }
};

}  // namespace YAML

namespace shepherd {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    // An empty document selects every default.
    if (!root.IsDefined() || root.IsNull()) {
      return SystemConfig{};
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::InvalidArgument);
  };

  const auto& c = config.controller;
  if (c.workers < 1) {
    return reject("controller.workers must be at least 1");
  }
  if (c.resync_interval_sec < 1 || c.pending_poll_ms < 1 ||
      c.running_poll_ms < 1 || c.assign_retry_ms < 1) {
    return reject("controller intervals must be positive");
  }
  if (c.termination_grace_sec < 0) {
    return reject("controller.termination_grace_sec must not be negative");
  }
  if (c.backoff_base_ms < 1 || c.backoff_max_ms < c.backoff_base_ms) {
    return reject("controller backoff must satisfy 0 < base <= max");
  }

  const auto& a = config.assignment;
  if (a.max_attempts < 1) {
    return reject("assignment.max_attempts must be at least 1");
  }
  if (a.runner_port == 0 || a.path.empty() || a.path.front() != '/') {
    return reject("assignment.runner_port and assignment.path are required");
  }

  if (config.sandbox.port == 0 || config.sandbox.host.empty()) {
    return reject("sandbox.host and sandbox.port are required");
  }

  const auto& l = config.leader_election;
  if (l.enabled && (l.lease_duration_sec <= l.renew_deadline_sec ||
                    l.renew_deadline_sec <= l.retry_period_sec ||
                    l.retry_period_sec < 1)) {
    return reject(
        "leader_election requires lease_duration > renew_deadline > "
        "retry_period > 0");
  }
  return ok();
}

}  // namespace shepherd
