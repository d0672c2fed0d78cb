#include "cronwork/config/config.hpp"

#include "cronwork/config/yaml_utils.hpp"
#include "cronwork/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<cronwork::StorageConfig> {
  static bool decode(const Node& node, cronwork::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file =
        cronwork::yaml_get_or<std::string>(node, "db_file", "cronwork.db");
    s.busy_timeout_ms = cronwork::yaml_get_or(node, "busy_timeout_ms", 5000);
    return true;
  }
};

template <>
struct convert<cronwork::WorkerConfig> {
  static bool decode(const Node& node, cronwork::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.name = cronwork::yaml_get_or<std::string>(node, "name", "");
    w.groups = cronwork::yaml_get_or<std::vector<std::string>>(
        node, "groups", {"main"});
    w.pid_file = cronwork::yaml_get_or<std::string>(node, "pid_file", "");
    w.tick_interval_ms = cronwork::yaml_get_or(node, "tick_interval_ms", 1000);
    w.heartbeat_interval_ms =
        cronwork::yaml_get_or(node, "heartbeat_interval_ms", 3000);
    w.stale_after_ms = cronwork::yaml_get_or(node, "stale_after_ms", 30000);
    w.cancel_check_interval_ms =
        cronwork::yaml_get_or(node, "cancel_check_interval_ms", 1000);
    w.max_empty_runs = cronwork::yaml_get_or(node, "max_empty_runs", 0);
    return true;
  }
};

template <>
struct convert<cronwork::RetryConfig> {
  static bool decode(const Node& node, cronwork::RetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.mode = cronwork::yaml_get_or<std::string>(node, "mode", "immediate");
    r.delay_sec = cronwork::yaml_get_or(node, "delay_sec", 0);
    return true;
  }
};

template <>
struct convert<cronwork::LogConfig> {
  static bool decode(const Node& node, cronwork::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = cronwork::yaml_get_or<std::string>(node, "level", "info");
    l.file = cronwork::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<cronwork::SystemConfig> {
  static bool decode(const Node& node, cronwork::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<cronwork::StorageConfig>();
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<cronwork::WorkerConfig>();
    }
    if (auto retry = node["retry"]) {
      c.retry = retry.as<cronwork::RetryConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<cronwork::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace cronwork {

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
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  if (!parse_retry_mode(config.retry.mode)) {
    log::error("Unknown retry mode '{}'", config.retry.mode);
    return fail(Error::InvalidArgument);
  }
  if (config.retry.delay_sec < 0) {
    log::error("retry.delay_sec must not be negative");
    return fail(Error::InvalidArgument);
  }

  const auto& w = config.worker;
  if (w.tick_interval_ms <= 0 || w.heartbeat_interval_ms <= 0 ||
      w.stale_after_ms <= 0 || w.cancel_check_interval_ms <= 0) {
    log::error("Worker intervals must be positive");
    return fail(Error::InvalidArgument);
  }
  if (w.stale_after_ms <= w.heartbeat_interval_ms) {
    log::error("worker.stale_after_ms must exceed heartbeat_interval_ms");
    return fail(Error::InvalidArgument);
  }
  if (w.max_empty_runs < 0 || w.groups.empty()) {
    log::error("Invalid worker configuration");
    return fail(Error::InvalidArgument);
  }
  if (config.storage.db_file.empty() || config.storage.busy_timeout_ms < 0) {
    log::error("Invalid storage configuration");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto retry_policy_from(const RetryConfig& retry) -> RetryPolicy {
  return RetryPolicy{
      .mode = parse_retry_mode(retry.mode).value_or(RetryMode::Immediate),
      .delay = std::chrono::seconds(retry.delay_sec)};
}

}  // namespace cronwork
