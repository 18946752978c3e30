#include "stepflow/config/config.hpp"

#include "stepflow/config/yaml_utils.hpp"
#include "stepflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<stepflow::StorageConfig> {
  static bool decode(const Node& node, stepflow::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = stepflow::yaml_get_or<std::string>(node, "db_file", "stepflow.db");
    s.snapshot_dir =
        stepflow::yaml_get_or<std::string>(node, "snapshot_dir", "./snapshots");
    s.busy_timeout_ms = stepflow::yaml_get_or(node, "busy_timeout_ms", 5000);
    return true;
  }
};

template <>
struct convert<stepflow::LoggingConfig> {
  static bool decode(const Node& node, stepflow::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = stepflow::yaml_get_or<std::string>(node, "level", "info");
    l.file = stepflow::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<stepflow::WorkerConfig> {
  static bool decode(const Node& node, stepflow::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.count = stepflow::yaml_get_or(node, "count", 1);
    w.poll_interval_ms = stepflow::yaml_get_or(node, "poll_interval_ms", 1000);
    w.id_prefix = stepflow::yaml_get_or<std::string>(node, "id_prefix", "worker");
    w.dry_run = stepflow::yaml_get_or(node, "dry_run", false);
    return true;
  }
};

template <>
struct convert<stepflow::LimitsConfig> {
  static bool decode(const Node& node, stepflow::LimitsConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.max_steps = stepflow::yaml_get_or(node, "max_steps", 20);
    l.max_wall_time_sec = stepflow::yaml_get_or(node, "max_wall_time_sec", 300);
    l.handler_timeout_sec = stepflow::yaml_get_or(node, "handler_timeout_sec", 120);
    l.lease_timeout_sec = stepflow::yaml_get_or(node, "lease_timeout_sec", 300);
    l.max_attempts = stepflow::yaml_get_or(node, "max_attempts", 3);
    l.max_queued_per_owner = stepflow::yaml_get_or(node, "max_queued_per_owner", 10);
    l.max_active_per_owner = stepflow::yaml_get_or(node, "max_active_per_owner", 3);
    l.max_tasks_per_hour = stepflow::yaml_get_or(node, "max_tasks_per_hour", 100);
    return true;
  }
};

template <>
struct convert<stepflow::RetentionConfig> {
  static bool decode(const Node& node, stepflow::RetentionConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.event_retention_days = stepflow::yaml_get_or(node, "event_retention_days", 30);
    return true;
  }
};

template <>
struct convert<stepflow::SystemConfig> {
  static bool decode(const Node& node, stepflow::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<stepflow::StorageConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<stepflow::LoggingConfig>();
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<stepflow::WorkerConfig>();
    }
    if (auto limits = node["limits"]) {
      c.limits = limits.as<stepflow::LimitsConfig>();
    }
    if (auto retention = node["retention"]) {
      c.retention = retention.as<stepflow::RetentionConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace stepflow {

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
  const auto& l = config.limits;
  auto positive = [](std::string_view name, int value) {
    if (value <= 0) {
      log::error("Config value {} must be positive, got {}", name, value);
      return false;
    }
    return true;
  };

  if (config.storage.db_file.empty()) {
    log::error("Config value storage.db_file must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (!positive("limits.max_steps", l.max_steps) ||
      !positive("limits.max_wall_time_sec", l.max_wall_time_sec) ||
      !positive("limits.lease_timeout_sec", l.lease_timeout_sec) ||
      !positive("limits.max_attempts", l.max_attempts) ||
      !positive("limits.max_queued_per_owner", l.max_queued_per_owner) ||
      !positive("limits.max_active_per_owner", l.max_active_per_owner) ||
      !positive("limits.max_tasks_per_hour", l.max_tasks_per_hour) ||
      !positive("worker.count", config.worker.count) ||
      !positive("worker.poll_interval_ms", config.worker.poll_interval_ms) ||
      !positive("retention.event_retention_days",
                config.retention.event_retention_days)) {
    return fail(Error::InvalidArgument);
  }
  if (l.handler_timeout_sec < 0 || config.storage.busy_timeout_ms < 0) {
    log::error("Timeouts must not be negative");
    return fail(Error::InvalidArgument);
  }
  // A handler still running when its lease lapses could be reclaimed by
  // another worker.
  if (l.handler_timeout_sec > 0 && l.handler_timeout_sec >= l.lease_timeout_sec) {
    log::error("limits.handler_timeout_sec ({}) must be below limits.lease_timeout_sec ({})",
               l.handler_timeout_sec, l.lease_timeout_sec);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace stepflow
