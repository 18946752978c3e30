#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace stepflow {

struct StorageConfig {
  std::string db_file{"stepflow.db"};
  std::string snapshot_dir{"./snapshots"};
  int busy_timeout_ms{5000};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct WorkerConfig {
  int count{1};
  int poll_interval_ms{1000};
  std::string id_prefix{"worker"};
  // Registers no-op handlers for llm_call and tool_call.
  bool dry_run{false};
};

struct LimitsConfig {
  int max_steps{20};
  int max_wall_time_sec{300};
  int handler_timeout_sec{120};
  int lease_timeout_sec{300};
  int max_attempts{3};
  int max_queued_per_owner{10};
  int max_active_per_owner{3};
  int max_tasks_per_hour{100};
};

struct RetentionConfig {
  int event_retention_days{30};
};

struct SystemConfig {
  StorageConfig storage;
  LoggingConfig logging;
  WorkerConfig worker;
  LimitsConfig limits;
  RetentionConfig retention;
};

}  // namespace stepflow
