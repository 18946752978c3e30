#pragma once

#include "stepflow/config/system_config.hpp"
#include "stepflow/core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace stepflow::cli {

// Every command reads the config (defaults when no file is given); --db
// overrides storage.db_file.
struct CommonOptions {
  std::string config_file;
  std::string db_file;
};

struct ServeOptions {
  CommonOptions common;
  std::optional<int> workers;
  bool daemon{false};
};

struct SubmitOptions {
  CommonOptions common;
  std::int64_t owner{0};
  std::string kind{"general"};
  std::string input_text;
  std::string input_json;
  std::optional<int> max_attempts;
  bool skip_limits{false};
};

struct StatusOptions {
  CommonOptions common;
  std::optional<std::int64_t> task_id;
  std::optional<std::int64_t> owner;
};

struct EventsOptions {
  CommonOptions common;
  std::int64_t task_id{0};
  int limit{100};
};

struct ApprovalOptions {
  CommonOptions common;
  std::int64_t task_id{0};
  std::optional<std::string> content;
};

struct TaskOptions {
  CommonOptions common;
  std::int64_t task_id{0};
  std::string reason;
};

struct ValidateOptions {
  std::string config_file;
};

[[nodiscard]] auto load_config(const CommonOptions& opts) -> Result<SystemConfig>;

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_enqueue(const SubmitOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_events(const EventsOptions& opts) -> int;
[[nodiscard]] auto cmd_approve(const ApprovalOptions& opts) -> int;
[[nodiscard]] auto cmd_reject(const TaskOptions& opts) -> int;
[[nodiscard]] auto cmd_resume(const TaskOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(const TaskOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

}  // namespace stepflow::cli
