#pragma once

#include "stepflow/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stepflow {

enum class TaskStatus : std::uint8_t {
  Queued,
  Running,
  Paused,
  Succeeded,
  Failed,
  Cancelled,
};

enum class PauseReason : std::uint8_t {
  Approval,
  Dependency,
  RateLimit,
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Succeeded || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

// Statuses that count against the per-owner active quota. Paused tasks wait
// on a human and are not counted.
[[nodiscard]] constexpr auto is_active(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Queued || status == TaskStatus::Running;
}

struct Task {
  using time_point = std::chrono::system_clock::time_point;

  TaskId id{0};
  OwnerId owner_id{0};
  std::string kind;
  std::string input_text;
  nlohmann::json input_data = nlohmann::json::object();

  TaskStatus status{TaskStatus::Queued};
  std::optional<PauseReason> pause_reason;

  int attempts{0};
  int max_attempts{3};

  std::optional<WorkerId> locked_by;
  std::optional<time_point> locked_at;
  std::optional<time_point> lease_expires_at;

  std::optional<PlanId> current_plan_id;
  std::optional<StepId> current_step_id;

  nlohmann::json result;  // null until succeeded
  std::optional<std::string> error;

  time_point created_at{};
  time_point updated_at{};
  std::optional<time_point> started_at;
  std::optional<time_point> completed_at;
};

// Append-only audit record.
struct TaskEvent {
  std::int64_t id{0};
  TaskId task_id{0};
  std::string event_type;
  nlohmann::json data = nlohmann::json::object();
  std::optional<StepId> step_id;
  std::optional<std::string> tool_name;
  std::chrono::system_clock::time_point created_at{};
};

struct EnqueueOptions {
  std::string input_text;
  nlohmann::json input_data = nlohmann::json::object();
  std::optional<int> max_attempts;
  // System tasks bypass per-owner quotas.
  bool skip_limits{false};
};

struct QuotaUsage {
  int used{0};
  int limit{0};

  [[nodiscard]] auto exhausted() const noexcept -> bool { return used >= limit; }
};

struct OwnerLimits {
  QuotaUsage queued;
  QuotaUsage active;
  QuotaUsage per_hour;
};

}  // namespace stepflow
