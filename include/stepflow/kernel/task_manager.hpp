#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/kernel/task.hpp"
#include "stepflow/storage/database.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stepflow {

struct TaskManagerOptions {
  std::chrono::milliseconds lease_timeout{std::chrono::seconds(300)};
  int max_attempts{3};
  int max_queued_per_owner{10};
  int max_active_per_owner{3};
  int max_tasks_per_hour{100};
};

// Owns the task lifecycle: every status change goes through here, happens in
// a single transaction with its audit event, and is safe against other
// workers holding their own connection to the same database.
class TaskManager {
public:
  TaskManager(Database& db, TaskManagerOptions options = {});

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  [[nodiscard]] auto options() const noexcept -> const TaskManagerOptions& {
    return options_;
  }

  // Creates a queued task. Rejected with a descriptive message when the
  // owner is over a quota (checked in order: queued, active, hourly).
  [[nodiscard]] auto enqueue(OwnerId owner, std::string_view kind,
                             EnqueueOptions options = {})
      -> DetailedResult<TaskId>;

  // Takes the oldest queued task, or a running task whose lease expired.
  // Returns nullopt when nothing is claimable.
  [[nodiscard]] auto claim(const WorkerId& worker)
      -> Result<std::optional<Task>>;

  // Extends the lease. False when the worker no longer holds a running task.
  [[nodiscard]] auto heartbeat(TaskId task_id, const WorkerId& worker)
      -> Result<bool>;

  [[nodiscard]] auto pause(TaskId task_id, PauseReason reason,
                           const nlohmann::json& data = nlohmann::json::object())
      -> Result<void>;
  [[nodiscard]] auto resume(TaskId task_id) -> Result<void>;
  [[nodiscard]] auto succeed(TaskId task_id, const nlohmann::json& result)
      -> Result<void>;

  // Requeues while attempts remain; otherwise, or when retryable is false,
  // the task fails permanently.
  [[nodiscard]] auto fail(TaskId task_id, std::string_view error,
                          bool retryable = true) -> Result<void>;

  // No-op (returns false) for a task already in a terminal state.
  [[nodiscard]] auto cancel(TaskId task_id,
                            std::string_view reason = "user_cancelled")
      -> Result<bool>;

  [[nodiscard]] auto update_step(TaskId task_id,
                                 const std::optional<PlanId>& plan_id,
                                 const std::optional<StepId>& step_id)
      -> Result<void>;

  [[nodiscard]] auto record_event(TaskId task_id, std::string_view event_type,
                                  const nlohmann::json& data,
                                  const std::optional<StepId>& step_id = std::nullopt,
                                  const std::optional<std::string>& tool_name = std::nullopt)
      -> Result<void>;

  [[nodiscard]] auto get_task(TaskId task_id) -> Result<Task>;
  [[nodiscard]] auto get_owner_tasks(OwnerId owner,
                                     std::optional<TaskStatus> status = std::nullopt,
                                     int limit = 50)
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto get_queue_size() -> Result<int>;
  [[nodiscard]] auto get_task_events(TaskId task_id, int limit = 100)
      -> Result<std::vector<TaskEvent>>;
  [[nodiscard]] auto get_owner_limits(OwnerId owner) -> Result<OwnerLimits>;

  // Retention sweep for the audit log. Returns the number of events removed.
  [[nodiscard]] auto purge_events_before(std::chrono::system_clock::time_point cutoff)
      -> Result<int>;

private:
  [[nodiscard]] auto load_task(TaskId task_id) -> Result<Task>;
  [[nodiscard]] auto owner_limits(OwnerId owner, std::int64_t now_ms)
      -> Result<OwnerLimits>;
  [[nodiscard]] auto insert_event(TaskId task_id, std::string_view event_type,
                                  const nlohmann::json& data,
                                  const std::optional<StepId>& step_id,
                                  const std::optional<std::string>& tool_name,
                                  std::int64_t now_ms) -> Result<void>;
  [[nodiscard]] auto count(const char* sql, OwnerId owner,
                           std::optional<std::int64_t> since) -> Result<int>;

  Database& db_;
  TaskManagerOptions options_;
};

}  // namespace stepflow
