#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/executor/execution_context.hpp"
#include "stepflow/executor/step_executor.hpp"
#include "stepflow/kernel/task_manager.hpp"
#include "stepflow/plan/plan_manager.hpp"
#include "stepflow/storage/plan_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace stepflow {

struct ExecutorOptions {
  WorkerId worker_id{"worker"};
  std::chrono::milliseconds poll_interval{1000};
  ExecutionLimits limits;
};

struct RunSucceeded {
  nlohmann::json result;
};

struct RunSuspended {
  StepId step_id;
};

struct RunFailed {
  std::string error;
  bool retryable{true};
};

// The worker no longer holds the task (lease lost or cancelled).
struct RunAborted {
  std::string reason;
};

using RunOutcome = std::variant<RunSucceeded, RunSuspended, RunFailed, RunAborted>;

// One worker: claims tasks, plans or restores them, and drives the agent loop
// until the plan completes, suspends for approval, fails or hits a limit.
class Executor {
public:
  Executor(TaskManager& task_manager, const PlanManager& plan_manager,
           PlanStore& plan_store, StepExecutor& step_executor,
           ExecutorOptions options);
  ~Executor();

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto worker_id() const noexcept -> const WorkerId& {
    return options_.worker_id;
  }

  // Claims and runs a single task synchronously. Returns the id of the task
  // processed, or nullopt when the queue was empty.
  [[nodiscard]] auto process_one() -> Result<std::optional<TaskId>>;

  // Runs a task this worker has already claimed. Does not touch the task's
  // final status; process_one applies the outcome.
  [[nodiscard]] auto run_task(const Task& task) -> RunOutcome;

  // Decision on a task paused for approval. Approving completes the pending
  // approval step with the (possibly edited) draft and requeues the task;
  // rejecting cancels it.
  [[nodiscard]] auto handle_approval(TaskId task_id, bool approved,
                                     std::optional<std::string> edited_content = std::nullopt)
      -> Result<void>;

private:
  auto worker_loop() -> void;
  auto finish(const Task& task, RunOutcome outcome) -> void;
  [[nodiscard]] auto prepare_plan(const Task& task, ExecutionContext& ctx)
      -> std::optional<RunFailed>;
  [[nodiscard]] auto agent_loop(ExecutionContext& ctx) -> RunOutcome;
  auto persist(const Plan& plan) -> void;
  auto emit(TaskId task_id, std::string_view event, const nlohmann::json& data,
            const StepId& step_id) -> void;

  TaskManager& task_manager_;
  const PlanManager& plan_manager_;
  PlanStore& plan_store_;
  StepExecutor& step_executor_;
  ExecutorOptions options_;

  std::atomic<bool> running_{false};
  std::mutex wait_mu_;
  std::condition_variable wait_cv_;
  std::thread worker_;
};

}  // namespace stepflow
