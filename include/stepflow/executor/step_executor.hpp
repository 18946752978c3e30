#pragma once

#include "stepflow/executor/action_handler.hpp"
#include "stepflow/executor/execution_context.hpp"
#include "stepflow/kernel/task_manager.hpp"

#include <chrono>
#include <string>
#include <variant>

namespace stepflow {

struct StepSucceeded {
  nlohmann::json result;
};

struct StepSuspended {
  ApprovalRequired approval;
};

struct StepFailed {
  std::string error;
  // Fatal failures finalize the task without retry.
  bool fatal{false};
};

using StepOutcome = std::variant<StepSucceeded, StepSuspended, StepFailed>;

// Runs one step through its registered handler and records the result on the
// step and in the execution context. On suspension the step goes back to
// pending and the task is paused for approval.
class StepExecutor {
public:
  // A zero handler_timeout runs handlers inline with no deadline.
  StepExecutor(const HandlerRegistry& registry, TaskManager& task_manager,
               std::chrono::milliseconds handler_timeout = std::chrono::seconds(120));

  [[nodiscard]] auto execute(Step& step, ExecutionContext& ctx) -> StepOutcome;

private:
  [[nodiscard]] auto invoke(std::shared_ptr<IActionHandler> handler,
                            ActionRequest request) const -> HandlerResult;

  const HandlerRegistry& registry_;
  TaskManager& task_manager_;
  std::chrono::milliseconds handler_timeout_;
};

}  // namespace stepflow
