#include "stepflow/executor/step_executor.hpp"

#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <typeinfo>

namespace stepflow {

namespace {

auto call_handler(IActionHandler& handler, const ActionRequest& request)
    -> HandlerResult {
  try {
    return handler.execute(request);
  } catch (const std::exception& e) {
    return StepError{std::format("{}: {}", typeid(e).name(), e.what())};
  }
}

}  // namespace

StepExecutor::StepExecutor(const HandlerRegistry& registry,
                           TaskManager& task_manager,
                           std::chrono::milliseconds handler_timeout)
    : registry_(registry),
      task_manager_(task_manager),
      handler_timeout_(handler_timeout) {
}

auto StepExecutor::invoke(std::shared_ptr<IActionHandler> handler,
                          ActionRequest request) const -> HandlerResult {
  if (handler_timeout_.count() <= 0) {
    return call_handler(*handler, request);
  }

  // The call runs on its own thread so an overrunning handler cannot hold the
  // worker. On timeout the token is cancelled and the thread is left to
  // finish on its own; it only touches the shared state below.
  struct CallState {
    std::mutex mu;
    std::condition_variable cv;
    std::optional<HandlerResult> result;
  };
  auto state = std::make_shared<CallState>();
  CancellationSource source;
  request.cancel = source.token();

  std::thread([state, handler = std::move(handler),
               request = std::move(request)] {
    auto result = call_handler(*handler, request);
    {
      std::lock_guard lock(state->mu);
      state->result = std::move(result);
    }
    state->cv.notify_one();
  }).detach();

  std::unique_lock lock(state->mu);
  if (!state->cv.wait_for(lock, handler_timeout_,
                          [&] { return state->result.has_value(); })) {
    source.cancel();
    return StepError{std::format("Handler timed out after {}ms",
                                 handler_timeout_.count())};
  }
  return std::move(*state->result);
}

auto StepExecutor::execute(Step& step, ExecutionContext& ctx) -> StepOutcome {
  auto handler = registry_.find(step.action);
  if (!handler) {
    auto error = std::format("No handler registered for action {}",
                             action_kind_name(step.action));
    step.status = StepStatus::Failed;
    step.error = error;
    log::error("Task {} step {}: {}", ctx.task_id, step.step_id, error);
    return StepFailed{std::move(error), true};
  }

  step.status = StepStatus::Running;
  step.started_at = std::chrono::system_clock::now();
  step.error.reset();
  log::debug("Task {} step {} ({}) started", ctx.task_id, step.step_id,
             action_kind_name(step.action));

  ActionRequest request{
      .task_id = ctx.task_id,
      .owner_id = ctx.owner_id,
      .step_id = step.step_id,
      .action = step.action,
      .params = step.params,
      .input_text = ctx.input_text,
      .input_data = ctx.input_data,
      .step_results = ctx.step_results,
      .cancel = {},
  };
  auto result = invoke(std::move(handler), std::move(request));

  if (auto* done = std::get_if<StepCompleted>(&result)) {
    step.status = StepStatus::Completed;
    step.result = done->result;
    step.completed_at = std::chrono::system_clock::now();
    ctx.step_results.set(step.step_id, std::move(done->result));
    ++ctx.steps_executed;

    for (const auto& id : done->skip) {
      auto* target = ctx.plan.find_step(id);
      if (target == nullptr) {
        log::warn("Task {} step {}: cannot skip unknown step {}", ctx.task_id,
                  step.step_id, id);
        continue;
      }
      if (target->status == StepStatus::Pending) {
        target->status = StepStatus::Skipped;
        log::debug("Task {} step {} skipped", ctx.task_id, id);
      }
    }
    return StepSucceeded{step.result};
  }

  if (auto* approval = std::get_if<ApprovalRequired>(&result)) {
    step.status = StepStatus::Pending;
    step.started_at.reset();

    nlohmann::json data = {
        {"step_id", approval->step_id.str()},
        {"message", approval->message},
        {"draft_content",
         approval->draft ? nlohmann::json(*approval->draft) : nlohmann::json(nullptr)},
    };
    if (auto r = task_manager_.pause(ctx.task_id, PauseReason::Approval, data); !r) {
      auto error = std::format("Failed to pause for approval: {}",
                               r.error().message());
      log::error("Task {} step {}: {}", ctx.task_id, step.step_id, error);
      return StepFailed{std::move(error), false};
    }
    log::info("Task {} waiting for approval at step {}", ctx.task_id,
              step.step_id);
    return StepSuspended{std::move(*approval)};
  }

  auto& err = std::get<StepError>(result);
  step.status = StepStatus::Failed;
  step.error = err.message;
  step.completed_at = std::chrono::system_clock::now();
  log::warn("Task {} step {} failed: {}", ctx.task_id, step.step_id, err.message);
  return StepFailed{std::move(err.message), false};
}

}  // namespace stepflow
