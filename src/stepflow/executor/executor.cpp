#include "stepflow/executor/executor.hpp"

#include "stepflow/executor/builtin_handlers.hpp"
#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <exception>
#include <format>

namespace stepflow {

Executor::Executor(TaskManager& task_manager, const PlanManager& plan_manager,
                   PlanStore& plan_store, StepExecutor& step_executor,
                   ExecutorOptions options)
    : task_manager_(task_manager),
      plan_manager_(plan_manager),
      plan_store_(plan_store),
      step_executor_(step_executor),
      options_(std::move(options)) {
}

Executor::~Executor() {
  stop();
}

auto Executor::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread([this] { worker_loop(); });
  log::info("Worker {} started", options_.worker_id);
}

auto Executor::stop() -> void {
  {
    std::lock_guard lock(wait_mu_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wait_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  log::info("Worker {} stopped", options_.worker_id);
}

auto Executor::worker_loop() -> void {
  while (running_.load(std::memory_order_acquire)) {
    auto processed = process_one();
    if (!processed) {
      log::error("Worker {} claim failed: {}", options_.worker_id,
                 processed.error().message());
    }
    if (processed && *processed) {
      continue;
    }
    std::unique_lock lock(wait_mu_);
    wait_cv_.wait_for(lock, options_.poll_interval, [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }
}

auto Executor::process_one() -> Result<std::optional<TaskId>> {
  auto claimed = task_manager_.claim(options_.worker_id);
  if (!claimed) {
    return std::unexpected(claimed.error());
  }
  if (!*claimed) {
    return std::optional<TaskId>{};
  }

  const Task& task = **claimed;
  RunOutcome outcome;
  try {
    outcome = run_task(task);
  } catch (const std::exception& e) {
    // Malformed handler output or plan data surfacing from the json layer.
    outcome = RunFailed{std::format("Internal error: {}", e.what()), true};
  }
  finish(task, std::move(outcome));
  return std::optional<TaskId>{task.id};
}

auto Executor::finish(const Task& task, RunOutcome outcome) -> void {
  std::visit(
      [&](auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, RunSucceeded>) {
          if (auto r = task_manager_.succeed(task.id, o.result); !r) {
            log::warn("Task {} finished but could not be marked succeeded: {}",
                      task.id, r.error().message());
          }
        } else if constexpr (std::is_same_v<T, RunSuspended>) {
          log::info("Task {} suspended at step {}", task.id, o.step_id);
        } else if constexpr (std::is_same_v<T, RunFailed>) {
          if (auto r = task_manager_.fail(task.id, o.error, o.retryable); !r) {
            log::warn("Task {} failed but could not be marked: {}", task.id,
                      r.error().message());
          }
        } else {
          log::warn("Task {} abandoned by {}: {}", task.id, options_.worker_id,
                    o.reason);
        }
      },
      outcome);
}

auto Executor::run_task(const Task& task) -> RunOutcome {
  ExecutionContext ctx;
  ctx.task_id = task.id;
  ctx.owner_id = task.owner_id;
  ctx.input_text = task.input_text;
  ctx.input_data = task.input_data;
  ctx.limits = options_.limits;
  ctx.start_time = std::chrono::steady_clock::now();

  if (auto failed = prepare_plan(task, ctx)) {
    return std::move(*failed);
  }
  return agent_loop(ctx);
}

auto Executor::prepare_plan(const Task& task, ExecutionContext& ctx)
    -> std::optional<RunFailed> {
  if (task.current_plan_id) {
    auto plan = plan_store_.load(task.id, *task.current_plan_id);
    if (!plan) {
      return RunFailed{std::format("Plan {} could not be restored: {}",
                                   *task.current_plan_id,
                                   plan.error().message()),
                       false};
    }
    ctx.plan = std::move(*plan);
    if (auto r = ctx.plan.validate(); !r) {
      return RunFailed{std::format("Restored plan {} is invalid: {}",
                                   *task.current_plan_id, r.error().message()),
                       false};
    }
    for (auto& step : ctx.plan.steps()) {
      if (step.status == StepStatus::Completed) {
        ctx.step_results.set(step.step_id, step.result);
      } else if (step.status == StepStatus::Failed) {
        // Retry attempt: give the failed step another run.
        step.status = StepStatus::Pending;
        step.error.reset();
        step.started_at.reset();
        step.completed_at.reset();
      }
    }
    log::info("Task {} resuming plan {} ({} results restored)", task.id,
              ctx.plan.id(), ctx.step_results.size());
    return std::nullopt;
  }

  ctx.plan = plan_manager_.build(task.id, task.kind, task.input_text,
                                 task.input_data);
  if (auto r = ctx.plan.validate(); !r) {
    return RunFailed{std::format("Invalid plan for kind '{}': {}", task.kind,
                                 r.error().message()),
                     false};
  }
  if (auto r = plan_store_.save(ctx.plan); !r) {
    return RunFailed{std::format("Failed to save plan: {}", r.error().message()),
                     true};
  }
  if (auto r = task_manager_.update_step(task.id, ctx.plan.id(), std::nullopt);
      !r) {
    return RunFailed{std::format("Failed to record plan: {}", r.error().message()),
                     true};
  }
  return std::nullopt;
}

auto Executor::agent_loop(ExecutionContext& ctx) -> RunOutcome {
  auto& plan = ctx.plan;

  while (!plan.is_complete()) {
    if (auto r = ctx.check_limits(); !r) {
      log::warn("Task {}: {}", ctx.task_id, r.error().message);
      return RunFailed{r.error().message, false};
    }

    auto alive = task_manager_.heartbeat(ctx.task_id, options_.worker_id);
    if (!alive) {
      return RunFailed{std::format("Heartbeat failed: {}", alive.error().message()),
                       true};
    }
    if (!*alive) {
      return RunAborted{"lease lost"};
    }

    Step* step = plan.get_next_step();
    if (step == nullptr) {
      if (plan.has_failed()) {
        return RunFailed{"Plan has failed steps", true};
      }
      log::warn("Task {}: no runnable step left in plan {}", ctx.task_id, plan.id());
      break;
    }

    if (auto r = task_manager_.update_step(ctx.task_id, plan.id(), step->step_id);
        !r) {
      log::warn("Task {}: cannot record current step: {}", ctx.task_id,
                r.error().message());
    }
    auto step_id = step->step_id;
    auto action = std::string(action_kind_name(step->action));
    emit(ctx.task_id, "step_started", {{"step_id", step_id.str()}, {"action", action}},
         step_id);

    auto outcome = step_executor_.execute(*step, ctx);

    if (std::holds_alternative<StepSucceeded>(outcome)) {
      emit(ctx.task_id, "step_completed",
           {{"step_id", step_id.str()}, {"action", action}}, step_id);
      persist(plan);
      continue;
    }

    if (auto* suspended = std::get_if<StepSuspended>(&outcome)) {
      emit(ctx.task_id, "approval_required",
           {{"step_id", step_id.str()},
            {"action", action},
            {"message", suspended->approval.message}},
           step_id);
      persist(plan);
      return RunSuspended{step_id};
    }

    auto& failed = std::get<StepFailed>(outcome);
    emit(ctx.task_id, "step_failed",
         {{"step_id", step_id.str()}, {"action", action}, {"error", failed.error}},
         step_id);
    persist(plan);
    return RunFailed{std::move(failed.error), !failed.fatal};
  }

  auto primary = nlohmann::json(nullptr);
  if (const auto* last = ctx.step_results.latest()) {
    primary = *last;
  }
  return RunSucceeded{{
      {"success", true},
      {"steps_executed", ctx.steps_executed},
      {"primary_output", std::move(primary)},
      {"step_results", ctx.step_results.to_json()},
  }};
}

auto Executor::handle_approval(TaskId task_id, bool approved,
                               std::optional<std::string> edited_content)
    -> Result<void> {
  auto task = task_manager_.get_task(task_id);
  if (!task) {
    return std::unexpected(task.error());
  }
  if (task->status != TaskStatus::Paused ||
      task->pause_reason != PauseReason::Approval) {
    log::warn("Task {} is {} and not awaiting approval", task_id,
              task_status_name(task->status));
    return fail(Error::InvalidTransition);
  }

  if (!approved) {
    auto r = task_manager_.cancel(task_id, "user_rejected");
    if (!r) {
      return std::unexpected(r.error());
    }
    return ok();
  }

  if (!task->current_plan_id || !task->current_step_id) {
    log::error("Task {} paused for approval without a current step", task_id);
    return fail(Error::NotFound);
  }
  auto plan = plan_store_.load(task_id, *task->current_plan_id);
  if (!plan) {
    return std::unexpected(plan.error());
  }
  auto* step = plan->find_step(*task->current_step_id);
  if (step == nullptr || step->action != ActionKind::Approval ||
      step->status != StepStatus::Pending) {
    log::error("Task {} current step is not a pending approval", task_id);
    return fail(Error::InvalidTransition);
  }

  std::optional<std::string> content = std::move(edited_content);
  bool edited = content.has_value();
  if (!content) {
    if (auto it = step->params.find("draft_step_id");
        it != step->params.end() && it->is_string()) {
      if (const auto* draft = plan->find_step(StepId{it->get<std::string>()})) {
        content = extract_draft(draft->result);
      }
    }
  }

  step->status = StepStatus::Completed;
  step->result = {
      {"approved", true},
      {"content", content ? nlohmann::json(*content) : nlohmann::json(nullptr)},
  };
  step->completed_at = std::chrono::system_clock::now();

  if (auto r = plan_store_.save(*plan); !r) {
    return r;
  }
  emit(task_id, "approved", {{"step_id", step->step_id.str()}, {"edited", edited}},
       step->step_id);
  return task_manager_.resume(task_id);
}

auto Executor::persist(const Plan& plan) -> void {
  if (auto r = plan_store_.save(plan); !r) {
    log::error("Failed to persist plan {}: {}", plan.id(), r.error().message());
  }
}

auto Executor::emit(TaskId task_id, std::string_view event,
                    const nlohmann::json& data, const StepId& step_id) -> void {
  if (auto r = task_manager_.record_event(task_id, event, data, step_id); !r) {
    log::warn("Task {}: failed to record {} event", task_id, event);
  }
}

}  // namespace stepflow
