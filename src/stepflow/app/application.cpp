#include "stepflow/app/application.hpp"

#include "stepflow/executor/builtin_handlers.hpp"
#include "stepflow/storage/database.hpp"
#include "stepflow/storage/plan_store.hpp"
#include "stepflow/util/log.hpp"

#include <chrono>

namespace stepflow {

auto task_manager_options(const SystemConfig& config) -> TaskManagerOptions {
  const auto& l = config.limits;
  return TaskManagerOptions{
      .lease_timeout = std::chrono::seconds(l.lease_timeout_sec),
      .max_attempts = l.max_attempts,
      .max_queued_per_owner = l.max_queued_per_owner,
      .max_active_per_owner = l.max_active_per_owner,
      .max_tasks_per_hour = l.max_tasks_per_hour,
  };
}

auto execution_limits(const SystemConfig& config) -> ExecutionLimits {
  return ExecutionLimits{
      .max_steps = config.limits.max_steps,
      .max_wall_time = std::chrono::seconds(config.limits.max_wall_time_sec),
  };
}

struct Application::Worker {
  Worker(const SystemConfig& config, SnapshotStore& snapshots,
         const HandlerRegistry& registry, const PlanManager& planner,
         WorkerId id)
      : db(config.storage.db_file, config.storage.busy_timeout_ms),
        tasks(db, task_manager_options(config)),
        plans(db, snapshots),
        steps(registry, tasks,
              std::chrono::seconds(config.limits.handler_timeout_sec)),
        executor(tasks, planner, plans, steps,
                 ExecutorOptions{
                     .worker_id = std::move(id),
                     .poll_interval =
                         std::chrono::milliseconds(config.worker.poll_interval_ms),
                     .limits = execution_limits(config),
                 }) {
  }

  Database db;
  TaskManager tasks;
  PlanStore plans;
  StepExecutor steps;
  Executor executor;
};

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      registry_(make_builtin_registry(config_.worker.dry_run)),
      snapshots_(config_.storage.snapshot_dir) {
}

Application::~Application() {
  stop();
}

auto Application::make_worker(WorkerId id) -> Result<std::unique_ptr<Worker>> {
  auto worker = std::make_unique<Worker>(config_, snapshots_, registry_,
                                         plan_manager_, std::move(id));
  if (auto r = worker->db.open(); !r) {
    return std::unexpected(r.error());
  }
  return worker;
}

auto Application::init() -> Result<void> {
  if (control_) {
    return ok();
  }
  auto control = make_worker(WorkerId{"control"});
  if (!control) {
    log::error("Cannot open database {}: {}", config_.storage.db_file,
               control.error().message());
    return std::unexpected(control.error());
  }
  control_ = std::move(*control);

  auto cutoff = std::chrono::system_clock::now() -
                std::chrono::days(config_.retention.event_retention_days);
  if (auto r = control_->tasks.purge_events_before(cutoff); !r) {
    log::warn("Event retention sweep failed: {}", r.error().message());
  }
  return ok();
}

auto Application::start() -> Result<void> {
  if (auto r = init(); !r) {
    return r;
  }
  if (!workers_.empty()) {
    return ok();
  }

  for (int i = 0; i < config_.worker.count; ++i) {
    auto worker = make_worker(generate_worker_id(config_.worker.id_prefix, i));
    if (!worker) {
      stop();
      return std::unexpected(worker.error());
    }
    workers_.push_back(std::move(*worker));
  }
  for (auto& worker : workers_) {
    worker->executor.start();
  }
  log::info("Started {} worker(s) on {}", workers_.size(),
            config_.storage.db_file);
  return ok();
}

auto Application::stop() -> void {
  for (auto& worker : workers_) {
    worker->executor.stop();
  }
  workers_.clear();
}

auto Application::tasks() -> TaskManager& {
  return control_->tasks;
}

auto Application::handle_approval(TaskId task_id, bool approved,
                                  std::optional<std::string> edited_content)
    -> Result<void> {
  if (!control_) {
    return fail(Error::InvalidArgument);
  }
  return control_->executor.handle_approval(task_id, approved,
                                            std::move(edited_content));
}

}  // namespace stepflow
