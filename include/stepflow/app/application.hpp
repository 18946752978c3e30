#pragma once

#include "stepflow/config/system_config.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/executor/action_handler.hpp"
#include "stepflow/executor/executor.hpp"
#include "stepflow/kernel/task_manager.hpp"
#include "stepflow/plan/plan_manager.hpp"
#include "stepflow/storage/snapshot_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stepflow {

[[nodiscard]] auto task_manager_options(const SystemConfig& config)
    -> TaskManagerOptions;
[[nodiscard]] auto execution_limits(const SystemConfig& config) -> ExecutionLimits;

// Application facade: wires storage, planning and handlers from the config
// and owns the worker pool. Each worker has its own database connection.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }

  // Handlers and strategies may be added between init() and start().
  [[nodiscard]] auto registry() noexcept -> HandlerRegistry& { return registry_; }
  [[nodiscard]] auto plan_manager() noexcept -> PlanManager& { return plan_manager_; }

  // Opens the control connection and applies event retention.
  [[nodiscard]] auto init() -> Result<void>;
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool { return !workers_.empty(); }

  // Control-plane access, usable without starting workers.
  [[nodiscard]] auto tasks() -> TaskManager&;
  [[nodiscard]] auto handle_approval(TaskId task_id, bool approved,
                                     std::optional<std::string> edited_content = std::nullopt)
      -> Result<void>;

private:
  struct Worker;

  [[nodiscard]] auto make_worker(WorkerId id) -> Result<std::unique_ptr<Worker>>;

  SystemConfig config_;
  HandlerRegistry registry_;
  PlanManager plan_manager_;
  SnapshotStore snapshots_;
  std::unique_ptr<Worker> control_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

}  // namespace stepflow
