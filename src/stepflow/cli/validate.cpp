#include "stepflow/cli/commands.hpp"
#include "stepflow/config/config.hpp"
#include "stepflow/plan/plan_manager.hpp"

#include <print>

namespace stepflow::cli {

auto load_config(const CommonOptions& opts) -> Result<SystemConfig> {
  SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  return config;
}

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  const auto& config = *result;

  std::println("✓ {} - Valid", opts.config_file);
  std::println("  storage:  {} (snapshots in {})", config.storage.db_file,
               config.storage.snapshot_dir);
  std::println("  workers:  {} x {} (poll {}ms{})", config.worker.count,
               config.worker.id_prefix, config.worker.poll_interval_ms,
               config.worker.dry_run ? ", dry run" : "");
  std::println("  limits:   {} steps, {}s wall, {}s handler, {}s lease",
               config.limits.max_steps, config.limits.max_wall_time_sec,
               config.limits.handler_timeout_sec, config.limits.lease_timeout_sec);
  std::println("  quotas:   {} queued, {} active, {}/hour per owner",
               config.limits.max_queued_per_owner,
               config.limits.max_active_per_owner,
               config.limits.max_tasks_per_hour);

  PlanManager planner;
  std::print("  kinds:   ");
  for (const auto& kind : planner.kinds()) {
    std::print(" {}", kind);
  }
  std::println("");
  return 0;
}

}  // namespace stepflow::cli
