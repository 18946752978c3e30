#include "stepflow/storage/plan_store.hpp"

#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <sqlite3.h>

#include <ranges>

namespace stepflow {

namespace {

auto reset_interrupted(Plan& plan) -> void {
  for (auto& step : plan.steps()) {
    if (step.status == StepStatus::Running) {
      log::warn("Plan {} step {} was running during crash, marking pending",
                plan.id(), step.step_id);
      step.status = StepStatus::Pending;
      step.started_at.reset();
    }
  }
}

}  // namespace

PlanStore::PlanStore(Database& db, SnapshotStore& snapshots)
    : db_(db), snapshots_(snapshots) {
}

auto PlanStore::save(const Plan& plan) -> Result<void> {
  if (auto r = snapshots_.save(plan.id(), plan.to_json()); !r) {
    // A stale snapshot would shadow the rows on restore.
    snapshots_.remove(plan.id());
    log::warn("Snapshot of plan {} not written, relying on step rows",
              plan.id());
  }
  return save_rows(plan);
}

auto PlanStore::save_rows(const Plan& plan) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_steps
      (task_id, plan_id, step_id, step_index, action, action_data, depends_on,
       status, result, error, snapshot_ref, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(task_id, plan_id, step_id) DO UPDATE SET
      step_index = excluded.step_index,
      action = excluded.action,
      action_data = excluded.action_data,
      depends_on = excluded.depends_on,
      status = excluded.status,
      result = excluded.result,
      error = excluded.error,
      snapshot_ref = excluded.snapshot_ref,
      updated_at = excluded.updated_at;
  )";

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return fail(Error::DatabaseError);
  }

  auto now = to_timestamp(std::chrono::system_clock::now());
  for (auto [index, step] : std::views::enumerate(plan.steps())) {
    auto stmt = db_.prepare(sql);
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    nlohmann::json deps = nlohmann::json::array();
    for (const auto& dep : step.depends_on) {
      deps.push_back(dep.str());
    }

    sqlite3_bind_int64(stmt->get(), 1, plan.task_id());
    bind_text(stmt->get(), 2, plan.id().value());
    bind_text(stmt->get(), 3, step.step_id.value());
    sqlite3_bind_int64(stmt->get(), 4, static_cast<sqlite3_int64>(index));
    bind_text(stmt->get(), 5, action_kind_name(step.action));
    bind_text(stmt->get(), 6, step.params.dump());
    bind_text(stmt->get(), 7, deps.dump());
    bind_text(stmt->get(), 8, step_status_name(step.status));
    if (step.result.is_null()) {
      sqlite3_bind_null(stmt->get(), 9);
    } else {
      bind_text(stmt->get(), 9, step.result.dump());
    }
    if (step.error) {
      bind_text(stmt->get(), 10, *step.error);
    } else {
      sqlite3_bind_null(stmt->get(), 10);
    }
    if (step.snapshot_ref) {
      bind_text(stmt->get(), 11, *step.snapshot_ref);
    } else {
      sqlite3_bind_null(stmt->get(), 11);
    }
    sqlite3_bind_int64(stmt->get(), 12, now);

    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
      log::error("Failed to save step {} of plan {}: {}", step.step_id,
                 plan.id(), db_.last_error());
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return tx.commit();
}

auto PlanStore::load(TaskId task_id, const PlanId& plan_id) -> Result<Plan> {
  auto snapshot = snapshots_.load(plan_id);
  if (snapshot && *snapshot) {
    auto plan = Plan::from_json(**snapshot);
    if (plan && plan->task_id() == task_id) {
      reset_interrupted(*plan);
      log::debug("Plan {} restored from snapshot", plan_id);
      return plan;
    }
    log::warn("Snapshot of plan {} unusable, falling back to step rows",
              plan_id);
  }

  auto plan = load_rows(task_id, plan_id);
  if (!plan) {
    return plan;
  }
  reset_interrupted(*plan);
  log::debug("Plan {} restored from step rows", plan_id);
  return plan;
}

auto PlanStore::load_rows(TaskId task_id, const PlanId& plan_id)
    -> Result<Plan> {
  constexpr auto sql = R"(
    SELECT step_id, action, action_data, depends_on, status, result, error,
           snapshot_ref
    FROM task_steps WHERE task_id = ? AND plan_id = ?
    ORDER BY step_index ASC;
  )";

  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, task_id);
  bind_text(stmt->get(), 2, plan_id.value());

  std::vector<Step> steps;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    nlohmann::json row = {
        {"step_id", col_text(stmt->get(), 0)},
        {"action", col_text(stmt->get(), 1)},
        {"action_data", col_json(stmt->get(), 2)},
        {"depends_on", col_json(stmt->get(), 3)},
        {"status", col_text(stmt->get(), 4)},
        {"result", col_json(stmt->get(), 5)},
        {"error", col_json_text(stmt->get(), 6)},
        {"snapshot_ref", col_json_text(stmt->get(), 7)},
    };
    auto step = step_from_json(row);
    if (!step) {
      log::error("Corrupt step row in plan {}", plan_id);
      return std::unexpected(step.error());
    }
    steps.push_back(std::move(*step));
  }

  if (steps.empty()) {
    log::warn("Plan {} not found for task {}", plan_id, task_id);
    return fail(Error::NotFound);
  }
  return Plan{plan_id, task_id, std::move(steps)};
}

}  // namespace stepflow
