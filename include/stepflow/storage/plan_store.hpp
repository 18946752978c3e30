#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/plan/plan.hpp"
#include "stepflow/storage/database.hpp"
#include "stepflow/storage/snapshot_store.hpp"

namespace stepflow {

// Durable plan state in two places: a JSON snapshot file and one row per
// step. Restore prefers the snapshot and falls back to the rows.
class PlanStore {
public:
  PlanStore(Database& db, SnapshotStore& snapshots);

  [[nodiscard]] auto save(const Plan& plan) -> Result<void>;

  // Steps found running (interrupted mid-step) come back as pending.
  [[nodiscard]] auto load(TaskId task_id, const PlanId& plan_id) -> Result<Plan>;

private:
  [[nodiscard]] auto save_rows(const Plan& plan) -> Result<void>;
  [[nodiscard]] auto load_rows(TaskId task_id, const PlanId& plan_id)
      -> Result<Plan>;

  Database& db_;
  SnapshotStore& snapshots_;
};

}  // namespace stepflow
