#include "stepflow/kernel/task_manager.hpp"

#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <sqlite3.h>

#include <format>
#include <utility>

namespace stepflow {

namespace {

constexpr auto kTaskColumns =
    "id, owner_id, kind, input_text, input_data, status, pause_reason, "
    "attempts, max_attempts, locked_by, locked_at, lease_expires_at, "
    "current_plan_id, current_step_id, result, error, created_at, updated_at, "
    "started_at, completed_at";

constexpr std::size_t kResultPreviewChars = 200;

auto now_ms() -> std::int64_t {
  return to_timestamp(std::chrono::system_clock::now());
}

template <typename Tag>
auto bind_optional_id(sqlite3_stmt* stmt, int idx,
                      const std::optional<TypedId<Tag>>& id) -> void {
  if (id) {
    bind_text(stmt, idx, id->value());
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto read_task(sqlite3_stmt* stmt) -> Task {
  Task t;
  t.id = sqlite3_column_int64(stmt, 0);
  t.owner_id = sqlite3_column_int64(stmt, 1);
  t.kind = col_text(stmt, 2);
  t.input_text = col_text(stmt, 3);
  t.input_data = col_json(stmt, 4);
  if (!t.input_data.is_object()) {
    t.input_data = nlohmann::json::object();
  }
  t.status = parse_task_status(col_text(stmt, 5)).value_or(TaskStatus::Queued);
  if (auto reason = col_optional_text(stmt, 6)) {
    t.pause_reason = parse_pause_reason(*reason);
  }
  t.attempts = sqlite3_column_int(stmt, 7);
  t.max_attempts = sqlite3_column_int(stmt, 8);
  if (auto worker = col_optional_text(stmt, 9)) {
    t.locked_by = WorkerId{std::move(*worker)};
  }
  t.locked_at = col_optional_time(stmt, 10);
  t.lease_expires_at = col_optional_time(stmt, 11);
  if (auto plan = col_optional_text(stmt, 12)) {
    t.current_plan_id = PlanId{std::move(*plan)};
  }
  if (auto step = col_optional_text(stmt, 13)) {
    t.current_step_id = StepId{std::move(*step)};
  }
  t.result = col_json(stmt, 14);
  t.error = col_optional_text(stmt, 15);
  t.created_at = from_timestamp(sqlite3_column_int64(stmt, 16));
  t.updated_at = from_timestamp(sqlite3_column_int64(stmt, 17));
  t.started_at = col_optional_time(stmt, 18);
  t.completed_at = col_optional_time(stmt, 19);
  return t;
}

auto detailed(std::error_code ec, std::string message)
    -> std::unexpected<ErrorInfo> {
  return std::unexpected{ErrorInfo{ec, std::move(message)}};
}

auto preview(const nlohmann::json& result) -> std::string {
  auto text = result.is_string() ? result.get<std::string>() : result.dump();
  if (text.size() > kResultPreviewChars) {
    text.resize(kResultPreviewChars);
  }
  return text;
}

}  // namespace

TaskManager::TaskManager(Database& db, TaskManagerOptions options)
    : db_(db), options_(options) {
}

auto TaskManager::enqueue(OwnerId owner, std::string_view kind,
                          EnqueueOptions options) -> DetailedResult<TaskId> {
  if (kind.empty()) {
    return stepflow::fail(Error::InvalidArgument, "Task kind must not be empty");
  }
  int max_attempts = options.max_attempts.value_or(options_.max_attempts);
  if (max_attempts < 1) {
    return stepflow::fail(Error::InvalidArgument,
                          std::format("max_attempts must be >= 1, got {}",
                                      max_attempts));
  }
  if (!options.input_data.is_object()) {
    return stepflow::fail(Error::InvalidArgument,
                          "input_data must be a JSON object");
  }

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError,
                          std::format("begin transaction: {}", db_.last_error()));
  }

  auto now = now_ms();
  if (!options.skip_limits) {
    auto limits = owner_limits(owner, now);
    if (!limits) {
      return detailed(limits.error(), "Failed to read owner quotas");
    }
    if (limits->queued.exhausted()) {
      log::warn("Owner {} rejected: queued {}/{}", owner, limits->queued.used,
                limits->queued.limit);
      return stepflow::fail(Error::QueuedLimitExceeded,
                            std::format("Too many queued tasks: {}/{}",
                                        limits->queued.used,
                                        limits->queued.limit));
    }
    if (limits->active.exhausted()) {
      log::warn("Owner {} rejected: active {}/{}", owner, limits->active.used,
                limits->active.limit);
      return stepflow::fail(Error::ActiveLimitExceeded,
                            std::format("Too many active tasks: {}/{}",
                                        limits->active.used,
                                        limits->active.limit));
    }
    if (limits->per_hour.exhausted()) {
      log::warn("Owner {} rejected: hourly {}/{}", owner,
                limits->per_hour.used, limits->per_hour.limit);
      return stepflow::fail(Error::HourlyLimitExceeded,
                            std::format("Too many tasks per hour: {}/{}",
                                        limits->per_hour.used,
                                        limits->per_hour.limit));
    }
  }

  constexpr auto sql = R"(
    INSERT INTO tasks (owner_id, kind, input_text, input_data, status,
                       attempts, max_attempts, created_at, updated_at)
    VALUES (?, ?, ?, ?, 'queued', 0, ?, ?, ?);
  )";
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return detailed(stmt.error(), "Failed to prepare task insert");
  }
  sqlite3_bind_int64(stmt->get(), 1, owner);
  bind_text(stmt->get(), 2, kind);
  bind_text(stmt->get(), 3, options.input_text);
  bind_text(stmt->get(), 4, options.input_data.dump());
  sqlite3_bind_int(stmt->get(), 5, max_attempts);
  sqlite3_bind_int64(stmt->get(), 6, now);
  sqlite3_bind_int64(stmt->get(), 7, now);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return detailed(make_error_code(Error::DatabaseQueryFailed),
                    std::format("Failed to insert task: {}", db_.last_error()));
  }
  TaskId id = db_.last_insert_id();

  if (auto r = insert_event(id, "enqueued",
                            {{"kind", std::string(kind)}, {"skip_limits", options.skip_limits}},
                            std::nullopt, std::nullopt, now);
      !r) {
    return detailed(r.error(), "Failed to record enqueue event");
  }
  if (auto r = tx.commit(); !r) {
    return detailed(r.error(), "Failed to commit enqueue");
  }

  log::info("Task {} enqueued (owner={}, kind={})", id, owner, kind);
  return id;
}

auto TaskManager::claim(const WorkerId& worker)
    -> Result<std::optional<Task>> {
  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }

  auto now = now_ms();
  auto select_sql = std::format(
      "SELECT {} FROM tasks "
      "WHERE (status = 'queued' AND locked_by IS NULL) "
      "   OR (status = 'running' AND lease_expires_at < ?) "
      "ORDER BY created_at ASC, id ASC LIMIT 1;",
      kTaskColumns);

  // An expired lease that has used up its attempts is failed here instead of
  // being handed out again; keep looking for a claimable task after that.
  for (;;) {
    auto stmt = db_.prepare(select_sql.c_str());
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, now);
    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
      if (auto r = tx.commit(); !r) {
        return std::unexpected(r.error());
      }
      return std::optional<Task>{};
    }
    if (rc != SQLITE_ROW) {
      log::error("Claim query failed: {}", db_.last_error());
      return stepflow::fail(Error::DatabaseQueryFailed);
    }
    Task task = read_task(stmt->get());
    stmt->reset();

    bool reclaimed = task.status == TaskStatus::Running;
    if (reclaimed && task.attempts >= task.max_attempts) {
      constexpr auto exhaust_sql = R"(
        UPDATE tasks SET status = 'failed', error = ?, locked_by = NULL,
          locked_at = NULL, lease_expires_at = NULL, completed_at = ?,
          updated_at = ?
        WHERE id = ?;
      )";
      auto ex = db_.prepare(exhaust_sql);
      if (!ex) {
        return std::unexpected(ex.error());
      }
      auto error = std::format("Lease expired after {} attempts", task.attempts);
      bind_text(ex->get(), 1, error);
      sqlite3_bind_int64(ex->get(), 2, now);
      sqlite3_bind_int64(ex->get(), 3, now);
      sqlite3_bind_int64(ex->get(), 4, task.id);
      if (sqlite3_step(ex->get()) != SQLITE_DONE) {
        return stepflow::fail(Error::DatabaseQueryFailed);
      }
      if (auto r = insert_event(task.id, "failed",
                                {{"error", error}, {"attempts", task.attempts}},
                                std::nullopt, std::nullopt, now);
          !r) {
        return std::unexpected(r.error());
      }
      log::error("Task {} failed: {}", task.id, error);
      continue;
    }

    constexpr auto update_sql = R"(
      UPDATE tasks SET status = 'running', locked_by = ?, locked_at = ?,
        lease_expires_at = ?, attempts = attempts + 1,
        started_at = COALESCE(started_at, ?), updated_at = ?
      WHERE id = ?;
    )";
    auto upd = db_.prepare(update_sql);
    if (!upd) {
      return std::unexpected(upd.error());
    }
    auto lease_until = now + options_.lease_timeout.count();
    bind_text(upd->get(), 1, worker.value());
    sqlite3_bind_int64(upd->get(), 2, now);
    sqlite3_bind_int64(upd->get(), 3, lease_until);
    sqlite3_bind_int64(upd->get(), 4, now);
    sqlite3_bind_int64(upd->get(), 5, now);
    sqlite3_bind_int64(upd->get(), 6, task.id);
    if (sqlite3_step(upd->get()) != SQLITE_DONE) {
      return stepflow::fail(Error::DatabaseQueryFailed);
    }

    if (auto r = insert_event(task.id, "claimed",
                              {{"worker_id", worker.str()},
                               {"attempt", task.attempts + 1},
                               {"reclaimed", reclaimed}},
                              std::nullopt, std::nullopt, now);
        !r) {
      return std::unexpected(r.error());
    }

    auto claimed = load_task(task.id);
    if (!claimed) {
      return std::unexpected(claimed.error());
    }
    if (auto r = tx.commit(); !r) {
      return std::unexpected(r.error());
    }

    if (reclaimed) {
      log::warn("Task {} reclaimed by {} after lease expiry (attempt {})",
                task.id, worker, claimed->attempts);
    } else {
      log::info("Task {} claimed by {} (attempt {})", task.id, worker,
                claimed->attempts);
    }
    return std::optional<Task>{std::move(*claimed)};
  }
}

auto TaskManager::heartbeat(TaskId task_id, const WorkerId& worker)
    -> Result<bool> {
  constexpr auto sql = R"(
    UPDATE tasks SET lease_expires_at = ?, updated_at = ?
    WHERE id = ? AND locked_by = ? AND status = 'running';
  )";

  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  auto now = now_ms();
  sqlite3_bind_int64(stmt->get(), 1, now + options_.lease_timeout.count());
  sqlite3_bind_int64(stmt->get(), 2, now);
  sqlite3_bind_int64(stmt->get(), 3, task_id);
  bind_text(stmt->get(), 4, worker.value());
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  return db_.changes() > 0;
}

auto TaskManager::pause(TaskId task_id, PauseReason reason,
                        const nlohmann::json& data) -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'paused', pause_reason = ?, locked_by = NULL,
      locked_at = NULL, lease_expires_at = NULL, updated_at = ?
    WHERE id = ? AND status = 'running';
  )";

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  auto now = now_ms();
  bind_text(stmt->get(), 1, pause_reason_name(reason));
  sqlite3_bind_int64(stmt->get(), 2, now);
  sqlite3_bind_int64(stmt->get(), 3, task_id);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    auto task = load_task(task_id);
    if (!task) {
      return std::unexpected(task.error());
    }
    log::warn("Cannot pause task {} in status {}", task_id,
              task_status_name(task->status));
    return stepflow::fail(Error::InvalidTransition);
  }

  nlohmann::json event_data = {{"reason", pause_reason_name(reason)}};
  if (data.is_object()) {
    event_data.update(data);
  }
  if (auto r = insert_event(task_id, "paused", event_data, std::nullopt,
                            std::nullopt, now);
      !r) {
    return r;
  }
  if (auto r = tx.commit(); !r) {
    return r;
  }
  log::info("Task {} paused ({})", task_id, pause_reason_name(reason));
  return ok();
}

auto TaskManager::resume(TaskId task_id) -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'queued', pause_reason = NULL, updated_at = ?
    WHERE id = ? AND status = 'paused';
  )";

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  auto now = now_ms();
  sqlite3_bind_int64(stmt->get(), 1, now);
  sqlite3_bind_int64(stmt->get(), 2, task_id);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    auto task = load_task(task_id);
    if (!task) {
      return std::unexpected(task.error());
    }
    log::warn("Cannot resume task {} in status {}", task_id,
              task_status_name(task->status));
    return stepflow::fail(Error::InvalidTransition);
  }

  if (auto r = insert_event(task_id, "resumed", nlohmann::json::object(),
                            std::nullopt, std::nullopt, now);
      !r) {
    return r;
  }
  if (auto r = tx.commit(); !r) {
    return r;
  }
  log::info("Task {} resumed", task_id);
  return ok();
}

auto TaskManager::succeed(TaskId task_id, const nlohmann::json& result)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'succeeded', result = ?, error = NULL,
      locked_by = NULL, locked_at = NULL, lease_expires_at = NULL,
      completed_at = ?, updated_at = ?
    WHERE id = ? AND status = 'running';
  )";

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  auto now = now_ms();
  bind_text(stmt->get(), 1, result.dump());
  sqlite3_bind_int64(stmt->get(), 2, now);
  sqlite3_bind_int64(stmt->get(), 3, now);
  sqlite3_bind_int64(stmt->get(), 4, task_id);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    auto task = load_task(task_id);
    if (!task) {
      return std::unexpected(task.error());
    }
    log::warn("Cannot complete task {} in status {}", task_id,
              task_status_name(task->status));
    return stepflow::fail(Error::InvalidTransition);
  }

  if (auto r = insert_event(task_id, "succeeded",
                            {{"result_preview", preview(result)}},
                            std::nullopt, std::nullopt, now);
      !r) {
    return r;
  }
  if (auto r = tx.commit(); !r) {
    return r;
  }
  log::info("Task {} succeeded", task_id);
  return ok();
}

auto TaskManager::fail(TaskId task_id, std::string_view error, bool retryable)
    -> Result<void> {
  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }

  auto task = load_task(task_id);
  if (!task) {
    return std::unexpected(task.error());
  }
  if (task->status != TaskStatus::Running) {
    log::warn("Cannot fail task {} in status {}", task_id,
              task_status_name(task->status));
    return stepflow::fail(Error::InvalidTransition);
  }

  auto now = now_ms();
  bool retry = retryable && task->attempts < task->max_attempts;
  const char* sql = retry ? R"(
      UPDATE tasks SET status = 'queued', error = ?, locked_by = NULL,
        locked_at = NULL, lease_expires_at = NULL, updated_at = ?
      WHERE id = ?;
    )"
                          : R"(
      UPDATE tasks SET status = 'failed', error = ?, locked_by = NULL,
        locked_at = NULL, lease_expires_at = NULL, updated_at = ?,
        completed_at = ?
      WHERE id = ?;
    )";

  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  bind_text(stmt->get(), 1, error);
  sqlite3_bind_int64(stmt->get(), 2, now);
  if (retry) {
    sqlite3_bind_int64(stmt->get(), 3, task_id);
  } else {
    sqlite3_bind_int64(stmt->get(), 3, now);
    sqlite3_bind_int64(stmt->get(), 4, task_id);
  }
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }

  auto r = retry ? insert_event(task_id, "retry_scheduled",
                                {{"error", std::string(error)},
                                 {"attempt", task->attempts},
                                 {"max_attempts", task->max_attempts}},
                                std::nullopt, std::nullopt, now)
                 : insert_event(task_id, "failed",
                                {{"error", std::string(error)},
                                 {"attempts", task->attempts},
                                 {"retryable", retryable}},
                                std::nullopt, std::nullopt, now);
  if (!r) {
    return r;
  }
  if (auto c = tx.commit(); !c) {
    return c;
  }

  if (retry) {
    log::warn("Task {} attempt {}/{} failed, requeued: {}", task_id,
              task->attempts, task->max_attempts, error);
  } else {
    log::error("Task {} failed: {}", task_id, error);
  }
  return ok();
}

auto TaskManager::cancel(TaskId task_id, std::string_view reason)
    -> Result<bool> {
  constexpr auto sql = R"(
    UPDATE tasks SET status = 'cancelled', error = ?, pause_reason = NULL,
      locked_by = NULL, locked_at = NULL, lease_expires_at = NULL,
      completed_at = ?, updated_at = ?
    WHERE id = ? AND status NOT IN ('succeeded', 'failed', 'cancelled');
  )";

  auto guard = db_.lock();
  Database::Transaction tx(db_);
  if (!tx.begun()) {
    return stepflow::fail(Error::DatabaseError);
  }
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  auto now = now_ms();
  bind_text(stmt->get(), 1, reason);
  sqlite3_bind_int64(stmt->get(), 2, now);
  sqlite3_bind_int64(stmt->get(), 3, now);
  sqlite3_bind_int64(stmt->get(), 4, task_id);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    auto task = load_task(task_id);
    if (!task) {
      return std::unexpected(task.error());
    }
    log::debug("Task {} already {}, cancel ignored", task_id,
               task_status_name(task->status));
    return false;
  }

  if (auto r = insert_event(task_id, "cancelled", {{"reason", std::string(reason)}},
                            std::nullopt, std::nullopt, now);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = tx.commit(); !r) {
    return std::unexpected(r.error());
  }
  log::info("Task {} cancelled: {}", task_id, reason);
  return true;
}

auto TaskManager::update_step(TaskId task_id,
                              const std::optional<PlanId>& plan_id,
                              const std::optional<StepId>& step_id)
    -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET current_plan_id = ?, current_step_id = ?, updated_at = ?
    WHERE id = ?;
  )";

  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  bind_optional_id(stmt->get(), 1, plan_id);
  bind_optional_id(stmt->get(), 2, step_id);
  sqlite3_bind_int64(stmt->get(), 3, now_ms());
  sqlite3_bind_int64(stmt->get(), 4, task_id);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    return stepflow::fail(Error::NotFound);
  }
  return ok();
}

auto TaskManager::record_event(TaskId task_id, std::string_view event_type,
                               const nlohmann::json& data,
                               const std::optional<StepId>& step_id,
                               const std::optional<std::string>& tool_name)
    -> Result<void> {
  auto guard = db_.lock();
  return insert_event(task_id, event_type, data, step_id, tool_name, now_ms());
}

auto TaskManager::get_task(TaskId task_id) -> Result<Task> {
  auto guard = db_.lock();
  return load_task(task_id);
}

auto TaskManager::get_owner_tasks(OwnerId owner,
                                  std::optional<TaskStatus> status, int limit)
    -> Result<std::vector<Task>> {
  auto sql = status ? std::format("SELECT {} FROM tasks WHERE owner_id = ? "
                                  "AND status = ? ORDER BY created_at DESC, "
                                  "id DESC LIMIT ?;",
                                  kTaskColumns)
                    : std::format("SELECT {} FROM tasks WHERE owner_id = ? "
                                  "ORDER BY created_at DESC, id DESC LIMIT ?;",
                                  kTaskColumns);

  auto guard = db_.lock();
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  int idx = 1;
  sqlite3_bind_int64(stmt->get(), idx++, owner);
  if (status) {
    bind_text(stmt->get(), idx++, task_status_name(*status));
  }
  sqlite3_bind_int(stmt->get(), idx, limit);

  std::vector<Task> tasks;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    tasks.push_back(read_task(stmt->get()));
  }
  return tasks;
}

auto TaskManager::get_queue_size() -> Result<int> {
  constexpr auto sql = "SELECT COUNT(*) FROM tasks WHERE status = 'queued';";
  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_column_int(stmt->get(), 0);
}

auto TaskManager::get_task_events(TaskId task_id, int limit)
    -> Result<std::vector<TaskEvent>> {
  constexpr auto sql = R"(
    SELECT id, task_id, event_type, event_data, step_id, tool_name, created_at
    FROM task_events WHERE task_id = ?
    ORDER BY created_at DESC, id DESC LIMIT ?;
  )";

  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, task_id);
  sqlite3_bind_int(stmt->get(), 2, limit);

  std::vector<TaskEvent> events;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    TaskEvent e;
    e.id = sqlite3_column_int64(stmt->get(), 0);
    e.task_id = sqlite3_column_int64(stmt->get(), 1);
    e.event_type = col_text(stmt->get(), 2);
    e.data = col_json(stmt->get(), 3);
    if (auto step = col_optional_text(stmt->get(), 4)) {
      e.step_id = StepId{std::move(*step)};
    }
    e.tool_name = col_optional_text(stmt->get(), 5);
    e.created_at = from_timestamp(sqlite3_column_int64(stmt->get(), 6));
    events.push_back(std::move(e));
  }
  return events;
}

auto TaskManager::get_owner_limits(OwnerId owner) -> Result<OwnerLimits> {
  auto guard = db_.lock();
  return owner_limits(owner, now_ms());
}

auto TaskManager::purge_events_before(std::chrono::system_clock::time_point cutoff)
    -> Result<int> {
  constexpr auto sql = "DELETE FROM task_events WHERE created_at < ?;";
  auto guard = db_.lock();
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, to_timestamp(cutoff));
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  int removed = db_.changes();
  if (removed > 0) {
    log::info("Purged {} task events", removed);
  }
  return removed;
}

auto TaskManager::load_task(TaskId task_id) -> Result<Task> {
  auto sql = std::format("SELECT {} FROM tasks WHERE id = ?;", kTaskColumns);
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, task_id);
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return stepflow::fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  return read_task(stmt->get());
}

auto TaskManager::count(const char* sql, OwnerId owner,
                        std::optional<std::int64_t> since) -> Result<int> {
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, owner);
  if (since) {
    sqlite3_bind_int64(stmt->get(), 2, *since);
  }
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_column_int(stmt->get(), 0);
}

auto TaskManager::owner_limits(OwnerId owner, std::int64_t now_ms)
    -> Result<OwnerLimits> {
  constexpr auto queued_sql =
      "SELECT COUNT(*) FROM tasks WHERE owner_id = ? AND status = 'queued';";
  constexpr auto active_sql =
      "SELECT COUNT(*) FROM tasks WHERE owner_id = ? "
      "AND status IN ('queued', 'running');";
  constexpr auto hourly_sql =
      "SELECT COUNT(*) FROM tasks WHERE owner_id = ? AND created_at >= ?;";
  constexpr std::int64_t kHourMs = 60LL * 60 * 1000;

  auto queued = count(queued_sql, owner, std::nullopt);
  if (!queued) {
    return std::unexpected(queued.error());
  }
  auto active = count(active_sql, owner, std::nullopt);
  if (!active) {
    return std::unexpected(active.error());
  }
  auto hourly = count(hourly_sql, owner, now_ms - kHourMs);
  if (!hourly) {
    return std::unexpected(hourly.error());
  }

  return OwnerLimits{
      .queued = {*queued, options_.max_queued_per_owner},
      .active = {*active, options_.max_active_per_owner},
      .per_hour = {*hourly, options_.max_tasks_per_hour},
  };
}

auto TaskManager::insert_event(TaskId task_id, std::string_view event_type,
                               const nlohmann::json& data,
                               const std::optional<StepId>& step_id,
                               const std::optional<std::string>& tool_name,
                               std::int64_t now_ms) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_events (task_id, event_type, event_data, step_id,
                             tool_name, created_at)
    VALUES (?, ?, ?, ?, ?, ?);
  )";
  auto stmt = db_.prepare(sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, task_id);
  bind_text(stmt->get(), 2, event_type);
  bind_text(stmt->get(), 3, data.dump());
  bind_optional_id(stmt->get(), 4, step_id);
  bind_optional_text(stmt->get(), 5, tool_name);
  sqlite3_bind_int64(stmt->get(), 6, now_ms);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    log::error("Failed to record {} event for task {}: {}", event_type,
               task_id, db_.last_error());
    return stepflow::fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

}  // namespace stepflow
