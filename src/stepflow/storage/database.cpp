#include "stepflow/storage/database.hpp"

#include "stepflow/util/log.hpp"

#include <sqlite3.h>

namespace stepflow {

auto to_timestamp(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_timestamp(std::int64_t ts) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ts));
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto bind_optional_text(sqlite3_stmt* stmt, int idx,
                        const std::optional<std::string>& text) -> void {
  if (text) {
    bind_text(stmt, idx, *text);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_optional_text(sqlite3_stmt* stmt, int col)
    -> std::optional<std::string> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return col_text(stmt, col);
}

auto col_optional_time(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return from_timestamp(sqlite3_column_int64(stmt, col));
}

auto col_json(sqlite3_stmt* stmt, int col) -> nlohmann::json {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return nullptr;
  }
  auto parsed = nlohmann::json::parse(col_text(stmt, col), nullptr, false);
  return parsed.is_discarded() ? nlohmann::json(nullptr) : parsed;
}

auto col_json_text(sqlite3_stmt* stmt, int col) -> nlohmann::json {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return nullptr;
  }
  return col_text(stmt, col);
}

auto Database::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Database::Statement::~Statement() {
  reset();
}

auto Database::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Database::Transaction::Transaction(Database& db) : db_(db) {
  begun_ = db_.begin_transaction().has_value();
}

Database::Transaction::~Transaction() {
  if (begun_ && !done_) {
    if (auto r = db_.rollback_transaction(); !r) {
      log::warn("Rollback failed: {}", db_.last_error());
    }
  }
}

auto Database::Transaction::commit() -> Result<void> {
  if (!begun_ || done_) {
    return fail(Error::DatabaseError);
  }
  auto r = db_.commit_transaction();
  if (r) {
    done_ = true;
  }
  return r;
}

Database::Database(std::string_view db_path, int busy_timeout_ms)
    : db_path_(db_path), busy_timeout_ms_(busy_timeout_ms) {
}

Database::~Database() {
  close();
}

auto Database::prepare(const char* sql) -> Result<Statement> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement{stmt};
}

auto Database::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), busy_timeout_ms_);

  // PRAGMA statements may fail on some configurations, but we continue anyway
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Database opened: {}", db_path_);
  return ok();
}

auto Database::close() -> void {
  db_.reset();
}

auto Database::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      owner_id INTEGER NOT NULL,
      kind TEXT NOT NULL,
      input_text TEXT NOT NULL DEFAULT '',
      input_data TEXT NOT NULL DEFAULT '{}',
      status TEXT NOT NULL DEFAULT 'queued',
      pause_reason TEXT,
      attempts INTEGER NOT NULL DEFAULT 0,
      max_attempts INTEGER NOT NULL DEFAULT 3,
      locked_by TEXT,
      locked_at INTEGER,
      lease_expires_at INTEGER,
      current_plan_id TEXT,
      current_step_id TEXT,
      result TEXT,
      error TEXT,
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      started_at INTEGER,
      completed_at INTEGER
    );

    CREATE TABLE IF NOT EXISTS task_events (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id INTEGER NOT NULL,
      event_type TEXT NOT NULL,
      event_data TEXT,
      step_id TEXT,
      tool_name TEXT,
      created_at INTEGER NOT NULL,
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS task_steps (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id INTEGER NOT NULL,
      plan_id TEXT NOT NULL,
      step_id TEXT NOT NULL,
      step_index INTEGER NOT NULL,
      action TEXT NOT NULL,
      action_data TEXT NOT NULL DEFAULT '{}',
      depends_on TEXT NOT NULL DEFAULT '[]',
      status TEXT NOT NULL DEFAULT 'pending',
      result TEXT,
      error TEXT,
      snapshot_ref TEXT,
      updated_at INTEGER NOT NULL,
      UNIQUE (task_id, plan_id, step_id),
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_claim ON tasks(status, created_at);
    CREATE INDEX IF NOT EXISTS idx_tasks_owner ON tasks(owner_id, status);
    CREATE INDEX IF NOT EXISTS idx_task_events_task ON task_events(task_id, created_at);
    CREATE INDEX IF NOT EXISTS idx_task_steps_plan ON task_steps(task_id, plan_id, step_index);
  )";

  return execute(sql);
}

auto Database::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str(sql);
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Database::changes() const -> int {
  return sqlite3_changes(db_.get());
}

auto Database::last_insert_id() const -> std::int64_t {
  return sqlite3_last_insert_rowid(db_.get());
}

auto Database::last_error() const -> std::string {
  return db_ ? sqlite3_errmsg(db_.get()) : "database not open";
}

auto Database::begin_transaction() -> Result<void> {
  return execute("BEGIN IMMEDIATE;");
}

auto Database::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Database::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace stepflow
