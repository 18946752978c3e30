#pragma once

#include "stepflow/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace stepflow {

// Timestamps are stored as epoch milliseconds.
[[nodiscard]] auto to_timestamp(std::chrono::system_clock::time_point tp)
    -> std::int64_t;
[[nodiscard]] auto from_timestamp(std::int64_t ts)
    -> std::chrono::system_clock::time_point;

// Column and parameter helpers shared by the stores. Text is bound as a
// transient copy; NULL columns read as empty, nullopt or JSON null.
auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void;
auto bind_optional_text(sqlite3_stmt* stmt, int idx,
                        const std::optional<std::string>& text) -> void;
[[nodiscard]] auto col_text(sqlite3_stmt* stmt, int col) -> std::string;
[[nodiscard]] auto col_optional_text(sqlite3_stmt* stmt, int col)
    -> std::optional<std::string>;
[[nodiscard]] auto col_optional_time(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point>;
// Stored JSON is written by us; a column that fails to parse reads as null.
[[nodiscard]] auto col_json(sqlite3_stmt* stmt, int col) -> nlohmann::json;
// Plain text column as a JSON string.
[[nodiscard]] auto col_json_text(sqlite3_stmt* stmt, int col) -> nlohmann::json;

// One SQLite connection. Callers that issue more than one statement for a
// logical operation hold lock() for its duration; a connection is never used
// from two threads at once.
class Database {
public:
  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit()
  // succeeded. The immediate lock makes read-then-update sequences atomic
  // against other connections to the same file.
  class Transaction {
  public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] auto begun() const noexcept -> bool { return begun_; }
    [[nodiscard]] auto commit() -> Result<void>;

  private:
    Database& db_;
    bool begun_{false};
    bool done_{false};
  };

  explicit Database(std::string_view db_path, int busy_timeout_ms = 5000);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  [[nodiscard]] auto lock() -> std::unique_lock<std::mutex> {
    return std::unique_lock{mu_};
  }

  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto changes() const -> int;
  [[nodiscard]] auto last_insert_id() const -> std::int64_t;
  [[nodiscard]] auto last_error() const -> std::string;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  std::string db_path_;
  int busy_timeout_ms_;
  std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace stepflow
