#pragma once

#include "fixloop/core/error.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace fixloop {

// Thin owner of one SQLite connection. Not thread-safe by itself; callers
// serialize access (see SqliteTaskStore / SqliteTaskQueue).
class Database {
public:
  explicit Database(std::string_view db_path);
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

  // Rolls back on destruction unless commit() succeeded.
  class Transaction {
  public:
    explicit Transaction(Database& db) : db_(&db) {
    }
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] auto begin() -> Result<void>;
    [[nodiscard]] auto commit() -> Result<void>;

  private:
    Database* db_;
    bool active_{false};
  };

  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;
  [[nodiscard]] auto changes() const noexcept -> int;
  [[nodiscard]] auto last_error() const -> std::string;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

// Helpers shared by the storage implementations
[[nodiscard]] auto col_text(sqlite3_stmt* stmt, int col) -> std::string;
[[nodiscard]] auto col_is_null(sqlite3_stmt* stmt, int col) -> bool;
auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void;

}  // namespace fixloop
