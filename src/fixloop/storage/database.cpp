#include "fixloop/storage/database.hpp"

#include "fixloop/util/log.hpp"

#include <sqlite3.h>

namespace fixloop {

namespace {
constexpr int kBusyTimeoutMs = 5000;
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_is_null(sqlite3_stmt* stmt, int col) -> bool {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
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

Database::Transaction::~Transaction() {
  if (active_) {
    if (auto r = db_->rollback_transaction(); !r) {
      log::error("Rollback failed: {}", r.error().message());
    }
  }
}

auto Database::Transaction::begin() -> Result<void> {
  auto r = db_->begin_transaction();
  active_ = r.has_value();
  return r;
}

auto Database::Transaction::commit() -> Result<void> {
  auto r = db_->commit_transaction();
  if (r) {
    active_ = false;
  }
  return r;
}

Database::Database(std::string_view db_path) : db_path_(db_path) {
}

Database::~Database() {
  close();
}

auto Database::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(db_path_.c_str(), &raw_db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);

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

  log::debug("Database opened: {}", db_path_);
  return ok();
}

auto Database::close() -> void {
  db_.reset();
}

auto Database::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Database::prepare(const char* sql) -> Result<Statement> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement{stmt};
}

auto Database::changes() const noexcept -> int {
  return db_ ? sqlite3_changes(db_.get()) : 0;
}

auto Database::last_error() const -> std::string {
  return db_ ? sqlite3_errmsg(db_.get()) : "database not open";
}

// IMMEDIATE takes the write lock up front so read-modify-write sequences
// cannot interleave with another connection's writer.
auto Database::begin_transaction() -> Result<void> {
  return execute("BEGIN IMMEDIATE TRANSACTION;");
}

auto Database::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Database::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace fixloop
