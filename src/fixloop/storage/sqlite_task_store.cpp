#include "fixloop/storage/sqlite_task_store.hpp"

#include "fixloop/model/json.hpp"
#include "fixloop/model/state_strings.hpp"
#include "fixloop/util/log.hpp"

#include <sqlite3.h>

namespace fixloop {

namespace {

auto is_consistent(const Task& task) -> bool {
  if (is_terminal(task.status) != task.completed_at.has_value()) {
    log::error("Task {}: completed_at must be set exactly when terminal",
               task.id);
    return false;
  }
  if (static_cast<int>(task.attempts.size()) > task.max_attempts) {
    log::error("Task {}: {} attempts exceeds max_attempts {}", task.id,
               task.attempts.size(), task.max_attempts);
    return false;
  }
  for (std::size_t i = 0; i < task.attempts.size(); ++i) {
    const auto& attempt = task.attempts[i];
    if (attempt.index != static_cast<int>(i) || !attempt.is_well_ordered()) {
      log::error("Task {}: attempt {} is malformed", task.id, i);
      return false;
    }
  }
  return true;
}

}  // namespace

SqliteTaskStore::SqliteTaskStore(std::string_view db_path) : db_(db_path) {
}

auto SqliteTaskStore::open() -> Result<void> {
  std::lock_guard lock(mutex_);
  if (auto r = db_.open(); !r) {
    return r;
  }
  if (auto r = create_tables(); !r) {
    db_.close();
    return r;
  }
  return ok();
}

auto SqliteTaskStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      repository_url TEXT NOT NULL,
      branch TEXT NOT NULL,
      issue TEXT NOT NULL,
      test_command TEXT,
      language TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'PENDING',
      max_attempts INTEGER NOT NULL DEFAULT 3,
      created_at INTEGER NOT NULL,
      completed_at INTEGER,
      result_summary TEXT NOT NULL DEFAULT '',
      failure_kind TEXT NOT NULL DEFAULT 'none',
      failure_reason TEXT NOT NULL DEFAULT '',
      cancel_requested INTEGER NOT NULL DEFAULT 0,
      needs_human_review INTEGER NOT NULL DEFAULT 0,
      version INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS attempts (
      task_id TEXT NOT NULL,
      idx INTEGER NOT NULL,
      payload TEXT NOT NULL,
      PRIMARY KEY (task_id, idx),
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
    CREATE INDEX IF NOT EXISTS idx_tasks_created ON tasks(created_at);
  )";

  return db_.execute(sql);
}

auto SqliteTaskStore::create(const Task& task) -> Result<void> {
  if (!task.attempts.empty() || task.status != TaskStatus::Pending) {
    log::error("Task {} must be created PENDING with no attempts", task.id);
    return fail(Error::InvalidArgument);
  }

  constexpr auto sql = R"(
    INSERT INTO tasks (id, repository_url, branch, issue, test_command,
                       language, status, max_attempts, created_at, version)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 0);
  )";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  auto* s = stmt->get();
  bind_text(s, 1, task.id.value());
  bind_text(s, 2, task.repo.url);
  bind_text(s, 3, task.repo.branch);
  bind_text(s, 4, task.issue);
  if (task.test_command) {
    bind_text(s, 5, *task.test_command);
  } else {
    sqlite3_bind_null(s, 5);
  }
  bind_text(s, 6, task.language);
  sqlite3_bind_text(s, 7, task_status_name(task.status), -1, SQLITE_STATIC);
  sqlite3_bind_int(s, 8, task.max_attempts);
  sqlite3_bind_int64(s, 9, to_millis(task.created_at));

  int rc = sqlite3_step(s);
  if (rc == SQLITE_CONSTRAINT) {
    return fail(Error::AlreadyExists);
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to create task {}: {}", task.id, db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::get(const TaskId& id) -> Result<Task> {
  std::lock_guard lock(mutex_);
  return load_task(id);
}

auto SqliteTaskStore::load_task(const TaskId& id) -> Result<Task> {
  constexpr auto sql = R"(
    SELECT repository_url, branch, issue, test_command, language, status,
           max_attempts, created_at, completed_at, result_summary,
           failure_kind, failure_reason, cancel_requested,
           needs_human_review, version
    FROM tasks WHERE id = ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  auto* s = stmt->get();
  bind_text(s, 1, id.value());

  int rc = sqlite3_step(s);
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to load task {}: {}", id, db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }

  auto status = parse_task_status(col_text(s, 5));
  if (!status) {
    log::error("Task {} has unknown status '{}'", id, col_text(s, 5));
    return fail(Error::ParseError);
  }

  Task task;
  task.id = id;
  task.repo = RepoRef{.url = col_text(s, 0), .branch = col_text(s, 1)};
  task.issue = col_text(s, 2);
  if (!col_is_null(s, 3)) {
    task.test_command = col_text(s, 3);
  }
  task.language = col_text(s, 4);
  task.status = *status;
  task.max_attempts = sqlite3_column_int(s, 6);
  task.created_at = from_millis(sqlite3_column_int64(s, 7));
  if (!col_is_null(s, 8)) {
    task.completed_at = from_millis(sqlite3_column_int64(s, 8));
  }
  task.result_summary = col_text(s, 9);
  task.failure_kind = parse_failure_kind(col_text(s, 10));
  task.failure_reason = col_text(s, 11);
  task.cancel_requested = sqlite3_column_int(s, 12) != 0;
  task.needs_human_review = sqlite3_column_int(s, 13) != 0;
  task.version = static_cast<std::uint64_t>(sqlite3_column_int64(s, 14));

  if (auto r = load_attempts(task); !r) {
    return std::unexpected(r.error());
  }
  return task;
}

auto SqliteTaskStore::load_attempts(Task& task) -> Result<void> {
  constexpr auto sql =
      "SELECT payload FROM attempts WHERE task_id = ? ORDER BY idx;";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  bind_text(stmt->get(), 1, task.id.value());

  int rc;
  while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
    auto attempt = attempt_from_string(col_text(stmt->get(), 0));
    if (!attempt) {
      return std::unexpected(attempt.error());
    }
    task.attempts.push_back(std::move(*attempt));
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::upsert_attempt(const TaskId& id, const Attempt& attempt)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO attempts (task_id, idx, payload) VALUES (?, ?, ?)
    ON CONFLICT(task_id, idx) DO UPDATE SET payload = excluded.payload;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  auto* s = stmt->get();
  bind_text(s, 1, id.value());
  sqlite3_bind_int(s, 2, attempt.index);
  bind_text(s, 3, attempt_to_string(attempt));

  return sqlite3_step(s) == SQLITE_DONE ? ok()
                                        : fail(Error::DatabaseQueryFailed);
}

auto SqliteTaskStore::compare_and_set(const Task& next, TaskStatus expected)
    -> Result<bool> {
  return write(next, expected, false);
}

auto SqliteTaskStore::append_attempt(const Task& next, TaskStatus expected)
    -> Result<bool> {
  if (next.attempts.empty()) {
    return fail(Error::InvalidArgument);
  }
  return write(next, expected, true);
}

auto SqliteTaskStore::write(const Task& next, TaskStatus expected,
                            bool appending) -> Result<bool> {
  // Terminal states are final: nothing may move a task out of one.
  if (is_terminal(expected)) {
    log::debug("Task {}: refusing write over terminal status {}", next.id,
               task_status_name(expected));
    return false;
  }
  if (!is_consistent(next)) {
    return fail(Error::InvalidArgument);
  }

  std::lock_guard lock(mutex_);
  Database::Transaction tx(db_);
  if (auto r = tx.begin(); !r) {
    return std::unexpected(r.error());
  }

  {
    constexpr auto sql = R"(
      SELECT status, version,
             (SELECT COUNT(*) FROM attempts WHERE task_id = tasks.id)
      FROM tasks WHERE id = ?;
    )";
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    auto* s = stmt->get();
    bind_text(s, 1, next.id.value());

    int rc = sqlite3_step(s);
    if (rc == SQLITE_DONE) {
      return fail(Error::NotFound);
    }
    if (rc != SQLITE_ROW) {
      return fail(Error::DatabaseQueryFailed);
    }

    auto stored_status = parse_task_status(col_text(s, 0));
    auto stored_version = static_cast<std::uint64_t>(sqlite3_column_int64(s, 1));
    auto stored_count = static_cast<std::size_t>(sqlite3_column_int64(s, 2));

    if (!stored_status || *stored_status != expected ||
        stored_version != next.version) {
      log::debug("Task {}: compare-and-set lost (expected {}@{}, stored {}@{})",
                 next.id, task_status_name(expected), next.version,
                 col_text(s, 0), stored_version);
      return false;
    }

    auto wanted = appending ? stored_count + 1 : stored_count;
    if (next.attempts.size() != wanted) {
      log::error("Task {}: attempt count {} does not match stored {}{}",
                 next.id, next.attempts.size(), stored_count,
                 appending ? " + 1" : "");
      return fail(Error::InvalidArgument);
    }
  }

  {
    constexpr auto sql = R"(
      UPDATE tasks SET
        status = ?, completed_at = ?, result_summary = ?, failure_kind = ?,
        failure_reason = ?, needs_human_review = ?, version = version + 1
      WHERE id = ? AND version = ?;
    )";
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    auto* s = stmt->get();
    sqlite3_bind_text(s, 1, task_status_name(next.status), -1, SQLITE_STATIC);
    if (next.completed_at) {
      sqlite3_bind_int64(s, 2, to_millis(*next.completed_at));
    } else {
      sqlite3_bind_null(s, 2);
    }
    bind_text(s, 3, next.result_summary);
    sqlite3_bind_text(s, 4, failure_kind_name(next.failure_kind), -1,
                      SQLITE_STATIC);
    bind_text(s, 5, next.failure_reason);
    sqlite3_bind_int(s, 6, next.needs_human_review ? 1 : 0);
    bind_text(s, 7, next.id.value());
    sqlite3_bind_int64(s, 8, static_cast<sqlite3_int64>(next.version));

    if (sqlite3_step(s) != SQLITE_DONE || db_.changes() != 1) {
      log::error("Task {}: update failed: {}", next.id, db_.last_error());
      return fail(Error::DatabaseQueryFailed);
    }
  }

  // Only the last two attempts can change in a single transition.
  auto first = next.attempts.size() > 2 ? next.attempts.size() - 2 : 0;
  for (auto i = first; i < next.attempts.size(); ++i) {
    if (auto r = upsert_attempt(next.id, next.attempts[i]); !r) {
      return std::unexpected(r.error());
    }
  }

  if (auto r = tx.commit(); !r) {
    return std::unexpected(r.error());
  }
  return true;
}

auto SqliteTaskStore::list(const TaskFilter& filter)
    -> Result<std::vector<TaskSummary>> {
  std::string sql = R"(
    SELECT id, repository_url, language, status, failure_kind, created_at,
           completed_at,
           (SELECT COUNT(*) FROM attempts WHERE task_id = tasks.id)
    FROM tasks )";
  if (filter.status) {
    sql += "WHERE status = ? ";
  }
  sql += "ORDER BY created_at DESC, id LIMIT ? OFFSET ?;";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());
  auto* s = stmt->get();

  int idx = 1;
  if (filter.status) {
    sqlite3_bind_text(s, idx++, task_status_name(*filter.status), -1,
                      SQLITE_STATIC);
  }
  sqlite3_bind_int64(s, idx++, static_cast<sqlite3_int64>(filter.limit));
  sqlite3_bind_int64(s, idx++, static_cast<sqlite3_int64>(filter.offset));

  std::vector<TaskSummary> out;
  int rc;
  while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
    auto status = parse_task_status(col_text(s, 3));
    if (!status) {
      log::warn("Skipping task {} with unknown status", col_text(s, 0));
      continue;
    }
    TaskSummary summary{
        .id = TaskId{col_text(s, 0)},
        .repository_url = col_text(s, 1),
        .language = col_text(s, 2),
        .status = *status,
        .failure_kind = parse_failure_kind(col_text(s, 4)),
        .attempt_count = sqlite3_column_int(s, 7),
        .created_at = from_millis(sqlite3_column_int64(s, 5)),
        .completed_at = std::nullopt,
    };
    if (!col_is_null(s, 6)) {
      summary.completed_at = from_millis(sqlite3_column_int64(s, 6));
    }
    out.push_back(std::move(summary));
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return out;
}

auto SqliteTaskStore::count(const TaskFilter& filter) -> Result<std::size_t> {
  std::string sql = "SELECT COUNT(*) FROM tasks";
  if (filter.status) {
    sql += " WHERE status = ?";
  }
  sql += ";";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());
  if (filter.status) {
    sqlite3_bind_text(stmt->get(), 1, task_status_name(*filter.status), -1,
                      SQLITE_STATIC);
  }
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
}

auto SqliteTaskStore::purge_terminal(TimePoint cutoff)
    -> Result<std::size_t> {
  // Attempts go with their task through ON DELETE CASCADE.
  constexpr auto sql = R"(
    DELETE FROM tasks
    WHERE status IN ('SUCCESS', 'FAILED', 'CANCELLED')
      AND completed_at IS NOT NULL AND completed_at < ?;
  )";

  std::lock_guard lock(mutex_);
  Database::Transaction tx(db_);
  if (auto r = tx.begin(); !r) {
    return std::unexpected(r.error());
  }
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  sqlite3_bind_int64(stmt->get(), 1, to_millis(cutoff));
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  auto removed = static_cast<std::size_t>(db_.changes());
  if (auto r = tx.commit(); !r) {
    return std::unexpected(r.error());
  }
  if (removed > 0) {
    log::info("Purged {} terminal tasks", removed);
  }
  return removed;
}

auto SqliteTaskStore::request_cancel(const TaskId& id)
    -> Result<CancelOutcome> {
  constexpr auto sql = R"(
    UPDATE tasks SET cancel_requested = 1
    WHERE id = ? AND cancel_requested = 0
      AND status NOT IN ('SUCCESS', 'FAILED', 'CANCELLED');
  )";

  std::lock_guard lock(mutex_);
  Database::Transaction tx(db_);
  if (auto r = tx.begin(); !r) {
    return std::unexpected(r.error());
  }

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  bind_text(stmt->get(), 1, id.value());
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }

  CancelOutcome outcome = CancelOutcome::Requested;
  if (db_.changes() == 0) {
    auto task = load_task(id);
    if (!task) {
      return std::unexpected(task.error());
    }
    outcome = is_terminal(task->status) ? CancelOutcome::AlreadyTerminal
                                        : CancelOutcome::AlreadyRequested;
  }

  if (auto r = tx.commit(); !r) {
    return std::unexpected(r.error());
  }
  return outcome;
}

auto SqliteTaskStore::is_cancel_requested(const TaskId& id) -> Result<bool> {
  constexpr auto sql = "SELECT cancel_requested FROM tasks WHERE id = ?;";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  bind_text(stmt->get(), 1, id.value());

  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return sqlite3_column_int(stmt->get(), 0) != 0;
}

auto SqliteTaskStore::list_non_terminal() -> Result<std::vector<TaskId>> {
  constexpr auto sql = R"(
    SELECT id FROM tasks
    WHERE status NOT IN ('SUCCESS', 'FAILED', 'CANCELLED')
    ORDER BY created_at;
  )";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  std::vector<TaskId> ids;
  int rc;
  while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
    ids.emplace_back(col_text(stmt->get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return ids;
}

}  // namespace fixloop
