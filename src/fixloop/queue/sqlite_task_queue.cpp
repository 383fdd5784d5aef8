#include "fixloop/queue/sqlite_task_queue.hpp"

#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <sqlite3.h>

namespace fixloop {

namespace {

auto now_ms() -> std::int64_t {
  return to_millis(Clock::now());
}

}  // namespace

SqliteTaskQueue::SqliteTaskQueue(std::string_view db_path) : db_(db_path) {
}

auto SqliteTaskQueue::open() -> Result<void> {
  std::lock_guard lock(mutex_);
  if (auto r = db_.open(); !r) {
    return r;
  }
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS task_queue (
      task_id TEXT PRIMARY KEY,
      enqueued_at INTEGER NOT NULL,
      visible_at INTEGER NOT NULL,
      receipt TEXT NOT NULL DEFAULT '',
      owner TEXT NOT NULL DEFAULT '',
      deliveries INTEGER NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_task_queue_visible
      ON task_queue(visible_at, enqueued_at);
  )";
  if (auto r = db_.execute(sql); !r) {
    db_.close();
    return r;
  }
  return ok();
}

auto SqliteTaskQueue::enqueue(const TaskId& id) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_queue (task_id, enqueued_at, visible_at)
    VALUES (?, ?, ?)
    ON CONFLICT(task_id) DO NOTHING;
  )";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  auto now = now_ms();
  bind_text(stmt->get(), 1, id.value());
  sqlite3_bind_int64(stmt->get(), 2, now);
  sqlite3_bind_int64(stmt->get(), 3, now);
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    log::error("Failed to enqueue task {}: {}", id, db_.last_error());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskQueue::claim(std::string_view owner,
                            std::chrono::seconds visibility_timeout)
    -> Result<std::optional<Delivery>> {
  std::lock_guard lock(mutex_);
  Database::Transaction tx(db_);
  if (auto r = tx.begin(); !r) {
    return std::unexpected(r.error());
  }

  auto now = now_ms();
  Delivery delivery;
  {
    constexpr auto sql = R"(
      SELECT task_id, deliveries FROM task_queue
      WHERE visible_at <= ?
      ORDER BY visible_at, enqueued_at
      LIMIT 1;
    )";
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    sqlite3_bind_int64(stmt->get(), 1, now);

    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
      return std::optional<Delivery>{};
    }
    if (rc != SQLITE_ROW) {
      return fail(Error::DatabaseQueryFailed);
    }
    delivery.task_id = TaskId{col_text(stmt->get(), 0)};
    delivery.deliveries = sqlite3_column_int(stmt->get(), 1) + 1;
    delivery.receipt = ReceiptId{generate_uuid()};
  }

  {
    constexpr auto sql = R"(
      UPDATE task_queue
      SET visible_at = ?, receipt = ?, owner = ?, deliveries = ?
      WHERE task_id = ?;
    )";
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    auto* s = stmt->get();
    sqlite3_bind_int64(
        s, 1,
        now + std::chrono::duration_cast<std::chrono::milliseconds>(
                  visibility_timeout)
                  .count());
    bind_text(s, 2, delivery.receipt.value());
    bind_text(s, 3, owner);
    sqlite3_bind_int(s, 4, delivery.deliveries);
    bind_text(s, 5, delivery.task_id.value());
    if (sqlite3_step(s) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }

  if (auto r = tx.commit(); !r) {
    return std::unexpected(r.error());
  }
  if (delivery.deliveries > 1) {
    log::debug("Task {} redelivered (delivery #{})", delivery.task_id,
               delivery.deliveries);
  }
  return std::optional<Delivery>{std::move(delivery)};
}

auto SqliteTaskQueue::ack(const Delivery& delivery) -> Result<bool> {
  constexpr auto sql =
      "DELETE FROM task_queue WHERE task_id = ? AND receipt = ?;";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  bind_text(stmt->get(), 1, delivery.task_id.value());
  bind_text(stmt->get(), 2, delivery.receipt.value());
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return db_.changes() == 1;
}

auto SqliteTaskQueue::nack(const Delivery& delivery,
                           std::chrono::milliseconds delay) -> Result<bool> {
  std::lock_guard lock(mutex_);
  return set_visible_at(delivery, now_ms() + delay.count());
}

auto SqliteTaskQueue::extend(const Delivery& delivery,
                             std::chrono::seconds visibility_timeout)
    -> Result<bool> {
  std::lock_guard lock(mutex_);
  return set_visible_at(
      delivery,
      now_ms() + std::chrono::duration_cast<std::chrono::milliseconds>(
                     visibility_timeout)
                     .count());
}

auto SqliteTaskQueue::set_visible_at(const Delivery& delivery,
                                     std::int64_t visible_at_ms)
    -> Result<bool> {
  constexpr auto sql = R"(
    UPDATE task_queue SET visible_at = ?
    WHERE task_id = ? AND receipt = ?;
  )";
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  sqlite3_bind_int64(stmt->get(), 1, visible_at_ms);
  bind_text(stmt->get(), 2, delivery.task_id.value());
  bind_text(stmt->get(), 3, delivery.receipt.value());
  if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return db_.changes() == 1;
}

auto SqliteTaskQueue::contains(const TaskId& id) -> Result<bool> {
  constexpr auto sql = "SELECT 1 FROM task_queue WHERE task_id = ?;";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  bind_text(stmt->get(), 1, id.value());
  int rc = sqlite3_step(stmt->get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return rc == SQLITE_ROW;
}

auto SqliteTaskQueue::depth() -> Result<std::size_t> {
  constexpr auto sql = "SELECT COUNT(*) FROM task_queue;";

  std::lock_guard lock(mutex_);
  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
}

}  // namespace fixloop
