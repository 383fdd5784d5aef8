#pragma once

#include "fixloop/storage/database.hpp"
#include "fixloop/storage/task_store.hpp"

#include <mutex>
#include <string_view>

namespace fixloop {

class SqliteTaskStore : public ITaskStore {
public:
  explicit SqliteTaskStore(std::string_view db_path);
  ~SqliteTaskStore() override = default;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;

  [[nodiscard]] auto create(const Task& task) -> Result<void> override;
  [[nodiscard]] auto get(const TaskId& id) -> Result<Task> override;
  [[nodiscard]] auto compare_and_set(const Task& next, TaskStatus expected)
      -> Result<bool> override;
  [[nodiscard]] auto append_attempt(const Task& next, TaskStatus expected)
      -> Result<bool> override;
  [[nodiscard]] auto list(const TaskFilter& filter)
      -> Result<std::vector<TaskSummary>> override;
  [[nodiscard]] auto count(const TaskFilter& filter)
      -> Result<std::size_t> override;
  [[nodiscard]] auto purge_terminal(TimePoint cutoff)
      -> Result<std::size_t> override;
  [[nodiscard]] auto request_cancel(const TaskId& id)
      -> Result<CancelOutcome> override;
  [[nodiscard]] auto is_cancel_requested(const TaskId& id)
      -> Result<bool> override;
  [[nodiscard]] auto list_non_terminal()
      -> Result<std::vector<TaskId>> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto write(const Task& next, TaskStatus expected,
                           bool appending) -> Result<bool>;
  [[nodiscard]] auto load_task(const TaskId& id) -> Result<Task>;
  [[nodiscard]] auto load_attempts(Task& task) -> Result<void>;
  [[nodiscard]] auto upsert_attempt(const TaskId& id, const Attempt& attempt)
      -> Result<void>;

  std::mutex mutex_;
  Database db_;
};

}  // namespace fixloop
