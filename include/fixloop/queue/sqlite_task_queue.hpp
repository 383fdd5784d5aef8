#pragma once

#include "fixloop/queue/task_queue.hpp"
#include "fixloop/storage/database.hpp"

#include <cstdint>
#include <mutex>
#include <string_view>

namespace fixloop {

// Queue rows live in their own table, usually in the same database file as
// the task store but on a separate connection.
class SqliteTaskQueue : public ITaskQueue {
public:
  explicit SqliteTaskQueue(std::string_view db_path);
  ~SqliteTaskQueue() override = default;

  SqliteTaskQueue(const SqliteTaskQueue&) = delete;
  SqliteTaskQueue& operator=(const SqliteTaskQueue&) = delete;

  [[nodiscard]] auto open() -> Result<void>;

  [[nodiscard]] auto enqueue(const TaskId& id) -> Result<void> override;
  [[nodiscard]] auto claim(std::string_view owner,
                           std::chrono::seconds visibility_timeout)
      -> Result<std::optional<Delivery>> override;
  [[nodiscard]] auto ack(const Delivery& delivery) -> Result<bool> override;
  [[nodiscard]] auto nack(const Delivery& delivery,
                          std::chrono::milliseconds delay)
      -> Result<bool> override;
  [[nodiscard]] auto extend(const Delivery& delivery,
                            std::chrono::seconds visibility_timeout)
      -> Result<bool> override;
  [[nodiscard]] auto contains(const TaskId& id) -> Result<bool> override;
  [[nodiscard]] auto depth() -> Result<std::size_t> override;

private:
  [[nodiscard]] auto set_visible_at(const Delivery& delivery,
                                    std::int64_t visible_at_ms)
      -> Result<bool>;

  std::mutex mutex_;
  Database db_;
};

}  // namespace fixloop
