#pragma once

#include "fixloop/core/error.hpp"
#include "fixloop/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace fixloop {

struct Delivery {
  TaskId task_id;
  ReceiptId receipt;
  // 1 on first delivery; larger values mean a redelivery
  int deliveries{1};
};

// At-least-once delivery of task ids. A claimed id stays invisible for the
// visibility timeout and reappears unless it is acked.
class ITaskQueue {
public:
  virtual ~ITaskQueue() = default;

  // Enqueuing an id that is already queued is a no-op.
  [[nodiscard]] virtual auto enqueue(const TaskId& id) -> Result<void> = 0;

  [[nodiscard]] virtual auto claim(std::string_view owner,
                                   std::chrono::seconds visibility_timeout)
      -> Result<std::optional<Delivery>> = 0;

  // ack, nack and extend return false when the receipt is stale, i.e. the
  // id was redelivered to someone else in the meantime.
  [[nodiscard]] virtual auto ack(const Delivery& delivery) -> Result<bool> = 0;
  [[nodiscard]] virtual auto nack(const Delivery& delivery,
                                  std::chrono::milliseconds delay)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto extend(const Delivery& delivery,
                                    std::chrono::seconds visibility_timeout)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto contains(const TaskId& id) -> Result<bool> = 0;
  [[nodiscard]] virtual auto depth() -> Result<std::size_t> = 0;
};

}  // namespace fixloop
