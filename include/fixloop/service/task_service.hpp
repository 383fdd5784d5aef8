#pragma once

#include "fixloop/core/error.hpp"
#include "fixloop/model/task.hpp"
#include "fixloop/queue/task_queue.hpp"
#include "fixloop/storage/task_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fixloop {

// One page of a listing plus the number of tasks matching the filter.
struct TaskPage {
  std::vector<TaskSummary> items;
  std::size_t total{0};
};

// Submission, query and cancellation entry points used by the CLI.
class TaskService {
public:
  TaskService(ITaskStore& store, ITaskQueue& queue, int default_max_attempts);

  // ValidationError for a malformed request; nothing is stored then.
  [[nodiscard]] auto submit(const SubmitRequest& request)
      -> Result<SubmitResponse>;

  [[nodiscard]] auto query(const TaskId& id) -> Result<TaskView>;

  // Idempotent. A PENDING task is cancelled immediately; a running one gets
  // the cancellation marker and is stopped by its worker.
  [[nodiscard]] auto cancel(const TaskId& id) -> Result<CancelOutcome>;

  [[nodiscard]] auto list(const TaskFilter& filter) -> Result<TaskPage>;

private:
  ITaskStore& store_;
  ITaskQueue& queue_;
  int default_max_attempts_;
};

// Empty when the request is acceptable, otherwise the first problem found.
[[nodiscard]] auto validate_submission(const SubmitRequest& request)
    -> std::string;

}  // namespace fixloop
