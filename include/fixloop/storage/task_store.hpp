#pragma once

#include "fixloop/core/error.hpp"
#include "fixloop/model/task.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace fixloop {

struct TaskFilter {
  std::optional<TaskStatus> status;
  std::size_t limit{10};
  std::size_t offset{0};
};

enum class CancelOutcome {
  Requested,
  AlreadyRequested,
  AlreadyTerminal,
};

// Durable task records. Every mutation is one atomic read-modify-write;
// no lock is held between calls.
class ITaskStore {
public:
  virtual ~ITaskStore() = default;

  // Fails with AlreadyExists if the id is taken.
  [[nodiscard]] virtual auto create(const Task& task) -> Result<void> = 0;

  // Fails with NotFound for an unknown id.
  [[nodiscard]] virtual auto get(const TaskId& id) -> Result<Task> = 0;

  // Writes `next` only if the stored status equals `expected` and the stored
  // version equals next.version; returns false on mismatch. The attempt
  // count must not change (see append_attempt).
  [[nodiscard]] virtual auto compare_and_set(const Task& next,
                                             TaskStatus expected)
      -> Result<bool> = 0;

  // Same as compare_and_set, and additionally inserts next.attempts.back()
  // as a new attempt record. The new attempt's index must equal the stored
  // attempt count and stay below max_attempts.
  [[nodiscard]] virtual auto append_attempt(const Task& next,
                                            TaskStatus expected)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto list(const TaskFilter& filter)
      -> Result<std::vector<TaskSummary>> = 0;

  // Tasks matching filter.status, ignoring limit and offset.
  [[nodiscard]] virtual auto count(const TaskFilter& filter)
      -> Result<std::size_t> = 0;

  // Deletes terminal tasks completed before `cutoff`, attempts included.
  // Returns how many tasks were removed.
  [[nodiscard]] virtual auto purge_terminal(TimePoint cutoff)
      -> Result<std::size_t> = 0;

  // Sets the cancellation marker without touching the version, so a
  // concurrently running orchestrator still owns the record.
  [[nodiscard]] virtual auto request_cancel(const TaskId& id)
      -> Result<CancelOutcome> = 0;

  [[nodiscard]] virtual auto is_cancel_requested(const TaskId& id)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto list_non_terminal()
      -> Result<std::vector<TaskId>> = 0;
};

}  // namespace fixloop
