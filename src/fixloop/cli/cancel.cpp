#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/service/task_service.hpp"

#include <print>

namespace fixloop::cli {

auto cmd_cancel(const CancelOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  auto storage = open_storage(*config);
  if (!storage) {
    std::println(stderr, "Error: Failed to open database: {}",
                 storage.error().message());
    return 1;
  }

  TaskService service(*storage->store, *storage->queue,
                      config->orchestrator.max_attempts);
  auto outcome = service.cancel(TaskId{opts.task_id});
  if (!outcome) {
    std::println(stderr, "Error: Task {}: {}", opts.task_id,
                 outcome.error().message());
    return outcome.error() == Error::NotFound ? 3 : 1;
  }

  switch (*outcome) {
    case CancelOutcome::Requested:
      std::println("Cancellation requested for {}", opts.task_id);
      break;
    case CancelOutcome::AlreadyRequested:
      std::println("Cancellation already requested for {}", opts.task_id);
      break;
    case CancelOutcome::AlreadyTerminal:
      std::println("Task {} has already finished", opts.task_id);
      break;
  }
  return 0;
}

}  // namespace fixloop::cli
