#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/model/state_strings.hpp"
#include "fixloop/service/task_service.hpp"
#include "fixloop/util/log.hpp"

#include <print>

namespace fixloop::cli {

auto cmd_submit(const SubmitOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  log::set_level(config->worker.log_level);

  SubmitRequest request{
      .repository_url = opts.repository_url,
      .branch = opts.branch,
      .issue_description = opts.issue,
      .test_command = opts.test_command,
      .language = opts.language,
      .max_attempts = opts.max_attempts,
  };
  if (auto problem = validate_submission(request); !problem.empty()) {
    std::println(stderr, "Error: {}", problem);
    return 2;
  }

  auto storage = open_storage(*config);
  if (!storage) {
    std::println(stderr, "Error: Failed to open database: {}",
                 storage.error().message());
    return 1;
  }

  TaskService service(*storage->store, *storage->queue,
                      config->orchestrator.max_attempts);
  auto submitted = service.submit(request);
  if (!submitted) {
    std::println(stderr, "Error: {}", submitted.error().message());
    return 1;
  }
  std::println("Task:    {}", submitted->id);
  std::println("Status:  {}", task_status_name(submitted->status));
  std::println("Created: {}", format_timestamp(submitted->created_at));
  return 0;
}

}  // namespace fixloop::cli
