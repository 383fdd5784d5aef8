#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/model/state_strings.hpp"
#include "fixloop/service/task_service.hpp"

#include <algorithm>
#include <cctype>
#include <print>

namespace fixloop::cli {

auto cmd_list(const ListOptions& opts) -> int {
  TaskFilter filter{.limit = opts.limit, .offset = opts.offset};
  if (opts.status) {
    std::string name = *opts.status;
    std::ranges::transform(name, name.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    filter.status = parse_task_status(name);
    if (!filter.status) {
      std::println(stderr, "Error: Unknown status: {}", *opts.status);
      return 2;
    }
  }

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
  auto page = service.list(filter);
  if (!page) {
    std::println(stderr, "Error: {}", page.error().message());
    return 1;
  }
  if (page->items.empty()) {
    if (page->total > 0) {
      std::println("No tasks at offset {} ({} total).", filter.offset,
                   page->total);
    } else {
      std::println("No tasks found.");
    }
    return 0;
  }

  std::println("{:<36} {:<10} {:<15} {:<8} {:<20} {}", "TASK_ID", "STATUS",
               "REASON", "ATTEMPTS", "CREATED", "REPOSITORY");
  for (const auto& t : page->items) {
    std::println("{:<36} {:<10} {:<15} {:<8} {:<20} {}", t.id,
                 task_status_name(t.status),
                 t.failure_kind == FailureKind::None
                     ? "-"
                     : failure_kind_name(t.failure_kind),
                 t.attempt_count, format_timestamp(t.created_at),
                 t.repository_url);
  }
  std::println("Showing {}-{} of {} tasks.", filter.offset + 1,
               filter.offset + page->items.size(), page->total);
  return 0;
}

}  // namespace fixloop::cli
