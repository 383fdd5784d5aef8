#include "fixloop/cli/commands.hpp"
#include "fixloop/cli/context.hpp"
#include "fixloop/model/json.hpp"
#include "fixloop/model/state_strings.hpp"
#include "fixloop/service/task_service.hpp"

#include <print>

namespace fixloop::cli {

namespace {

auto print_view(const TaskView& v) -> void {
  std::println("Task:     {}", v.id);
  std::println("Status:   {}{}", task_status_name(v.status),
               v.cancel_requested && !is_terminal(v.status)
                   ? " (cancellation requested)"
                   : "");
  std::println("Created:  {}", format_timestamp(v.created_at));
  if (v.completed_at) {
    std::println("Finished: {}", format_timestamp(*v.completed_at));
  }

  if (!v.attempts.empty()) {
    std::println("");
    std::println("{:<8} {:<7} {:<10} {:<9} {:<8} {:<8}", "ATTEMPT", "PATCH",
                 "REVIEW", "REJECTED", "TEST", "TOKENS");
    for (const auto& a : v.attempts) {
      std::string review = "-";
      if (a.review_approved) {
        review = *a.review_approved ? "approved" : "rejected";
      }
      std::string test = "-";
      if (a.test_success) {
        test = *a.test_success ? "passed" : (a.timed_out ? "timeout" : "failed");
      }
      std::println("{:<8} {:<7} {:<10} {:<9} {:<8} {:<8}", a.index,
                   a.has_patch ? "yes" : "no", review, a.rejection_count, test,
                   a.tokens_used);
    }
  }

  if (v.result_summary) {
    std::println("");
    std::println("Result:   {}", *v.result_summary);
    if (v.failure_kind != FailureKind::None) {
      std::println("Reason:   {} ({})", v.failure_reason,
                   failure_kind_name(v.failure_kind));
    }
    if (v.needs_human_review) {
      std::println("Flagged for human review");
    }
    if (v.final_patch) {
      std::println("Patch:    {}", v.final_patch->filename);
    }
  }
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
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
  auto view = service.query(TaskId{opts.task_id});
  if (!view) {
    std::println(stderr, "Error: Task {}: {}", opts.task_id,
                 view.error().message());
    return view.error() == Error::NotFound ? 3 : 1;
  }

  if (opts.json) {
    nlohmann::json j = *view;
    std::println("{}", j.dump(2));
  } else {
    print_view(*view);
  }
  return 0;
}

}  // namespace fixloop::cli
