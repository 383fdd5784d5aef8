#include "fixloop/service/task_service.hpp"

#include "fixloop/model/state_strings.hpp"
#include "fixloop/sandbox/sandbox.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace fixloop {

namespace {

constexpr std::array<std::string_view, 6> kRepoSchemes = {
    "http://", "https://", "ssh://", "git://", "file://", "git@",
};

auto is_blank(std::string_view s) -> bool {
  return std::ranges::all_of(
      s, [](unsigned char c) { return std::isspace(c) != 0; });
}

auto valid_repository(std::string_view url) -> bool {
  if (url.starts_with('/')) {
    return true;
  }
  return std::ranges::any_of(kRepoSchemes, [url](std::string_view scheme) {
    return url.starts_with(scheme) && url.size() > scheme.size();
  });
}

auto valid_branch(std::string_view branch) -> bool {
  if (branch.empty() || branch.starts_with('-') ||
      branch.find("..") != std::string_view::npos) {
    return false;
  }
  return std::ranges::none_of(
      branch, [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

auto validate_submission(const SubmitRequest& request) -> std::string {
  if (!valid_repository(request.repository_url)) {
    return std::format("unsupported repository url '{}'",
                       request.repository_url);
  }
  if (!valid_branch(request.branch)) {
    return std::format("invalid branch name '{}'", request.branch);
  }
  if (is_blank(request.issue_description)) {
    return "issue description is empty";
  }
  if (!is_supported_language(request.language)) {
    return std::format("unsupported language '{}'", request.language);
  }
  if (request.max_attempts && (*request.max_attempts < 1 ||
                               *request.max_attempts > limits::kMaxAttemptsCeiling)) {
    return std::format("max_attempts must be between 1 and {}",
                       limits::kMaxAttemptsCeiling);
  }
  return {};
}

TaskService::TaskService(ITaskStore& store, ITaskQueue& queue,
                         int default_max_attempts)
    : store_(store),
      queue_(queue),
      default_max_attempts_(default_max_attempts) {
}

auto TaskService::submit(const SubmitRequest& request)
    -> Result<SubmitResponse> {
  if (auto problem = validate_submission(request); !problem.empty()) {
    log::warn("Rejected submission: {}", problem);
    return fail(Error::ValidationError);
  }

  Task task;
  task.id = TaskId{generate_uuid()};
  task.repo = RepoRef{.url = request.repository_url, .branch = request.branch};
  task.issue = request.issue_description;
  if (request.test_command && !is_blank(*request.test_command)) {
    task.test_command = request.test_command;
  }
  task.language = request.language;
  task.max_attempts = request.max_attempts.value_or(
      std::clamp(default_max_attempts_, 1, limits::kMaxAttemptsCeiling));
  task.created_at = std::chrono::floor<std::chrono::milliseconds>(Clock::now());

  if (auto r = store_.create(task); !r) {
    log::error("Failed to store task {}: {}", task.id, r.error().message());
    return fail(r.error());
  }
  if (auto r = queue_.enqueue(task.id); !r) {
    // The record exists; worker startup recovery queues it again
    log::error("Task {} stored but not queued: {}", task.id,
               r.error().message());
  }
  log::info("Submitted task {} for {} ({})", task.id, task.repo.url,
            task.language);

  return SubmitResponse{.id = task.id,
                        .status = task.status,
                        .created_at = task.created_at};
}

auto TaskService::query(const TaskId& id) -> Result<TaskView> {
  auto task = store_.get(id);
  if (!task) {
    return fail(task.error());
  }
  return make_view(*task);
}

auto TaskService::cancel(const TaskId& id) -> Result<CancelOutcome> {
  auto task = store_.get(id);
  if (!task) {
    return fail(task.error());
  }
  if (is_terminal(task->status)) {
    return CancelOutcome::AlreadyTerminal;
  }

  if (task->status == TaskStatus::Pending) {
    Task next = *task;
    next.status = TaskStatus::Cancelled;
    next.completed_at = Clock::now();
    next.failure_kind = FailureKind::Cancelled;
    next.failure_reason = "cancelled before start";
    next.result_summary = "Cancelled";
    auto written = store_.compare_and_set(next, TaskStatus::Pending);
    if (!written) {
      return fail(written.error());
    }
    if (*written) {
      log::info("Task {} cancelled while pending", id);
      return CancelOutcome::Requested;
    }
    // A worker claimed it in the meantime; fall back to the marker
  }

  auto outcome = store_.request_cancel(id);
  if (outcome && *outcome == CancelOutcome::Requested) {
    log::info("Cancellation requested for task {}", id);
  }
  return outcome;
}

auto TaskService::list(const TaskFilter& filter) -> Result<TaskPage> {
  auto items = store_.list(filter);
  if (!items) {
    return fail(items.error());
  }
  auto total = store_.count(filter);
  if (!total) {
    return fail(total.error());
  }
  return TaskPage{.items = std::move(*items), .total = *total};
}

}  // namespace fixloop
