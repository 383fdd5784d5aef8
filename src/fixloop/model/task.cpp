#include "fixloop/model/task.hpp"

namespace fixloop {

auto summarize(const Attempt& attempt) -> AttemptSummary {
  AttemptSummary s;
  s.index = attempt.index;
  s.has_patch = attempt.patch.has_value();
  if (attempt.review) {
    s.review_approved = attempt.review->approved;
  }
  s.rejection_count = attempt.rejection_count;
  if (attempt.test) {
    s.test_success = attempt.test->success;
    s.exit_code = attempt.test->exit_code;
    s.timed_out = attempt.test->timed_out;
  }
  s.tokens_used = attempt.usage.tokens_used;
  return s;
}

auto make_view(const Task& task) -> TaskView {
  TaskView view;
  view.id = task.id;
  view.status = task.status;
  view.cancel_requested = task.cancel_requested;
  view.created_at = task.created_at;
  view.completed_at = task.completed_at;
  view.attempts.reserve(task.attempts.size());
  for (const auto& attempt : task.attempts) {
    view.attempts.push_back(summarize(attempt));
  }
  if (is_terminal(task.status)) {
    view.result_summary = task.result_summary;
    view.failure_kind = task.failure_kind;
    view.failure_reason = task.failure_reason;
    view.needs_human_review = task.needs_human_review;
    if (task.status == TaskStatus::Success && !task.attempts.empty()) {
      view.final_patch = task.attempts.back().patch;
    }
  }
  return view;
}

}  // namespace fixloop
