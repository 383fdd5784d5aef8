#pragma once

#include "fixloop/core/constants.hpp"
#include "fixloop/util/id.hpp"
#include "fixloop/util/util.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fixloop {

enum class TaskStatus : std::uint8_t {
  Pending,
  Planning,
  Coding,
  Reviewing,
  Testing,
  Success,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Success || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

// Structured reason attached to a terminal status.
enum class FailureKind : std::uint8_t {
  None,
  LogicExhausted,
  Infrastructure,
  Cancelled,
};

enum class RiskLevel : std::uint8_t {
  Unknown,
  Low,
  Medium,
  High,
};

struct RepoRef {
  std::string url;
  std::string branch{"main"};
};

struct Patch {
  std::string filename;
  std::string code;
  std::string explanation;
  // Extra files written beside the patch, e.g. requirements.txt
  std::map<std::string, std::string> dependencies;
};

struct Review {
  bool approved{false};
  std::string comments;
  RiskLevel risk{RiskLevel::Unknown};
  bool security_issues{false};
};

struct TestResult {
  bool success{false};
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  std::chrono::milliseconds duration{0};
  bool timed_out{false};
  bool resource_exceeded{false};
};

struct Usage {
  int generation_calls{0};
  std::int64_t tokens_used{0};
};

// Context handed to a CODING phase that follows a failed test or a
// rejected review. Only the immediately preceding outcome is kept.
struct CarriedContext {
  std::optional<Patch> previous_patch;
  std::string test_stdout_tail;
  std::string test_stderr_tail;
  std::string review_comments;

  [[nodiscard]] auto empty() const -> bool {
    return !previous_patch && test_stdout_tail.empty() &&
           test_stderr_tail.empty() && review_comments.empty();
  }
};

struct Attempt {
  int index{0};
  std::optional<std::string> plan;
  std::optional<Patch> patch;
  std::optional<Review> review;
  std::optional<TestResult> test;
  Usage usage;
  int rejection_count{0};
  CarriedContext carried;
  std::vector<std::string> diagnostics;

  // Fields are filled in phase order: plan, patch, review, test.
  [[nodiscard]] auto is_well_ordered() const -> bool {
    if (test && !review) return false;
    if (review && !patch) return false;
    if (patch && !plan) return false;
    return true;
  }
};

struct Task {
  TaskId id;
  RepoRef repo;
  std::string issue;
  std::optional<std::string> test_command;
  std::string language{"python"};
  TaskStatus status{TaskStatus::Pending};
  std::vector<Attempt> attempts;
  int max_attempts{limits::kDefaultMaxAttempts};
  TimePoint created_at{};
  std::optional<TimePoint> completed_at;
  std::string result_summary;
  FailureKind failure_kind{FailureKind::None};
  std::string failure_reason;
  bool cancel_requested{false};
  bool needs_human_review{false};
  // Bumped by every successful store write; compared on compare-and-set.
  std::uint64_t version{0};

  [[nodiscard]] auto current_attempt() -> Attempt* {
    return attempts.empty() ? nullptr : &attempts.back();
  }
  [[nodiscard]] auto current_attempt() const -> const Attempt* {
    return attempts.empty() ? nullptr : &attempts.back();
  }
};

struct SubmitRequest {
  std::string repository_url;
  std::string branch{"main"};
  std::string issue_description;
  std::optional<std::string> test_command;
  std::string language{"python"};
  std::optional<int> max_attempts;
};

struct SubmitResponse {
  TaskId id;
  TaskStatus status{TaskStatus::Pending};
  TimePoint created_at{};
};

struct AttemptSummary {
  int index{0};
  bool has_patch{false};
  std::optional<bool> review_approved;
  int rejection_count{0};
  std::optional<bool> test_success;
  std::optional<int> exit_code;
  bool timed_out{false};
  std::int64_t tokens_used{0};
};

struct TaskSummary {
  TaskId id;
  std::string repository_url;
  std::string language;
  TaskStatus status{TaskStatus::Pending};
  FailureKind failure_kind{FailureKind::None};
  int attempt_count{0};
  TimePoint created_at{};
  std::optional<TimePoint> completed_at;
};

struct TaskView {
  TaskId id;
  TaskStatus status{TaskStatus::Pending};
  bool cancel_requested{false};
  TimePoint created_at{};
  std::optional<TimePoint> completed_at;
  std::vector<AttemptSummary> attempts;
  // Populated only for terminal tasks
  std::optional<std::string> result_summary;
  FailureKind failure_kind{FailureKind::None};
  std::string failure_reason;
  std::optional<Patch> final_patch;
  bool needs_human_review{false};
};

[[nodiscard]] auto summarize(const Attempt& attempt) -> AttemptSummary;
[[nodiscard]] auto make_view(const Task& task) -> TaskView;

}  // namespace fixloop
