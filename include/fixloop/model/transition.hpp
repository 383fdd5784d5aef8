#pragma once

#include "fixloop/model/task.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fixloop {

enum class Event : std::uint8_t {
  Claimed,
  PlanProduced,
  PatchProduced,
  ReviewApproved,
  ReviewRejected,
  TestPassed,
  TestFailed,
  CancelRequested,
  InfrastructureError,
};

[[nodiscard]] constexpr auto event_name(Event e) noexcept -> std::string_view {
  constexpr std::string_view names[] = {
      "claimed",        "plan_produced", "patch_produced",
      "review_approved", "review_rejected", "test_passed",
      "test_failed",    "cancel_requested", "infrastructure_error",
  };
  return names[static_cast<std::uint8_t>(e)];
}

// What the orchestrator must do to the task record besides the status change.
enum class Effect : std::uint8_t {
  None,
  CreateFirstAttempt,  // append attempt 0 carrying the plan
  RetryCoding,         // same attempt, rejection_count + 1
  AppendAttempt,       // new attempt index + 1 with carried context
  Succeed,
  FailLogic,
  FailInfrastructure,
  Cancel,
};

// Guard evaluated against the current attempt.
enum class Guard : std::uint8_t {
  Always,
  ReviewRetriesLeft,
  ReviewExhaustedAttemptsLeft,
  ReviewExhaustedNoAttemptsLeft,
  AttemptsLeft,
  AttemptsExhausted,
};

struct GuardInputs {
  int rejection_count{0};
  int review_retry_limit{limits::kDefaultReviewRetryLimit};
  int attempt_index{0};
  int max_attempts{limits::kDefaultMaxAttempts};
};

struct TransitionRow {
  TaskStatus from;
  Event event;
  Guard guard;
  TaskStatus to;
  Effect effect;
};

struct Transition {
  TaskStatus to;
  Effect effect;
};

namespace detail {

using enum TaskStatus;

// Cancellation and infrastructure rows apply to every non-terminal state and
// are handled separately in next_transition().
inline constexpr std::array<TransitionRow, 10> kTransitionTable = {{
    {Pending, Event::Claimed, Guard::Always, Planning, Effect::None},
    {Planning, Event::PlanProduced, Guard::Always, Coding,
     Effect::CreateFirstAttempt},
    {Coding, Event::PatchProduced, Guard::Always, Reviewing, Effect::None},
    {Reviewing, Event::ReviewApproved, Guard::Always, Testing, Effect::None},
    {Reviewing, Event::ReviewRejected, Guard::ReviewRetriesLeft, Coding,
     Effect::RetryCoding},
    {Reviewing, Event::ReviewRejected, Guard::ReviewExhaustedAttemptsLeft,
     Coding, Effect::AppendAttempt},
    {Reviewing, Event::ReviewRejected, Guard::ReviewExhaustedNoAttemptsLeft,
     Failed, Effect::FailLogic},
    {Testing, Event::TestPassed, Guard::Always, Success, Effect::Succeed},
    {Testing, Event::TestFailed, Guard::AttemptsLeft, Coding,
     Effect::AppendAttempt},
    {Testing, Event::TestFailed, Guard::AttemptsExhausted, Failed,
     Effect::FailLogic},
}};

}  // namespace detail

[[nodiscard]] constexpr auto guard_holds(Guard g, const GuardInputs& in) noexcept
    -> bool {
  bool review_left = in.rejection_count < in.review_retry_limit;
  bool attempts_left = in.attempt_index + 1 < in.max_attempts;
  switch (g) {
    case Guard::Always: return true;
    case Guard::ReviewRetriesLeft: return review_left;
    case Guard::ReviewExhaustedAttemptsLeft: return !review_left && attempts_left;
    case Guard::ReviewExhaustedNoAttemptsLeft:
      return !review_left && !attempts_left;
    case Guard::AttemptsLeft: return attempts_left;
    case Guard::AttemptsExhausted: return !attempts_left;
  }
  return false;
}

// Returns the transition for (from, event) or nullopt when the table has no
// edge; terminal states have no outgoing edges at all.
[[nodiscard]] constexpr auto next_transition(TaskStatus from, Event event,
                                             const GuardInputs& in = {})
    -> std::optional<Transition> {
  if (is_terminal(from)) {
    return std::nullopt;
  }
  if (event == Event::CancelRequested) {
    return Transition{TaskStatus::Cancelled, Effect::Cancel};
  }
  if (event == Event::InfrastructureError) {
    return Transition{TaskStatus::Failed, Effect::FailInfrastructure};
  }
  for (const auto& row : detail::kTransitionTable) {
    if (row.from == from && row.event == event && guard_holds(row.guard, in)) {
      return Transition{row.to, row.effect};
    }
  }
  return std::nullopt;
}

}  // namespace fixloop
