#include "fixloop/orchestrator/orchestrator.hpp"

#include "fixloop/model/state_strings.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <algorithm>
#include <utility>

namespace fixloop {

struct Orchestrator::Step {
  bool halt{false};
  RunOutcome outcome{RunOutcome::Completed};

  [[nodiscard]] static auto proceed() -> Step {
    return {};
  }
  [[nodiscard]] static auto stop(RunOutcome outcome) -> Step {
    return {.halt = true, .outcome = outcome};
  }
};

namespace {

auto merge_output(Attempt& attempt, const PhaseOutput& out) -> void {
  attempt.usage.generation_calls += out.usage.generation_calls;
  attempt.usage.tokens_used += out.usage.tokens_used;
  attempt.diagnostics.insert(attempt.diagnostics.end(), out.diagnostics.begin(),
                             out.diagnostics.end());
}

auto guard_inputs(const Task& task, int review_retry_limit) -> GuardInputs {
  GuardInputs in{.review_retry_limit = review_retry_limit,
                 .max_attempts = task.max_attempts};
  if (const auto* attempt = task.current_attempt()) {
    in.rejection_count = attempt->rejection_count;
    in.attempt_index = attempt->index;
  }
  return in;
}

}  // namespace

auto make_orchestrator_options(const SystemConfig& config)
    -> OrchestratorOptions {
  const auto& o = config.orchestrator;
  const auto& s = config.sandbox;
  OrchestratorOptions options{
      .review_retry_limit = o.review_retry_limit,
      .generation_max_retries = o.generation_max_retries,
      .backoff_base = std::chrono::milliseconds(o.backoff_base_ms),
      .backoff_max = std::chrono::milliseconds(o.backoff_max_ms),
      .output_tail_bytes = o.output_tail_bytes,
      .slot_acquire_timeout = std::chrono::seconds(s.slot_acquire_timeout_sec),
  };
  options.limits.timeout = std::chrono::seconds(s.timeout_sec);
  options.limits.memory_bytes =
      parse_memory_size(s.memory).value_or(options.limits.memory_bytes);
  options.limits.cpu = s.cpu;
  options.limits.pids_limit = s.pids_limit;
  return options;
}

Orchestrator::Orchestrator(ITaskStore& store, IGenerator& generator,
                           ISandbox& sandbox, SlotPool& slots,
                           OrchestratorOptions options)
    : store_(store),
      options_(std::move(options)),
      sandbox_(sandbox),
      phases_(generator, sandbox, slots, options_) {
}

auto Orchestrator::run(const TaskId& id, const RunSignals& signals)
    -> Result<RunOutcome> {
  auto loaded = store_.get(id);
  if (!loaded) {
    log::error("Task {}: failed to load: {}", id, loaded.error().message());
    return fail(loaded.error());
  }
  Task task = std::move(*loaded);
  if (is_terminal(task.status)) {
    log::info("Task {} is already {}", id, task_status_name(task.status));
    return RunOutcome::Completed;
  }
  log::info("Task {}: resuming in {} with {} attempts", id,
            task_status_name(task.status), task.attempts.size());

  auto cancelled = cancel_requested(task, signals);
  if (!cancelled) {
    return fail(cancelled.error());
  }
  if (*cancelled) {
    auto step = finish(task, Event::CancelRequested, "cancelled by request");
    if (!step) {
      return fail(step.error());
    }
    return step->outcome;
  }

  if (auto usable = sandbox_.check(); !usable) {
    log::error("Task {}: sandbox runtime unavailable: {}", id,
               usable.error().message());
    auto step = finish(task, Event::InfrastructureError,
                       std::format("sandbox runtime unavailable: {}",
                                   usable.error().message()));
    if (!step) {
      return fail(step.error());
    }
    return step->outcome;
  }

  while (true) {
    auto step = advance(task, signals);
    if (!step) {
      return fail(step.error());
    }
    if (step->halt) {
      log::info("Task {}: run ended ({}) in {}", id,
                run_outcome_name(step->outcome), task_status_name(task.status));
      return step->outcome;
    }
  }
}

auto Orchestrator::cancel_requested(const Task& task, const RunSignals& signals)
    -> Result<bool> {
  if (signals.cancel.is_cancelled()) {
    return true;
  }
  return store_.is_cancel_requested(task.id);
}

auto Orchestrator::advance(Task& task, const RunSignals& signals)
    -> Result<Step> {
  if (is_terminal(task.status)) {
    return Step::stop(RunOutcome::Completed);
  }

  auto cancelled = cancel_requested(task, signals);
  if (!cancelled) {
    return fail(cancelled.error());
  }
  if (*cancelled) {
    return finish(task, Event::CancelRequested, "cancelled by request");
  }
  if (signals.shutdown.is_cancelled()) {
    return Step::stop(RunOutcome::Suspended);
  }

  if (task.status == TaskStatus::Pending) {
    return apply(task, Event::Claimed, PhaseOutput{});
  }

  Result<PhaseOutput> output = fail(Error::InvalidArgument);
  if (task.status == TaskStatus::Planning) {
    output = phases_.plan(task, signals);
  } else {
    const auto* attempt = task.current_attempt();
    if (!attempt) {
      return finish(task, Event::InfrastructureError,
                    std::format("no attempt record in {}",
                                task_status_name(task.status)));
    }
    switch (task.status) {
      case TaskStatus::Coding:
        output = phases_.code(task, *attempt, signals);
        break;
      case TaskStatus::Reviewing:
        output = phases_.review(task, *attempt, signals);
        break;
      case TaskStatus::Testing:
        output = phases_.test(task, *attempt, signals);
        break;
      default:
        return Step::stop(RunOutcome::Completed);
    }
  }

  if (!output) {
    if (output.error() == Error::Cancelled) {
      cancelled = cancel_requested(task, signals);
      if (!cancelled) {
        return fail(cancelled.error());
      }
      if (*cancelled) {
        return finish(task, Event::CancelRequested, "cancelled by request");
      }
      return Step::stop(RunOutcome::Suspended);
    }
    log::error("Task {}: {} phase failed: {}", task.id,
               task_status_name(task.status), output.error().message());
    return finish(task, Event::InfrastructureError,
                  std::format("{} phase failed: {}",
                              task_status_name(task.status),
                              output.error().message()));
  }

  auto event = output->event;
  return apply(task, event, std::move(*output));
}

auto Orchestrator::apply(Task& task, Event event, PhaseOutput output)
    -> Result<Step> {
  auto transition = next_transition(
      task.status, event, guard_inputs(task, options_.review_retry_limit));
  if (!transition) {
    log::error("Task {}: no transition from {} on {}", task.id,
               task_status_name(task.status), event_name(event));
    return finish(task, Event::InfrastructureError,
                  std::format("no transition from {} on {}",
                              task_status_name(task.status), event_name(event)));
  }

  Task next = task;
  next.status = transition->to;
  Attempt* current = next.current_attempt();
  bool appending = false;

  if (output.review &&
      (output.review->needs_human_review || output.review->review.security_issues)) {
    next.needs_human_review = true;
  }

  switch (transition->effect) {
    case Effect::None:
      if (current) {
        if (event == Event::PatchProduced) {
          current->patch = std::move(output.patch);
        } else if (event == Event::ReviewApproved && output.review) {
          current->review = output.review->review;
        }
        merge_output(*current, output);
      }
      break;

    case Effect::CreateFirstAttempt: {
      Attempt first;
      first.index = static_cast<int>(next.attempts.size());
      first.plan = std::move(output.plan);
      merge_output(first, output);
      next.attempts.push_back(std::move(first));
      appending = true;
      break;
    }

    case Effect::RetryCoding: {
      ++current->rejection_count;
      // The previous attempt's test tail stays with the attempt
      current->carried = CarriedContext{
          .previous_patch = std::move(current->patch),
          .test_stdout_tail = std::move(current->carried.test_stdout_tail),
          .test_stderr_tail = std::move(current->carried.test_stderr_tail),
          .review_comments = output.review ? output.review->review.comments
                                           : std::string{},
      };
      current->patch.reset();
      current->review.reset();
      current->diagnostics.push_back(std::format(
          "review rejected, round {} of {}", current->rejection_count,
          options_.review_retry_limit));
      merge_output(*current, output);
      break;
    }

    case Effect::AppendAttempt: {
      CarriedContext carried{.previous_patch = current->patch};
      if (event == Event::TestFailed) {
        current->test = output.test;
        if (output.test) {
          carried.test_stdout_tail =
              tail(output.test->stdout_output, options_.output_tail_bytes);
          carried.test_stderr_tail =
              tail(output.test->stderr_output, options_.output_tail_bytes);
        }
        if (current->review) {
          carried.review_comments = current->review->comments;
        }
      } else if (output.review) {
        current->review = output.review->review;
        carried.review_comments = output.review->review.comments;
        current->diagnostics.emplace_back(
            "review retries exhausted, counted as a failed attempt");
      }
      merge_output(*current, output);

      Attempt retry;
      retry.index = current->index + 1;
      retry.plan = current->plan;
      retry.carried = std::move(carried);
      next.attempts.push_back(std::move(retry));
      appending = true;
      break;
    }

    case Effect::Succeed:
      current->test = std::move(output.test);
      merge_output(*current, output);
      next.completed_at = Clock::now();
      next.failure_kind = FailureKind::None;
      next.result_summary = std::format(
          "Fix validated on attempt {} of {}: {}", current->index + 1,
          next.max_attempts,
          current->patch ? current->patch->explanation : std::string{});
      break;

    case Effect::FailLogic:
      if (event == Event::TestFailed) {
        current->test = std::move(output.test);
        next.failure_reason =
            std::format("tests failed on all {} attempts", next.max_attempts);
      } else {
        if (output.review) {
          current->review = output.review->review;
        }
        next.failure_reason = std::format(
            "review rejected the patch {} times on the final attempt",
            current->rejection_count + 1);
      }
      merge_output(*current, output);
      next.completed_at = Clock::now();
      next.failure_kind = FailureKind::LogicExhausted;
      next.result_summary = "Failed: no patch passed validation";
      break;

    case Effect::FailInfrastructure:
    case Effect::Cancel:
      // Reached only through finish()
      return finish(task, event, "unexpected terminal event");
  }

  return persist(task, std::move(next), appending);
}

auto Orchestrator::finish(Task& task, Event event, std::string reason)
    -> Result<Step> {
  auto transition = next_transition(task.status, event);
  if (!transition) {
    return Step::stop(RunOutcome::Completed);
  }

  Task next = task;
  next.status = transition->to;
  next.completed_at = Clock::now();
  next.failure_reason = std::move(reason);
  if (transition->effect == Effect::Cancel) {
    next.failure_kind = FailureKind::Cancelled;
    next.result_summary = "Cancelled";
  } else {
    next.failure_kind = FailureKind::Infrastructure;
    next.result_summary = "Failed: infrastructure error";
  }
  return persist(task, std::move(next), false);
}

auto Orchestrator::persist(Task& task, Task next, bool appending)
    -> Result<Step> {
  auto written = appending ? store_.append_attempt(next, task.status)
                           : store_.compare_and_set(next, task.status);
  if (!written) {
    log::error("Task {}: store write failed: {}", task.id,
               written.error().message());
    return fail(written.error());
  }
  if (!*written) {
    log::info("Task {}: lost compare-and-set in {}, stopping", task.id,
              task_status_name(task.status));
    return Step::stop(RunOutcome::LostRace);
  }

  log::info("Task {}: {} -> {}", task.id, task_status_name(task.status),
            task_status_name(next.status));
  next.version = task.version + 1;
  task = std::move(next);
  if (is_terminal(task.status)) {
    return Step::stop(RunOutcome::Completed);
  }
  return Step::proceed();
}

}  // namespace fixloop
