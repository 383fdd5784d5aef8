#include "fixloop/orchestrator/phases.hpp"

#include "fixloop/core/constants.hpp"
#include "fixloop/util/log.hpp"

#include <algorithm>

namespace fixloop {

namespace {

// Sleeps up to `delay`; true if either signal fired first.
auto wait_interruptible(const RunSignals& signals,
                        std::chrono::milliseconds delay) -> bool {
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (!signals.shutdown.is_cancelled()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, timing::kDaemonPollInterval);
    if (signals.cancel.wait_for(slice)) {
      return true;
    }
  }
  return true;
}

auto to_test_result(const ExecutionResult& r) -> TestResult {
  return TestResult{
      .success = r.success(),
      .exit_code = r.exit_code,
      .stdout_output = tail(r.stdout_output, io::kStoredOutputSize),
      .stderr_output = tail(r.stderr_output, io::kStoredOutputSize),
      .duration = r.duration,
      .timed_out = r.timed_out,
      .resource_exceeded = r.resource_exceeded,
  };
}

}  // namespace

auto backoff_delay(int retry, std::chrono::milliseconds base,
                   std::chrono::milliseconds max)
    -> std::chrono::milliseconds {
  auto delay = base;
  for (int i = 0; i < retry && delay < max; ++i) {
    delay *= 2;
  }
  return std::min(delay, max);
}

PhaseRunner::PhaseRunner(IGenerator& generator, ISandbox& sandbox,
                         SlotPool& slots, const OrchestratorOptions& options)
    : generator_(generator),
      sandbox_(sandbox),
      slots_(slots),
      options_(options) {
}

auto PhaseRunner::call(Role role, const std::string& prompt,
                       const RunSignals& signals, PhaseOutput& out)
    -> Result<Generation> {
  for (int retry = 0;; ++retry) {
    auto gen = generator_.generate(role, prompt, {});
    ++out.usage.generation_calls;

    // A result that arrives after cancellation is discarded
    if (signals.interrupted()) {
      return fail(Error::Cancelled);
    }
    if (gen) {
      out.usage.tokens_used += gen->tokens_used;
      return gen;
    }
    if (gen.error() != Error::TransientProvider ||
        retry >= options_.generation_max_retries) {
      out.diagnostics.push_back(std::format("{} generation failed after {} retries: {}",
                                            role_name(role), retry,
                                            gen.error().message()));
      log::warn("{} generation failed after {} retries: {}", role_name(role),
                retry, gen.error().message());
      return fail(gen.error());
    }

    auto delay = backoff_delay(retry, options_.backoff_base, options_.backoff_max);
    out.diagnostics.push_back(std::format(
        "{} generation transient error, retry {} in {}ms", role_name(role),
        retry + 1, delay.count()));
    log::info("{} generation transient error, retry {} in {}ms",
              role_name(role), retry + 1, delay.count());
    if (wait_interruptible(signals, delay)) {
      return fail(Error::Cancelled);
    }
  }
}

auto PhaseRunner::plan(const Task& task, const RunSignals& signals)
    -> Result<PhaseOutput> {
  PhaseOutput out;
  auto gen = call(Role::Manager, build_manager_prompt(task), signals, out);
  if (!gen) {
    return fail(gen.error());
  }
  out.plan = parse_plan(gen->content);
  out.event = Event::PlanProduced;
  return out;
}

auto PhaseRunner::code(const Task& task, const Attempt& attempt,
                       const RunSignals& signals) -> Result<PhaseOutput> {
  PhaseOutput out;
  auto gen = call(Role::Coder, build_coder_prompt(task, attempt), signals, out);
  if (!gen) {
    return fail(gen.error());
  }
  out.patch = parse_patch(gen->content, task.language);
  out.event = Event::PatchProduced;
  return out;
}

auto PhaseRunner::review(const Task& task, const Attempt& attempt,
                         const RunSignals& signals) -> Result<PhaseOutput> {
  PhaseOutput out;
  if (!attempt.patch) {
    return fail(Error::InvalidArgument);
  }
  auto gen = call(Role::Reviewer, build_reviewer_prompt(task, *attempt.patch),
                  signals, out);
  if (!gen) {
    return fail(gen.error());
  }
  auto outcome = parse_review(gen->content);
  if (!outcome.conclusive) {
    out.diagnostics.emplace_back("review answer was not JSON, treated as approval");
  }
  out.event = outcome.review.approved ? Event::ReviewApproved
                                      : Event::ReviewRejected;
  out.review = std::move(outcome);
  return out;
}

auto PhaseRunner::test(const Task& task, const Attempt& attempt,
                       const RunSignals& signals) -> Result<PhaseOutput> {
  PhaseOutput out;
  if (!attempt.patch) {
    return fail(Error::InvalidArgument);
  }

  auto lease = slots_.acquire(options_.slot_acquire_timeout, signals.cancel);
  if (!lease) {
    log::warn("Task {}: no sandbox slot: {}", task.id, lease.error().message());
    return fail(lease.error());
  }

  ExecutionRequest request{
      .name = make_sandbox_name(task.id, attempt.index, attempt.rejection_count),
      .task_id = task.id,
      .repo = task.repo,
      .patch = *attempt.patch,
      .test_command = task.test_command.value_or(""),
      .language = task.language,
  };
  log::info("Task {}: running tests in {}", task.id, request.name);

  auto result = sandbox_.execute(request, options_.limits, signals.cancel);
  lease->reset();

  if (!result) {
    if (result.error() == Error::PatchRejected) {
      out.diagnostics.push_back(
          std::format("patch {} could not be applied", attempt.patch->filename));
      out.test = TestResult{
          .success = false,
          .exit_code = -1,
          .stderr_output =
              std::format("patch rejected: {}", attempt.patch->filename),
      };
      out.event = Event::TestFailed;
      return out;
    }
    return fail(result.error());
  }
  if (result->cancelled) {
    return fail(Error::Cancelled);
  }

  if (result->timed_out) {
    out.diagnostics.push_back(std::format(
        "test timed out after {}s", options_.limits.timeout.count()));
  }
  if (result->resource_exceeded) {
    out.diagnostics.emplace_back("test exceeded its resource limits");
  }
  out.test = to_test_result(*result);
  out.event = out.test->success ? Event::TestPassed : Event::TestFailed;
  return out;
}

}  // namespace fixloop
