#pragma once

#include "fixloop/core/cancellation.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/generation/generator.hpp"
#include "fixloop/generation/prompts.hpp"
#include "fixloop/model/task.hpp"
#include "fixloop/model/transition.hpp"
#include "fixloop/sandbox/sandbox.hpp"
#include "fixloop/sandbox/slot_pool.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fixloop {

struct OrchestratorOptions {
  int review_retry_limit{limits::kDefaultReviewRetryLimit};
  int generation_max_retries{3};
  std::chrono::milliseconds backoff_base{60000};
  std::chrono::milliseconds backoff_max{300000};
  std::size_t output_tail_bytes{1000};
  std::chrono::milliseconds slot_acquire_timeout{600000};
  ResourceLimits limits;
};

// What one phase produced. Nothing here is persisted until the
// orchestrator applies the resulting event.
struct PhaseOutput {
  Event event{Event::InfrastructureError};
  std::optional<std::string> plan;
  std::optional<Patch> patch;
  std::optional<ReviewOutcome> review;
  std::optional<TestResult> test;
  Usage usage;
  std::vector<std::string> diagnostics;
};

// Signals for one run. `cancel` force-kills in-flight work;
// `shutdown` only stops the task at the next phase boundary.
struct RunSignals {
  CancellationToken cancel;
  CancellationToken shutdown;

  [[nodiscard]] auto interrupted() const -> bool {
    return cancel.is_cancelled() || shutdown.is_cancelled();
  }
};

// Backoff before retry `n` (0-based): min(base * 2^n, max).
[[nodiscard]] auto backoff_delay(int retry, std::chrono::milliseconds base,
                                 std::chrono::milliseconds max)
    -> std::chrono::milliseconds;

// Each phase maps (Task, Attempt) to an event. Errors are
// Error::Cancelled when the run was interrupted, or an infrastructure
// error that fails the task without consuming an attempt.
class PhaseRunner {
public:
  PhaseRunner(IGenerator& generator, ISandbox& sandbox, SlotPool& slots,
              const OrchestratorOptions& options);

  [[nodiscard]] auto plan(const Task& task, const RunSignals& signals)
      -> Result<PhaseOutput>;
  [[nodiscard]] auto code(const Task& task, const Attempt& attempt,
                          const RunSignals& signals) -> Result<PhaseOutput>;
  [[nodiscard]] auto review(const Task& task, const Attempt& attempt,
                            const RunSignals& signals) -> Result<PhaseOutput>;
  [[nodiscard]] auto test(const Task& task, const Attempt& attempt,
                          const RunSignals& signals) -> Result<PhaseOutput>;

private:
  [[nodiscard]] auto call(Role role, const std::string& prompt,
                          const RunSignals& signals, PhaseOutput& out)
      -> Result<Generation>;

  IGenerator& generator_;
  ISandbox& sandbox_;
  SlotPool& slots_;
  const OrchestratorOptions& options_;
};

}  // namespace fixloop
