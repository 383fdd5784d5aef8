#pragma once

#include "fixloop/config/system_config.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/orchestrator/phases.hpp"
#include "fixloop/storage/task_store.hpp"

#include <cstdint>
#include <string_view>

namespace fixloop {

enum class RunOutcome : std::uint8_t {
  // The task is terminal, whoever put it there
  Completed,
  // A compare-and-set lost; another instance owns the task
  LostRace,
  // Stopped at a phase boundary on shutdown; resumable
  Suspended,
};

[[nodiscard]] constexpr auto run_outcome_name(RunOutcome o) noexcept
    -> std::string_view {
  switch (o) {
    case RunOutcome::Completed: return "completed";
    case RunOutcome::LostRace: return "lost_race";
    case RunOutcome::Suspended: return "suspended";
  }
  return "unknown";
}

[[nodiscard]] auto make_orchestrator_options(const SystemConfig& config)
    -> OrchestratorOptions;

// Drives one task through PLAN, CODE, REVIEW and TEST using the transition
// table. Every transition is persisted through the store's compare-and-set
// before the next phase starts, so a later run resumes where this one left
// off. Errors returned from run() are store failures only.
class Orchestrator {
public:
  Orchestrator(ITaskStore& store, IGenerator& generator, ISandbox& sandbox,
               SlotPool& slots, OrchestratorOptions options);

  [[nodiscard]] auto run(const TaskId& id, const RunSignals& signals)
      -> Result<RunOutcome>;

  [[nodiscard]] auto options() const noexcept -> const OrchestratorOptions& {
    return options_;
  }

private:
  struct Step;

  [[nodiscard]] auto advance(Task& task, const RunSignals& signals)
      -> Result<Step>;
  [[nodiscard]] auto apply(Task& task, Event event, PhaseOutput output)
      -> Result<Step>;
  [[nodiscard]] auto persist(Task& task, Task next, bool appending)
      -> Result<Step>;
  [[nodiscard]] auto finish(Task& task, Event event, std::string reason)
      -> Result<Step>;
  [[nodiscard]] auto cancel_requested(const Task& task,
                                      const RunSignals& signals) -> Result<bool>;

  ITaskStore& store_;
  OrchestratorOptions options_;
  ISandbox& sandbox_;
  PhaseRunner phases_;
};

}  // namespace fixloop
