#include "fixloop/storage/recovery.hpp"

#include "fixloop/util/log.hpp"

namespace fixloop {

Recovery::Recovery(ITaskStore& store, ITaskQueue& queue, ISandbox& sandbox)
    : store_(store), queue_(queue), sandbox_(sandbox) {
}

auto Recovery::recover(const OwnerLock& lock) -> Result<RecoveryResult> {
  RecoveryResult result;

  auto pending = store_.list_non_terminal();
  if (!pending) {
    log::error("Failed to list non-terminal tasks");
    return fail(pending.error());
  }
  log::info("Found {} non-terminal tasks to reconcile", pending->size());

  for (const auto& id : *pending) {
    auto queued = queue_.contains(id);
    if (!queued) {
      return fail(queued.error());
    }
    if (*queued) {
      continue;
    }
    if (auto r = queue_.enqueue(id); !r) {
      log::error("Failed to requeue task {}: {}", id, r.error().message());
      return fail(r.error());
    }
    log::info("Task {} was missing from the queue, requeued", id);
    ++result.requeued;
  }

  auto swept = sandbox_.sweep_orphans(lock);
  if (!swept) {
    log::warn("Sandbox orphan sweep failed: {}", swept.error().message());
    return fail(swept.error());
  }
  result.swept = *swept;

  log::info("Recovery complete: {} requeued, {} sandboxes swept",
            result.requeued, result.swept);
  return ok(result);
}

}  // namespace fixloop
