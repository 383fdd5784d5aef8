#pragma once

#include "fixloop/core/error.hpp"
#include "fixloop/queue/task_queue.hpp"
#include "fixloop/sandbox/sandbox.hpp"
#include "fixloop/storage/task_store.hpp"

#include <cstddef>

namespace fixloop {

struct RecoveryResult {
  std::size_t requeued{0};
  std::size_t swept{0};
};

// Startup reconciliation. Re-enqueues non-terminal tasks the queue has lost
// track of and removes sandbox environments left behind by this owner.
class Recovery {
public:
  Recovery(ITaskStore& store, ITaskQueue& queue, ISandbox& sandbox);

  // `lock` must be held for the sandbox's owner.
  [[nodiscard]] auto recover(const OwnerLock& lock) -> Result<RecoveryResult>;

private:
  ITaskStore& store_;
  ITaskQueue& queue_;
  ISandbox& sandbox_;
};

}  // namespace fixloop
