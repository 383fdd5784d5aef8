#pragma once

#include "fixloop/core/cancellation.hpp"
#include "fixloop/core/constants.hpp"
#include "fixloop/core/error.hpp"
#include "fixloop/orchestrator/orchestrator.hpp"
#include "fixloop/queue/task_queue.hpp"
#include "fixloop/storage/task_store.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fixloop {

struct CoordinatorOptions {
  std::string owner;
  int concurrency{4};
  std::chrono::milliseconds poll_interval{500};
  std::chrono::seconds visibility_timeout{900};
  std::chrono::milliseconds heartbeat_interval{1000};
  // Terminal tasks older than this are purged by the watcher; 0 disables
  std::chrono::hours retention{0};
  std::chrono::milliseconds retention_interval{timing::kRetentionSweepInterval};
};

struct ClaimedTask {
  Delivery delivery;
  Task task;
};

// Claims queued tasks and runs one orchestrator per task on a fixed pool of
// worker threads. A watcher thread keeps leases alive and turns a stored
// cancellation request into a forced cancel of the running task.
class Coordinator {
public:
  Coordinator(ITaskStore& store, ITaskQueue& queue, Orchestrator& orchestrator,
              CoordinatorOptions options);
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  auto operator=(const Coordinator&) -> Coordinator& = delete;

  auto start() -> void;
  // Stops claiming, lets running tasks reach their next phase boundary, then
  // joins every thread.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Claims the next deliverable task and registers it as in flight, so a
  // redelivery of the same id is deferred until process() settles it.
  // Deliveries of unknown or already terminal tasks are acked and skipped.
  [[nodiscard]] auto claim_next() -> Result<std::optional<ClaimedTask>>;

  // Drives a claimed task on the calling thread and settles its delivery.
  // A task already in flight under another receipt is released as LostRace.
  [[nodiscard]] auto process(ClaimedTask claimed) -> Result<RunOutcome>;

  // claim_next() + process(); false when nothing was claimed.
  [[nodiscard]] auto process_next() -> Result<bool>;

  [[nodiscard]] auto active_count() const -> std::size_t;

  // One watcher pass: extend leases and propagate cancellation requests.
  auto heartbeat() -> void;

  // Deletes terminal tasks older than options.retention. Returns how many;
  // 0 when retention is disabled.
  [[nodiscard]] auto purge_expired() -> Result<std::size_t>;

private:
  struct Active {
    Delivery delivery;
    CancellationSource cancel;
  };

  // Drops the in-flight entry if it still belongs to `active`.
  auto unregister(const std::shared_ptr<Active>& active) -> void;
  auto worker_loop(int index) -> void;
  auto watcher_loop() -> void;
  auto settle(const ClaimedTask& claimed, const Result<RunOutcome>& outcome)
      -> void;
  auto release(const Delivery& delivery, std::chrono::milliseconds delay)
      -> void;

  ITaskStore& store_;
  ITaskQueue& queue_;
  Orchestrator& orchestrator_;
  CoordinatorOptions options_;

  std::atomic<bool> running_{false};
  CancellationSource shutdown_;
  CancellationSource watcher_stop_;

  mutable std::mutex mutex_;
  std::unordered_map<TaskId, std::shared_ptr<Active>> active_;

  std::vector<std::thread> workers_;
  std::thread watcher_;
};

}  // namespace fixloop
