#include "fixloop/worker/coordinator.hpp"

#include "fixloop/model/state_strings.hpp"
#include "fixloop/util/log.hpp"
#include "fixloop/util/util.hpp"

#include <experimental/scope>

namespace fixloop {

Coordinator::Coordinator(ITaskStore& store, ITaskQueue& queue,
                         Orchestrator& orchestrator, CoordinatorOptions options)
    : store_(store),
      queue_(queue),
      orchestrator_(orchestrator),
      options_(std::move(options)) {
}

Coordinator::~Coordinator() {
  stop();
}

auto Coordinator::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  shutdown_ = CancellationSource{};
  watcher_stop_ = CancellationSource{};

  log::info("Coordinator {} starting {} workers", options_.owner,
            options_.concurrency);
  workers_.reserve(static_cast<std::size_t>(options_.concurrency));
  for (int i = 0; i < options_.concurrency; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
  watcher_ = std::thread([this] { watcher_loop(); });
}

auto Coordinator::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Coordinator {} stopping, {} tasks in flight", options_.owner,
            active_count());
  shutdown_.cancel();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  // Leases stay alive until the last in-flight task has settled
  watcher_stop_.cancel();
  if (watcher_.joinable()) {
    watcher_.join();
  }
  log::info("Coordinator {} stopped", options_.owner);
}

auto Coordinator::active_count() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return active_.size();
}

auto Coordinator::release(const Delivery& delivery,
                          std::chrono::milliseconds delay) -> void {
  auto r = queue_.nack(delivery, delay);
  if (!r) {
    log::error("Task {}: nack failed: {}", delivery.task_id,
               r.error().message());
  } else if (!*r) {
    log::warn("Task {}: nack on a stale receipt", delivery.task_id);
  }
}

auto Coordinator::claim_next() -> Result<std::optional<ClaimedTask>> {
  auto claimed = queue_.claim(options_.owner, options_.visibility_timeout);
  if (!claimed) {
    return fail(claimed.error());
  }
  if (!*claimed) {
    return std::optional<ClaimedTask>{};
  }
  auto delivery = std::move(**claimed);

  auto active = std::make_shared<Active>();
  active->delivery = delivery;
  bool in_flight = false;
  {
    std::lock_guard lock(mutex_);
    in_flight = !active_.try_emplace(delivery.task_id, active).second;
  }
  if (in_flight) {
    // Redelivered while still running here
    log::warn("Task {} redelivered while in flight", delivery.task_id);
    release(delivery, timing::kLostRaceRedeliveryDelay);
    return std::optional<ClaimedTask>{};
  }
  auto forget = std::experimental::scope_exit([this, &active] {
    unregister(active);
  });

  auto task = store_.get(delivery.task_id);
  if (!task) {
    if (task.error() == Error::NotFound) {
      log::warn("Dropping delivery of unknown task {}", delivery.task_id);
      if (auto r = queue_.ack(delivery); !r) {
        return fail(r.error());
      }
      return std::optional<ClaimedTask>{};
    }
    release(delivery, timing::kStoreErrorRedeliveryDelay);
    return fail(task.error());
  }

  if (is_terminal(task->status)) {
    log::info("Task {} already {}, acking", delivery.task_id,
              task_status_name(task->status));
    if (auto r = queue_.ack(delivery); !r) {
      return fail(r.error());
    }
    return std::optional<ClaimedTask>{};
  }

  if (delivery.deliveries > 1) {
    log::info("Task {}: redelivery #{} in {}", delivery.task_id,
              delivery.deliveries, task_status_name(task->status));
  }
  forget.release();
  return std::optional<ClaimedTask>{
      ClaimedTask{std::move(delivery), std::move(*task)}};
}

auto Coordinator::unregister(const std::shared_ptr<Active>& active) -> void {
  std::lock_guard lock(mutex_);
  auto it = active_.find(active->delivery.task_id);
  if (it != active_.end() && it->second == active) {
    active_.erase(it);
  }
}

auto Coordinator::process(ClaimedTask claimed) -> Result<RunOutcome> {
  std::shared_ptr<Active> active;
  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = active_.try_emplace(claimed.task.id);
    if (inserted) {
      it->second = std::make_shared<Active>();
      it->second->delivery = claimed.delivery;
    }
    if (it->second->delivery.receipt == claimed.delivery.receipt) {
      active = it->second;
    }
  }
  if (!active) {
    log::warn("Task {} is already in flight under another receipt",
              claimed.task.id);
    release(claimed.delivery, timing::kLostRaceRedeliveryDelay);
    return RunOutcome::LostRace;
  }
  auto forget = std::experimental::scope_exit([this, &active] {
    unregister(active);
  });

  RunSignals signals{.cancel = active->cancel.token(),
                     .shutdown = shutdown_.token()};
  auto outcome = orchestrator_.run(claimed.task.id, signals);
  settle(claimed, outcome);
  return outcome;
}

auto Coordinator::settle(const ClaimedTask& claimed,
                         const Result<RunOutcome>& outcome) -> void {
  const auto& delivery = claimed.delivery;
  if (!outcome) {
    log::error("Task {}: run failed: {}", delivery.task_id,
               outcome.error().message());
    release(delivery, timing::kStoreErrorRedeliveryDelay);
    return;
  }

  switch (*outcome) {
    case RunOutcome::Completed: {
      auto r = queue_.ack(delivery);
      if (!r) {
        log::error("Task {}: ack failed: {}", delivery.task_id,
                   r.error().message());
      }
      return;
    }
    case RunOutcome::LostRace: {
      auto task = store_.get(delivery.task_id);
      if (task && is_terminal(task->status)) {
        if (auto r = queue_.ack(delivery); !r) {
          log::error("Task {}: ack failed: {}", delivery.task_id,
                     r.error().message());
        }
        return;
      }
      release(delivery, timing::kLostRaceRedeliveryDelay);
      return;
    }
    case RunOutcome::Suspended:
      release(delivery, std::chrono::milliseconds(0));
      return;
  }
}

auto Coordinator::process_next() -> Result<bool> {
  auto claimed = claim_next();
  if (!claimed) {
    return fail(claimed.error());
  }
  if (!*claimed) {
    return false;
  }
  auto outcome = process(std::move(**claimed));
  if (!outcome) {
    return fail(outcome.error());
  }
  return true;
}

auto Coordinator::heartbeat() -> void {
  std::vector<std::shared_ptr<Active>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.reserve(active_.size());
    for (const auto& [id, active] : active_) {
      snapshot.push_back(active);
    }
  }

  for (const auto& active : snapshot) {
    const auto& delivery = active->delivery;
    if (auto r = queue_.extend(delivery, options_.visibility_timeout); !r) {
      log::warn("Task {}: lease extension failed: {}", delivery.task_id,
                r.error().message());
    } else if (!*r) {
      log::warn("Task {}: lease lost", delivery.task_id);
    }

    auto requested = store_.is_cancel_requested(delivery.task_id);
    if (!requested) {
      log::warn("Task {}: cancel poll failed: {}", delivery.task_id,
                requested.error().message());
      continue;
    }
    if (*requested && !active->cancel.is_cancelled()) {
      log::info("Task {}: cancellation requested, interrupting",
                delivery.task_id);
      active->cancel.cancel();
    }
  }
}

auto Coordinator::purge_expired() -> Result<std::size_t> {
  if (options_.retention.count() <= 0) {
    return std::size_t{0};
  }
  auto cutoff = Clock::now() - options_.retention;
  auto purged = store_.purge_terminal(cutoff);
  if (!purged) {
    log::warn("Retention sweep failed: {}", purged.error().message());
    return fail(purged.error());
  }
  if (*purged > 0) {
    log::info("Retention sweep removed {} tasks finished before {}", *purged,
              format_timestamp(cutoff));
  }
  return purged;
}

auto Coordinator::worker_loop(int index) -> void {
  log::debug("Worker {} started", index);
  auto token = shutdown_.token();
  while (!token.is_cancelled()) {
    auto processed = process_next();
    if (!processed) {
      log::error("Worker {}: {}", index, processed.error().message());
    }
    if (!processed || !*processed) {
      if (token.wait_for(options_.poll_interval)) {
        break;
      }
    }
  }
  log::debug("Worker {} exiting", index);
}

auto Coordinator::watcher_loop() -> void {
  auto token = watcher_stop_.token();
  auto next_purge = std::chrono::steady_clock::now();
  while (!token.wait_for(options_.heartbeat_interval)) {
    heartbeat();
    if (options_.retention.count() > 0 &&
        std::chrono::steady_clock::now() >= next_purge) {
      // A failure is logged and retried on the next interval
      (void)purge_expired();
      next_purge =
          std::chrono::steady_clock::now() + options_.retention_interval;
    }
  }
}

}  // namespace fixloop
