#include "fixloop/sandbox/slot_pool.hpp"

#include "fixloop/util/log.hpp"

#include <algorithm>

namespace fixloop {

SlotPool::SlotPool(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {
}

auto SlotPool::acquire(std::chrono::milliseconds timeout,
                       const CancellationToken& token) -> Result<Lease> {
  // Registered before taking mutex_: the callback itself locks it.
  auto registration = token.on_cancel([this] {
    std::lock_guard lock(mutex_);
    cv_.notify_all();
  });

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);
  auto ticket = next_ticket_++;
  queue_.push_back(ticket);

  bool granted = cv_.wait_until(lock, deadline, [&] {
    return token.is_cancelled() ||
           (queue_.front() == ticket && in_use_ < capacity_);
  });

  if (granted && !token.is_cancelled()) {
    queue_.pop_front();
    ++in_use_;
    // The next waiter may also fit.
    cv_.notify_all();
    return Lease{this};
  }

  queue_.erase(std::ranges::find(queue_, ticket));
  cv_.notify_all();
  if (token.is_cancelled()) {
    return fail(Error::Cancelled);
  }
  log::warn("Timed out after {}ms waiting for a sandbox slot ({} in use)",
            timeout.count(), in_use_);
  return fail(Error::SandboxSlotTimeout);
}

auto SlotPool::release() -> void {
  {
    std::lock_guard lock(mutex_);
    if (in_use_ > 0) {
      --in_use_;
    }
  }
  cv_.notify_all();
}

auto SlotPool::in_use() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return in_use_;
}

auto SlotPool::waiting() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

}  // namespace fixloop
