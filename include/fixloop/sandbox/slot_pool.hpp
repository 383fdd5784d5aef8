#pragma once

#include "fixloop/core/cancellation.hpp"
#include "fixloop/core/error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace fixloop {

// Bounded pool of sandbox execution slots shared by every orchestrator in
// the process. Waiters are served strictly in arrival order.
class SlotPool {
public:
  class Lease {
  public:
    Lease() = default;
    ~Lease() {
      reset();
    }
    Lease(Lease&& other) noexcept : pool_(std::exchange(other.pool_, nullptr)) {
    }
    auto operator=(Lease&& other) noexcept -> Lease& {
      if (this != &other) {
        reset();
        pool_ = std::exchange(other.pool_, nullptr);
      }
      return *this;
    }
    Lease(const Lease&) = delete;
    auto operator=(const Lease&) -> Lease& = delete;

    [[nodiscard]] explicit operator bool() const noexcept {
      return pool_ != nullptr;
    }

    auto reset() -> void {
      if (auto* pool = std::exchange(pool_, nullptr)) {
        pool->release();
      }
    }

  private:
    friend class SlotPool;
    explicit Lease(SlotPool* pool) : pool_(pool) {
    }

    SlotPool* pool_{nullptr};
  };

  explicit SlotPool(std::size_t capacity);

  SlotPool(const SlotPool&) = delete;
  auto operator=(const SlotPool&) -> SlotPool& = delete;

  // Blocks until a slot is free. Fails with SandboxSlotTimeout after
  // `timeout`, or Cancelled as soon as the token fires.
  [[nodiscard]] auto acquire(std::chrono::milliseconds timeout,
                             const CancellationToken& token) -> Result<Lease>;

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }
  [[nodiscard]] auto in_use() const -> std::size_t;
  [[nodiscard]] auto waiting() const -> std::size_t;

private:
  auto release() -> void;

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_use_{0};
  std::uint64_t next_ticket_{0};
  std::deque<std::uint64_t> queue_;
};

}  // namespace fixloop
