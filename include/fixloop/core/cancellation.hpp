#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace fixloop {

class CancellationToken;

// Shared cancellation flag. Callbacks registered through a token run once,
// on the thread that calls cancel(), and are used to force-kill blocking
// work such as a running sandbox.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  auto cancel() -> void {
    std::unique_lock lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
    state_->runner = std::this_thread::get_id();
    state_->cv.notify_all();
    while (!state_->callbacks.empty()) {
      auto node = state_->callbacks.extract(state_->callbacks.begin());
      state_->running = node.key();
      lock.unlock();
      node.mapped()();
      lock.lock();
      state_->running = 0;
      state_->cv.notify_all();
    }
  }

  [[nodiscard]] auto is_cancelled() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

private:
  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    std::uint64_t next_id{1};
    std::map<std::uint64_t, std::function<void()>> callbacks;
    // Id of the callback cancel() is executing, 0 when idle
    std::uint64_t running{0};
    std::thread::id runner;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
  friend class CancellationRegistration;
};

// RAII registration handle; unregisters the callback on destruction.
class CancellationRegistration {
public:
  CancellationRegistration() = default;
  ~CancellationRegistration() {
    reset();
  }

  CancellationRegistration(CancellationRegistration&& other) noexcept
      : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {
  }
  auto operator=(CancellationRegistration&& other) noexcept
      -> CancellationRegistration& {
    if (this != &other) {
      reset();
      state_ = std::move(other.state_);
      id_ = std::exchange(other.id_, 0);
    }
    return *this;
  }
  CancellationRegistration(const CancellationRegistration&) = delete;
  auto operator=(const CancellationRegistration&)
      -> CancellationRegistration& = delete;

  // Once this returns the callback is not running and never will. A
  // callback may reset its own registration.
  auto reset() -> void {
    if (auto state = state_.lock(); state && id_ != 0) {
      std::unique_lock lock(state->mutex);
      if (state->callbacks.erase(id_) == 0 && state->running == id_ &&
          state->runner != std::this_thread::get_id()) {
        state->cv.wait(lock, [&] { return state->running != id_; });
      }
    }
    state_.reset();
    id_ = 0;
  }

private:
  friend class CancellationToken;
  CancellationRegistration(std::weak_ptr<CancellationSource::State> state,
                           std::uint64_t id)
      : state_(std::move(state)), id_(id) {
  }

  std::weak_ptr<CancellationSource::State> state_;
  std::uint64_t id_{0};
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const -> bool {
    if (!state_) {
      return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  [[nodiscard]] explicit operator bool() const {
    return !is_cancelled();
  }

  // Sleeps up to `duration`; returns true if cancelled in the meantime.
  template <typename Rep, typename Period>
  [[nodiscard]] auto wait_for(std::chrono::duration<Rep, Period> duration) const
      -> bool {
    if (!state_) {
      std::this_thread::sleep_for(duration);
      return false;
    }
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled; });
  }

  // Runs `fn` immediately if already cancelled.
  [[nodiscard]] auto on_cancel(std::function<void()> fn) const
      -> CancellationRegistration {
    if (!state_) {
      return {};
    }
    std::unique_lock lock(state_->mutex);
    if (state_->cancelled) {
      lock.unlock();
      fn();
      return {};
    }
    auto id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(fn));
    return CancellationRegistration{state_, id};
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace fixloop
