#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fixloop::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Async logger: producers append to a bounded deque, one writer thread
// flushes batches to stdout or to the configured log file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  struct Record {
    Level level;
    std::string text;
  };

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Record> queue_;
  std::FILE* file_{nullptr};
  std::thread writer_;

  auto write_one(const Record& rec) -> void {
    if (file_) {
      std::print(file_, "{}", rec.text);
    } else {
      std::print("{}", rec.text);
    }
  }

  auto format_line(Level level, std::string_view msg, bool color) const
      -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (color) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                         level_color(level), level_name(level), "\033[0m", tid,
                         msg);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_name(level), tid, msg);
  }

  auto writer_loop() -> void {
    std::vector<Record> batch;
    batch.reserve(BATCH_SIZE);

    std::unique_lock lock(mutex_);
    while (true) {
      cv_.wait(lock, [this] {
        return !queue_.empty() || !running_.load(std::memory_order_acquire);
      });
      if (queue_.empty() && !running_.load(std::memory_order_acquire)) {
        break;
      }

      while (!queue_.empty() && batch.size() < BATCH_SIZE) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }

      lock.unlock();
      for (const auto& rec : batch) {
        write_one(rec);
      }
      if (file_) {
        std::fflush(file_);
      }
      batch.clear();
      lock.lock();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(mutex_);
      if (!running_.exchange(false))
        return;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Must be called before start(). Empty path keeps stdout.
  auto set_output(std::string_view path) -> bool {
    if (path.empty()) {
      return true;
    }
    std::FILE* f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::lock_guard lock(mutex_);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto line = format_line(level, std::format(fmt, std::forward<Args>(args)...),
                            file_ == nullptr);

    std::unique_lock lock(mutex_);
    // Synchronous fallback outside start()/stop() or when the queue is full
    if (!running_.load(std::memory_order_acquire) ||
        queue_.size() >= QUEUE_CAPACITY) {
      write_one(Record{level, std::move(line)});
      return;
    }
    queue_.push_back(Record{level, std::move(line)});
    lock.unlock();
    cv_.notify_one();
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto set_output(std::string_view path) -> bool {
  return logger().set_output(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace fixloop::log
