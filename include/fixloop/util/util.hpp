#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include <unistd.h>

namespace fixloop {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

inline auto format_timestamp(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(Clock::now());
}

[[nodiscard]] inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint{std::chrono::milliseconds(ms)};
}

// Keeps the last `max_bytes` of `text`; failures are usually at the end.
[[nodiscard]] inline auto tail(std::string_view text, std::size_t max_bytes)
    -> std::string {
  if (text.size() <= max_bytes) {
    return std::string{text};
  }
  return std::string{text.substr(text.size() - max_bytes)};
}

// Docker-style sizes: "512m", "1g", "256k", or plain bytes.
[[nodiscard]] inline auto parse_memory_size(std::string_view text)
    -> std::optional<std::uint64_t> {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t multiplier = 1;
  switch (text.back()) {
    case 'k': case 'K': multiplier = 1024ULL; break;
    case 'm': case 'M': multiplier = 1024ULL * 1024; break;
    case 'g': case 'G': multiplier = 1024ULL * 1024 * 1024; break;
    case 'b': case 'B': multiplier = 1; break;
    default: break;
  }
  if (multiplier != 1 || text.back() == 'b' || text.back() == 'B') {
    text.remove_suffix(1);
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
    return std::nullopt;
  }
  return value * multiplier;
}

inline auto host_name() -> std::string {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "localhost";
  }
  return buf;
}

}  // namespace fixloop
