#pragma once

#include "fixloop/model/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace fixloop {

namespace detail {

constexpr std::array<std::string_view, 8> kTaskStatusNames = {
    "PENDING", "PLANNING", "CODING",  "REVIEWING",
    "TESTING", "SUCCESS",  "FAILED",  "CANCELLED",
};

constexpr std::array<std::string_view, 4> kFailureKindNames = {
    "none",
    "logic",
    "infrastructure",
    "cancelled",
};

constexpr std::array<std::string_view, 4> kRiskLevelNames = {
    "unknown",
    "low",
    "medium",
    "high",
};

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "UNKNOWN";
}

// Strict: unknown names are reported, not defaulted, so a corrupt row
// never masquerades as a valid state.
[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto failure_kind_name(FailureKind kind) noexcept
    -> const char* {
  auto idx = std::to_underlying(kind);
  return idx < detail::kFailureKindNames.size()
             ? detail::kFailureKindNames[idx].data()
             : "none";
}

[[nodiscard]] inline auto parse_failure_kind(std::string_view name) noexcept
    -> FailureKind {
  auto it = std::ranges::find(detail::kFailureKindNames, name);
  if (it != detail::kFailureKindNames.end()) {
    return static_cast<FailureKind>(
        std::ranges::distance(detail::kFailureKindNames.begin(), it));
  }
  return FailureKind::None;
}

[[nodiscard]] inline auto risk_level_name(RiskLevel risk) noexcept
    -> const char* {
  auto idx = std::to_underlying(risk);
  return idx < detail::kRiskLevelNames.size()
             ? detail::kRiskLevelNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_risk_level(std::string_view name) noexcept
    -> RiskLevel {
  auto it = std::ranges::find(detail::kRiskLevelNames, name);
  if (it != detail::kRiskLevelNames.end()) {
    return static_cast<RiskLevel>(
        std::ranges::distance(detail::kRiskLevelNames.begin(), it));
  }
  return RiskLevel::Unknown;
}

}  // namespace fixloop
