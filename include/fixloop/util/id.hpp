#pragma once

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace fixloop {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct SandboxTag {};
struct ReceiptTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using SandboxName = TypedId<SandboxTag>;
using ReceiptId = TypedId<ReceiptTag>;

inline constexpr std::string_view kSandboxPrefix = "fixloop-";

// Deterministic per (task, attempt, review round): a rerun after a crash
// reuses the name, so the leftover environment is found and replaced.
inline auto make_sandbox_name(const TaskId& task_id, int attempt_index,
                              int review_round) -> SandboxName {
  return SandboxName{std::format("{}{}-a{}-r{}", kSandboxPrefix,
                                 task_id.value(), attempt_index,
                                 review_round)};
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace fixloop

template <typename Tag>
struct std::hash<fixloop::TypedId<Tag>> {
  auto operator()(const fixloop::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<fixloop::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const fixloop::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
