#pragma once

#include "fixloop/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace fixloop {

enum class Role : std::uint8_t {
  Manager,
  Coder,
  Reviewer,
};

[[nodiscard]] constexpr auto role_name(Role role) noexcept -> std::string_view {
  switch (role) {
    case Role::Manager: return "manager";
    case Role::Coder: return "coder";
    case Role::Reviewer: return "reviewer";
  }
  return "unknown";
}

struct Generation {
  std::string content;
  std::int64_t tokens_used{0};
};

// External code-generation capability. Errors are TransientProvider (the
// caller may retry) or ProviderFailed (not retryable).
class IGenerator {
public:
  virtual ~IGenerator() = default;

  [[nodiscard]] virtual auto generate(Role role, std::string_view prompt,
                                      std::string_view context)
      -> Result<Generation> = 0;
};

}  // namespace fixloop
