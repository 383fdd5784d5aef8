#pragma once

#include "fixloop/config/system_config.hpp"
#include "fixloop/core/error.hpp"

#include <string_view>

namespace fixloop {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // InvalidArgument when a value is out of range.
  [[nodiscard]] static auto validate(const SystemConfig& config) -> Result<void>;
};

}  // namespace fixloop
