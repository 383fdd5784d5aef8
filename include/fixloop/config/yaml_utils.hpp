#pragma once

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <string_view>

namespace fixloop {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

// Missing or null keys fall back to `default_val`.
template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// Scalar-to-scalar mapping under `key`, e.g. sandbox.images. Anything that
// is not a map yields an empty result.
[[nodiscard]] inline auto yaml_get_string_map(const YAML::Node& node,
                                              std::string_view key)
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  auto field = node[std::string(key)];
  if (!field || !field.IsMap()) {
    return out;
  }
  for (const auto& entry : field) {
    out[entry.first.as<std::string>()] = entry.second.as<std::string>();
  }
  return out;
}

}  // namespace fixloop
