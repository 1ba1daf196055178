#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace shepherd {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

// Absent and null keys keep the default; a value of the wrong type throws
// YAML::BadConversion.
template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

// Overwrites out with the decoded section when the key is present.
template <YamlParsable T>
auto yaml_read_section(const YAML::Node& root, std::string_view key, T& out)
    -> void {
  if (auto section = root[std::string(key)]; section && !section.IsNull()) {
    out = section.as<T>();
  }
}

}  // namespace shepherd
