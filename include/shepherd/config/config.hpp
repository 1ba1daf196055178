#pragma once

#include "shepherd/config/system_config.hpp"
#include "shepherd/core/error.hpp"

#include <string_view>

namespace shepherd {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Rejects values the controller cannot run with.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

}  // namespace shepherd
