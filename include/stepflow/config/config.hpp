#pragma once

#include "stepflow/config/system_config.hpp"
#include "stepflow/core/error.hpp"

#include <string_view>

namespace stepflow {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto validate(const SystemConfig& config) -> Result<void>;
};

}  // namespace stepflow
