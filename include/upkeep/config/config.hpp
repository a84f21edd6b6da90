#pragma once

#include "upkeep/config/system_config.hpp"
#include "upkeep/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace upkeep {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Effective configuration as YAML, defaults included.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;

  // Human-readable problems that do not prevent loading: out-of-range
  // numbers and frequencies the scheduler will reject.
  [[nodiscard]] static auto check(const SystemConfig& config)
      -> std::vector<std::string>;
};

}  // namespace upkeep
