#pragma once

#include "cronwork/config/system_config.hpp"
#include "cronwork/core/error.hpp"
#include "cronwork/scheduler/reschedule.hpp"

#include <string_view>

namespace cronwork {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Rejects unknown retry modes and non-positive intervals.
  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

[[nodiscard]] auto retry_policy_from(const RetryConfig& retry) -> RetryPolicy;

}  // namespace cronwork
