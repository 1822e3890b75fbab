#pragma once

#include "contentflow/config/service_config.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/model/rule.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/scheduler/daily_scheduler.hpp"

#include <string_view>

namespace contentflow {

// TOML file -> ServiceConfig, then CONTENTFLOW_* environment overrides, then
// validation. Any invalid value yields Error::ParseError.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ServiceConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<ServiceConfig>;
  // Built-in defaults with environment overrides applied.
  [[nodiscard]] static auto load_defaults() -> Result<ServiceConfig>;
};

[[nodiscard]] auto validate(const ServiceConfig &cfg) -> Result<void>;

[[nodiscard]] auto to_rule_thresholds(const EngineSettings &s)
    -> RuleThresholds;
[[nodiscard]] auto to_retry_config(const RetrySettings &s) -> RetryConfig;
[[nodiscard]] auto to_scheduler_config(const SchedulerSettings &s)
    -> SchedulerConfig;

} // namespace contentflow
