#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace contentflow {

struct EngineSettings {
  int fans_feedback_days{rules::kFansFeedbackThreshold.count()};
  int overall_feedback_days{rules::kOverallFeedbackThreshold.count()};
  int task_ttl_days{rules::kTaskTimeToLive.count()};

  auto operator==(const EngineSettings &) const -> bool = default;
};

struct SchedulerSettings {
  int catchup_interval_sec{3600};
  std::string marker_key{storage::kLastRunMarkerKey};
  bool check_on_start{true};

  auto operator==(const SchedulerSettings &) const -> bool = default;
};

struct RetrySettings {
  int max_attempts{retry_defaults::kMaxAttempts};
  int base_delay_ms{retry_defaults::kBaseDelay.count()};
  double backoff_factor{retry_defaults::kBackoffFactor};
  int max_delay_ms{retry_defaults::kMaxDelay.count()};

  auto operator==(const RetrySettings &) const -> bool = default;
};

enum class StoreBackend : std::uint8_t { File, Memory };
BOOST_DESCRIBE_ENUM(StoreBackend, File, Memory)
CONTENTFLOW_DEFINE_ENUM_SERDE(StoreBackend)

struct StoreSettings {
  StoreBackend backend{StoreBackend::File};
  std::string data_file{"./contentflow-data.json"};
  std::string marker_file{"./contentflow-state.json"};

  auto operator==(const StoreSettings &) const -> bool = default;
};

struct LogSettings {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LogSettings &) const -> bool = default;
};

struct ServiceConfig {
  EngineSettings engine;
  SchedulerSettings scheduler;
  RetrySettings retry;
  StoreSettings store;
  LogSettings log;

  auto operator==(const ServiceConfig &) const -> bool = default;
};

} // namespace contentflow
