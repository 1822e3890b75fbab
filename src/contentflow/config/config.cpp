#include "contentflow/config/config.hpp"
#include "contentflow/config/toml_util.hpp"

#include "contentflow/core/error.hpp"
#include "contentflow/util/file.hpp"
#include "contentflow/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace contentflow {
namespace detail {

struct EngineToml {
  int fans_feedback_days{rules::kFansFeedbackThreshold.count()};
  int overall_feedback_days{rules::kOverallFeedbackThreshold.count()};
  int task_ttl_days{rules::kTaskTimeToLive.count()};
};

struct SchedulerToml {
  int catchup_interval_sec{3600};
  std::string marker_key{storage::kLastRunMarkerKey};
  bool check_on_start{true};
};

struct RetryToml {
  int max_attempts{retry_defaults::kMaxAttempts};
  int base_delay_ms{retry_defaults::kBaseDelay.count()};
  double backoff_factor{retry_defaults::kBackoffFactor};
  int max_delay_ms{retry_defaults::kMaxDelay.count()};
};

struct StoreToml {
  std::string backend{"file"};
  std::string data_file{"./contentflow-data.json"};
  std::string marker_file{"./contentflow-state.json"};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ServiceToml {
  EngineToml engine{};
  SchedulerToml scheduler{};
  RetryToml retry{};
  StoreToml store{};
  LogToml log{};
};

} // namespace detail
} // namespace contentflow

namespace glz {
template <> struct meta<contentflow::detail::EngineToml> {
  using T = contentflow::detail::EngineToml;
  static constexpr auto value =
      object("fans_feedback_days", &T::fans_feedback_days,
             "overall_feedback_days", &T::overall_feedback_days,
             "task_ttl_days", &T::task_ttl_days);
};

template <> struct meta<contentflow::detail::SchedulerToml> {
  using T = contentflow::detail::SchedulerToml;
  static constexpr auto value =
      object("catchup_interval_sec", &T::catchup_interval_sec, "marker_key",
             &T::marker_key, "check_on_start", &T::check_on_start);
};

template <> struct meta<contentflow::detail::RetryToml> {
  using T = contentflow::detail::RetryToml;
  static constexpr auto value =
      object("max_attempts", &T::max_attempts, "base_delay_ms",
             &T::base_delay_ms, "backoff_factor", &T::backoff_factor,
             "max_delay_ms", &T::max_delay_ms);
};

template <> struct meta<contentflow::detail::StoreToml> {
  using T = contentflow::detail::StoreToml;
  static constexpr auto value =
      object("backend", &T::backend, "data_file", &T::data_file,
             "marker_file", &T::marker_file);
};

template <> struct meta<contentflow::detail::LogToml> {
  using T = contentflow::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<contentflow::detail::ServiceToml> {
  using T = contentflow::detail::ServiceToml;
  static constexpr auto value =
      object("engine", &T::engine, "scheduler", &T::scheduler, "retry",
             &T::retry, "store", &T::store, "log", &T::log);
};
} // namespace glz

namespace contentflow {
namespace {

[[nodiscard]] auto is_truthy(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Throws boost::bad_lexical_cast on malformed numbers.
auto apply_env_overrides(ServiceConfig &cfg) -> Result<void> {
  if (const char *v = std::getenv("CONTENTFLOW_FANS_FEEDBACK_DAYS");
      v != nullptr) {
    cfg.engine.fans_feedback_days = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_OVERALL_FEEDBACK_DAYS");
      v != nullptr) {
    cfg.engine.overall_feedback_days = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_TASK_TTL_DAYS"); v != nullptr) {
    cfg.engine.task_ttl_days = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_CATCHUP_INTERVAL_SEC");
      v != nullptr) {
    cfg.scheduler.catchup_interval_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_CHECK_ON_START"); v != nullptr) {
    cfg.scheduler.check_on_start = is_truthy(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_RETRY_MAX_ATTEMPTS");
      v != nullptr) {
    cfg.retry.max_attempts = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_RETRY_BASE_DELAY_MS");
      v != nullptr) {
    cfg.retry.base_delay_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_RETRY_MAX_DELAY_MS");
      v != nullptr) {
    cfg.retry.max_delay_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("CONTENTFLOW_STORE_BACKEND"); v != nullptr) {
    auto backend = parse<StoreBackend>(v);
    if (!backend) {
      log::error("Unknown CONTENTFLOW_STORE_BACKEND '{}'", v);
      return fail(Error::ParseError);
    }
    cfg.store.backend = *backend;
  }
  if (const char *v = std::getenv("CONTENTFLOW_DATA_FILE"); v != nullptr) {
    cfg.store.data_file = v;
  }
  if (const char *v = std::getenv("CONTENTFLOW_MARKER_FILE"); v != nullptr) {
    cfg.store.marker_file = v;
  }
  if (const char *v = std::getenv("CONTENTFLOW_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("CONTENTFLOW_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<ServiceConfig> {
  auto raw_result = toml_util::parse_toml<detail::ServiceToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  ServiceConfig cfg{};
  cfg.engine.fans_feedback_days = raw.engine.fans_feedback_days;
  cfg.engine.overall_feedback_days = raw.engine.overall_feedback_days;
  cfg.engine.task_ttl_days = raw.engine.task_ttl_days;

  cfg.scheduler.catchup_interval_sec = raw.scheduler.catchup_interval_sec;
  cfg.scheduler.marker_key = std::move(raw.scheduler.marker_key);
  cfg.scheduler.check_on_start = raw.scheduler.check_on_start;

  cfg.retry.max_attempts = raw.retry.max_attempts;
  cfg.retry.base_delay_ms = raw.retry.base_delay_ms;
  cfg.retry.backoff_factor = raw.retry.backoff_factor;
  cfg.retry.max_delay_ms = raw.retry.max_delay_ms;

  auto backend = parse<StoreBackend>(raw.store.backend);
  if (!backend) {
    log::error("Unknown store backend '{}'", raw.store.backend);
    return fail(Error::ParseError);
  }
  cfg.store.backend = *backend;
  cfg.store.data_file = std::move(raw.store.data_file);
  cfg.store.marker_file = std::move(raw.store.marker_file);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  return ok(std::move(cfg));
}

[[nodiscard]] auto finish(ServiceConfig cfg) -> Result<ServiceConfig> {
  if (auto r = apply_env_overrides(cfg); !r) {
    return fail(r.error());
  }
  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto validate(const ServiceConfig &cfg) -> Result<void> {
  const auto &e = cfg.engine;
  const auto &r = cfg.retry;
  if (e.fans_feedback_days < 0 || e.overall_feedback_days < 0 ||
      e.task_ttl_days <= 0) {
    log::error("Invalid [engine] settings");
    return fail(Error::ParseError);
  }
  if (cfg.scheduler.catchup_interval_sec <= 0 ||
      cfg.scheduler.marker_key.empty()) {
    log::error("Invalid [scheduler] settings");
    return fail(Error::ParseError);
  }
  if (r.max_attempts < 1 || r.base_delay_ms < 0 || r.backoff_factor < 1.0 ||
      r.max_delay_ms < r.base_delay_ms) {
    log::error("Invalid [retry] settings");
    return fail(Error::ParseError);
  }
  if (cfg.store.backend == StoreBackend::File &&
      (cfg.store.data_file.empty() || cfg.store.marker_file.empty())) {
    log::error("File store requires data_file and marker_file");
    return fail(Error::ParseError);
  }
  if (!log::parse_level(cfg.log.level)) {
    log::error("Unknown log level '{}'", cfg.log.level);
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ServiceConfig> {
  auto text = util::read_file(std::string(path));
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<ServiceConfig> {
  try {
    auto cfg = convert_toml(toml_str);
    if (!cfg) {
      return fail(cfg.error());
    }
    return finish(std::move(*cfg));
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<ServiceConfig> {
  try {
    return finish(ServiceConfig{});
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto to_rule_thresholds(const EngineSettings &s) -> RuleThresholds {
  return RuleThresholds{
      .fans_feedback = std::chrono::days(s.fans_feedback_days),
      .overall_feedback = std::chrono::days(s.overall_feedback_days)};
}

auto to_retry_config(const RetrySettings &s) -> RetryConfig {
  RetryConfig out;
  out.max_attempts = s.max_attempts;
  out.base_delay = std::chrono::milliseconds(s.base_delay_ms);
  out.backoff_factor = s.backoff_factor;
  out.max_delay = std::chrono::milliseconds(s.max_delay_ms);
  return out;
}

auto to_scheduler_config(const SchedulerSettings &s) -> SchedulerConfig {
  SchedulerConfig out;
  out.catchup_interval = std::chrono::seconds(s.catchup_interval_sec);
  out.marker_key = s.marker_key;
  out.check_on_start = s.check_on_start;
  return out;
}

} // namespace contentflow
