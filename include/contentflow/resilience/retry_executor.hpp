#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/core/fault.hpp"
#include "contentflow/resilience/error_reporter.hpp"
#include "contentflow/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace contentflow {

struct RetryConfig {
  int max_attempts{retry_defaults::kMaxAttempts};
  std::chrono::milliseconds base_delay{retry_defaults::kBaseDelay};
  double backoff_factor{retry_defaults::kBackoffFactor};
  std::chrono::milliseconds max_delay{retry_defaults::kMaxDelay};
  std::function<bool(const Fault &)> retry_condition{is_retryable};
};

// One-off overrides for execute_with(); unset fields keep the defaults.
struct RetryOverrides {
  std::optional<int> max_attempts;
  std::optional<std::chrono::milliseconds> base_delay;
  std::optional<double> backoff_factor;
  std::optional<std::chrono::milliseconds> max_delay;
  std::function<bool(const Fault &)> retry_condition;

  [[nodiscard]] auto apply(RetryConfig base) const -> RetryConfig {
    if (max_attempts) {
      base.max_attempts = *max_attempts;
    }
    if (base_delay) {
      base.base_delay = *base_delay;
    }
    if (backoff_factor) {
      base.backoff_factor = *backoff_factor;
    }
    if (max_delay) {
      base.max_delay = *max_delay;
    }
    if (retry_condition) {
      base.retry_condition = retry_condition;
    }
    return base;
  }
};

// min(base * factor^(attempt-1), max_delay), attempt counted from 1.
[[nodiscard]] inline auto backoff_delay(const RetryConfig &cfg, int attempt)
    -> std::chrono::milliseconds {
  const auto exponent = static_cast<double>(std::max(attempt, 1) - 1);
  const auto raw = static_cast<double>(cfg.base_delay.count()) *
                   std::pow(cfg.backoff_factor, exponent);
  const auto cap = static_cast<double>(cfg.max_delay.count());
  return std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(std::min(raw, cap))};
}

struct RetryState {
  int attempt_count{0};
  bool is_retrying{false};
  std::optional<Fault> last_error;
};

namespace detail {

template <typename> struct retry_result;

template <typename T> struct retry_result<task<Result<T>>> {
  using type = T;
};

template <typename Op>
using retry_value_t =
    typename retry_result<std::invoke_result_t<Op &>>::type;

} // namespace detail

// Runs a fallible coroutine with bounded, backed-off retries. An operation is
// any callable returning task<Result<T>>; it is invoked once per attempt.
// Thrown exceptions are coerced into a Fault and treated like an error
// result. Every terminal failure is reported exactly once. An instance runs
// one operation at a time; callers that can overlap each need their own.
class RetryExecutor {
public:
  using Sleeper = std::function<task<void>(std::chrono::milliseconds)>;

  explicit RetryExecutor(ErrorReporter &reporter, RetryConfig config = {},
                         Sleeper sleeper = {})
      : reporter_(reporter), config_(std::move(config)),
        sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
      sleeper_ = [](std::chrono::milliseconds delay) -> task<void> {
        (void)co_await async_sleep(delay);
      };
    }
  }

  RetryExecutor(const RetryExecutor &) = delete;
  auto operator=(const RetryExecutor &) -> RetryExecutor & = delete;

  template <typename Op>
  auto execute(std::string name, Op op)
      -> task<Outcome<detail::retry_value_t<Op>>> {
    return run<detail::retry_value_t<Op>>(config_, std::move(name),
                                          std::move(op));
  }

  template <typename Op>
  auto execute_with(const RetryOverrides &overrides, std::string name, Op op)
      -> task<Outcome<detail::retry_value_t<Op>>> {
    return run<detail::retry_value_t<Op>>(overrides.apply(config_),
                                          std::move(name), std::move(op));
  }

  [[nodiscard]] auto state() const noexcept -> const RetryState & {
    return state_;
  }
  [[nodiscard]] auto is_retrying() const noexcept -> bool {
    return state_.is_retrying;
  }
  [[nodiscard]] auto attempt_count() const noexcept -> int {
    return state_.attempt_count;
  }
  [[nodiscard]] auto last_error() const noexcept
      -> const std::optional<Fault> & {
    return state_.last_error;
  }
  [[nodiscard]] auto config() const noexcept -> const RetryConfig & {
    return config_;
  }

private:
  template <typename T, typename Op>
  auto run(RetryConfig cfg, std::string name, Op op) -> task<Outcome<T>> {
    if (name.empty()) {
      name = "Operation";
    }
    const int max_attempts = std::max(cfg.max_attempts, 1);
    state_ = RetryState{.attempt_count = 0, .is_retrying = true};

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
      state_.attempt_count = attempt;

      std::optional<Fault> fault;
      try {
        auto result = co_await op();
        if (result) {
          state_ = RetryState{.attempt_count = attempt, .is_retrying = false};
          if constexpr (std::is_void_v<T>) {
            co_return Outcome<T>{};
          } else {
            co_return Outcome<T>{std::move(*result)};
          }
        }
        fault = Fault{result.error()};
      } catch (...) {
        // Coerced into a Fault and reported below.
        fault = fault_from_exception(std::current_exception());
      }

      state_.last_error = *fault;
      const bool retryable =
          cfg.retry_condition ? cfg.retry_condition(*fault) : false;

      if (!retryable) {
        state_.is_retrying = false;
        reporter_.report(*fault,
                         std::format("{} failed: {}", name, fault->message()),
                         ReportMeta{.attempt = attempt});
        co_return std::unexpected(std::move(*fault));
      }
      if (attempt == max_attempts) {
        state_.is_retrying = false;
        reporter_.report(*fault,
                         std::format("{} failed after {} attempts: {}", name,
                                     attempt, fault->message()),
                         ReportMeta{.attempt = attempt});
        co_return std::unexpected(std::move(*fault));
      }

      const auto delay = backoff_delay(cfg, attempt);
      log::debug("{} attempt {}/{} failed ({}), retrying in {}ms", name,
                 attempt, max_attempts, fault->message(), delay.count());
      co_await sleeper_(delay);
    }

    // Unreachable: the last attempt always returns above.
    state_.is_retrying = false;
    co_return std::unexpected(Fault{make_error_code(Error::Unknown)});
  }

  ErrorReporter &reporter_;
  RetryConfig config_;
  Sleeper sleeper_;
  RetryState state_;
};

// Operation-in, operation-out: the returned callable runs `op` through
// `executor` under `name` each time it is invoked. The executor must outlive
// the returned callable.
template <typename Op>
[[nodiscard]] auto with_retry(RetryExecutor &executor, std::string name, Op op) {
  return [&executor, name = std::move(name), op = std::move(op)]() {
    return executor.execute(name, op);
  };
}

} // namespace contentflow
