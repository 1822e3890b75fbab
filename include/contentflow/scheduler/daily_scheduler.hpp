#pragma once

#include "contentflow/core/constants.hpp"
#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/engine/task_rules_engine.hpp"
#include "contentflow/host/host_signals.hpp"
#include "contentflow/resilience/error_reporter.hpp"
#include "contentflow/storage/repository.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace contentflow {

struct SchedulerConfig {
  std::chrono::milliseconds catchup_interval{timing::kCatchupPollInterval};
  std::string marker_key{storage::kLastRunMarkerKey};
  // Run a catch-up check as soon as start() is called.
  bool check_on_start{true};
};

struct SchedulerStatus {
  bool is_running{false};
  std::optional<std::chrono::system_clock::time_point> next_run_time;
  std::optional<std::string> last_run_date;
};

struct DailyRunReport {
  bool ran{false}; // false when today's run had already happened
  std::string date;
  EvaluationReport evaluation;
  std::size_t expired_removed{0};
};

// Drives TaskRulesEngine once per local calendar day.
//
// Two timers run while started: a one-shot boundary timer at the next local
// midnight (re-armed after each fire) and a periodic catch-up poll for
// boundaries missed while the process was suspended. Every trigger goes
// through check_and_run(), which compares the persisted last-run date with
// today, so the daily job runs at most once per day however many timers
// fire. Nothing stops a timer-driven run from overlapping force_run().
class DailyScheduler {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using Clock = std::function<TimePoint()>;

  DailyScheduler(boost::asio::any_io_executor executor, TaskRulesEngine &engine,
                 MarkerStore &marker, ErrorReporter &reporter,
                 SchedulerConfig config = {}, Clock clock = {});
  ~DailyScheduler();

  DailyScheduler(const DailyScheduler &) = delete;
  auto operator=(const DailyScheduler &) -> DailyScheduler & = delete;

  auto start() -> void;
  // Cancels the timers. A run already in progress completes.
  auto stop() -> void;

  // start() plus visibility-regained (catch-up check) and teardown (stop)
  // subscriptions on `signals`.
  auto initialize(HostSignals &signals) -> void;

  // Runs the daily job unless the marker already holds today's date. The
  // marker is only written after a successful evaluation.
  auto check_and_run() -> task<Result<DailyRunReport>>;

  // Runs the daily job and rewrites the marker regardless of the date. Does
  // not change the running state.
  auto force_run() -> task<Result<DailyRunReport>>;

  [[nodiscard]] auto status() const -> SchedulerStatus;
  [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }
  [[nodiscard]] auto config() const noexcept -> const SchedulerConfig & {
    return config_;
  }

private:
  using TimerPtr = std::shared_ptr<boost::asio::steady_timer>;

  [[nodiscard]] auto now() const -> TimePoint;
  auto run_daily_job(std::string today) -> task<Result<DailyRunReport>>;
  // check_and_run() with whole-run failures reported instead of returned.
  auto trigger(std::string source) -> task<void>;
  auto boundary_loop(TimerPtr timer) -> task<void>;
  auto catchup_loop(TimerPtr timer, bool check_first) -> task<void>;
  [[nodiscard]] auto wait_on(const TimerPtr &timer,
                             std::chrono::system_clock::duration delay)
      -> task<bool>;
  auto release_subscriptions() -> void;

  boost::asio::any_io_executor executor_;
  TaskRulesEngine &engine_;
  MarkerStore &marker_;
  ErrorReporter &reporter_;
  SchedulerConfig config_;
  Clock clock_;

  bool running_{false};
  TimerPtr boundary_timer_;
  TimerPtr catchup_timer_;

  HostSignals *signals_{nullptr};
  std::vector<HostSignals::SubscriptionId> subscriptions_;
};

} // namespace contentflow
