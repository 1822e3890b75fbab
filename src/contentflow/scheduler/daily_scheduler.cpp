#include "contentflow/scheduler/daily_scheduler.hpp"

#include "contentflow/core/fault.hpp"
#include "contentflow/util/log.hpp"
#include "contentflow/util/time.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <format>
#include <utility>

namespace contentflow {

DailyScheduler::DailyScheduler(boost::asio::any_io_executor executor,
                               TaskRulesEngine &engine, MarkerStore &marker,
                               ErrorReporter &reporter, SchedulerConfig config,
                               Clock clock)
    : executor_(std::move(executor)), engine_(engine), marker_(marker),
      reporter_(reporter), config_(std::move(config)),
      clock_(std::move(clock)) {}

DailyScheduler::~DailyScheduler() {
  release_subscriptions();
  if (boundary_timer_) {
    boundary_timer_->cancel();
  }
  if (catchup_timer_) {
    catchup_timer_->cancel();
  }
}

auto DailyScheduler::now() const -> TimePoint {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

auto DailyScheduler::start() -> void {
  if (running_) {
    log::warn("Task scheduler is already running");
    return;
  }
  running_ = true;

  boundary_timer_ = std::make_shared<boost::asio::steady_timer>(executor_);
  catchup_timer_ = std::make_shared<boost::asio::steady_timer>(executor_);
  co_spawn(executor_, boundary_loop(boundary_timer_), detached);
  co_spawn(executor_, catchup_loop(catchup_timer_, config_.check_on_start),
           detached);

  const auto current = now();
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(
      util::next_local_midnight(current) - current);
  log::info("Task scheduler started, next daily run in {} minutes",
            minutes.count());
}

auto DailyScheduler::stop() -> void {
  if (boundary_timer_) {
    boundary_timer_->cancel();
    boundary_timer_.reset();
  }
  if (catchup_timer_) {
    catchup_timer_->cancel();
    catchup_timer_.reset();
  }
  if (running_) {
    running_ = false;
    log::info("Task scheduler stopped");
  }
}

auto DailyScheduler::initialize(HostSignals &signals) -> void {
  start();

  release_subscriptions();
  signals_ = &signals;
  subscriptions_.push_back(
      signals.subscribe(HostEvent::VisibilityRegained, [this] {
        log::info("Visibility regained, checking daily tasks");
        co_spawn(executor_, trigger("visibility"), detached);
      }));
  subscriptions_.push_back(
      signals.subscribe(HostEvent::Teardown, [this] { stop(); }));
}

auto DailyScheduler::release_subscriptions() -> void {
  if (signals_ == nullptr) {
    return;
  }
  for (auto id : subscriptions_) {
    signals_->unsubscribe(id);
  }
  subscriptions_.clear();
  signals_ = nullptr;
}

auto DailyScheduler::wait_on(const TimerPtr &timer,
                             std::chrono::system_clock::duration delay)
    -> task<bool> {
  if (delay < std::chrono::system_clock::duration::zero()) {
    delay = std::chrono::system_clock::duration::zero();
  }
  timer->expires_after(
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(delay));

  boost::system::error_code ec;
  co_await timer->async_wait(
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec == boost::asio::error::operation_aborted) {
    co_return false;
  }
  if (ec) {
    log::warn("Scheduler timer wait failed: {}", ec.message());
    co_return false;
  }
  co_return true;
}

auto DailyScheduler::boundary_loop(TimerPtr timer) -> task<void> {
  while (running_ && boundary_timer_ == timer) {
    const auto current = now();
    const auto next = util::next_local_midnight(current);
    if (!co_await wait_on(timer, next - current)) {
      co_return;
    }
    if (!running_ || boundary_timer_ != timer) {
      co_return;
    }
    co_await trigger("midnight");
  }
}

auto DailyScheduler::catchup_loop(TimerPtr timer, bool check_first)
    -> task<void> {
  if (check_first) {
    co_await trigger("startup");
  }
  while (running_ && catchup_timer_ == timer) {
    if (!co_await wait_on(timer, config_.catchup_interval)) {
      co_return;
    }
    if (!running_ || catchup_timer_ != timer) {
      co_return;
    }
    co_await trigger("catch-up poll");
  }
}

auto DailyScheduler::trigger(std::string source) -> task<void> {
  Result<DailyRunReport> result;
  try {
    result = co_await check_and_run();
  } catch (...) {
    const auto fault = fault_from_exception(std::current_exception());
    reporter_.report(fault, std::format("Daily task run ({}) failed: {}",
                                        source, fault.message()));
    co_return;
  }
  if (!result) {
    reporter_.report(Fault{result.error()},
                     std::format("Daily task run ({}) failed: {}", source,
                                 result.error().message()));
    co_return;
  }
  if (!result->ran) {
    log::debug("Daily tasks already ran today ({}), skipping {} trigger",
               result->date, source);
  }
}

auto DailyScheduler::check_and_run() -> task<Result<DailyRunReport>> {
  auto today = util::local_date_string(now());

  auto stored = marker_.get(config_.marker_key);
  if (!stored) {
    co_return fail(stored.error());
  }
  if (*stored && **stored == today) {
    co_return ok(DailyRunReport{.ran = false, .date = std::move(today)});
  }
  co_return co_await run_daily_job(std::move(today));
}

auto DailyScheduler::force_run() -> task<Result<DailyRunReport>> {
  log::info("Force running daily tasks");
  auto result = co_await run_daily_job(util::local_date_string(now()));
  if (!result) {
    log::error("Forced daily run failed: {}", result.error().message());
  }
  co_return result;
}

auto DailyScheduler::run_daily_job(std::string today)
    -> task<Result<DailyRunReport>> {
  log::info("Running daily automated tasks");
  const auto started = std::chrono::steady_clock::now();

  auto evaluation = co_await engine_.evaluate_rules();
  if (!evaluation) {
    co_return fail(evaluation.error());
  }

  DailyRunReport report{.ran = true,
                        .date = std::move(today),
                        .evaluation = std::move(*evaluation)};

  // Expiry cleanup failures are reported by the retry executor and do not
  // fail the day.
  if (auto swept = co_await engine_.sweep_expired_tasks(); swept) {
    report.expired_removed = *swept;
  } else {
    log::warn("Expired task cleanup failed: {}", swept.error().message());
  }

  if (auto r = marker_.set(config_.marker_key, report.date); !r) {
    co_return fail(r.error());
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  log::info("Daily tasks completed in {}ms: {} created, {} failed, {} expired "
            "removed",
            elapsed.count(), report.evaluation.total_created(),
            report.evaluation.failures, report.expired_removed);
  co_return ok(std::move(report));
}

auto DailyScheduler::status() const -> SchedulerStatus {
  SchedulerStatus out{.is_running = running_};
  if (running_) {
    out.next_run_time = util::next_local_midnight(now());
  }
  if (auto stored = marker_.get(config_.marker_key); stored && *stored) {
    out.last_run_date = **stored;
  }
  return out;
}

} // namespace contentflow
