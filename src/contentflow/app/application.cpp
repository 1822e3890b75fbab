#include "contentflow/app/application.hpp"

#include "contentflow/storage/marker_store.hpp"
#include "contentflow/util/log.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <csignal>
#include <system_error>

namespace contentflow {
namespace {

template <typename T> auto require(const std::unique_ptr<T> &p) -> T & {
  if (!p) {
    throw std::system_error(make_error_code(Error::InvalidState),
                            "Application::init() has not been called");
  }
  return *p;
}

} // namespace

Application::Application() : Application(ServiceConfig{}) {}

Application::Application(ServiceConfig config) : config_(std::move(config)) {}

Application::~Application() { stop(); }

auto Application::init() -> Result<void> {
  if (store_) {
    return ok();
  }
  const auto ttl = std::chrono::days(config_.engine.task_ttl_days);

  if (config_.store.backend == StoreBackend::File) {
    auto store = JsonFileStore::open(config_.store.data_file, ttl);
    if (!store) {
      log::error("Failed to open store {}: {}", config_.store.data_file,
                 store.error().message());
      return fail(store.error());
    }
    auto marker = FileMarkerStore::open(config_.store.marker_file);
    if (!marker) {
      log::error("Failed to open marker file {}: {}",
                 config_.store.marker_file, marker.error().message());
      return fail(marker.error());
    }
    file_store_ = store->get();
    store_ = std::move(*store);
    marker_ = std::move(*marker);
  } else {
    store_ = std::make_unique<MemoryStore>(ttl);
    marker_ = std::make_unique<MemoryMarkerStore>();
  }

  const auto retry_config = to_retry_config(config_.retry);
  engine_retry_ = std::make_unique<RetryExecutor>(reporter_, retry_config);
  queue_retry_ = std::make_unique<RetryExecutor>(reporter_, retry_config);
  gateway_retry_ = std::make_unique<RetryExecutor>(reporter_, retry_config);
  queue_ = std::make_unique<OfflineQueue>(
      io_.get_executor(), signals_.online(), queue_retry_.get());
  gateway_ = std::make_unique<ResilientGateway>(*gateway_retry_, *queue_);
  engine_ = std::make_unique<TaskRulesEngine>(
      *store_, *store_, reporter_, *engine_retry_,
      default_rules(to_rule_thresholds(config_.engine)));
  scheduler_ = std::make_unique<DailyScheduler>(
      io_.get_executor(), *engine_, *marker_, reporter_,
      to_scheduler_config(config_.scheduler));

  log::debug("Application initialised ({} store)",
             to_string_view(config_.store.backend));
  return ok();
}

auto Application::start() -> Result<void> {
  if (!scheduler_) {
    return fail(Error::InvalidState);
  }
  if (scheduler_->is_running()) {
    return ok();
  }
  queue_->attach(signals_);
  scheduler_->initialize(signals_);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!scheduler_ || !scheduler_->is_running()) {
    return;
  }
  signals_.emit(HostEvent::Teardown);
  if (queue_) {
    queue_->detach();
  }
}

auto Application::is_running() const noexcept -> bool {
  return scheduler_ && scheduler_->is_running();
}

auto Application::serve() -> Result<void> {
  if (auto r = start(); !r) {
    return r;
  }

  boost::asio::signal_set os_signals(io_, SIGINT, SIGTERM, SIGUSR1);
  co_spawn(
      io_,
      [this, &os_signals]() -> task<void> {
        for (;;) {
          boost::system::error_code ec;
          const int signo = co_await os_signals.async_wait(
              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec) {
            co_return;
          }
          if (signo == SIGUSR1) {
            signals_.emit(HostEvent::VisibilityRegained);
            continue;
          }
          log::info("Received signal {}, shutting down", signo);
          stop();
          co_return;
        }
      },
      detached);

  io_.run();
  io_.restart();
  return ok();
}

auto Application::save_content(Content content) -> Result<void> {
  if (!store_) {
    return fail(Error::InvalidState);
  }
  if (file_store_ != nullptr) {
    return file_store_->save_content(std::move(content));
  }
  return store_->upsert_content(std::move(content));
}

auto Application::store() -> MemoryStore & { return require(store_); }

auto Application::engine() -> TaskRulesEngine & { return require(engine_); }

auto Application::scheduler() -> DailyScheduler & {
  return require(scheduler_);
}

auto Application::engine_retry() -> RetryExecutor & {
  return require(engine_retry_);
}

auto Application::queue_retry() -> RetryExecutor & {
  return require(queue_retry_);
}

auto Application::gateway_retry() -> RetryExecutor & {
  return require(gateway_retry_);
}

auto Application::offline_queue() -> OfflineQueue & { return require(queue_); }

auto Application::gateway() -> ResilientGateway & { return require(gateway_); }

} // namespace contentflow
