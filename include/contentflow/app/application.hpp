#pragma once

#include "contentflow/config/config.hpp"
#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/engine/task_rules_engine.hpp"
#include "contentflow/host/host_signals.hpp"
#include "contentflow/resilience/error_reporter.hpp"
#include "contentflow/resilience/offline_queue.hpp"
#include "contentflow/resilience/resilient_gateway.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/scheduler/daily_scheduler.hpp"
#include "contentflow/storage/json_file_store.hpp"
#include "contentflow/storage/memory_store.hpp"
#include "contentflow/storage/repository.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <memory>
#include <utility>

namespace contentflow {

// Composition root: owns the io_context, the stores and every component,
// and wires them to the host signal hub.
class Application {
public:
  Application();
  explicit Application(ServiceConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const ServiceConfig & {
    return config_;
  }

  // Opens the stores and builds the component graph.
  [[nodiscard]] auto init() -> Result<void>;

  // Starts the scheduler and subscribes it and the offline queue to the host
  // signals.
  [[nodiscard]] auto start() -> Result<void>;
  // Emits the teardown signal.
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // start(), then run the event loop until SIGINT/SIGTERM. SIGUSR1 is
  // forwarded as visibility-regained.
  [[nodiscard]] auto serve() -> Result<void>;

  // Runs `op` to completion on the application's io_context. Not for use
  // while serve() is running.
  template <typename T> auto block_on(task<T> op) -> T {
    auto fut = co_spawn(io_, std::move(op), boost::asio::use_future);
    io_.run();
    io_.restart();
    return fut.get();
  }

  // Adds or updates a content item in the active store.
  [[nodiscard]] auto save_content(Content content) -> Result<void>;

  [[nodiscard]] auto io() noexcept -> boost::asio::io_context & { return io_; }
  [[nodiscard]] auto signals() noexcept -> HostSignals & { return signals_; }
  [[nodiscard]] auto reporter() noexcept -> LogErrorReporter & {
    return reporter_;
  }
  [[nodiscard]] auto store() -> MemoryStore &;
  [[nodiscard]] auto engine() -> TaskRulesEngine &;
  [[nodiscard]] auto scheduler() -> DailyScheduler &;
  // One executor per component, all built from the [retry] settings, so
  // their live retry state never interleaves.
  [[nodiscard]] auto engine_retry() -> RetryExecutor &;
  [[nodiscard]] auto queue_retry() -> RetryExecutor &;
  [[nodiscard]] auto gateway_retry() -> RetryExecutor &;
  [[nodiscard]] auto offline_queue() -> OfflineQueue &;
  [[nodiscard]] auto gateway() -> ResilientGateway &;

private:
  ServiceConfig config_;

  boost::asio::io_context io_;
  LogErrorReporter reporter_;
  HostSignals signals_;

  std::unique_ptr<MemoryStore> store_;
  JsonFileStore *file_store_{nullptr}; // store_ when the file backend is used
  std::unique_ptr<MarkerStore> marker_;
  std::unique_ptr<RetryExecutor> engine_retry_;
  std::unique_ptr<RetryExecutor> queue_retry_;
  std::unique_ptr<RetryExecutor> gateway_retry_;
  std::unique_ptr<OfflineQueue> queue_;
  std::unique_ptr<ResilientGateway> gateway_;
  std::unique_ptr<TaskRulesEngine> engine_;
  std::unique_ptr<DailyScheduler> scheduler_;
};

} // namespace contentflow
