#include "contentflow/resilience/offline_queue.hpp"

#include "contentflow/core/fault.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/util/log.hpp"

#include <exception>
#include <utility>

namespace contentflow {

OfflineQueue::OfflineQueue(boost::asio::any_io_executor executor,
                           bool initially_online, RetryExecutor *retry,
                           Clock clock)
    : executor_(std::move(executor)), retry_(retry), clock_(std::move(clock)),
      online_(initially_online) {
  if (online_) {
    last_online_ = now();
  } else {
    last_offline_ = now();
  }
}

OfflineQueue::~OfflineQueue() { detach(); }

auto OfflineQueue::now() const -> TimePoint {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

auto OfflineQueue::handle_online() -> void {
  const bool transition = !online_;
  online_ = true;
  last_online_ = now();
  if (!transition) {
    return;
  }
  was_offline_ = true;
  log::info("Connectivity restored, {} pending operation(s)", pending_.size());

  co_spawn(executor_, sync_pending_operations(),
           [](std::exception_ptr eptr, SyncReport report) {
             if (eptr) {
               log::error("Automatic offline sync failed: {}",
                          fault_from_exception(eptr).message());
               return;
             }
             if (!report.skipped) {
               log::info("Automatic offline sync: {}/{} succeeded, {} requeued",
                         report.succeeded, report.attempted, report.requeued);
             }
           });
}

auto OfflineQueue::handle_offline() -> void {
  if (online_) {
    log::warn("Connectivity lost, mutations will be queued");
  }
  online_ = false;
  last_offline_ = now();
}

auto OfflineQueue::add_pending_operation(std::string name, Operation op)
    -> void {
  log::debug("Queued operation '{}' ({} pending)", name, pending_.size() + 1);
  pending_.push_back(PendingOperation{
      .name = std::move(name), .operation = std::move(op), .enqueued_at = now()});
}

auto OfflineQueue::run_one(const PendingOperation &op) -> task<bool> {
  if (retry_ != nullptr) {
    auto outcome = co_await retry_->execute(op.name, op.operation);
    co_return outcome.has_value();
  }

  std::optional<Fault> fault;
  try {
    auto result = co_await op.operation();
    if (result) {
      co_return true;
    }
    fault = Fault{result.error()};
  } catch (...) {
    fault = fault_from_exception(std::current_exception());
  }
  log::error("Failed to sync pending operation '{}': {}", op.name,
             fault->message());
  co_return false;
}

auto OfflineQueue::sync_pending_operations() -> task<SyncReport> {
  SyncReport report;
  if (!online_ || pending_.empty()) {
    report.skipped = true;
    co_return report;
  }

  auto snapshot = std::exchange(pending_, {});
  syncing_ = true;
  for (auto &op : snapshot) {
    ++report.attempted;
    if (co_await run_one(op)) {
      ++report.succeeded;
      continue;
    }
    ++report.requeued;
    pending_.push_back(std::move(op));
  }
  syncing_ = false;
  co_return report;
}

auto OfflineQueue::pending_names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(pending_.size());
  for (const auto &op : pending_) {
    out.push_back(op.name);
  }
  return out;
}

auto OfflineQueue::attach(HostSignals &signals) -> void {
  detach();
  signals_ = &signals;
  subscriptions_.push_back(
      signals.subscribe(HostEvent::Online, [this] { handle_online(); }));
  subscriptions_.push_back(
      signals.subscribe(HostEvent::Offline, [this] { handle_offline(); }));
}

auto OfflineQueue::detach() -> void {
  if (signals_ == nullptr) {
    return;
  }
  for (auto id : subscriptions_) {
    signals_->unsubscribe(id);
  }
  subscriptions_.clear();
  signals_ = nullptr;
}

} // namespace contentflow
