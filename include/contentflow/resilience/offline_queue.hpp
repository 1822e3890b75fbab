#pragma once

#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/error.hpp"
#include "contentflow/host/host_signals.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace contentflow {

class RetryExecutor;

struct PendingOperation {
  using Operation = std::function<task<Result<void>>()>;

  std::string name;
  Operation operation;
  std::chrono::system_clock::time_point enqueued_at{};
};

struct SyncReport {
  std::size_t attempted{0};
  std::size_t succeeded{0};
  std::size_t requeued{0};
  bool skipped{false}; // offline or nothing queued
};

// Memory-resident buffer of deferred mutations. Queued operations are lost on
// process exit. A failed operation is never dropped; it goes back to the tail
// of the queue.
class OfflineQueue {
public:
  using Operation = PendingOperation::Operation;
  using TimePoint = std::chrono::system_clock::time_point;
  using Clock = std::function<TimePoint()>;

  // `retry` is optional; when set, each drained operation runs through it.
  OfflineQueue(boost::asio::any_io_executor executor, bool initially_online,
               RetryExecutor *retry = nullptr, Clock clock = {});
  ~OfflineQueue();

  OfflineQueue(const OfflineQueue &) = delete;
  auto operator=(const OfflineQueue &) -> OfflineQueue & = delete;

  // Connectivity transitions. An offline->online transition schedules exactly
  // one sync on the executor.
  auto handle_online() -> void;
  auto handle_offline() -> void;

  auto add_pending_operation(std::string name, Operation op) -> void;

  // Drains a snapshot of the queue sequentially. Operations added while the
  // drain runs stay queued for the next sync.
  auto sync_pending_operations() -> task<SyncReport>;

  auto clear_was_offline_flag() -> void { was_offline_ = false; }

  // Follow Online/Offline events from `signals` until detach() or
  // destruction.
  auto attach(HostSignals &signals) -> void;
  auto detach() -> void;

  [[nodiscard]] auto is_online() const noexcept -> bool { return online_; }
  [[nodiscard]] auto was_offline() const noexcept -> bool {
    return was_offline_;
  }
  [[nodiscard]] auto pending_count() const noexcept -> std::size_t {
    return pending_.size();
  }
  [[nodiscard]] auto pending_names() const -> std::vector<std::string>;
  [[nodiscard]] auto last_online_time() const noexcept
      -> std::optional<TimePoint> {
    return last_online_;
  }
  [[nodiscard]] auto last_offline_time() const noexcept
      -> std::optional<TimePoint> {
    return last_offline_;
  }
  [[nodiscard]] auto is_syncing() const noexcept -> bool { return syncing_; }

private:
  [[nodiscard]] auto now() const -> TimePoint;
  auto run_one(const PendingOperation &op) -> task<bool>;

  boost::asio::any_io_executor executor_;
  RetryExecutor *retry_;
  Clock clock_;

  bool online_;
  bool was_offline_{false};
  bool syncing_{false};
  std::optional<TimePoint> last_online_;
  std::optional<TimePoint> last_offline_;
  std::vector<PendingOperation> pending_;

  HostSignals *signals_{nullptr};
  std::vector<HostSignals::SubscriptionId> subscriptions_;
};

} // namespace contentflow
