#pragma once

#include "contentflow/core/coroutine.hpp"
#include "contentflow/core/fault.hpp"
#include "contentflow/resilience/offline_queue.hpp"
#include "contentflow/resilience/retry_executor.hpp"
#include "contentflow/util/log.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace contentflow {

enum class Submission : std::uint8_t {
  Completed, // ran now, through the retry executor
  Queued,    // offline; parked on the queue for the next sync
};

// Front door for mutations issued by callers outside the engine: online
// calls go through RetryExecutor, offline calls are deferred on OfflineQueue.
class ResilientGateway {
public:
  using Operation = OfflineQueue::Operation;

  ResilientGateway(RetryExecutor &retry, OfflineQueue &queue)
      : retry_(retry), queue_(queue) {}

  auto submit(std::string name, Operation op) -> task<Outcome<Submission>> {
    if (!queue_.is_online()) {
      log::info("Offline: deferring '{}'", name);
      queue_.add_pending_operation(std::move(name), std::move(op));
      co_return Submission::Queued;
    }
    auto outcome = co_await retry_.execute(std::move(name), std::move(op));
    if (!outcome) {
      co_return std::unexpected(std::move(outcome.error()));
    }
    co_return Submission::Completed;
  }

private:
  RetryExecutor &retry_;
  OfflineQueue &queue_;
};

} // namespace contentflow
