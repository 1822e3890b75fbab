#pragma once

#include "contentflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <functional>
#include <vector>

namespace contentflow {

// Lifecycle and connectivity notifications from the embedding host.
enum class HostEvent : std::uint8_t {
  Online,
  Offline,
  VisibilityRegained,
  Teardown,
};
BOOST_DESCRIBE_ENUM(HostEvent, Online, Offline, VisibilityRegained, Teardown)
CONTENTFLOW_DEFINE_ENUM_SERDE(HostEvent)

// Synchronous publish/subscribe hub. Handlers run on the emitting thread, in
// subscription order; a handler may unsubscribe itself or others.
class HostSignals {
public:
  using Handler = std::function<void()>;
  using SubscriptionId = std::uint64_t;

  explicit HostSignals(bool initially_online = true)
      : online_(initially_online) {}

  HostSignals(const HostSignals &) = delete;
  auto operator=(const HostSignals &) -> HostSignals & = delete;

  [[nodiscard]] auto subscribe(HostEvent event, Handler handler)
      -> SubscriptionId;
  auto unsubscribe(SubscriptionId id) -> bool;

  auto emit(HostEvent event) -> void;

  [[nodiscard]] auto online() const noexcept -> bool { return online_; }
  [[nodiscard]] auto subscriber_count() const noexcept -> std::size_t {
    return subscriptions_.size();
  }

private:
  struct Subscription {
    SubscriptionId id;
    HostEvent event;
    Handler handler;
  };

  std::vector<Subscription> subscriptions_;
  SubscriptionId next_id_{1};
  bool online_;
};

} // namespace contentflow
