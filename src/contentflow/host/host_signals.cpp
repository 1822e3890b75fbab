#include "contentflow/host/host_signals.hpp"

#include "contentflow/util/log.hpp"

#include <algorithm>
#include <utility>

namespace contentflow {

auto HostSignals::subscribe(HostEvent event, Handler handler)
    -> SubscriptionId {
  const auto id = next_id_++;
  subscriptions_.push_back(
      Subscription{.id = id, .event = event, .handler = std::move(handler)});
  return id;
}

auto HostSignals::unsubscribe(SubscriptionId id) -> bool {
  return std::erase_if(subscriptions_, [id](const Subscription &s) {
           return s.id == id;
         }) > 0;
}

auto HostSignals::emit(HostEvent event) -> void {
  if (event == HostEvent::Online) {
    online_ = true;
  } else if (event == HostEvent::Offline) {
    online_ = false;
  }
  log::debug("Host event: {}", to_string_view(event));

  // Snapshot so handlers can (un)subscribe while we iterate.
  std::vector<std::pair<SubscriptionId, Handler>> targets;
  for (const auto &s : subscriptions_) {
    if (s.event == event) {
      targets.emplace_back(s.id, s.handler);
    }
  }
  for (auto &target : targets) {
    const auto id = target.first;
    const bool still_subscribed = std::ranges::any_of(
        subscriptions_, [id](const Subscription &s) { return s.id == id; });
    if (still_subscribed && target.second) {
      target.second();
    }
  }
}

} // namespace contentflow
