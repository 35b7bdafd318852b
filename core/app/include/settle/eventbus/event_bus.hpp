#pragma once

#include "settle/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe channel for settlement
// notifications. SettlementEngine is the only publisher; observers (the IPC
// telemetry bridge, the daemon's log subscriber, tests) register callbacks.
//
// Delivery: publish() runs every matching callback on the calling thread
// before it returns. SettlementEngine publishes after it has released its
// own mutex, so a callback may call back into the engine.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback for every event kind (loggers, telemetry bridges).
  // Returns the id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only fires when the published variant holds
  // EventType, e.g. subscribe<SettlementFinalizedEvent>(...).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // progress on another thread may still deliver its current event.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers `event` to every subscriber registered at the time of the call.
  // The subscriber list is copied under the lock and callbacks run unlocked,
  // so a callback may subscribe, unsubscribe or publish without deadlock.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// Typed subscription: wrap in a generic callback that filters on the
// variant alternative.
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* typed = std::get_if<EventType>(&event)) {
      cb(*typed);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace settle
