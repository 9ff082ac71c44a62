#pragma once

#include "tradecore/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe channel for engine events.
//
// @details
// The Orchestrator owns one bus. Components publish from whichever thread
// they run on and callbacks execute on that same thread before publish()
// returns. There is no dispatcher thread.
//
// A callback that throws std::exception is logged and skipped; remaining
// subscribers still receive the event and the publisher is not affected.
// An observer must never be able to break the trading pipeline.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
//   publish() copies the subscriber list under the lock and invokes the
//   callbacks without it, so a callback may itself publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback for every event kind.
  // @return Id for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback that only sees events holding EventType.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in progress on another thread
  // may still deliver its current event to the removed callback.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      });
}

}  // namespace tradecore
