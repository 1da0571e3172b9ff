#pragma once

#include "tradebook/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe channel for fills, classifications
//         and rejections.
//
// @details
// publish() invokes every matching subscriber on the calling thread, in
// subscription order, before returning.
//
// The subscriber list is copy-on-write: subscribe/unsubscribe build a new
// list and swap it in, publish() only grabs a reference to the current one.
// Callbacks run without the lock, so a callback may publish, subscribe or
// unsubscribe. A publish already in flight may still reach a callback once
// after it was unsubscribed.
//
// A subscriber that throws std::exception is logged and skipped; the
// remaining subscribers still see the event. An alert sink failing must not
// stop the fill from being persisted by a later subscriber.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // Returns the number of subscribers that threw.
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;
  using SubscriberList = std::vector<SubscriberEntry>;

  std::shared_ptr<const SubscriberList> snapshot() const;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::shared_ptr<const SubscriberList> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradebook
