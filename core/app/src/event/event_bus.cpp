#include "tradebook/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>

namespace tradebook {

EventBus::EventBus() : subscribers_(std::make_shared<const SubscriberList>()) {}

// -----------------------------------------------------------------------------
// subscribe / unsubscribe: rebuild the list, swap it in under the lock
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  next->emplace_back(id, std::move(callback));
  subscribers_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  const auto matches = [id](const SubscriberEntry& e) { return e.first == id; };
  if (std::none_of(subscribers_->begin(), subscribers_->end(), matches)) {
    return;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  std::copy_if(subscribers_->begin(), subscribers_->end(),
               std::back_inserter(*next),
               [&matches](const SubscriberEntry& e) { return !matches(e); });
  subscribers_ = std::move(next);
}

// -----------------------------------------------------------------------------
// publish: deliver to the current list, isolating subscriber failures
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  const auto list = snapshot();
  std::size_t failures = 0;

  for (const auto& [id, callback] : *list) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      ++failures;
      std::cerr << "[EventBus] ERROR: subscriber " << id
                << " threw: " << e.what() << "\n";
    }
  }
  return failures;
}

std::size_t EventBus::subscriberCount() const { return snapshot()->size(); }

std::shared_ptr<const EventBus::SubscriberList> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return subscribers_;
}

}  // namespace tradebook
