#pragma once

#include "tradebook/concurrent/thread_safe_queue.hpp"
#include "tradebook/eventbus/event_bus.hpp"
#include "tradebook/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <thread>

namespace tradebook {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a queue of Events and publishes each
//         on its own EventBus.
//
// @details
// Every subscriber of the loop's bus runs on the worker, one event at a time,
// in push order. The tracker relies on this to serialize fills: two fills can
// never be classified against a racing view of the ledger.
//
// The worker sleeps on the queue itself and wakes as soon as something is
// pushed. stop() lets it publish whatever is already queued before it exits,
// so fills pushed before shutdown are still applied (and persisted).
//
// Thread model:
//   push() and pending() are safe from any thread. start()/stop() from the
//   owning thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Drains the queue, then joins the worker.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  // Events queued but not yet published.
  std::size_t pending() const { return queue_.size(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace tradebook
