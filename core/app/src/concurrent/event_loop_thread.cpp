#include "tradebook/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <optional>

namespace tradebook {

namespace {

// Longest the worker sleeps on an empty queue before rechecking running_.
// Bounds how long stop() waits for the join.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): publish as events arrive; on stop, publish the backlog and exit
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout)) {
      bus_.publish(*event);
    }
  }

  auto backlog = queue_.take_all();
  if (!backlog.empty()) {
    std::cout << "[EventLoopThread] draining " << backlog.size()
              << " queued event(s) before exit\n";
  }
  for (const Event& event : backlog) {
    bus_.publish(event);
  }
}

}  // namespace tradebook
