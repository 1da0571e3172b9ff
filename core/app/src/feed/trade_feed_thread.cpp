#include "tradebook/feed/trade_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace tradebook {

TradeFeedThread::TradeFeedThread(TradeFeedGateway::FillSink sink,
                                 FeedFilter filter,
                                 std::string endpoint)
    : sink_(std::move(sink)),
      filter_(std::move(filter)),
      endpoint_(std::move(endpoint)) {}

TradeFeedThread::~TradeFeedThread() { stop(); }

void TradeFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<TradeFeedGateway>(sink_, filter_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[TradeFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[TradeFeedThread] recv loop exited.\n";
  });
}

void TradeFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace tradebook
