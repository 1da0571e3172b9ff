#pragma once

#include "tradebook/feed/trade_feed_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace tradebook {

// -----------------------------------------------------------------------------
// TradeFeedThread — owns a TradeFeedGateway and the thread that runs it
// -----------------------------------------------------------------------------
// The gateway (and its socket) is created in start() on the owning thread
// and destroyed in stop() after the recv loop has been joined.
// -----------------------------------------------------------------------------
class TradeFeedThread {
 public:
  TradeFeedThread(TradeFeedGateway::FillSink sink,
                  FeedFilter filter,
                  std::string endpoint = "tcp://127.0.0.1:5555");

  ~TradeFeedThread();

  TradeFeedThread(const TradeFeedThread&) = delete;
  TradeFeedThread& operator=(const TradeFeedThread&) = delete;
  TradeFeedThread(TradeFeedThread&&) = delete;
  TradeFeedThread& operator=(TradeFeedThread&&) = delete;

  void start();
  void stop();

 private:
  TradeFeedGateway::FillSink sink_;
  FeedFilter filter_;
  std::string endpoint_;

  std::unique_ptr<TradeFeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace tradebook
