#pragma once

#include "tradebook/domain/trade_event.hpp"
#include "tradebook/feed/activity_decoder.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// TradeFeedGateway — ZeroMQ SUB socket that turns activity JSON into fills
// -----------------------------------------------------------------------------
//
// @brief  Receives trade-activity messages from the feed publisher (the
//         process that polls the exchange API), decodes them, drops
//         duplicates and forwards accepted fills to a sink.
//
// @details
// Each message is either one activity object or a JSON array of them (one
// poll result). See decodeActivity() for the object layout. Arrays are
// forwarded in ascending timestamp order; the publisher's newest-first
// ordering is reversed here so the ledger sees fills chronologically.
//
// Malformed messages or records are logged to stderr and skipped; one bad
// record does not drop the rest of its batch.
//
// Shutdown:
//   The socket has ZMQ_RCVTIMEO = kRecvTimeoutMs, so run() re-checks the
//   stop flag at least that often.
//
// Thread model:
//   run() blocks; call it from TradeFeedThread's worker. stop() is safe from
//   any thread. The FeedFilter is touched only by run().
// -----------------------------------------------------------------------------
class TradeFeedGateway {
 public:
  using FillSink = std::function<void(domain::TradeEvent)>;

  TradeFeedGateway(FillSink sink, FeedFilter filter,
                   const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~TradeFeedGateway() = default;

  TradeFeedGateway(const TradeFeedGateway&) = delete;
  TradeFeedGateway& operator=(const TradeFeedGateway&) = delete;
  TradeFeedGateway(TradeFeedGateway&&) = delete;
  TradeFeedGateway& operator=(TradeFeedGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // handlePayload(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one message and forwards every accepted fill.
  //
  // @return Number of fills forwarded to the sink.
  //
  // Exposed so the decoding path can be exercised without a socket.
  // -------------------------------------------------------------------------
  std::size_t handlePayload(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  FillSink sink_;
  FeedFilter filter_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace tradebook
