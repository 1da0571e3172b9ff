#include "tradebook/feed/trade_feed_gateway.hpp"
#include "tradebook/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <utility>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv timeout
// -----------------------------------------------------------------------------
TradeFeedGateway::TradeFeedGateway(FillSink sink, FeedFilter filter,
                                   const std::string& endpoint)
    : sink_(std::move(sink)), filter_(std::move(filter)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void TradeFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    handlePayload(msg.to_string());
  }
}

void TradeFeedGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handlePayload(): decode object or batch, filter, forward in time order
// -----------------------------------------------------------------------------
std::size_t TradeFeedGateway::handlePayload(const std::string& payload) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[TradeFeedGateway] JSON parse error: " << e.what()
              << " — payload: " << payload << "\n";
    return 0;
  }

  std::vector<nlohmann::json> records;
  if (json.is_array()) {
    records.assign(json.begin(), json.end());
  } else {
    records.push_back(std::move(json));
  }

  std::vector<std::pair<domain::TradeEvent, std::string>> decoded;
  decoded.reserve(records.size());
  for (const auto& record : records) {
    try {
      std::string wallet;
      domain::TradeEvent fill = decodeActivity(record, &wallet);
      decoded.emplace_back(std::move(fill), std::move(wallet));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[TradeFeedGateway] skipping activity: " << e.what()
                << "\n";
    } catch (const InvalidEventError& e) {
      std::cerr << "[TradeFeedGateway] skipping activity: " << e.what()
                << "\n";
    }
  }

  std::stable_sort(decoded.begin(), decoded.end(),
                   [](const auto& a, const auto& b) {
                     return a.first.timestamp_ms < b.first.timestamp_ms;
                   });

  std::size_t forwarded = 0;
  for (auto& [fill, wallet] : decoded) {
    if (!filter_.accept(fill, wallet)) {
      continue;
    }
    sink_(std::move(fill));
    ++forwarded;
  }
  return forwarded;
}

}  // namespace tradebook
