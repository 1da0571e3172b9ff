#include "tradebook/feed/activity_decoder.hpp"
#include "tradebook/domain/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <stdexcept>
#include <utility>

namespace tradebook {

namespace {

// The activity API sends numbers either as JSON numbers or as strings.
double numberField(const nlohmann::json& activity, const char* key) {
  const nlohmann::json& v = activity.at(key);
  if (v.is_number()) {
    return v.get<double>();
  }
  const std::string text = v.get<std::string>();
  try {
    std::size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
    return value;
  } catch (const std::logic_error&) {
    throw InvalidEventError(std::string("field '") + key +
                            "' is not numeric: " + text);
  }
}

// Feed timestamps are Unix seconds; anything outside this range would
// overflow when scaled to milliseconds.
constexpr std::int64_t kMaxTimestampSec =
    std::numeric_limits<std::int64_t>::max() / 1000;

std::int64_t timestampMs(const nlohmann::json& activity,
                         const std::string& trade_id) {
  const auto seconds = activity.at("timestamp").get<std::int64_t>();
  if (seconds < 0 || seconds > kMaxTimestampSec) {
    throw InvalidEventError("trade " + trade_id + ": timestamp " +
                            std::to_string(seconds) + " out of range");
  }
  return seconds * 1000;
}

}  // namespace

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// -----------------------------------------------------------------------------
// decodeActivity
// -----------------------------------------------------------------------------
domain::TradeEvent decodeActivity(const nlohmann::json& activity,
                                  std::string* wallet_out) {
  domain::TradeEvent fill;
  fill.trade_id = activity.value("transactionHash", std::string{});
  fill.timestamp_ms = timestampMs(activity, fill.trade_id);
  fill.market_id = activity.at("market").get<std::string>();
  fill.token_id = activity.at("asset").get<std::string>();
  fill.outcome = activity.value("outcome", std::string{});

  const std::string side = toLower(activity.at("side").get<std::string>());
  if (side == "buy") {
    fill.side = domain::Side::Buy;
  } else if (side == "sell") {
    fill.side = domain::Side::Sell;
  } else {
    throw InvalidEventError("trade " + fill.trade_id + ": unknown side '" +
                            side + "'");
  }

  fill.size = numberField(activity, "size");
  fill.price = numberField(activity, "price");

  if (wallet_out != nullptr) {
    *wallet_out = toLower(activity.value("user", std::string{}));
  }
  return fill;
}

// -----------------------------------------------------------------------------
// FeedFilter
// -----------------------------------------------------------------------------
FeedFilter::FeedFilter(std::string tracked_wallet, FeedCursor cursor)
    : tracked_wallet_(toLower(std::move(tracked_wallet))),
      cursor_(std::move(cursor)) {}

bool FeedFilter::accept(const domain::TradeEvent& fill,
                        const std::string& wallet) {
  if (fill.trade_id.empty()) {
    return false;
  }
  if (!tracked_wallet_.empty() && toLower(wallet) != tracked_wallet_) {
    return false;
  }
  if (!cursor_.seen_trade_ids.insert(fill.trade_id).second) {
    return false;
  }
  cursor_.last_seen_timestamp_ms =
      std::max(cursor_.last_seen_timestamp_ms, fill.timestamp_ms);
  return true;
}

}  // namespace tradebook
