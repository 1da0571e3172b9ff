#pragma once

#include <cstdint>
#include <string>

namespace tradebook {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Buy or sell side of a single fill. Scoped enum so the side never converts
// silently to an int or a sign.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// TradeEvent — one executed fill reported by the trade feed
// -----------------------------------------------------------------------------
//
// @brief  Read-only input to the classification engine. Identifies the traded
//         token, the market it belongs to, and the outcome it represents.
//
// @details
// A token belongs to exactly one market and stands for exactly one outcome of
// that market (e.g. "Up" / "Down" on a binary market). The feed guarantees
// that events are deduplicated and arrive in chronological order per market;
// trade_id is the feed's deduplication key and is carried only for audit.
//
// Value ranges expected by the engine:
//   size   > 0
//   price  in [0, 1]
// Anything else is rejected with InvalidEventError.
//
// Thread model:
//   Plain value type. Copied into the ledger loop's queue by the feed thread.
// -----------------------------------------------------------------------------
struct TradeEvent {
  std::string trade_id;        // Feed-assigned id (transaction hash)
  std::string token_id;        // Outcome token that was traded
  std::string market_id;       // Market the token belongs to
  std::string outcome;         // Human-readable outcome label ("Up", "Yes")
  Side side{Side::Buy};
  double size{0.0};            // Shares
  double price{0.0};           // Price per share, 0..1
  std::int64_t timestamp_ms{0};  // Epoch milliseconds
};

inline const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace tradebook
