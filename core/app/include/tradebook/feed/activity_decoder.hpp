#pragma once

#include "tradebook/domain/trade_event.hpp"
#include "tradebook/ledger/ledger_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// decodeActivity(json)
// -----------------------------------------------------------------------------
//
// @brief  Converts one trade-activity record of the feed into a TradeEvent.
//
// @details
// Expected JSON (field names of the prediction-market activity API):
//   {
//     "transactionHash": "0xabc...",   → trade_id
//     "timestamp":       1700000000,   → timestamp_ms (seconds × 1000)
//     "market":          "0xcond...",  → market_id
//     "asset":           "1234...",    → token_id
//     "outcome":         "Up",
//     "side":            "BUY",        BUY or SELL, case-insensitive
//     "size":            100.0,        number or numeric string
//     "price":           0.61,         number or numeric string
//     "user":            "0xwallet"    optional; lower-cased
//   }
//
// @throws nlohmann::json::exception  on a missing or mistyped required key.
// @throws InvalidEventError          on an unknown side, a non-numeric
//                                    size/price string, or a negative
//                                    timestamp or one too large to express
//                                    in milliseconds.
//
// Range checks on size and price are left to the engine.
// -----------------------------------------------------------------------------
domain::TradeEvent decodeActivity(const nlohmann::json& activity,
                                  std::string* wallet_out = nullptr);

// -----------------------------------------------------------------------------
// FeedFilter — drops activity that must not reach the ledger
// -----------------------------------------------------------------------------
//
// @brief  Feed-side deduplication keyed on the trade id, plus an optional
//         wallet filter.
//
// @details
// accept() returns false and leaves the cursor unchanged for:
//   - an empty trade id
//   - a trade id already accepted
//   - a wallet different from tracked_wallet (when tracked_wallet is set;
//     comparison is case-insensitive)
// Otherwise it records the id, advances last_seen_timestamp_ms and returns
// true.
//
// Seeded from the persisted FeedCursor so a restart does not replay fills the
// ledger has already applied.
//
// Thread model: owned and used by the feed thread only.
// -----------------------------------------------------------------------------
class FeedFilter {
 public:
  explicit FeedFilter(std::string tracked_wallet = {}, FeedCursor cursor = {});

  bool accept(const domain::TradeEvent& fill, const std::string& wallet = {});

  const FeedCursor& cursor() const { return cursor_; }

 private:
  std::string tracked_wallet_;
  FeedCursor cursor_;
};

std::string toLower(std::string s);

}  // namespace tradebook
