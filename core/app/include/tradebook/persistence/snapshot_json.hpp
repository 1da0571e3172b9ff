#pragma once

#include "tradebook/domain/closed_trade.hpp"
#include "tradebook/domain/position.hpp"
#include "tradebook/domain/trade_classification.hpp"
#include "tradebook/ledger/ledger_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// JSON mapping of persisted types
// -----------------------------------------------------------------------------
// nlohmann::json finds these through ADL, so `json j = snapshot;` and
// `j.get<LedgerSnapshot>()` work directly. from_json uses at() for required
// keys and throws nlohmann::json::exception on missing or mistyped fields;
// callers translate that into StateStoreError.
//
// Snapshot layout:
//   {
//     "version": 1,
//     "positions":     [ { "token_id", "market_id", "outcome", "size",
//                          "entry_price", "direction", "opened_at_ms",
//                          "updated_at_ms" }, ... ],
//     "closed_trades": [ { "trade_id", "market_id", "token_id", "outcome",
//                          "kind", "closing_size", "entry_price",
//                          "exit_price", "realized_pnl", "timestamp_ms" } ],
//     "cursor": { "last_seen_timestamp_ms", "seen_trade_ids": [...] }
//   }
// -----------------------------------------------------------------------------

namespace domain {

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const ClosedTradeRecord& r);
void from_json(const nlohmann::json& j, ClosedTradeRecord& r);

// Throws std::invalid_argument for an unknown name.
TradeClassification classificationFromString(const std::string& name);

}  // namespace domain

void to_json(nlohmann::json& j, const FeedCursor& c);
void from_json(const nlohmann::json& j, FeedCursor& c);

void to_json(nlohmann::json& j, const LedgerSnapshot& s);
void from_json(const nlohmann::json& j, LedgerSnapshot& s);

constexpr int kSnapshotVersion = 1;

}  // namespace tradebook
