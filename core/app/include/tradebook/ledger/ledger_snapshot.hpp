#pragma once

#include "tradebook/domain/closed_trade.hpp"
#include "tradebook/domain/position.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// FeedCursor — how far the trade feed has been consumed
// -----------------------------------------------------------------------------
// last_seen_timestamp_ms is the newest fill timestamp accepted so far;
// seen_trade_ids holds the feed ids already processed. Persisted with the
// ledger so a restart neither skips nor replays fills.
// -----------------------------------------------------------------------------
struct FeedCursor {
  std::int64_t last_seen_timestamp_ms{0};
  std::set<std::string> seen_trade_ids;
};

inline bool operator==(const FeedCursor& a, const FeedCursor& b) {
  return a.last_seen_timestamp_ms == b.last_seen_timestamp_ms &&
         a.seen_trade_ids == b.seen_trade_ids;
}

// -----------------------------------------------------------------------------
// LedgerSnapshot — persisted state of the tracker
// -----------------------------------------------------------------------------
// Open positions, the full closed-trade history (chronological) and the feed
// cursor. Produced by PositionLedger::snapshot() and consumed by restore().
// -----------------------------------------------------------------------------
struct LedgerSnapshot {
  std::vector<domain::Position> positions;
  std::vector<domain::ClosedTradeRecord> closed_trades;
  FeedCursor cursor;
};

inline bool operator==(const LedgerSnapshot& a, const LedgerSnapshot& b) {
  return a.positions == b.positions && a.closed_trades == b.closed_trades &&
         a.cursor == b.cursor;
}

}  // namespace tradebook
