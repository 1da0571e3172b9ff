#pragma once

#include "tradebook/domain/trade_classification.hpp"

#include <cstdint>
#include <string>

namespace tradebook {
namespace domain {

// -----------------------------------------------------------------------------
// ClosedTradeRecord — realized PnL booked by one closing fill
// -----------------------------------------------------------------------------
//
// @brief  Immutable history row. One record per FullClose, PartialClose,
//         Reverse, HedgeClose or PartialHedge.
//
// @details
// For same-token closes, exit_price is the fill price and
//   realized_pnl = closing_size * (exit_price - entry_price) * direction.
//
// For hedges the record describes the unwound leg (the opposite outcome).
// Its effective exit price is 1 - p, the par value left for that outcome
// when the other side is bought at p, so
//   realized_pnl = closing_size * (1 - entry_price - p).
//
// Records are appended by PositionLedger and never mutated or removed.
// -----------------------------------------------------------------------------
struct ClosedTradeRecord {
  std::string trade_id;        // Feed id of the fill that closed the leg
  std::string market_id;
  std::string token_id;        // Token of the leg that was closed
  std::string outcome;
  TradeClassification kind{TradeClassification::FullClose};
  double closing_size{0.0};
  double entry_price{0.0};
  double exit_price{0.0};
  double realized_pnl{0.0};
  std::int64_t timestamp_ms{0};
};

inline bool operator==(const ClosedTradeRecord& a, const ClosedTradeRecord& b) {
  return a.trade_id == b.trade_id && a.market_id == b.market_id &&
         a.token_id == b.token_id && a.outcome == b.outcome &&
         a.kind == b.kind && a.closing_size == b.closing_size &&
         a.entry_price == b.entry_price && a.exit_price == b.exit_price &&
         a.realized_pnl == b.realized_pnl && a.timestamp_ms == b.timestamp_ms;
}

inline bool operator!=(const ClosedTradeRecord& a, const ClosedTradeRecord& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace tradebook
