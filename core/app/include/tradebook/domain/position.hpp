#pragma once

#include <cstdint>
#include <string>

namespace tradebook {
namespace domain {

// -----------------------------------------------------------------------------
// Position — open exposure on a single outcome token
// -----------------------------------------------------------------------------
//
// @brief  Size, average entry price and direction currently held for one
//         token id.
//
// @details
// Unlike a signed net quantity, size is always strictly positive and the
// direction is stored separately:
//   direction = +1 → long  (position was opened by a BUY)
//   direction = -1 → short (position was opened by a SELL or by a REVERSE
//                           out of a long)
// The direction is fixed at creation and does not change while the position
// exists. A fill that crosses zero removes this position and creates a new
// one with the opposite direction.
//
// entry_price is the volume-weighted average price of every increase since
// the position was opened. Closing fills leave it unchanged.
//
// Invariant: a Position with size == 0 is never stored. PositionLedger removes
// the row instead.
//
// market_id and outcome are kept on the row so the ledger can answer "what is
// held on the other outcome of this market" without an external token map.
// -----------------------------------------------------------------------------
struct Position {
  std::string token_id;
  std::string market_id;
  std::string outcome;
  double size{0.0};             // Shares held, > 0 while stored
  double entry_price{0.0};      // VWAP entry, 0..1
  int direction{1};             // +1 long, -1 short
  std::int64_t opened_at_ms{0};
  std::int64_t updated_at_ms{0};

  // Signed exposure used by the classification math.
  double signedSize() const { return size * static_cast<double>(direction); }
};

// Exact field comparison. Used to check that a resumed ledger matches.
inline bool operator==(const Position& a, const Position& b) {
  return a.token_id == b.token_id && a.market_id == b.market_id &&
         a.outcome == b.outcome && a.size == b.size &&
         a.entry_price == b.entry_price && a.direction == b.direction &&
         a.opened_at_ms == b.opened_at_ms &&
         a.updated_at_ms == b.updated_at_ms;
}

inline bool operator!=(const Position& a, const Position& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace tradebook
