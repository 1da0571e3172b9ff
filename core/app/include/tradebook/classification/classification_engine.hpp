#pragma once

#include "tradebook/domain/engine_config.hpp"
#include "tradebook/domain/position.hpp"
#include "tradebook/domain/trade_event.hpp"
#include "tradebook/ledger/ledger_delta.hpp"
#include "tradebook/ledger/position_ledger.hpp"

namespace tradebook {

// -----------------------------------------------------------------------------
// ClassificationEngine — decides what a fill means and what it changes
// -----------------------------------------------------------------------------
//
// @brief  Pure function of (ledger state, fill) → LedgerDelta. Reads the
//         ledger, never writes it, performs no I/O and never logs.
//
// @details
// Evaluation order for a fill with side s, size sz, price p:
//
//   Step 1 — Hedge check (BUY only):
//     OP = position on the other outcome of the same market.
//     If OP exists:
//       closing = min(sz, OP.size)
//       pnl     = closing * (1 - OP.entry_price - p)
//       OP.size - closing <= epsilon → HedgeClose, OP removed
//       otherwise                   → PartialHedge, OP.size -= closing
//     The bought token is opened (sz @ p, long) or increased by the full sz
//     with the VWAP rule. The full sz is booked on the new leg even when it
//     exceeds closing; only the unwound leg's PnL is capped. Evaluation
//     stops here.
//
//   Step 2/3 — Same-token evaluation:
//     No position                      → Open
//     current * signed > 0             → Increase
//       new_entry = (size * entry + sz * p) / (size + sz)
//     current * signed < 0:
//       closing = min(sz, size)
//       pnl     = closing * (p - entry) * direction
//       |remaining| <= epsilon         → FullClose, row removed
//       sign(remaining) != sign(curr)  → Reverse: close size, open
//                                        |remaining| @ p, -direction
//       otherwise                      → PartialClose, size = |remaining|
//
//   where current = size * direction, signed = ±sz, remaining = current +
//   signed.
//
// Input contract (InvalidEventError otherwise):
//   size > 0 and finite, price in [0, 1] and finite, non-empty token and
//   market ids. A SELL against a token with no position is rejected unless
//   EngineConfig::allow_short_open is set.
//
// Thread model:
//   Stateless apart from the immutable config; safe to call from any thread.
//   The caller must serialize fills of one market so that the ledger does
//   not change between classify() and PositionLedger::apply().
// -----------------------------------------------------------------------------
class ClassificationEngine {
 public:
  explicit ClassificationEngine(domain::EngineConfig config = {});

  // -------------------------------------------------------------------------
  // classify(ledger, event)
  // -------------------------------------------------------------------------
  // @brief  Classifies the fill against the ledger's current rows.
  //
  // @return LedgerDelta with exactly one classification, the row changes to
  //         apply and, for closing kinds, the ClosedTradeRecord.
  //
  // @throws InvalidEventError  on an input-contract violation.
  // -------------------------------------------------------------------------
  LedgerDelta classify(const PositionLedger& ledger,
                       const domain::TradeEvent& event) const;

  // -------------------------------------------------------------------------
  // validate(event)
  // -------------------------------------------------------------------------
  // @brief  Input-contract check shared by classify() and the tracker.
  //
  // @throws InvalidEventError  with a message naming the offending field.
  // -------------------------------------------------------------------------
  static void validate(const domain::TradeEvent& event);

 private:
  LedgerDelta classifyHedge(const domain::Position& opposite,
                            const std::optional<domain::Position>& own,
                            const domain::TradeEvent& event) const;

  LedgerDelta classifySameToken(const std::optional<domain::Position>& own,
                                const domain::TradeEvent& event) const;

  static domain::Position openedPosition(const domain::TradeEvent& event,
                                         int direction);

  static domain::Position increasedPosition(const domain::Position& pos,
                                            const domain::TradeEvent& event);

  const domain::EngineConfig config_;
};

}  // namespace tradebook
