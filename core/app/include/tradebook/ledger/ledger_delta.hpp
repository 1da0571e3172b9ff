#pragma once

#include "tradebook/domain/closed_trade.hpp"
#include "tradebook/domain/position.hpp"
#include "tradebook/domain/trade_classification.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// UpsertPosition / RemovePosition — single-row ledger changes
// -----------------------------------------------------------------------------
//
// UpsertPosition stores `position` as the new state of its token id.
// requires_existing is set when the change reduces or extends a row the
// engine read from the ledger (Increase, PartialClose, PartialHedge); the
// ledger refuses it if that row has disappeared in the meantime.
//
// RemovePosition deletes the row for token_id. The row must exist.
// -----------------------------------------------------------------------------
struct UpsertPosition {
  domain::Position position;
  bool requires_existing{false};
};

struct RemovePosition {
  std::string token_id;
};

using PositionChange = std::variant<UpsertPosition, RemovePosition>;

// -----------------------------------------------------------------------------
// LedgerDelta — the complete effect of one fill
// -----------------------------------------------------------------------------
//
// @brief  Value produced by ClassificationEngine::classify() and consumed by
//         PositionLedger::apply().
//
// @details
// A Reverse or a hedge touches two rows (close the old leg, open or grow the
// new one). Carrying both changes in one value lets the ledger validate and
// apply them under a single exclusive lock, so no reader ever sees one leg
// changed and the other not.
//
// Fields:
//   kind            classification of the fill.
//   changes         ordered row changes; applied in sequence.
//   closed_trade    present iff kind realizes PnL.
//   closing_size /
//   realized_pnl    duplicated from closed_trade for the notification path.
//   resulting_size  size of the traded token's row after the fill (0 if the
//                   row was removed).
//   hedged_token_id token of the unwound leg for HedgeClose/PartialHedge.
// -----------------------------------------------------------------------------
struct LedgerDelta {
  domain::TradeClassification kind{domain::TradeClassification::Open};
  std::vector<PositionChange> changes;
  std::optional<domain::ClosedTradeRecord> closed_trade;
  double resulting_size{0.0};
  std::string hedged_token_id;
};

}  // namespace tradebook
