#pragma once

#include "tradebook/domain/trade_classification.hpp"
#include "tradebook/domain/trade_event.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// ClassificationEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once per successfully applied fill. Carries enough to
//         render a human-readable alert without re-deriving anything from
//         the ledger.
//
// @details
// The optional fields are set only for the kinds where they mean something:
//   closing_size, entry_price, exit_price, realized_pnl
//       → PartialClose, FullClose, Reverse, HedgeClose, PartialHedge
//   resulting_position_size
//       → every kind; 0 after FullClose.
//   hedged_token_id
//       → HedgeClose, PartialHedge (token of the unwound leg).
//
// For hedges, entry_price/exit_price describe the unwound leg (exit is the
// par complement 1 - p).
//
// Thread model:
//   Built and published on the ledger loop thread by FillProcessor. Plain
//   data; forwarded by value to the IPC telemetry queue.
// -----------------------------------------------------------------------------
struct ClassificationEvent {
  domain::TradeClassification kind{domain::TradeClassification::Open};
  std::string trade_id;
  std::string token_id;
  std::string market_id;
  std::string outcome;
  domain::Side side{domain::Side::Buy};
  double trade_size{0.0};
  double trade_price{0.0};

  std::optional<double> closing_size;
  std::optional<double> entry_price;
  std::optional<double> exit_price;
  std::optional<double> realized_pnl;
  std::optional<double> resulting_position_size;
  std::optional<std::string> hedged_token_id;

  double cumulative_realized_pnl{0.0};  // Ledger total after this fill
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace tradebook
