#pragma once

#include "tradebook/domain/trade_event.hpp"

namespace tradebook {

// -----------------------------------------------------------------------------
// SizingConfig
// -----------------------------------------------------------------------------
// risk_multiplier  scales the observed size (1.0 = exact copy).
// max_trade_usdc   caps size * price per fill; <= 0 disables the cap.
// enabled          when false the tracker passes fills through unchanged.
// -----------------------------------------------------------------------------
struct SizingConfig {
  bool enabled{false};
  double risk_multiplier{1.0};
  double max_trade_usdc{100.0};
};

// -----------------------------------------------------------------------------
// CopySizer — pre-processing applied before a fill reaches the engine
// -----------------------------------------------------------------------------
//
// @brief  Filters observed fills and rescales their size for the copying
//         account.
//
// @details
// The classification engine never sizes anything; it books whatever size it
// is given. When the tracker mirrors another wallet, each observed fill
// passes through here first:
//
//   shouldCopy(fill)   false for size <= 0, price <= 0, or a missing
//                      market/token id.
//   computeSize(fill)  desired = size * risk_multiplier
//                      if max_trade_usdc > 0 and desired * price exceeds it,
//                      desired = max_trade_usdc / price.
//   apply(fill)        copy of fill with size = computeSize(fill).
//
// Stateless apart from the config; safe from any thread.
// -----------------------------------------------------------------------------
class CopySizer {
 public:
  explicit CopySizer(SizingConfig config = {});

  bool shouldCopy(const domain::TradeEvent& fill) const;
  double computeSize(const domain::TradeEvent& fill) const;
  domain::TradeEvent apply(const domain::TradeEvent& fill) const;

  // True if computeSize() would reduce the fill below the multiplied size.
  bool isCapped(const domain::TradeEvent& fill) const;

 private:
  const SizingConfig config_;
};

}  // namespace tradebook
