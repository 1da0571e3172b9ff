#pragma once

namespace tradebook {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig — tunables of the classification engine
// -----------------------------------------------------------------------------
//
// @brief  Immutable parameters copied into ClassificationEngine at
//         construction.
//
// @details
// size_epsilon is a tolerance on share size, never on PnL. Sizes that pass
// through repeated VWAP averaging and partial closes do not land on exact
// zero, so any residual with |size| <= size_epsilon is treated as flat.
//
// allow_short_open controls a SELL on a token with no position. The feed is
// expected to report SELLs only against held exposure, so by default such an
// event is rejected with InvalidEventError. When set, the SELL opens a short
// position (direction -1) instead.
// -----------------------------------------------------------------------------
struct EngineConfig {
  double size_epsilon{1e-9};
  bool allow_short_open{false};
};

}  // namespace domain
}  // namespace tradebook
