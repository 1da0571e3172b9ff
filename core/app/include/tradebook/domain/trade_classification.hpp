#pragma once

namespace tradebook {
namespace domain {

// -----------------------------------------------------------------------------
// TradeClassification
// -----------------------------------------------------------------------------
// What a fill means relative to the exposure held before it. Closed set:
// consumers switch on it without a default branch so the compiler flags any
// kind that is not handled.
//
//   Open          no prior position on the token
//   Increase      same direction as the held position
//   PartialClose  opposite direction, position shrinks
//   FullClose     opposite direction, position unwound exactly
//   Reverse       opposite direction, position crosses zero
//   HedgeClose    BUY on the other outcome fully unwinds the held leg
//   PartialHedge  BUY on the other outcome unwinds part of the held leg
// -----------------------------------------------------------------------------
enum class TradeClassification {
  Open,
  Increase,
  PartialClose,
  FullClose,
  Reverse,
  HedgeClose,
  PartialHedge,
};

inline const char* classificationToString(TradeClassification c) {
  using C = TradeClassification;
  switch (c) {
    case C::Open:         return "OPEN";
    case C::Increase:     return "INCREASE";
    case C::PartialClose: return "PARTIAL_CLOSE";
    case C::FullClose:    return "FULL_CLOSE";
    case C::Reverse:      return "REVERSE";
    case C::HedgeClose:   return "HEDGE_CLOSE";
    case C::PartialHedge: return "PARTIAL_HEDGE";
  }
  return "UNKNOWN";
}

// True for every kind that books realized PnL.
inline bool realizesPnl(TradeClassification c) {
  using C = TradeClassification;
  switch (c) {
    case C::Open:
    case C::Increase:
      return false;
    case C::PartialClose:
    case C::FullClose:
    case C::Reverse:
    case C::HedgeClose:
    case C::PartialHedge:
      return true;
  }
  return false;
}

}  // namespace domain
}  // namespace tradebook
