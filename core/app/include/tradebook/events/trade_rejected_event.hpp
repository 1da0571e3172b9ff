#pragma once

#include "tradebook/domain/trade_event.hpp"

#include <cstdint>
#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// TradeRejectedEvent
// -----------------------------------------------------------------------------
// Published when a fill is dropped instead of applied: the engine raised
// InvalidEventError, or the ledger raised InconsistentStateError. The ledger
// is unchanged in both cases.
// -----------------------------------------------------------------------------
struct TradeRejectedEvent {
  enum class Reason { InvalidEvent, InconsistentState };

  domain::TradeEvent trade;
  Reason reason{Reason::InvalidEvent};
  std::string message;
  std::uint64_t sequence_id{0};
};

inline const char* rejectReasonToString(TradeRejectedEvent::Reason r) {
  switch (r) {
    case TradeRejectedEvent::Reason::InvalidEvent:      return "InvalidEvent";
    case TradeRejectedEvent::Reason::InconsistentState: return "InconsistentState";
  }
  return "Unknown";
}

}  // namespace tradebook
