#pragma once

#include "tradebook/domain/trade_event.hpp"
#include "tradebook/events/classification_event.hpp"
#include "tradebook/events/trade_rejected_event.hpp"

#include <variant>

namespace tradebook {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Envelope for everything that travels over an EventBus or through an
// EventLoopThread queue:
//
//   domain::TradeEvent    feed → ledger loop (input fill)
//   ClassificationEvent   ledger loop → notification sinks
//   TradeRejectedEvent    ledger loop → notification sinks
//
// A closed std::variant keeps dispatch type-checked; adding a kind means
// adding it here and the compiler points at every std::visit that misses it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    domain::TradeEvent,
    ClassificationEvent,
    TradeRejectedEvent>;

}  // namespace tradebook
