#include "tradebook/tracking/fill_processor.hpp"
#include "tradebook/domain/errors.hpp"
#include "tradebook/events/trade_rejected_event.hpp"

#include <iostream>
#include <optional>

namespace tradebook {

// -----------------------------------------------------------------------------
// Constructor: subscribe to fills on the ledger loop bus
// -----------------------------------------------------------------------------
FillProcessor::FillProcessor(EventBus& bus,
                             PositionLedger& ledger,
                             const ClassificationEngine& engine,
                             IStateStore* store)
    : bus_(bus), ledger_(ledger), engine_(engine), store_(store) {
  trade_sub_id_ = bus_.subscribe<domain::TradeEvent>(
      [this](const domain::TradeEvent& e) { process(e); });
}

FillProcessor::~FillProcessor() { bus_.unsubscribe(trade_sub_id_); }

// -----------------------------------------------------------------------------
// process: classify → apply → publish → persist
// -----------------------------------------------------------------------------
bool FillProcessor::process(const domain::TradeEvent& fill) {
  if (!fill.trade_id.empty() && ledger_.hasSeen(fill.trade_id)) {
    std::cerr << "[FillProcessor] WARNING: trade " << fill.trade_id
              << " already processed. Skipping.\n";
    return false;
  }

  std::optional<TradeRejectedEvent> rejection;
  std::optional<ClassificationEvent> outcome;

  try {
    LedgerDelta delta = engine_.classify(ledger_, fill);
    ledger_.apply(delta);
    outcome = makeClassificationEvent(fill, delta);
    outcome->cumulative_realized_pnl = ledger_.cumulativeRealizedPnl();
  } catch (const InvalidEventError& e) {
    rejection = TradeRejectedEvent{
        fill, TradeRejectedEvent::Reason::InvalidEvent, e.what(), 0};
  } catch (const InconsistentStateError& e) {
    rejection = TradeRejectedEvent{
        fill, TradeRejectedEvent::Reason::InconsistentState, e.what(), 0};
  }

  ledger_.recordSeen(fill.trade_id, fill.timestamp_ms);

  if (outcome) {
    outcome->sequence_id = next_sequence_id_++;
    ++applied_count_;
    bus_.publish(*outcome);
  } else {
    rejection->sequence_id = next_sequence_id_++;
    ++rejected_count_;
    std::cerr << "[FillProcessor] rejected trade " << fill.trade_id << " ("
              << rejectReasonToString(rejection->reason)
              << "): " << rejection->message << "\n";
    bus_.publish(*rejection);
  }

  persist();
  return outcome.has_value();
}

// -----------------------------------------------------------------------------
// persist: best-effort snapshot after every fill
// -----------------------------------------------------------------------------
void FillProcessor::persist() {
  if (store_ == nullptr) {
    return;
  }
  try {
    store_->save(ledger_.snapshot());
  } catch (const StateStoreError& e) {
    std::cerr << "[FillProcessor] ERROR: state save failed: " << e.what()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// makeClassificationEvent: flatten the delta for notification sinks
// -----------------------------------------------------------------------------
ClassificationEvent FillProcessor::makeClassificationEvent(
    const domain::TradeEvent& fill, const LedgerDelta& delta) {
  ClassificationEvent e;
  e.kind = delta.kind;
  e.trade_id = fill.trade_id;
  e.token_id = fill.token_id;
  e.market_id = fill.market_id;
  e.outcome = fill.outcome;
  e.side = fill.side;
  e.trade_size = fill.size;
  e.trade_price = fill.price;
  e.resulting_position_size = delta.resulting_size;
  e.timestamp_ms = fill.timestamp_ms;

  if (delta.closed_trade) {
    e.closing_size = delta.closed_trade->closing_size;
    e.entry_price = delta.closed_trade->entry_price;
    e.exit_price = delta.closed_trade->exit_price;
    e.realized_pnl = delta.closed_trade->realized_pnl;
  }
  if (!delta.hedged_token_id.empty()) {
    e.hedged_token_id = delta.hedged_token_id;
  }
  return e;
}

}  // namespace tradebook
