#include "tradebook/classification/classification_engine.hpp"
#include "tradebook/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradebook {

namespace {

domain::ClosedTradeRecord makeRecord(const domain::TradeEvent& event,
                                     const domain::Position& closed_leg,
                                     domain::TradeClassification kind,
                                     double closing_size,
                                     double exit_price,
                                     double pnl) {
  domain::ClosedTradeRecord record;
  record.trade_id = event.trade_id;
  record.market_id = closed_leg.market_id;
  record.token_id = closed_leg.token_id;
  record.outcome = closed_leg.outcome;
  record.kind = kind;
  record.closing_size = closing_size;
  record.entry_price = closed_leg.entry_price;
  record.exit_price = exit_price;
  record.realized_pnl = pnl;
  record.timestamp_ms = event.timestamp_ms;
  return record;
}

}  // namespace

ClassificationEngine::ClassificationEngine(domain::EngineConfig config)
    : config_(config) {}

// -----------------------------------------------------------------------------
// validate: input contract at the engine boundary
// -----------------------------------------------------------------------------
void ClassificationEngine::validate(const domain::TradeEvent& event) {
  if (event.token_id.empty()) {
    throw InvalidEventError("trade " + event.trade_id +
                            ": missing token id");
  }
  if (event.market_id.empty()) {
    throw InvalidEventError("trade " + event.trade_id +
                            ": missing market id");
  }
  if (!std::isfinite(event.size) || event.size <= 0.0) {
    std::ostringstream msg;
    msg << "trade " << event.trade_id << ": size must be > 0, got "
        << event.size;
    throw InvalidEventError(msg.str());
  }
  if (!std::isfinite(event.price) || event.price < 0.0 || event.price > 1.0) {
    std::ostringstream msg;
    msg << "trade " << event.trade_id << ": price must be in [0, 1], got "
        << event.price;
    throw InvalidEventError(msg.str());
  }
}

// -----------------------------------------------------------------------------
// classify: hedge check first, then same-token evaluation
// -----------------------------------------------------------------------------
LedgerDelta ClassificationEngine::classify(
    const PositionLedger& ledger, const domain::TradeEvent& event) const {
  validate(event);

  std::optional<domain::Position> own = ledger.getPosition(event.token_id);

  if (event.side == domain::Side::Buy) {
    std::optional<domain::Position> opposite =
        ledger.getOppositePosition(event.market_id, event.outcome);
    if (opposite.has_value() && opposite->size > 0.0) {
      return classifyHedge(*opposite, own, event);
    }
  }

  return classifySameToken(own, event);
}

// -----------------------------------------------------------------------------
// classifyHedge: BUY on one outcome while the other outcome is held
// -----------------------------------------------------------------------------
LedgerDelta ClassificationEngine::classifyHedge(
    const domain::Position& opposite,
    const std::optional<domain::Position>& own,
    const domain::TradeEvent& event) const {
  LedgerDelta delta;
  delta.hedged_token_id = opposite.token_id;

  const double closing_size = std::min(event.size, opposite.size);
  const double pnl = closing_size * (1.0 - opposite.entry_price - event.price);
  const double left_over = opposite.size - closing_size;

  if (left_over <= config_.size_epsilon) {
    delta.kind = domain::TradeClassification::HedgeClose;
    delta.changes.emplace_back(RemovePosition{opposite.token_id});
  } else {
    delta.kind = domain::TradeClassification::PartialHedge;
    domain::Position reduced = opposite;
    reduced.size = left_over;
    reduced.updated_at_ms = event.timestamp_ms;
    delta.changes.emplace_back(UpsertPosition{reduced, true});
  }

  delta.closed_trade = makeRecord(event, opposite, delta.kind, closing_size,
                                  1.0 - event.price, pnl);

  // New leg: the full traded size, independent of closing_size.
  domain::Position bought = own.has_value() ? increasedPosition(*own, event)
                                            : openedPosition(event, +1);
  delta.resulting_size = bought.size;
  delta.changes.emplace_back(UpsertPosition{bought, own.has_value()});

  return delta;
}

// -----------------------------------------------------------------------------
// classifySameToken: open, increase, close or reverse on the traded token
// -----------------------------------------------------------------------------
LedgerDelta ClassificationEngine::classifySameToken(
    const std::optional<domain::Position>& own,
    const domain::TradeEvent& event) const {
  LedgerDelta delta;

  const double signed_size =
      (event.side == domain::Side::Buy) ? event.size : -event.size;

  // --- No position: first fill on this token ---------------------------------
  if (!own.has_value()) {
    if (event.side == domain::Side::Sell && !config_.allow_short_open) {
      throw InvalidEventError("trade " + event.trade_id + ": SELL of token " +
                              event.token_id + " with no open position");
    }
    domain::Position opened =
        openedPosition(event, event.side == domain::Side::Buy ? +1 : -1);
    delta.kind = domain::TradeClassification::Open;
    delta.resulting_size = opened.size;
    delta.changes.emplace_back(UpsertPosition{opened, false});
    return delta;
  }

  const domain::Position& pos = *own;
  const double current_signed = pos.signedSize();

  // --- Same direction: VWAP increase -----------------------------------------
  if (current_signed * signed_size > 0.0) {
    domain::Position grown = increasedPosition(pos, event);
    delta.kind = domain::TradeClassification::Increase;
    delta.resulting_size = grown.size;
    delta.changes.emplace_back(UpsertPosition{grown, true});
    return delta;
  }

  // --- Opposite direction: close, partial close or reverse -------------------
  // current_signed * signed_size == 0 is impossible: both sizes are > 0.
  const double remaining_signed = current_signed + signed_size;
  const double direction = static_cast<double>(pos.direction);
  double closing_size = std::min(event.size, pos.size);

  if (std::abs(remaining_signed) <= config_.size_epsilon) {
    delta.kind = domain::TradeClassification::FullClose;
    delta.resulting_size = 0.0;
    delta.changes.emplace_back(RemovePosition{pos.token_id});
  } else if ((remaining_signed > 0.0) != (current_signed > 0.0)) {
    closing_size = pos.size;

    domain::Position reversed = openedPosition(event, -pos.direction);
    reversed.size = std::abs(remaining_signed);

    delta.kind = domain::TradeClassification::Reverse;
    delta.resulting_size = reversed.size;
    delta.changes.emplace_back(RemovePosition{pos.token_id});
    delta.changes.emplace_back(UpsertPosition{reversed, false});
  } else {
    domain::Position reduced = pos;
    reduced.size = std::abs(remaining_signed);
    reduced.updated_at_ms = event.timestamp_ms;

    delta.kind = domain::TradeClassification::PartialClose;
    delta.resulting_size = reduced.size;
    delta.changes.emplace_back(UpsertPosition{reduced, true});
  }

  const double pnl = closing_size * (event.price - pos.entry_price) * direction;
  delta.closed_trade =
      makeRecord(event, pos, delta.kind, closing_size, event.price, pnl);
  return delta;
}

// -----------------------------------------------------------------------------
// openedPosition / increasedPosition: row builders
// -----------------------------------------------------------------------------
domain::Position ClassificationEngine::openedPosition(
    const domain::TradeEvent& event, int direction) {
  domain::Position pos;
  pos.token_id = event.token_id;
  pos.market_id = event.market_id;
  pos.outcome = event.outcome;
  pos.size = event.size;
  pos.entry_price = event.price;
  pos.direction = direction;
  pos.opened_at_ms = event.timestamp_ms;
  pos.updated_at_ms = event.timestamp_ms;
  return pos;
}

domain::Position ClassificationEngine::increasedPosition(
    const domain::Position& pos, const domain::TradeEvent& event) {
  domain::Position grown = pos;
  const double new_size = pos.size + event.size;
  grown.entry_price =
      (pos.size * pos.entry_price + event.size * event.price) / new_size;
  grown.size = new_size;
  grown.updated_at_ms = event.timestamp_ms;
  return grown;
}

}  // namespace tradebook
