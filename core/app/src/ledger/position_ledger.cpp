#include "tradebook/ledger/position_ledger.hpp"
#include "tradebook/domain/errors.hpp"

#include <algorithm>
#include <mutex>
#include <type_traits>
#include <utility>

namespace tradebook {

// -----------------------------------------------------------------------------
// validatePosition: a stored row must have an id, size > 0 and direction ±1
// -----------------------------------------------------------------------------
void PositionLedger::validatePosition(const domain::Position& position) {
  if (position.token_id.empty()) {
    throw InconsistentStateError("position has an empty token id");
  }
  if (!(position.size > 0.0)) {
    throw InconsistentStateError("position " + position.token_id +
                                 " would be stored with size <= 0");
  }
  if (position.direction != 1 && position.direction != -1) {
    throw InconsistentStateError("position " + position.token_id +
                                 " has direction other than +1/-1");
  }
}

// -----------------------------------------------------------------------------
// getPosition
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::getPosition(
    const std::string& token_id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(token_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// getOppositePosition: same market, other outcome
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::getOppositePosition(
    const std::string& market_id, const std::string& outcome) const {
  std::shared_lock lock(mutex_);
  const domain::Position* best = nullptr;
  for (const auto& [token_id, pos] : positions_) {
    if (pos.market_id == market_id && pos.outcome != outcome &&
        (best == nullptr || token_id < best->token_id)) {
      best = &pos;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

// -----------------------------------------------------------------------------
// Single-step mutations
// -----------------------------------------------------------------------------
void PositionLedger::upsertPosition(const domain::Position& position) {
  validatePosition(position);
  std::unique_lock lock(mutex_);
  positions_[position.token_id] = position;
}

void PositionLedger::removePosition(const std::string& token_id) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(token_id);
  if (it == positions_.end()) {
    throw InconsistentStateError("cannot remove position " + token_id +
                                 ": no such position");
  }
  positions_.erase(it);
}

void PositionLedger::appendClosedTrade(const domain::ClosedTradeRecord& record) {
  std::unique_lock lock(mutex_);
  appendClosedTradeLocked(record);
}

void PositionLedger::appendClosedTradeLocked(
    const domain::ClosedTradeRecord& record) {
  closed_trades_.push_back(record);
  realized_pnl_total_ += record.realized_pnl;
}

// -----------------------------------------------------------------------------
// apply: validate the whole delta, then mutate, all under one unique_lock
// -----------------------------------------------------------------------------
void PositionLedger::apply(const LedgerDelta& delta) {
  std::unique_lock lock(mutex_);

  // Presence of each touched token after the changes seen so far. Lets a
  // delta remove a row and re-create it (or the reverse) in one unit.
  std::unordered_map<std::string, bool> present;
  auto isPresent = [&](const std::string& token_id) {
    auto it = present.find(token_id);
    if (it != present.end()) {
      return it->second;
    }
    return positions_.count(token_id) != 0;
  };

  for (const auto& change : delta.changes) {
    std::visit(
        [&](const auto& c) {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, UpsertPosition>) {
            validatePosition(c.position);
            if (c.requires_existing && !isPresent(c.position.token_id)) {
              throw InconsistentStateError(
                  std::string(domain::classificationToString(delta.kind)) +
                  " references position " + c.position.token_id +
                  " which is not held");
            }
            present[c.position.token_id] = true;
          } else {
            if (!isPresent(c.token_id)) {
              throw InconsistentStateError(
                  std::string(domain::classificationToString(delta.kind)) +
                  " closes position " + c.token_id + " which is not held");
            }
            present[c.token_id] = false;
          }
        },
        change);
  }

  // Validation passed; nothing below can fail on state grounds.
  for (const auto& change : delta.changes) {
    if (const auto* up = std::get_if<UpsertPosition>(&change)) {
      positions_[up->position.token_id] = up->position;
    } else if (const auto* rm = std::get_if<RemovePosition>(&change)) {
      positions_.erase(rm->token_id);
    }
  }

  if (delta.closed_trade.has_value()) {
    appendClosedTradeLocked(*delta.closed_trade);
  }
}

// -----------------------------------------------------------------------------
// Query surface
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionLedger::listOpenPositions() const {
  std::vector<domain::Position> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(positions_.size());
    for (const auto& [token_id, pos] : positions_) {
      result.push_back(pos);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              if (a.market_id != b.market_id) {
                return a.market_id < b.market_id;
              }
              return a.token_id < b.token_id;
            });
  return result;
}

std::vector<domain::ClosedTradeRecord> PositionLedger::listClosedTrades(
    std::size_t limit) const {
  std::shared_lock lock(mutex_);
  if (limit == 0 || limit >= closed_trades_.size()) {
    return closed_trades_;
  }
  return std::vector<domain::ClosedTradeRecord>(
      closed_trades_.end() - static_cast<std::ptrdiff_t>(limit),
      closed_trades_.end());
}

double PositionLedger::cumulativeRealizedPnl() const {
  std::shared_lock lock(mutex_);
  return realized_pnl_total_;
}

std::size_t PositionLedger::openPositionCount() const {
  std::shared_lock lock(mutex_);
  return positions_.size();
}

std::size_t PositionLedger::closedTradeCount() const {
  std::shared_lock lock(mutex_);
  return closed_trades_.size();
}

// -----------------------------------------------------------------------------
// Feed cursor
// -----------------------------------------------------------------------------
FeedCursor PositionLedger::cursor() const {
  std::shared_lock lock(mutex_);
  return cursor_;
}

void PositionLedger::recordSeen(const std::string& trade_id,
                                std::int64_t timestamp_ms) {
  std::unique_lock lock(mutex_);
  if (!trade_id.empty()) {
    cursor_.seen_trade_ids.insert(trade_id);
  }
  cursor_.last_seen_timestamp_ms =
      std::max(cursor_.last_seen_timestamp_ms, timestamp_ms);
}

bool PositionLedger::hasSeen(const std::string& trade_id) const {
  std::shared_lock lock(mutex_);
  return cursor_.seen_trade_ids.count(trade_id) != 0;
}

// -----------------------------------------------------------------------------
// snapshot / restore
// -----------------------------------------------------------------------------
LedgerSnapshot PositionLedger::snapshot() const {
  LedgerSnapshot snap;
  {
    std::shared_lock lock(mutex_);
    snap.positions.reserve(positions_.size());
    for (const auto& [token_id, pos] : positions_) {
      snap.positions.push_back(pos);
    }
    snap.closed_trades = closed_trades_;
    snap.cursor = cursor_;
  }
  std::sort(snap.positions.begin(), snap.positions.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.token_id < b.token_id;
            });
  return snap;
}

void PositionLedger::restore(const LedgerSnapshot& snapshot) {
  std::unordered_map<std::string, domain::Position> rows;
  for (const auto& pos : snapshot.positions) {
    validatePosition(pos);
    if (!rows.emplace(pos.token_id, pos).second) {
      throw InconsistentStateError("snapshot holds token " + pos.token_id +
                                   " more than once");
    }
  }

  double total = 0.0;
  for (const auto& record : snapshot.closed_trades) {
    total += record.realized_pnl;
  }

  std::unique_lock lock(mutex_);
  positions_ = std::move(rows);
  closed_trades_ = snapshot.closed_trades;
  realized_pnl_total_ = total;
  cursor_ = snapshot.cursor;
}

}  // namespace tradebook
