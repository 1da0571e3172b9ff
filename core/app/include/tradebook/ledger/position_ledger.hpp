#pragma once

#include "tradebook/domain/closed_trade.hpp"
#include "tradebook/domain/position.hpp"
#include "tradebook/ledger/ledger_delta.hpp"
#include "tradebook/ledger/ledger_snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// PositionLedger — open positions per token and closed-trade history
// -----------------------------------------------------------------------------
//
// @brief  Owns the authoritative position rows and the append-only list of
//         ClosedTradeRecords. Applies LedgerDeltas atomically.
//
// @details
// Two containers:
//
//   1. positions_: token_id → Position. A row exists only while size > 0.
//
//   2. closed_trades_: chronological vector of ClosedTradeRecord. Never
//      mutated or shrunk; cumulative realized PnL is the sum over it and is
//      cached in realized_pnl_total_.
//
// Atomicity:
//   apply() validates every change of a delta against the current rows under
//   an exclusive lock, and only if all of them are valid mutates the rows and
//   appends the closed-trade record, still under the same lock. A failed
//   validation throws InconsistentStateError with the ledger untouched.
//   Readers take a shared lock, so a query observes either the state before a
//   fill or the state after it, never half.
//
// Thread model:
//   Writers (apply, upsert/remove/append, restore, recordSeen) run on the
//   ledger loop thread in the tracker. Readers may run on any thread (IPC
//   query thread). All accessors return copies.
//
// Ownership:
//   Plain object, owned by whoever constructs it (TradeTracker, or a test).
//   ClassificationEngine reads it by const reference.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger() = default;

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // getPosition(token_id)
  // -------------------------------------------------------------------------
  // @return Copy of the row for token_id, or std::nullopt if none is held.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> getPosition(const std::string& token_id) const;

  // -------------------------------------------------------------------------
  // getOppositePosition(market_id, outcome)
  // -------------------------------------------------------------------------
  // @brief  Looks up the position held on the market's other outcome.
  //
  // @return The row with the same market_id and a different outcome, or
  //         std::nullopt. On a binary market there is at most one; if a
  //         market carries several, the lowest token_id wins, so the answer
  //         does not depend on map iteration order.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> getOppositePosition(
      const std::string& market_id, const std::string& outcome) const;

  // -------------------------------------------------------------------------
  // upsertPosition / removePosition / appendClosedTrade
  // -------------------------------------------------------------------------
  // Single-step mutations. Each one takes the exclusive lock on its own.
  // Used to seed state in tests and by apply() internally; a fill is always
  // applied through apply() so its changes stay together.
  //
  // upsertPosition throws InconsistentStateError for size <= 0 or an empty
  // token id. removePosition throws InconsistentStateError if the row does
  // not exist.
  // -------------------------------------------------------------------------
  void upsertPosition(const domain::Position& position);
  void removePosition(const std::string& token_id);
  void appendClosedTrade(const domain::ClosedTradeRecord& record);

  // -------------------------------------------------------------------------
  // apply(delta)
  // -------------------------------------------------------------------------
  // @brief  Applies every change of the delta and appends its closed-trade
  //         record as one unit.
  //
  // @throws InconsistentStateError  if any change is invalid against the
  //         current rows. Nothing is applied in that case.
  // -------------------------------------------------------------------------
  void apply(const LedgerDelta& delta);

  // -------------------------------------------------------------------------
  // Query surface
  // -------------------------------------------------------------------------
  // listOpenPositions()     rows sorted by market_id then token_id.
  // listClosedTrades(limit) the most recent `limit` records in
  //                         chronological order; limit == 0 returns all.
  // cumulativeRealizedPnl() sum of realized_pnl over every record.
  // -------------------------------------------------------------------------
  std::vector<domain::Position> listOpenPositions() const;
  std::vector<domain::ClosedTradeRecord> listClosedTrades(
      std::size_t limit = 0) const;
  double cumulativeRealizedPnl() const;

  std::size_t openPositionCount() const;
  std::size_t closedTradeCount() const;

  // -------------------------------------------------------------------------
  // Feed cursor
  // -------------------------------------------------------------------------
  // Stored next to the rows so one snapshot captures both consistently.
  // -------------------------------------------------------------------------
  FeedCursor cursor() const;

  // Marks a feed id as processed and advances last_seen_timestamp_ms.
  void recordSeen(const std::string& trade_id, std::int64_t timestamp_ms);
  bool hasSeen(const std::string& trade_id) const;

  // -------------------------------------------------------------------------
  // snapshot() / restore(snapshot)
  // -------------------------------------------------------------------------
  // snapshot() copies the whole state under one shared lock.
  // restore() replaces the whole state. It validates every row first and
  // throws InconsistentStateError (ledger untouched) on a non-positive size,
  // an empty token id, a duplicate token id or a direction other than ±1.
  // -------------------------------------------------------------------------
  LedgerSnapshot snapshot() const;
  void restore(const LedgerSnapshot& snapshot);

 private:
  static void validatePosition(const domain::Position& position);

  // Caller must hold mutex_ exclusively.
  void appendClosedTradeLocked(const domain::ClosedTradeRecord& record);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::vector<domain::ClosedTradeRecord> closed_trades_;
  double realized_pnl_total_{0.0};
  FeedCursor cursor_;
};

}  // namespace tradebook
