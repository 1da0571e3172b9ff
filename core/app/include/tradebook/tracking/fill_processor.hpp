#pragma once

#include "tradebook/classification/classification_engine.hpp"
#include "tradebook/domain/trade_event.hpp"
#include "tradebook/eventbus/event_bus.hpp"
#include "tradebook/events/classification_event.hpp"
#include "tradebook/ledger/position_ledger.hpp"
#include "tradebook/persistence/i_state_store.hpp"

#include <cstdint>

namespace tradebook {

// -----------------------------------------------------------------------------
// FillProcessor — drives the engine and the ledger for every fill
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to domain::TradeEvent on the ledger loop's EventBus,
//         classifies each fill, applies the resulting LedgerDelta and
//         publishes the outcome.
//
// @details
// Per fill, on the ledger loop thread:
//   1. Skip if the feed id was already processed (a fill replayed after a
//      restart). The feed owes exactly-once delivery; this is a backstop,
//      not the deduplication mechanism.
//   2. delta = engine.classify(ledger, fill)
//   3. ledger.apply(delta)
//   4. ledger.recordSeen(trade_id, timestamp)
//   5. publish ClassificationEvent
//   6. store->save(ledger.snapshot())  (if a store is attached)
//
// Failures:
//   InvalidEventError      from step 2 → TradeRejectedEvent(InvalidEvent)
//   InconsistentStateError from step 3 → TradeRejectedEvent(InconsistentState)
//   The ledger is untouched in both cases. The fill still counts as seen and
//   the snapshot is still saved, so it is not retried after a restart.
//   StateStoreError from step 6 is reported on stderr; the in-memory ledger
//   stays authoritative and the next fill retries the save.
//
// Because the loop runs subscribers one event at a time, step 2 and step 3
// see the same ledger state; no other writer exists.
//
// Ownership:
//   Owned by TradeTracker via std::unique_ptr. Holds references to the bus,
//   the ledger and the engine, all of which outlive it. The store pointer is
//   non-owning and may be null.
// -----------------------------------------------------------------------------
class FillProcessor {
 public:
  FillProcessor(EventBus& bus,
                PositionLedger& ledger,
                const ClassificationEngine& engine,
                IStateStore* store = nullptr);

  // Unsubscribes. Must run before the bus is destroyed.
  ~FillProcessor();

  FillProcessor(const FillProcessor&) = delete;
  FillProcessor& operator=(const FillProcessor&) = delete;
  FillProcessor(FillProcessor&&) = delete;
  FillProcessor& operator=(FillProcessor&&) = delete;

  // -------------------------------------------------------------------------
  // process(fill)
  // -------------------------------------------------------------------------
  // @brief  Runs steps 1–6 above for one fill. Called by the bus
  //         subscription; also callable directly from tests.
  //
  // @return true if the fill was applied, false if skipped or rejected.
  // -------------------------------------------------------------------------
  bool process(const domain::TradeEvent& fill);

  std::uint64_t appliedCount() const { return applied_count_; }
  std::uint64_t rejectedCount() const { return rejected_count_; }

 private:
  static ClassificationEvent makeClassificationEvent(
      const domain::TradeEvent& fill, const LedgerDelta& delta);

  void persist();

  EventBus& bus_;
  EventBus::SubscriptionId trade_sub_id_{0};

  PositionLedger& ledger_;
  const ClassificationEngine& engine_;
  IStateStore* store_;

  std::uint64_t next_sequence_id_{1};
  std::uint64_t applied_count_{0};
  std::uint64_t rejected_count_{0};
};

}  // namespace tradebook
