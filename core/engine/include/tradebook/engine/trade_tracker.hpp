#pragma once

#include "tradebook/classification/classification_engine.hpp"
#include "tradebook/concurrent/event_loop_thread.hpp"
#include "tradebook/config/tracker_config.hpp"
#include "tradebook/domain/trade_event.hpp"
#include "tradebook/feed/trade_feed_thread.hpp"
#include "tradebook/ledger/position_ledger.hpp"
#include "tradebook/network/ipc_server.hpp"
#include "tradebook/persistence/i_state_store.hpp"
#include "tradebook/sizing/copy_sizer.hpp"
#include "tradebook/tracking/fill_processor.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tradebook {

// -----------------------------------------------------------------------------
// TradeTracker
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator that owns the ledger, the classification
//         engine, the ledger loop thread and the network I/O threads.
//
// @details
// Provides a start/stop lifecycle so that main() and tests can run the
// tracker without wiring internals by hand.
//
// Thread layout:
//
//   ledger_loop thread   → FillProcessor (classify, apply, publish, persist)
//   trade_feed thread    → TradeFeedGateway ZMQ recv loop
//   ipc thread           → IpcServer REP commands + PUB telemetry
//
//   main thread          → tracker.start(), wait for shutdown, tracker.stop()
//
// Every fill, from any market, is processed on the single ledger loop
// thread. Reading positions and applying the delta therefore never
// interleave with another fill. Query commands run on the IPC thread and
// only take the ledger's shared lock.
//
// Cross-thread bridges (wired in start()):
//   1. trade_feed   →  ledger_loop:  TradeEvent (via pushTrade)
//   2. ledger_loop  →  ipc thread:   ClassificationEvent, TradeRejectedEvent
//
// Ownership:
//   TradeTracker
//    ├── config_           (TrackerConfig — value member, immutable)
//    ├── engine_           (ClassificationEngine — value member, stateless)
//    ├── sizer_            (CopySizer — value member)
//    ├── ledger_           (PositionLedger — value member, outlives loops)
//    ├── ledger_loop_      (EventLoopThread — value member)
//    ├── fill_processor_   (unique_ptr<FillProcessor>)
//    ├── ipc_server_       (unique_ptr<IpcServer>)
//    ├── feed_thread_      (unique_ptr<TradeFeedThread>)
//    └── store_            (IStateStore* — optional, non-owning)
// -----------------------------------------------------------------------------
class TradeTracker {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  Full tracker configuration. An empty feed_endpoint skips
  //                 the TradeFeedThread and an empty IPC endpoint skips the
  //                 IpcServer (unit tests push fills via pushTrade()).
  //
  // @details
  // No threads are spawned and no sockets are opened in the constructor.
  // -------------------------------------------------------------------------
  explicit TradeTracker(TrackerConfig config = {});

  // Destructor calls stop() for RAII safety.
  ~TradeTracker();

  TradeTracker(const TradeTracker&) = delete;
  TradeTracker& operator=(const TradeTracker&) = delete;
  TradeTracker(TradeTracker&&) = delete;
  TradeTracker& operator=(TradeTracker&&) = delete;

  // -------------------------------------------------------------------------
  // start(store)
  // -------------------------------------------------------------------------
  //
  // @brief  Restores persisted state and brings the tracker to a running
  //         state.
  //
  // @param  store  Optional non-owning state store. If non-null, the last
  //                snapshot is loaded into the ledger before any fill is
  //                processed, a snapshot is saved after every fill, and a
  //                final snapshot is saved by stop(). Must outlive the
  //                running tracker.
  //
  // @details
  // Startup sequence:
  //   1. Load and restore the snapshot (StateStoreError and
  //      InconsistentStateError propagate; nothing is started).
  //   2. Create the FillProcessor and start the ledger loop.
  //   3. Start the IpcServer and wire telemetry.
  //   4. Start the TradeFeedThread LAST, seeded with the restored cursor.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start(IStateStore* store = nullptr);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops inflow, drains queued fills, joins all threads and saves
  //         a final snapshot. Idempotent. start() may be called again.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // pushTrade(fill)
  // -------------------------------------------------------------------------
  //
  // @brief  Enqueues a fill on the ledger loop.
  //
  // @details
  // When sizing is enabled, the fill is first filtered by
  // CopySizer::shouldCopy() and resized by CopySizer::apply(). This is the
  // sink bound to the TradeFeedThread; tests call it directly.
  //
  // @return false if the sizer dropped the fill.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  bool pushTrade(domain::TradeEvent fill);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers an IPC query with a JSON document.
  //
  // @details
  // Supported commands:
  //   "PING"          → {"status":"ok","response":"PONG"}
  //   "STATUS"        → {"status":"ok","running":bool,"positions":[...],
  //                      "closed_trades":n,"cumulative_realized_pnl":x,...}
  //   "POSITIONS"     → {"status":"ok","positions":[...]}
  //   "TRADES [n]"    → {"status":"ok","trades":[...]}  (n defaults to 10)
  //   "PNL"           → {"status":"ok","cumulative_realized_pnl":x}
  //   other           → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: Safe to call from any thread (ledger shared lock only).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus of the ledger loop. Subscribe before start() to see every event.
  EventBus& eventBus();

  const PositionLedger& ledger() const { return ledger_; }
  bool running() const { return running_.load(); }

  static constexpr std::size_t kDefaultTradesLimit = 10;

 private:
  void shutdownComponents();
  void saveSnapshot();

  const TrackerConfig config_;
  const ClassificationEngine engine_;
  const CopySizer sizer_;

  PositionLedger ledger_;
  IStateStore* store_{nullptr};

  EventLoopThread ledger_loop_;

  std::unique_ptr<FillProcessor> fill_processor_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<TradeFeedThread> feed_thread_;

  std::vector<EventBus::SubscriptionId> telemetry_subs_;

  std::atomic<bool> running_{false};
};

}  // namespace tradebook
