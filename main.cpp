// -----------------------------------------------------------------------------
// tradebook — single executable entry point.
//
//   1) Load the TrackerConfig (optional JSON path in argv[1]) and apply
//      environment overrides.
//   2) Open the JSON state store and start the TradeTracker. The tracker
//      restores the last snapshot before the feed starts.
//   3) Subscribe the console alert logger to ClassificationEvent and
//      TradeRejectedEvent.
//   4) Block until Ctrl-C, then stop the tracker (drains queued fills and
//      saves the final snapshot).
//
// Thread layout:
//   main thread        → waits on the shutdown flag
//   ledger thread      → FillProcessor + alert logger callbacks
//   trade_feed thread  → TradeFeedGateway ZMQ recv loop
//   ipc thread         → IpcServer
// -----------------------------------------------------------------------------

#include "tradebook/config/tracker_config.hpp"
#include "tradebook/domain/errors.hpp"
#include "tradebook/engine/trade_tracker.hpp"
#include "tradebook/events/classification_event.hpp"
#include "tradebook/events/trade_rejected_event.hpp"
#include "tradebook/persistence/json_state_store.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag. Set by the SIGINT handler, polled by main().
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

namespace {

bool enabled(tradebook::LogLevel configured, tradebook::LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(configured);
}

// -----------------------------------------------------------------------------
// printAlert
// -----------------------------------------------------------------------------
// @brief  Renders one classified fill as a human-readable alert line.
//
// OPEN and INCREASE are reported at debug level; anything that realizes PnL
// is always reported at info.
// -----------------------------------------------------------------------------
void printAlert(const tradebook::ClassificationEvent& e,
                tradebook::LogLevel level) {
  using tradebook::domain::classificationToString;
  using tradebook::domain::realizesPnl;
  using tradebook::domain::sideToString;

  const bool closes = realizesPnl(e.kind);
  if (!enabled(level,
               closes ? tradebook::LogLevel::Info : tradebook::LogLevel::Debug)) {
    return;
  }

  std::cout << "[Alert] " << classificationToString(e.kind) << " "
            << sideToString(e.side) << " " << e.trade_size << " " << e.outcome
            << " @ " << e.trade_price << " market=" << e.market_id;
  if (e.resulting_position_size) {
    std::cout << " position=" << *e.resulting_position_size;
  }
  if (e.hedged_token_id) {
    std::cout << " hedged=" << *e.hedged_token_id;
  }
  if (closes) {
    std::cout << " closing=" << e.closing_size.value_or(0.0)
              << " entry=" << e.entry_price.value_or(0.0)
              << " exit=" << e.exit_price.value_or(0.0)
              << " pnl=" << e.realized_pnl.value_or(0.0)
              << " total_pnl=" << e.cumulative_realized_pnl;
  }
  std::cout << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradebook::TrackerConfig config;
  try {
    if (argc > 1) {
      config = tradebook::loadTrackerConfig(argv[1]);
    }
    tradebook::applyEnvironmentOverrides(config);
    tradebook::validateTrackerConfig(config);
  } catch (const tradebook::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] log_level=" << tradebook::logLevelToString(config.log_level)
            << " sizing=" << (config.sizing.enabled ? "on" : "off")
            << " state_file=" << config.state_file << "\n";

  const tradebook::LogLevel level = config.log_level;

  // -------------------------------------------------------------------------
  // 2) Tracker + alert logging. Subscribed before start() so the first
  //    fill is reported.
  // -------------------------------------------------------------------------
  tradebook::JsonFileStateStore store(config.state_file);
  tradebook::TradeTracker tracker(config);

  tracker.eventBus().subscribe<tradebook::ClassificationEvent>(
      [level](const tradebook::ClassificationEvent& e) {
        printAlert(e, level);
      });

  tracker.eventBus().subscribe<tradebook::TradeRejectedEvent>(
      [level](const tradebook::TradeRejectedEvent& e) {
        if (!enabled(level, tradebook::LogLevel::Warning)) {
          return;
        }
        std::cerr << "[Alert] REJECTED trade " << e.trade.trade_id << " ("
                  << tradebook::rejectReasonToString(e.reason)
                  << "): " << e.message << "\n";
      });

  try {
    tracker.start(&store);
  } catch (const tradebook::TradebookError& e) {
    std::cerr << "[main] ERROR: failed to start: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: socket setup failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] Tracking fills from " << config.feed_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown: drain fills, join threads, save state.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Stopping tracker...\n";
  tracker.stop();

  std::cout << "[main] Realized PnL: "
            << tracker.ledger().cumulativeRealizedPnl() << " across "
            << tracker.ledger().closedTradeCount() << " closed trade(s).\n";

  return 0;
}
