#include "tradebook/engine/trade_tracker.hpp"

#include "tradebook/domain/errors.hpp"
#include "tradebook/persistence/snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tradebook {

namespace {

nlohmann::json positionsJson(const PositionLedger& ledger) {
  nlohmann::json positions = nlohmann::json::array();
  for (const auto& pos : ledger.listOpenPositions()) {
    positions.push_back(nlohmann::json(pos));
  }
  return positions;
}

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradeTracker::TradeTracker(TrackerConfig config)
    : config_(std::move(config)),
      engine_(config_.engine),
      sizer_(config_.sizing) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradeTracker::~TradeTracker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradeTracker::start(IStateStore* store) {
  if (running_.load()) {
    return;
  }

  // ---  1) Restore persisted state before any fill can arrive ---------------
  store_ = store;
  if (store_ != nullptr) {
    if (auto snapshot = store_->load()) {
      ledger_.restore(*snapshot);
      std::cout << "[TradeTracker] Restored " << snapshot->positions.size()
                << " position(s), " << snapshot->closed_trades.size()
                << " closed trade(s), cumulative realized PnL "
                << ledger_.cumulativeRealizedPnl() << ".\n";
    } else {
      std::cout << "[TradeTracker] No saved state. Starting empty.\n";
    }
  }

  // ---  2) Fill processor on the ledger loop --------------------------------
  fill_processor_ = std::make_unique<FillProcessor>(
      ledger_loop_.eventBus(), ledger_, engine_, store_);
  ledger_loop_.start();

  // Socket setup can fail (e.g. endpoint in use). Undo the partial start so
  // no thread is left behind, then let the caller see the original error.
  try {
    // ---  3) IpcServer (queries + telemetry) --------------------------------
    if (!config_.ipc_cmd_endpoint.empty() &&
        !config_.ipc_pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
      ipc_server_->start();

      telemetry_subs_.push_back(
          ledger_loop_.eventBus().subscribe<ClassificationEvent>(
              [this](const ClassificationEvent& e) {
                ipc_server_->pushTelemetry(e);
              }));
      telemetry_subs_.push_back(
          ledger_loop_.eventBus().subscribe<TradeRejectedEvent>(
              [this](const TradeRejectedEvent& e) {
                ipc_server_->pushTelemetry(e);
              }));
    }

    // ---  4) Trade feed LAST (fills begin flowing) --------------------------
    if (!config_.feed_endpoint.empty()) {
      feed_thread_ = std::make_unique<TradeFeedThread>(
          [this](domain::TradeEvent fill) { pushTrade(std::move(fill)); },
          FeedFilter(config_.tracked_wallet, ledger_.cursor()),
          config_.feed_endpoint);
      feed_thread_->start();
    }
  } catch (const std::exception& e) {
    std::cerr << "[TradeTracker] ERROR: start failed: " << e.what()
              << ". Rolling back.\n";
    shutdownComponents();
    store_ = nullptr;
    throw;
  }

  running_.store(true);

  std::cout << "[TradeTracker] started. Threads: ledger"
            << (ipc_server_ ? ", ipc" : "")
            << (feed_thread_ ? ", trade_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradeTracker::stop() {
  if (!running_.load()) {
    return;
  }

  shutdownComponents();

  saveSnapshot();
  store_ = nullptr;

  running_.store(false);

  std::cout << "[TradeTracker] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// shutdownComponents(): reverse of start(), safe on a partially started tracker
// -----------------------------------------------------------------------------
void TradeTracker::shutdownComponents() {
  // ---  1) Stop fill inflow FIRST -------------------------------------------
  feed_thread_.reset();

  // ---  2) Drain queued fills and join the ledger loop ----------------------
  // Must precede the IPC teardown: a publish in flight may still reach the
  // telemetry callbacks after they are unsubscribed.
  ledger_loop_.stop();
  fill_processor_.reset();

  // ---  3) Detach telemetry, then stop the IPC server -----------------------
  for (auto id : telemetry_subs_) {
    ledger_loop_.eventBus().unsubscribe(id);
  }
  telemetry_subs_.clear();
  ipc_server_.reset();
}

// -----------------------------------------------------------------------------
// pushTrade(fill)
// -----------------------------------------------------------------------------
bool TradeTracker::pushTrade(domain::TradeEvent fill) {
  if (config_.sizing.enabled) {
    if (!sizer_.shouldCopy(fill)) {
      std::cerr << "[TradeTracker] WARNING: skipping trade " << fill.trade_id
                << " (not copyable).\n";
      return false;
    }
    if (sizer_.isCapped(fill)) {
      std::cout << "[TradeTracker] trade " << fill.trade_id
                << " capped at " << config_.sizing.max_trade_usdc
                << " USDC.\n";
    }
    fill = sizer_.apply(fill);
  }

  ledger_loop_.push(std::move(fill));
  return true;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC query requests
// -----------------------------------------------------------------------------
std::string TradeTracker::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  in >> verb;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    response["status"] = "ok";
    response["running"] = running_.load();
    response["queued_fills"] = ledger_loop_.pending();
    response["positions"] = positionsJson(ledger_);
    response["closed_trades"] = ledger_.closedTradeCount();
    response["cumulative_realized_pnl"] = ledger_.cumulativeRealizedPnl();
    response["last_seen_timestamp_ms"] =
        ledger_.cursor().last_seen_timestamp_ms;
  } else if (verb == "POSITIONS") {
    response["status"] = "ok";
    response["positions"] = positionsJson(ledger_);
  } else if (verb == "TRADES") {
    std::size_t limit = kDefaultTradesLimit;
    std::string arg;
    if (in >> arg) {
      try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(arg, &consumed);
        if (consumed != arg.size() || parsed <= 0) {
          return errorResponse("Invalid trade limit: " + arg).dump();
        }
        limit = static_cast<std::size_t>(parsed);
      } catch (const std::logic_error&) {
        return errorResponse("Invalid trade limit: " + arg).dump();
      }
    }

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& record : ledger_.listClosedTrades(limit)) {
      trades.push_back(nlohmann::json(record));
    }
    response["status"] = "ok";
    response["trades"] = std::move(trades);
  } else if (verb == "PNL") {
    response["status"] = "ok";
    response["cumulative_realized_pnl"] = ledger_.cumulativeRealizedPnl();
    response["closed_trades"] = ledger_.closedTradeCount();
  } else {
    response = errorResponse("Unknown command: " + cmd);
  }

  return response.dump();
}

EventBus& TradeTracker::eventBus() { return ledger_loop_.eventBus(); }

// -----------------------------------------------------------------------------
// saveSnapshot(): final save on stop
// -----------------------------------------------------------------------------
void TradeTracker::saveSnapshot() {
  if (store_ == nullptr) {
    return;
  }
  try {
    store_->save(ledger_.snapshot());
    std::cout << "[TradeTracker] State saved.\n";
  } catch (const StateStoreError& e) {
    std::cerr << "[TradeTracker] ERROR: final state save failed: " << e.what()
              << "\n";
  }
}

}  // namespace tradebook
