#pragma once

#include "tradebook/domain/engine_config.hpp"
#include "tradebook/sizing/copy_sizer.hpp"

#include <string>

namespace tradebook {

// -----------------------------------------------------------------------------
// LogLevel
// -----------------------------------------------------------------------------
enum class LogLevel { Debug, Info, Warning, Error };

// Throws ConfigError for an unknown name. Case-insensitive.
LogLevel logLevelFromString(const std::string& name);
const char* logLevelToString(LogLevel level);

// -----------------------------------------------------------------------------
// TrackerConfig — everything the executable can be configured with
// -----------------------------------------------------------------------------
//
// @brief  Plain struct with working defaults. Copied by value into the
//         components that need it; never mutated after startup.
//
// @details
// Endpoints left empty disable the corresponding thread (the tests push
// fills directly and run without sockets):
//   feed_endpoint      SUB socket for trade activity
//   ipc_cmd_endpoint   REP socket for status queries
//   ipc_pub_endpoint   PUB socket for classification telemetry
//
// tracked_wallet, when set, drops feed activity from any other wallet.
// state_file is where JsonFileStateStore keeps the ledger snapshot.
// -----------------------------------------------------------------------------
struct TrackerConfig {
  domain::EngineConfig engine;
  SizingConfig sizing;

  std::string feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  std::string tracked_wallet;
  std::string state_file{"tradebook_state.json"};
  LogLevel log_level{LogLevel::Info};
};

// -----------------------------------------------------------------------------
// loadTrackerConfig(path)
// -----------------------------------------------------------------------------
//
// @brief  Reads a JSON config file on top of the defaults.
//
// @details
// Recognised layout (every key optional):
//   {
//     "engine":  { "size_epsilon": 1e-9, "allow_short_open": false },
//     "sizing":  { "enabled": true, "risk_multiplier": 0.5,
//                  "max_trade_usdc": 100.0 },
//     "feed_endpoint": "...", "ipc_cmd_endpoint": "...",
//     "ipc_pub_endpoint": "...", "tracked_wallet": "0x...",
//     "state_file": "...", "log_level": "info"
//   }
//
// @throws ConfigError  if the file cannot be read, is not valid JSON, a key
//         has the wrong type, or a value is out of range (negative epsilon,
//         non-positive multiplier).
// -----------------------------------------------------------------------------
TrackerConfig loadTrackerConfig(const std::string& path);

// Parses the same layout from an in-memory JSON string.
TrackerConfig parseTrackerConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides(config)
// -----------------------------------------------------------------------------
// Environment variables take precedence over the file:
//   MAX_TRADE_USDC        sizing.max_trade_usdc
//   RISK_MULTIPLIER       sizing.risk_multiplier
//   LOG_LEVEL             log_level
//   TRADEBOOK_STATE_FILE  state_file
//   TRADEBOOK_WALLET      tracked_wallet
// Throws ConfigError on a malformed value.
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(TrackerConfig& config);

// Throws ConfigError if any value is out of range.
void validateTrackerConfig(const TrackerConfig& config);

}  // namespace tradebook
