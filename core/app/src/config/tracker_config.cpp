#include "tradebook/config/tracker_config.hpp"
#include "tradebook/domain/errors.hpp"
#include "tradebook/feed/activity_decoder.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tradebook {

namespace {

double parseDouble(const char* name, const std::string& text) {
  try {
    std::size_t used = 0;
    double value = std::stod(text, &used);
    if (used == text.size()) {
      return value;
    }
  } catch (const std::logic_error&) {
  }
  throw ConfigError(std::string(name) + " is not a number: '" + text + "'");
}

void applyJson(const nlohmann::json& j, TrackerConfig& config) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  if (j.contains("engine")) {
    const auto& e = j.at("engine");
    config.engine.size_epsilon =
        e.value("size_epsilon", config.engine.size_epsilon);
    config.engine.allow_short_open =
        e.value("allow_short_open", config.engine.allow_short_open);
  }

  if (j.contains("sizing")) {
    const auto& s = j.at("sizing");
    config.sizing.enabled = s.value("enabled", config.sizing.enabled);
    config.sizing.risk_multiplier =
        s.value("risk_multiplier", config.sizing.risk_multiplier);
    config.sizing.max_trade_usdc =
        s.value("max_trade_usdc", config.sizing.max_trade_usdc);
  }

  config.feed_endpoint = j.value("feed_endpoint", config.feed_endpoint);
  config.ipc_cmd_endpoint = j.value("ipc_cmd_endpoint", config.ipc_cmd_endpoint);
  config.ipc_pub_endpoint = j.value("ipc_pub_endpoint", config.ipc_pub_endpoint);
  config.tracked_wallet = j.value("tracked_wallet", config.tracked_wallet);
  config.state_file = j.value("state_file", config.state_file);

  if (j.contains("log_level")) {
    config.log_level = logLevelFromString(j.at("log_level").get<std::string>());
  }
}

}  // namespace

LogLevel logLevelFromString(const std::string& name) {
  const std::string lower = toLower(name);
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warning" || lower == "warn") return LogLevel::Warning;
  if (lower == "error") return LogLevel::Error;
  throw ConfigError("unknown log level '" + name + "'");
}

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "debug";
    case LogLevel::Info:    return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error:   return "error";
  }
  return "unknown";
}

TrackerConfig parseTrackerConfig(const std::string& json_text) {
  TrackerConfig config;
  try {
    applyJson(nlohmann::json::parse(json_text), config);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
  validateTrackerConfig(config);
  return config;
}

TrackerConfig loadTrackerConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  std::ostringstream text;
  text << in.rdbuf();
  return parseTrackerConfig(text.str());
}

void applyEnvironmentOverrides(TrackerConfig& config) {
  if (const char* v = std::getenv("MAX_TRADE_USDC")) {
    config.sizing.max_trade_usdc = parseDouble("MAX_TRADE_USDC", v);
  }
  if (const char* v = std::getenv("RISK_MULTIPLIER")) {
    config.sizing.risk_multiplier = parseDouble("RISK_MULTIPLIER", v);
  }
  if (const char* v = std::getenv("LOG_LEVEL")) {
    config.log_level = logLevelFromString(v);
  }
  if (const char* v = std::getenv("TRADEBOOK_STATE_FILE")) {
    config.state_file = v;
  }
  if (const char* v = std::getenv("TRADEBOOK_WALLET")) {
    config.tracked_wallet = v;
  }
  validateTrackerConfig(config);
}

void validateTrackerConfig(const TrackerConfig& config) {
  if (!(config.engine.size_epsilon >= 0.0)) {
    throw ConfigError("engine.size_epsilon must be >= 0");
  }
  if (!(config.sizing.risk_multiplier > 0.0)) {
    throw ConfigError("sizing.risk_multiplier must be > 0");
  }
}

}  // namespace tradebook
