#include "tradebook/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace tradebook {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key,
                 const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped after " << commands_served_.load()
            << " command(s), " << telemetry_dropped_.load()
            << " telemetry message(s) dropped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): drain queue, publish JSON
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      // Dropped rather than blocking when no subscriber keeps up.
      if (!pub_socket_->send(zmq::buffer(*json_str),
                             zmq::send_flags::dontwait)) {
        telemetry_dropped_.fetch_add(1);
      }
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round-trip, or return on timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd = request.to_string();
  const std::string response = handleCommand(cmd);

  commands_served_.fetch_add(1);
  // REP must answer every request before it can receive the next one.
  cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// handleCommand(): handler failures become an error reply
// -----------------------------------------------------------------------------
std::string IpcServer::handleCommand(const std::string& cmd) const {
  try {
    return command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command '" << cmd
              << "' failed: " << e.what() << "\n";
    nlohmann::json j;
    j["status"] = "error";
    j["response"] = std::string("Command failed: ") + e.what();
    return j.dump();
  }
}

// -----------------------------------------------------------------------------
// formatTelemetry(): per-type JSON
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<ClassificationEvent>(&event)) {
    return formatClassification(*e);
  }
  if (auto* e = std::get_if<TradeRejectedEvent>(&event)) {
    return formatRejection(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatClassification(const ClassificationEvent& e) {
  nlohmann::json j;
  j["type"] = "classification";
  j["kind"] = domain::classificationToString(e.kind);
  j["trade_id"] = e.trade_id;
  j["token_id"] = e.token_id;
  j["market_id"] = e.market_id;
  j["outcome"] = e.outcome;
  j["side"] = domain::sideToString(e.side);
  j["trade_size"] = e.trade_size;
  j["trade_price"] = e.trade_price;
  putOptional(j, "closing_size", e.closing_size);
  putOptional(j, "entry_price", e.entry_price);
  putOptional(j, "exit_price", e.exit_price);
  putOptional(j, "realized_pnl", e.realized_pnl);
  putOptional(j, "resulting_position_size", e.resulting_position_size);
  putOptional(j, "hedged_token_id", e.hedged_token_id);
  j["cumulative_realized_pnl"] = e.cumulative_realized_pnl;
  j["timestamp_ms"] = e.timestamp_ms;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

std::string IpcServer::formatRejection(const TradeRejectedEvent& e) {
  nlohmann::json j;
  j["type"] = "trade_rejected";
  j["reason"] = rejectReasonToString(e.reason);
  j["message"] = e.message;
  j["trade_id"] = e.trade.trade_id;
  j["token_id"] = e.trade.token_id;
  j["market_id"] = e.trade.market_id;
  j["side"] = domain::sideToString(e.trade.side);
  j["size"] = e.trade.size;
  j["price"] = e.trade.price;
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

}  // namespace tradebook
