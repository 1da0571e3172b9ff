#pragma once

#include "tradebook/concurrent/thread_safe_queue.hpp"
#include "tradebook/events/classification_event.hpp"
#include "tradebook/events/event.hpp"
#include "tradebook/events/trade_rejected_event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradebook {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ query socket and classification telemetry
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two sockets:
//
//   1. REP (commands): receives a command string such as "STATUS" or
//      "TRADES 20", passes it to the command handler (bound to
//      TradeTracker::executeCommand()) and replies with its JSON. This is the
//      query surface used by status/reporting clients such as a chat bot.
//
//   2. PUB (telemetry): broadcasts one JSON message per ClassificationEvent
//      and TradeRejectedEvent. Events are queued by pushTelemetry() on the
//      ledger loop thread and serialized here, so JSON formatting and socket
//      I/O never run on the ledger loop.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread and must only use the
//   thread-safe ledger query methods. A handler that throws gets an error
//   JSON reply; the REP socket is never left waiting for a send.
//
// Ownership:
//   Owned by TradeTracker via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON for ClassificationEvent / TradeRejectedEvent, std::nullopt
  //         for any other kind.
  //
  // Public and static so the wire format can be checked without sockets.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

  std::size_t commandsServed() const { return commands_served_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();
  std::string handleCommand(const std::string& cmd) const;

  static std::string formatClassification(const ClassificationEvent& e);
  static std::string formatRejection(const TradeRejectedEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> commands_served_{0};
  std::atomic<std::size_t> telemetry_dropped_{0};
};

}  // namespace tradebook
