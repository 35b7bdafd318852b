#pragma once

#include "settle/concurrent/thread_safe_queue.hpp"
#include "settle/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace settle {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread serving two sockets:
//
//   1. REP socket (commands): each request is a JSON command string. It is
//      passed to the CommandHandler (EscrowService::executeCommand) and the
//      returned JSON string is sent back.
//   2. PUB socket (telemetry): every settlement notification pushed with
//      pushTelemetry() is serialized with eventToJson() and broadcast.
//
// @details
// The REP socket has a receive timeout so the worker alternates between
// draining the telemetry queue and waiting for the next command. The queue
// decouples the thread committing settlement operations from JSON encoding
// and socket I/O.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The CommandHandler runs on the IPC worker thread.
//
// Ownership:
//   Owned by EscrowService via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // Calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Stops the worker after a final telemetry drain and closes the sockets.
  // Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // JSON text published for `event`.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace settle
