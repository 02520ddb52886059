#pragma once

#include "escrow/concurrent/thread_safe_queue.hpp"
#include "escrow/events/notification.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace escrow {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a worker thread that answers JSON commands on a REP socket and
//         broadcasts engine notifications as JSON on a PUB socket.
//
// @details
// Two sockets share one thread:
//
//   1. REP socket (command_endpoint):
//      Each request is handed to the command handler (bound to
//      CommandRouter::handle()) and its reply is sent back. ZMQ_RCVTIMEO
//      keeps recv() from blocking so the loop can also serve telemetry.
//
//   2. PUB socket (telemetry_endpoint):
//      Notifications arrive through pushTelemetry() from whatever thread the
//      engine published on, wait in a ThreadSafeQueue, and are formatted
//      with notificationToJson() on the worker thread.
//
// The command handler runs on the worker thread. SwapEngine serialises it
// against calls from other threads with its CallGate.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//
// Ownership:
//   Owned by main(). Owns the ZMQ context, both sockets,
//   the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string command_endpoint = "tcp://127.0.0.1:5556",
                     std::string telemetry_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op if already running or
  // if either endpoint is empty.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  // Enqueues a notification for the PUB socket. Dropped while not running.
  void pushTelemetry(Notification notification);

  bool isRunning() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then wait up to kPollTimeoutMs for one
  // command.
  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> command_socket_;
  std::unique_ptr<zmq::socket_t> telemetry_socket_;

  ThreadSafeQueue<Notification> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace escrow
