#include "escrow/network/ipc_server.hpp"
#include "escrow/network/json_format.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace escrow {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }
  if (command_endpoint_.empty() || telemetry_endpoint_.empty()) {
    std::cout << "[IpcServer] disabled: no endpoint configured.\n";
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  command_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  telemetry_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  command_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  command_socket_->set(zmq::sockopt::linger, 0);
  telemetry_socket_->set(zmq::sockopt::linger, 0);
  command_socket_->bind(command_endpoint_);
  telemetry_socket_->bind(telemetry_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << command_endpoint_
            << " PUB=" << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  command_socket_.reset();
  telemetry_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Notification notification) {
  if (!running_.load()) {
    return;
  }
  telemetry_queue_.push(std::move(notification));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever was queued before shutdown.
  processTelemetry();
}

// -----------------------------------------------------------------------------
// processTelemetry(): one JSON message per queued notification
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (const auto& notification : telemetry_queue_.drain()) {
    const std::string payload = notificationToJson(notification).dump();
    zmq::message_t msg(payload.data(), payload.size());
    telemetry_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): at most one request per loop iteration
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = command_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  command_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace escrow
