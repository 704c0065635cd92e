#include "riskgate/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace riskgate {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn the worker
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
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    pub_socket_.reset();
  }
  cmd_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// publish(): non-blocking send on the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::publish(const std::string& message) {
  std::lock_guard<std::mutex> lock(pub_mutex_);
  if (!pub_socket_) {
    return;
  }
  zmq::message_t msg(message.data(), message.size());
  if (!pub_socket_->send(msg, zmq::send_flags::dontwait).has_value()) {
    std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
  }
}

void IpcServer::run() {
  while (running_.load()) {
    processCommand();
  }
}

// -----------------------------------------------------------------------------
// processCommand(): one REQ/REP round trip
// -----------------------------------------------------------------------------
void IpcServer::processCommand() {
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

  std::string cmd(static_cast<const char*>(request.data()), request.size());

  // REP requires exactly one reply per request, even when the handler fails.
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler failed: " << e.what() << "\n";
    nlohmann::json error{{"status", "error"},
                         {"error", "internal"},
                         {"message", e.what()}};
    response = error.dump(-1, ' ', false,
                          nlohmann::json::error_handler_t::replace);
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace riskgate
