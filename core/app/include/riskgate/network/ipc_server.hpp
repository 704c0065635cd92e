#pragma once

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace riskgate {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ front end of risk_server
// -----------------------------------------------------------------------------
//
// @brief  Serves JSON risk requests on a REP socket and broadcasts risk
//         telemetry on a PUB socket, both from one worker thread.
//
// @details
// Two sockets:
//
//   1. REP (default tcp://127.0.0.1:5556)
//      Each request string is handed to the CommandHandler (bound to
//      RiskService::executeCommand()) and its return value is sent back.
//      ZMQ_RCVTIMEO keeps recv() from blocking past kPollTimeoutMs so the
//      loop notices stop().
//
//   2. PUB (default tcp://127.0.0.1:5557)
//      publish() sends one telemetry message. RiskService emits telemetry
//      while handling a request, so in practice publish() runs on the
//      worker thread; a mutex still guards the socket for other callers.
//
// Thread model:
//   start()/stop() from the owning thread (main). The handler runs on the
//   worker thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets and the worker thread. Holds a copy
//   of the handler.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stops the worker if it is still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Creates the context, binds both sockets, spawns the worker.
  //         A no-op when already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // publish(message)
  // -------------------------------------------------------------------------
  // @brief  Sends one message on the PUB socket without blocking. Dropped
  //         silently by ZeroMQ when no subscriber is connected; ignored
  //         when the server is not running.
  // -------------------------------------------------------------------------
  void publish(const std::string& message);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: processCommand() until stop().
  void run();

  // Waits up to kPollTimeoutMs for one request, dispatches it, replies.
  // A handler exception is logged and answered with an "internal" error so
  // the REP socket is never left waiting for a reply.
  void processCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;
  std::mutex pub_mutex_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace riskgate
