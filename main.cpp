// -----------------------------------------------------------------------------
// risk_server — process entry point.
//
//   risk_server [config.json] [--cmd <endpoint>] [--pub <endpoint>]
//               [--mode <sizing_mode>]
//
//   1) Load RiskLimits: defaults, then the optional JSON file, then
//      RISKGATE_* environment overrides. Invalid configuration exits with
//      status 1 before any socket is opened.
//   2) Build the RiskManager and the RiskService around it.
//   3) Start the IpcServer: REP commands on --cmd, telemetry on --pub.
//   4) Sleep on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread  → argument parsing, signal wait, shutdown
//   ipc thread   → IpcServer loop; RiskService runs here
// -----------------------------------------------------------------------------

#include "riskgate/codec/json_codec.hpp"
#include "riskgate/config/risk_limits_loader.hpp"
#include "riskgate/engine/risk_manager.hpp"
#include "riskgate/engine/risk_service.hpp"
#include "riskgate/network/ipc_server.hpp"
#include "riskgate/risk/risk_errors.hpp"
#include "riskgate/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the signal handler, polled by main().
volatile std::sig_atomic_t g_shutdown_requested = 0;

void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

struct ServerOptions {
  std::string config_path;
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string sizing_mode{"fixed_fraction"};
};

void print_usage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [config.json] [--cmd <endpoint>] [--pub <endpoint>]"
               " [--mode fixed_fraction|volatility_adjusted|kelly|"
               "conservative]\n";
}

// Returns false on a malformed command line.
bool parse_args(int argc, char** argv, ServerOptions& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--cmd" && has_value) {
      options.cmd_endpoint = argv[++i];
    } else if (arg == "--pub" && has_value) {
      options.pub_endpoint = argv[++i];
    } else if (arg == "--mode" && has_value) {
      options.sizing_mode = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  ServerOptions options;
  if (!parse_args(argc, argv, options)) {
    print_usage(argv[0]);
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration. Errors exit before any socket is bound.
  // -------------------------------------------------------------------------
  riskgate::domain::RiskLimits limits;
  auto mode = riskgate::domain::SizingMode::FixedFraction;
  try {
    limits = riskgate::config::loadRiskLimits(options.config_path);
    mode = riskgate::domain::sizingModeFromString(options.sizing_mode);
  } catch (const riskgate::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const riskgate::InvalidInputError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Decision core and its command surface.
  // -------------------------------------------------------------------------
  riskgate::LiveTimeProvider clock;
  const riskgate::RiskManager manager(limits, mode);

  // The service publishes through the server it is bound to; the pointer is
  // set before start() and cleared after stop().
  riskgate::IpcServer* server_ptr = nullptr;
  const riskgate::RiskService service(
      manager, clock, [&server_ptr](const std::string& event) {
        if (server_ptr != nullptr) {
          server_ptr->publish(event);
        }
      });

  riskgate::IpcServer server(
      [&service](const std::string& request) {
        return service.executeCommand(request);
      },
      options.cmd_endpoint, options.pub_endpoint);
  server_ptr = &server;

  // -------------------------------------------------------------------------
  // 3) Bring the sockets up.
  // -------------------------------------------------------------------------
  try {
    server.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind sockets: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] risk_server ready. sizing_mode="
            << riskgate::domain::sizingModeToString(mode)
            << ". Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for a shutdown signal.
  // -------------------------------------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping server...\n";
  server.stop();
  server_ptr = nullptr;

  return 0;
}
