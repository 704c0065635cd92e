#pragma once

#include "riskgate/engine/risk_manager.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// RiskService — JSON command surface over RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Decodes one JSON request, runs it against the RiskManager and
//         encodes the JSON response. Bound to IpcServer's REP socket by
//         risk_server, and called directly by tests.
//
// @details
// Request:   {"command": "<NAME>", ...command fields...}
// Response:  {"status": "ok", ...} or
//            {"status": "error", "error": "<code>", "message": "..."}
//
// Commands:
//   PING         → "response": "PONG"
//   LIMITS       → "limits" (configuration key names), "default_mode"
//   SIZE         symbol, price, equity, [mode], [params]
//                → "quantity", "max_quantity", "mode"
//   CAN_OPEN     symbol, side, quantity, price, account, [portfolio],
//                [breakers] → "decision"
//   SHOULD_EXIT  position, current_price, [now_ms] → "decision"
//   BREAKERS     account, [breakers] → "breakers", "can_trade"
//   VAR          equity, portfolio → "determined", "var"
//   BETA         equity, portfolio → "determined", "beta"
//   CORRELATION  a, b, portfolio → "determined", "correlation"
//   RETURNS      prices → "returns"
//   SUMMARY      account, [portfolio], [breakers] → "summary"
//
// Error codes:
//   bad_request      malformed JSON, missing or mistyped field
//   invalid_input    InvalidInputError from the engine
//   unknown_command  command not in the list above
//   internal         any other std::exception (logged)
//
// Undetermined statistics are encoded as null with "determined": false.
// Timestamps are epoch milliseconds; an account without timestamp_ms and
// SHOULD_EXIT without now_ms are stamped from the ITimeProvider.
//
// Telemetry:
//   Denied CAN_OPEN requests, SHOULD_EXIT exits and newly tripped breakers
//   are also passed to the TelemetrySink as JSON ("risk_denial",
//   "exit_signal", "circuit_breaker"). The sink runs on the calling thread.
//
// Thread model:
//   Immutable after construction; executeCommand() is const. Safe to call
//   concurrently provided the sink is.
//
// Ownership:
//   Borrows the RiskManager and ITimeProvider; both must outlive it.
// -----------------------------------------------------------------------------
class RiskService {
 public:
  using TelemetrySink = std::function<void(const std::string&)>;

  RiskService(const RiskManager& manager, const ITimeProvider& clock,
              TelemetrySink telemetry = {});

  /// Full request/response cycle on serialized JSON. Never throws for a
  /// bad request; every failure becomes an error response.
  std::string executeCommand(const std::string& request) const;

  /// Same as executeCommand() on an already-parsed request.
  nlohmann::json handle(const nlohmann::json& request) const;

 private:
  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& request) const;

  nlohmann::json handleLimits() const;
  nlohmann::json handleSize(const nlohmann::json& request) const;
  nlohmann::json handleCanOpen(const nlohmann::json& request) const;
  nlohmann::json handleShouldExit(const nlohmann::json& request) const;
  nlohmann::json handleBreakers(const nlohmann::json& request) const;
  nlohmann::json handleVar(const nlohmann::json& request) const;
  nlohmann::json handleBeta(const nlohmann::json& request) const;
  nlohmann::json handleCorrelation(const nlohmann::json& request) const;
  nlohmann::json handleReturns(const nlohmann::json& request) const;
  nlohmann::json handleSummary(const nlohmann::json& request) const;

  domain::AccountSnapshot readAccount(const nlohmann::json& request) const;
  void publish(const nlohmann::json& event) const;

  static nlohmann::json errorResponse(const std::string& code,
                                      const std::string& message);

  const RiskManager& manager_;
  const ITimeProvider& clock_;
  TelemetrySink telemetry_;
};

}  // namespace riskgate
