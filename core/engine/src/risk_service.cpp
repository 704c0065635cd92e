#include "riskgate/engine/risk_service.hpp"
#include "riskgate/analytics/return_statistics.hpp"
#include "riskgate/codec/json_codec.hpp"
#include "riskgate/risk/risk_errors.hpp"
#include "riskgate/time/time_utils.hpp"

#include <cmath>
#include <exception>
#include <optional>
#include <iostream>
#include <utility>
#include <vector>

namespace riskgate {

namespace {

// Non-finite values (an infinite exposure ratio) are emitted as null.
nlohmann::json finiteOrNull(double value) {
  if (std::isfinite(value)) {
    return value;
  }
  return nullptr;
}

nlohmann::json encodeVar(const std::optional<VarEstimate>& var) {
  if (!var.has_value()) {
    return nullptr;
  }
  return nlohmann::json{
      {"confidence", var->confidence},
      {"percentile_return", var->percentile_return},
      {"loss_amount", var->loss_amount},
      {"observations", var->observations},
  };
}

// Request bytes echoed in error text may be invalid UTF-8; replace them
// instead of letting dump() throw.
std::string serialize(const nlohmann::json& response) {
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

nlohmann::json encodeOptional(const std::optional<double>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

domain::PortfolioSnapshot readPortfolio(const nlohmann::json& request) {
  domain::PortfolioSnapshot portfolio;
  auto it = request.find("portfolio");
  if (it != request.end() && !it->is_null()) {
    it->get_to(portfolio);
  }
  return portfolio;
}

domain::CircuitBreakerState readBreakers(const nlohmann::json& request) {
  domain::CircuitBreakerState breakers;
  auto it = request.find("breakers");
  if (it != request.end() && !it->is_null()) {
    it->get_to(breakers);
  }
  return breakers;
}

}  // namespace

RiskService::RiskService(const RiskManager& manager, const ITimeProvider& clock,
                         TelemetrySink telemetry)
    : manager_(manager), clock_(clock), telemetry_(std::move(telemetry)) {}

// -----------------------------------------------------------------------------
// executeCommand(): parse, handle, serialize
// -----------------------------------------------------------------------------
std::string RiskService::executeCommand(const std::string& request) const {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(request);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[RiskService] malformed request: " << e.what() << "\n";
    return serialize(errorResponse(
        "bad_request", std::string("malformed JSON: ") + e.what()));
  }
  return serialize(handle(parsed));
}

// -----------------------------------------------------------------------------
// handle(): validate the envelope and map exceptions to error responses
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handle(const nlohmann::json& request) const {
  if (!request.is_object()) {
    return errorResponse("bad_request", "request must be a JSON object");
  }
  auto cmd = request.find("command");
  if (cmd == request.end() || !cmd->is_string()) {
    return errorResponse("bad_request", "missing string field 'command'");
  }
  const std::string command = cmd->get<std::string>();

  try {
    return dispatch(command, request);
  } catch (const InvalidInputError& e) {
    std::cerr << "[RiskService] " << command << " invalid input: " << e.what()
              << "\n";
    return errorResponse("invalid_input", e.what());
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[RiskService] " << command << " bad request: " << e.what()
              << "\n";
    return errorResponse("bad_request", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[RiskService] " << command << " failed: " << e.what()
              << "\n";
    return errorResponse("internal", e.what());
  }
}

nlohmann::json RiskService::dispatch(const std::string& command,
                                     const nlohmann::json& request) const {
  if (command == "PING") {
    return nlohmann::json{{"status", "ok"}, {"response", "PONG"}};
  }
  if (command == "LIMITS") {
    return handleLimits();
  }
  if (command == "SIZE") {
    return handleSize(request);
  }
  if (command == "CAN_OPEN") {
    return handleCanOpen(request);
  }
  if (command == "SHOULD_EXIT") {
    return handleShouldExit(request);
  }
  if (command == "BREAKERS") {
    return handleBreakers(request);
  }
  if (command == "VAR") {
    return handleVar(request);
  }
  if (command == "BETA") {
    return handleBeta(request);
  }
  if (command == "CORRELATION") {
    return handleCorrelation(request);
  }
  if (command == "RETURNS") {
    return handleReturns(request);
  }
  if (command == "SUMMARY") {
    return handleSummary(request);
  }

  std::cerr << "[RiskService] unknown command: " << command << "\n";
  return errorResponse("unknown_command", "Unknown command: " + command);
}

// -----------------------------------------------------------------------------
// LIMITS
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleLimits() const {
  nlohmann::json response;
  response["status"] = "ok";
  response["limits"] = manager_.limits();
  response["default_mode"] = domain::sizingModeToString(manager_.defaultMode());
  return response;
}

// -----------------------------------------------------------------------------
// SIZE
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleSize(const nlohmann::json& request) const {
  const std::string symbol = request.at("symbol").get<std::string>();
  const double price = request.at("price").get<double>();
  const double equity = request.at("equity").get<double>();

  domain::SizingMode mode = manager_.defaultMode();
  auto mode_it = request.find("mode");
  if (mode_it != request.end() && !mode_it->is_null()) {
    mode = domain::sizingModeFromString(mode_it->get<std::string>());
  }

  domain::SizingParams params;
  auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    params_it->get_to(params);
  }

  const std::int64_t quantity =
      manager_.calculatePositionSize(symbol, price, equity, mode, params);

  nlohmann::json response;
  response["status"] = "ok";
  response["symbol"] = symbol;
  response["mode"] = domain::sizingModeToString(mode);
  response["quantity"] = quantity;
  response["max_quantity"] = manager_.positionSizer().maxQuantity(price, equity);
  return response;
}

// -----------------------------------------------------------------------------
// CAN_OPEN: denials are also published as telemetry
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleCanOpen(const nlohmann::json& request) const {
  const std::string symbol = request.at("symbol").get<std::string>();
  const domain::Side side =
      domain::sideFromString(request.at("side").get<std::string>());
  const double quantity = request.at("quantity").get<double>();
  const double price = request.at("price").get<double>();
  const domain::AccountSnapshot account = readAccount(request);
  const domain::PortfolioSnapshot portfolio = readPortfolio(request);
  const domain::CircuitBreakerState breakers = readBreakers(request);

  const domain::RiskDecision decision = manager_.canOpenPosition(
      symbol, side, quantity, price, account, portfolio, breakers);

  if (!decision.allowed) {
    std::cout << "[RiskService] CAN_OPEN " << symbol << " denied: "
              << decision.message << "\n";

    nlohmann::json event = decision;
    event["type"] = "risk_denial";
    event["symbol"] = symbol;
    event["side"] = domain::sideToString(side);
    event["quantity"] = quantity;
    event["price"] = price;
    event["timestamp_ms"] = timestamp_to_ms(account.timestamp);
    publish(event);
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["decision"] = decision;
  return response;
}

// -----------------------------------------------------------------------------
// SHOULD_EXIT: exits are also published as telemetry
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleShouldExit(
    const nlohmann::json& request) const {
  const domain::PositionState position =
      request.at("position").get<domain::PositionState>();
  const double current_price = request.at("current_price").get<double>();

  std::int64_t now_ms = clock_.now_ms();
  auto now_it = request.find("now_ms");
  if (now_it != request.end() && !now_it->is_null()) {
    now_ms = now_it->get<std::int64_t>();
  }

  const domain::ExitDecision decision = manager_.shouldExitPosition(
      position, current_price, ms_to_timestamp(now_ms));

  if (decision.exit) {
    std::cout << "[RiskService] SHOULD_EXIT " << position.symbol << ": "
              << decision.message() << "\n";

    nlohmann::json event = decision;
    event["type"] = "exit_signal";
    event["symbol"] = position.symbol;
    event["timestamp_ms"] = now_ms;
    publish(event);
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["decision"] = decision;
  return response;
}

// -----------------------------------------------------------------------------
// BREAKERS: newly tripped latches are published once
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleBreakers(
    const nlohmann::json& request) const {
  const domain::AccountSnapshot account = readAccount(request);
  const domain::CircuitBreakerState before = readBreakers(request);
  const domain::CircuitBreakerState after =
      manager_.updateCircuitBreakers(account, before);

  const bool drawdown_tripped = after.drawdown_halted && !before.drawdown_halted;
  const bool daily_tripped =
      after.daily_loss_halt_day != before.daily_loss_halt_day;

  if (drawdown_tripped || daily_tripped) {
    std::cout << "[RiskService] circuit breaker tripped:"
              << (drawdown_tripped ? " max_drawdown" : "")
              << (daily_tripped ? " daily_loss_limit" : "") << "\n";

    nlohmann::json event;
    event["type"] = "circuit_breaker";
    event["breakers"] = after;
    event["drawdown_tripped"] = drawdown_tripped;
    event["daily_loss_tripped"] = daily_tripped;
    event["timestamp_ms"] = timestamp_to_ms(account.timestamp);
    publish(event);
  }

  const PortfolioRisk& risk = manager_.portfolioRisk();
  nlohmann::json response;
  response["status"] = "ok";
  response["breakers"] = after;
  response["can_trade"] = risk.checkDrawdown(account, after).allowed &&
                          risk.checkDailyLoss(account, after).allowed;
  return response;
}

// -----------------------------------------------------------------------------
// Analytics: VAR, BETA, CORRELATION, RETURNS
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleVar(const nlohmann::json& request) const {
  const double equity = request.at("equity").get<double>();
  const domain::PortfolioSnapshot portfolio = readPortfolio(request);
  const std::optional<VarEstimate> var =
      manager_.portfolioRisk().valueAtRisk(portfolio, equity);

  nlohmann::json response;
  response["status"] = "ok";
  response["determined"] = var.has_value();
  response["var"] = encodeVar(var);
  return response;
}

nlohmann::json RiskService::handleBeta(const nlohmann::json& request) const {
  const double equity = request.at("equity").get<double>();
  const domain::PortfolioSnapshot portfolio = readPortfolio(request);
  const std::optional<double> beta =
      manager_.portfolioRisk().beta(portfolio, equity);

  nlohmann::json response;
  response["status"] = "ok";
  response["determined"] = beta.has_value();
  response["beta"] = encodeOptional(beta);
  return response;
}

nlohmann::json RiskService::handleCorrelation(
    const nlohmann::json& request) const {
  const std::string a = request.at("a").get<std::string>();
  const std::string b = request.at("b").get<std::string>();
  const domain::PortfolioSnapshot portfolio = readPortfolio(request);
  const std::optional<double> corr =
      manager_.portfolioRisk().correlation(portfolio, a, b);

  nlohmann::json response;
  response["status"] = "ok";
  response["determined"] = corr.has_value();
  response["correlation"] = encodeOptional(corr);
  return response;
}

nlohmann::json RiskService::handleReturns(const nlohmann::json& request) const {
  const std::vector<double> prices =
      request.at("prices").get<std::vector<double>>();

  nlohmann::json response;
  response["status"] = "ok";
  response["returns"] = analytics::simpleReturns(prices);
  return response;
}

// -----------------------------------------------------------------------------
// SUMMARY
// -----------------------------------------------------------------------------
nlohmann::json RiskService::handleSummary(const nlohmann::json& request) const {
  const domain::AccountSnapshot account = readAccount(request);
  const RiskSummary summary = manager_.riskSummary(
      account, readPortfolio(request), readBreakers(request));

  nlohmann::json body;
  body["equity"] = summary.equity;
  body["daily_pnl"] = summary.daily_pnl;
  body["daily_pnl_pct"] = summary.daily_pnl_pct;
  body["drawdown"] = summary.drawdown;
  body["drawdown_pct"] = summary.drawdown_pct;
  body["gross_exposure"] = summary.gross_exposure;
  body["exposure_pct"] = finiteOrNull(summary.exposure_pct);
  body["position_count"] = summary.position_count;
  body["var_determined"] = summary.var.has_value();
  body["var"] = encodeVar(summary.var);
  body["beta_determined"] = summary.beta.has_value();
  body["beta"] = encodeOptional(summary.beta);
  body["breakers"] = summary.breakers;
  body["can_trade"] = summary.can_trade;
  body["limits"] = manager_.limits();

  nlohmann::json response;
  response["status"] = "ok";
  response["summary"] = std::move(body);
  return response;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
domain::AccountSnapshot RiskService::readAccount(
    const nlohmann::json& request) const {
  const nlohmann::json& node = request.at("account");
  domain::AccountSnapshot account = node.get<domain::AccountSnapshot>();
  if (!node.contains("timestamp_ms")) {
    account.timestamp = ms_to_timestamp(clock_.now_ms());
  }
  return account;
}

void RiskService::publish(const nlohmann::json& event) const {
  if (telemetry_) {
    telemetry_(serialize(event));
  }
}

nlohmann::json RiskService::errorResponse(const std::string& code,
                                          const std::string& message) {
  return nlohmann::json{
      {"status", "error"}, {"error", code}, {"message", message}};
}

}  // namespace riskgate
