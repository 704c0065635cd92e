#include "riskgate/engine/risk_manager.hpp"
#include "riskgate/config/risk_limits_loader.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <algorithm>
#include <cmath>

namespace riskgate {

const domain::RiskLimits& RiskManager::validated(
    const domain::RiskLimits& limits) {
  config::validateRiskLimits(limits);
  return limits;
}

RiskManager::RiskManager(const domain::RiskLimits& limits,
                         domain::SizingMode default_mode)
    : limits_(validated(limits)),
      default_mode_(default_mode),
      sizer_(limits_),
      stop_loss_(limits_),
      portfolio_risk_(limits_) {}

// -----------------------------------------------------------------------------
// Sizing
// -----------------------------------------------------------------------------
std::int64_t RiskManager::calculatePositionSize(
    const std::string& symbol, double price, double account_equity,
    const domain::SizingParams& params) const {
  return sizer_.size(symbol, price, account_equity, default_mode_, params);
}

std::int64_t RiskManager::calculatePositionSize(
    const std::string& symbol, double price, double account_equity,
    domain::SizingMode mode, const domain::SizingParams& params) const {
  return sizer_.size(symbol, price, account_equity, mode, params);
}

// -----------------------------------------------------------------------------
// canOpenPosition(): fixed-order chain, first denial wins
// -----------------------------------------------------------------------------
domain::RiskDecision RiskManager::canOpenPosition(
    const std::string& symbol, domain::Side /*side*/, double proposed_quantity,
    double price, const domain::AccountSnapshot& account,
    const domain::PortfolioSnapshot& portfolio,
    const domain::CircuitBreakerState& breakers) const {
  if (symbol.empty()) {
    throw InvalidInputError("Symbol must not be empty");
  }
  if (!(price > 0.0) || !std::isfinite(price)) {
    throw InvalidInputError("Invalid price for " + symbol + ": " +
                            std::to_string(price));
  }
  if (proposed_quantity < 0.0 || !std::isfinite(proposed_quantity)) {
    throw InvalidInputError("Invalid quantity for " + symbol + ": " +
                            std::to_string(proposed_quantity));
  }
  if (!std::isfinite(account.equity)) {
    throw InvalidInputError("Invalid account equity: " +
                            std::to_string(account.equity));
  }

  const double proposed_notional = proposed_quantity * price;

  domain::RiskDecision decision = portfolio_risk_.checkDrawdown(account, breakers);
  if (!decision.allowed) {
    return decision;
  }

  decision = portfolio_risk_.checkDailyLoss(account, breakers);
  if (!decision.allowed) {
    return decision;
  }

  decision =
      portfolio_risk_.checkExposure(portfolio, account, proposed_notional);
  if (!decision.allowed) {
    return decision;
  }

  decision = portfolio_risk_.checkPositionWeight(symbol, proposed_notional,
                                                 account, portfolio);
  if (!decision.allowed) {
    return decision;
  }

  return portfolio_risk_.checkCorrelation(symbol, portfolio);
}

// -----------------------------------------------------------------------------
// Exits
// -----------------------------------------------------------------------------
domain::ExitDecision RiskManager::shouldExitPosition(
    double entry_price, double current_price, domain::Side side,
    Timestamp entry_time, Timestamp now, double high_water_mark) const {
  return stop_loss_.evaluate(entry_price, current_price, side, entry_time, now,
                             high_water_mark);
}

domain::ExitDecision RiskManager::shouldExitPosition(
    const domain::PositionState& position, double current_price,
    Timestamp now) const {
  return stop_loss_.evaluate(position, current_price, now);
}

domain::CircuitBreakerState RiskManager::updateCircuitBreakers(
    const domain::AccountSnapshot& account,
    const domain::CircuitBreakerState& breakers) const {
  return portfolio_risk_.updateCircuitBreakers(account, breakers);
}

// -----------------------------------------------------------------------------
// riskSummary()
// -----------------------------------------------------------------------------
RiskSummary RiskManager::riskSummary(
    const domain::AccountSnapshot& account,
    const domain::PortfolioSnapshot& portfolio,
    const domain::CircuitBreakerState& breakers) const {
  RiskSummary summary;
  summary.equity = account.equity;
  summary.daily_pnl = account.dailyPnl();
  summary.daily_pnl_pct = portfolio_risk_.dailyPnlFraction(account);
  summary.drawdown_pct = portfolio_risk_.drawdownFraction(account);
  if (account.peak_equity > 0.0) {
    summary.drawdown =
        std::max(account.peak_equity, account.equity) - account.equity;
  }
  summary.gross_exposure = portfolio_risk_.grossExposure(portfolio);
  summary.exposure_pct =
      portfolio_risk_.exposureRatio(portfolio, account.equity);
  summary.position_count = portfolio.positions.size();
  summary.var = portfolio_risk_.valueAtRisk(portfolio, account.equity);
  summary.beta = portfolio_risk_.beta(portfolio, account.equity);

  summary.breakers = portfolio_risk_.updateCircuitBreakers(account, breakers);
  summary.can_trade =
      portfolio_risk_.checkDrawdown(account, summary.breakers).allowed &&
      portfolio_risk_.checkDailyLoss(account, summary.breakers).allowed;
  return summary;
}

}  // namespace riskgate
