#include "riskgate/risk/portfolio_risk.hpp"
#include "riskgate/analytics/return_statistics.hpp"
#include "riskgate/risk/risk_errors.hpp"
#include "riskgate/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace riskgate {

PortfolioRisk::PortfolioRisk(const domain::RiskLimits& limits)
    : limits_(limits) {}

// -----------------------------------------------------------------------------
// validatePositions(): reject malformed holdings before any arithmetic
// -----------------------------------------------------------------------------
void PortfolioRisk::validatePositions(
    const domain::PortfolioSnapshot& portfolio) {
  for (const auto& pos : portfolio.positions) {
    if (pos.quantity < 0.0 || !std::isfinite(pos.quantity)) {
      throw InvalidInputError("Invalid quantity for " + pos.symbol + ": " +
                              std::to_string(pos.quantity));
    }
    if (!(pos.markPrice() > 0.0) || !std::isfinite(pos.markPrice())) {
      throw InvalidInputError("Invalid price for " + pos.symbol + ": " +
                              std::to_string(pos.markPrice()));
    }
  }
}

// -----------------------------------------------------------------------------
// Exposure
// -----------------------------------------------------------------------------
double PortfolioRisk::grossExposure(
    const domain::PortfolioSnapshot& portfolio) const {
  validatePositions(portfolio);
  double gross = 0.0;
  for (const auto& pos : portfolio.positions) {
    gross += std::abs(pos.quantity * pos.markPrice());
  }
  return gross;
}

double PortfolioRisk::symbolExposure(const domain::PortfolioSnapshot& portfolio,
                                     const std::string& symbol) const {
  validatePositions(portfolio);
  double exposure = 0.0;
  for (const auto& pos : portfolio.positions) {
    if (pos.symbol == symbol) {
      exposure += std::abs(pos.quantity * pos.markPrice());
    }
  }
  return exposure;
}

double PortfolioRisk::exposureRatio(const domain::PortfolioSnapshot& portfolio,
                                    double equity) const {
  const double gross = grossExposure(portfolio);
  if (!(equity > 0.0)) {
    return std::numeric_limits<double>::infinity();
  }
  return gross / equity;
}

domain::RiskDecision PortfolioRisk::checkExposure(
    const domain::PortfolioSnapshot& portfolio,
    const domain::AccountSnapshot& account, double proposed_notional) const {
  if (!(account.equity > 0.0)) {
    return domain::RiskDecision::deny(domain::DecisionReason::ExposureLimit,
                                      "account equity is not positive",
                                      account.equity, 0.0);
  }

  const double projected =
      (grossExposure(portfolio) + std::abs(proposed_notional)) / account.equity;
  if (projected > limits_.max_portfolio_exposure) {
    return domain::RiskDecision::deny(domain::DecisionReason::ExposureLimit,
                                      "portfolio exposure limit exceeded",
                                      projected,
                                      limits_.max_portfolio_exposure);
  }
  return domain::RiskDecision::approve();
}

// -----------------------------------------------------------------------------
// checkPositionWeight(): per-trade size, then resulting holding weight
// -----------------------------------------------------------------------------
domain::RiskDecision PortfolioRisk::checkPositionWeight(
    const std::string& symbol, double proposed_notional,
    const domain::AccountSnapshot& account,
    const domain::PortfolioSnapshot& portfolio) const {
  if (!(account.equity > 0.0)) {
    return domain::RiskDecision::deny(
        domain::DecisionReason::PositionSizeLimit,
        "account equity is not positive", account.equity, 0.0);
  }

  const double trade_weight = std::abs(proposed_notional) / account.equity;
  if (trade_weight > limits_.max_position_size) {
    return domain::RiskDecision::deny(
        domain::DecisionReason::PositionSizeLimit,
        "position size limit exceeded", trade_weight,
        limits_.max_position_size);
  }

  const double holding_weight =
      (symbolExposure(portfolio, symbol) + std::abs(proposed_notional)) /
      account.equity;
  if (holding_weight > limits_.max_single_position_weight) {
    return domain::RiskDecision::deny(
        domain::DecisionReason::PositionWeightLimit,
        "single position weight limit exceeded", holding_weight,
        limits_.max_single_position_weight);
  }
  return domain::RiskDecision::approve();
}

// -----------------------------------------------------------------------------
// Correlation
// -----------------------------------------------------------------------------
std::optional<double> PortfolioRisk::correlation(
    const domain::PortfolioSnapshot& portfolio, const std::string& a,
    const std::string& b) const {
  const domain::ReturnSeries* ra = portfolio.returnsFor(a);
  const domain::ReturnSeries* rb = portfolio.returnsFor(b);
  if (ra == nullptr || rb == nullptr) {
    return std::nullopt;
  }
  return analytics::pearsonCorrelation(*ra, *rb, limits_.correlation_lookback);
}

domain::RiskDecision PortfolioRisk::checkCorrelation(
    const std::string& symbol,
    const domain::PortfolioSnapshot& portfolio) const {
  for (const auto& pos : portfolio.positions) {
    // Adding to an existing holding is governed by the weight limit.
    if (pos.symbol == symbol || pos.quantity == 0.0) {
      continue;
    }

    std::optional<double> corr = correlation(portfolio, symbol, pos.symbol);
    if (!corr.has_value()) {
      auto d = domain::RiskDecision::deny(
          domain::DecisionReason::CorrelationUndetermined,
          "correlation with " + pos.symbol + " undetermined", 0.0,
          limits_.max_correlation);
      d.related_symbol = pos.symbol;
      return d;
    }
    if (std::abs(*corr) > limits_.max_correlation) {
      auto d = domain::RiskDecision::deny(
          domain::DecisionReason::CorrelationLimit,
          "correlation limit exceeded with " + pos.symbol, *corr,
          limits_.max_correlation);
      d.related_symbol = pos.symbol;
      return d;
    }
  }
  return domain::RiskDecision::approve();
}

// -----------------------------------------------------------------------------
// Circuit breakers
// -----------------------------------------------------------------------------
double PortfolioRisk::dailyPnlFraction(
    const domain::AccountSnapshot& account) const {
  if (!(account.start_of_day_equity > 0.0)) {
    return 0.0;
  }
  return account.dailyPnl() / account.start_of_day_equity;
}

double PortfolioRisk::drawdownFraction(
    const domain::AccountSnapshot& account) const {
  const double peak = std::max(account.peak_equity, account.equity);
  if (!(account.peak_equity > 0.0) || !(peak > 0.0)) {
    return 0.0;
  }
  return (peak - account.equity) / peak;
}

domain::RiskDecision PortfolioRisk::checkDailyLoss(
    const domain::AccountSnapshot& account,
    const domain::CircuitBreakerState& breakers) const {
  const double pnl = dailyPnlFraction(account);
  const bool latched = breakers.dailyHaltActive(trading_day(account.timestamp));
  const bool breached = pnl < 0.0 && pnl <= -limits_.daily_loss_limit;

  if (latched || breached) {
    return domain::RiskDecision::deny(domain::DecisionReason::DailyLossLimit,
                                      "daily loss limit breached", pnl,
                                      -limits_.daily_loss_limit);
  }
  return domain::RiskDecision::approve();
}

domain::RiskDecision PortfolioRisk::checkDrawdown(
    const domain::AccountSnapshot& account,
    const domain::CircuitBreakerState& breakers) const {
  const double dd = drawdownFraction(account);
  const bool breached = dd > 0.0 && dd >= limits_.max_drawdown_limit;

  if (breakers.drawdown_halted || breached) {
    return domain::RiskDecision::deny(domain::DecisionReason::DrawdownHalt,
                                      "max drawdown limit breached", dd,
                                      limits_.max_drawdown_limit);
  }
  return domain::RiskDecision::approve();
}

domain::CircuitBreakerState PortfolioRisk::updateCircuitBreakers(
    const domain::AccountSnapshot& account,
    const domain::CircuitBreakerState& breakers) const {
  domain::CircuitBreakerState next = breakers;

  if (!checkDrawdown(account, breakers).allowed) {
    next.drawdown_halted = true;
  }
  if (!checkDailyLoss(account, breakers).allowed) {
    next.daily_loss_halt_day = trading_day(account.timestamp);
  }
  return next;
}

// -----------------------------------------------------------------------------
// portfolioReturns(): explicit series or equity-weighted holdings
// -----------------------------------------------------------------------------
domain::ReturnSeries PortfolioRisk::portfolioReturns(
    const domain::PortfolioSnapshot& portfolio, double equity) const {
  if (!portfolio.portfolio_returns.empty()) {
    analytics::validateSeries(portfolio.portfolio_returns, "portfolio");
    return portfolio.portfolio_returns;
  }
  validatePositions(portfolio);
  if (portfolio.positions.empty() || !(equity > 0.0)) {
    return {};
  }

  // Common tail length across every held symbol.
  std::size_t length = std::numeric_limits<std::size_t>::max();
  for (const auto& pos : portfolio.positions) {
    const domain::ReturnSeries* series = portfolio.returnsFor(pos.symbol);
    if (series == nullptr) {
      return {};
    }
    analytics::validateSeries(*series, pos.symbol.c_str());
    length = std::min(length, series->size());
  }

  domain::ReturnSeries combined(length, 0.0);
  for (const auto& pos : portfolio.positions) {
    const domain::ReturnSeries& series = *portfolio.returnsFor(pos.symbol);
    const double weight = pos.signedNotional() / equity;
    const std::size_t offset = series.size() - length;
    for (std::size_t t = 0; t < length; ++t) {
      combined[t] += weight * series[offset + t];
    }
  }
  return combined;
}

std::optional<VarEstimate> PortfolioRisk::valueAtRisk(
    const domain::PortfolioSnapshot& portfolio, double equity) const {
  VarEstimate estimate;
  estimate.confidence = limits_.var_confidence;

  if (portfolio.positions.empty() && portfolio.portfolio_returns.empty()) {
    return estimate;
  }

  const domain::ReturnSeries series = portfolioReturns(portfolio, equity);
  std::optional<double> tail = analytics::historicalPercentile(
      series, 1.0 - limits_.var_confidence, limits_.var_lookback);
  if (!tail.has_value()) {
    return std::nullopt;
  }

  estimate.percentile_return = *tail;
  estimate.loss_amount = std::max(0.0, -*tail) * std::max(0.0, equity);
  estimate.observations = limits_.var_lookback;
  return estimate;
}

std::optional<double> PortfolioRisk::beta(
    const domain::PortfolioSnapshot& portfolio, double equity) const {
  if (portfolio.positions.empty() && portfolio.portfolio_returns.empty()) {
    return 0.0;
  }
  const domain::ReturnSeries series = portfolioReturns(portfolio, equity);
  return analytics::olsBeta(series, portfolio.benchmark_returns,
                            limits_.beta_lookback);
}

}  // namespace riskgate
