#pragma once

#include "riskgate/domain/account_snapshot.hpp"
#include "riskgate/domain/circuit_breaker_state.hpp"
#include "riskgate/domain/portfolio_snapshot.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/risk_limits.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// VarEstimate — one-day historical-simulation Value-at-Risk
// -----------------------------------------------------------------------------
// percentile_return is the portfolio return at the (1 - confidence) tail;
// loss_amount is the corresponding loss in account currency
// (max(0, -percentile_return) * equity). observations is the window used.
// -----------------------------------------------------------------------------
struct VarEstimate {
  double confidence{0.0};
  double percentile_return{0.0};
  double loss_amount{0.0};
  std::size_t observations{0};
};

// -----------------------------------------------------------------------------
// PortfolioRisk — aggregate checks over the caller's holdings
// -----------------------------------------------------------------------------
//
// @brief  Exposure, weight, correlation and circuit-breaker checks plus the
//         VaR and beta analytics, each a pure function of its snapshots.
//
// @details
// The check*() methods return a RiskDecision: approve() when the limit
// holds, deny(reason, ...) with observed and limit values when it does not.
// RiskManager chains them in its fixed order.
//
// Portfolio returns:
//   When PortfolioSnapshot::portfolio_returns is supplied it is used as-is.
//   Otherwise the series is derived from the holdings:
//     r_p[t] = sum_i (signed_notional_i / equity) * r_i[t]
//   over the common tail of the held symbols' return series. The result is
//   a return on equity, which is why VaR scales it by equity.
//
// InsufficientData:
//   Statistics return std::nullopt when a series is shorter than its
//   lookback window. checkCorrelation() treats an undetermined correlation
//   as blocking.
//
// Thread model:
//   Immutable after construction; every method is const and re-entrant.
// -----------------------------------------------------------------------------
class PortfolioRisk {
 public:
  explicit PortfolioRisk(const domain::RiskLimits& limits);

  // --- Exposure -------------------------------------------------------------

  /// Sum of |quantity * mark| over all positions.
  double grossExposure(const domain::PortfolioSnapshot& portfolio) const;

  /// Sum of |quantity * mark| over positions in `symbol`.
  double symbolExposure(const domain::PortfolioSnapshot& portfolio,
                        const std::string& symbol) const;

  /// Gross exposure / equity; +infinity when equity is not positive.
  double exposureRatio(const domain::PortfolioSnapshot& portfolio,
                       double equity) const;

  // -------------------------------------------------------------------------
  // checkExposure(portfolio, account, proposed_notional)
  // -------------------------------------------------------------------------
  // @brief  Denies when (gross exposure + proposed_notional) / equity
  //         exceeds max_portfolio_exposure. Existing positions are never
  //         force-reduced by this check.
  // -------------------------------------------------------------------------
  domain::RiskDecision checkExposure(const domain::PortfolioSnapshot& portfolio,
                                     const domain::AccountSnapshot& account,
                                     double proposed_notional) const;

  // -------------------------------------------------------------------------
  // checkPositionWeight(symbol, proposed_notional, account, portfolio)
  // -------------------------------------------------------------------------
  // @brief  Two weight limits on the candidate symbol:
  //           1. proposed_notional / equity <= max_position_size
  //              (PositionSizeLimit)
  //           2. (held notional in symbol + proposed_notional) / equity
  //              <= max_single_position_weight (PositionWeightLimit)
  // -------------------------------------------------------------------------
  domain::RiskDecision checkPositionWeight(
      const std::string& symbol, double proposed_notional,
      const domain::AccountSnapshot& account,
      const domain::PortfolioSnapshot& portfolio) const;

  // --- Correlation ----------------------------------------------------------

  /// Pearson correlation of two symbols' returns over correlation_lookback.
  std::optional<double> correlation(const domain::PortfolioSnapshot& portfolio,
                                    const std::string& a,
                                    const std::string& b) const;

  // -------------------------------------------------------------------------
  // checkCorrelation(symbol, portfolio)
  // -------------------------------------------------------------------------
  // @brief  Denies when the magnitude of the candidate's correlation with
  //         any held symbol (other than itself) exceeds max_correlation, or
  //         when it cannot be determined. related_symbol names the offending
  //         holding; observed_value keeps the sign.
  // -------------------------------------------------------------------------
  domain::RiskDecision checkCorrelation(
      const std::string& symbol,
      const domain::PortfolioSnapshot& portfolio) const;

  // --- Circuit breakers -----------------------------------------------------

  /// (equity - start_of_day_equity) / start_of_day_equity; 0 when unknown.
  double dailyPnlFraction(const domain::AccountSnapshot& account) const;

  /// (peak - equity) / peak with peak = max(peak_equity, equity); 0 when
  /// no peak is known.
  double drawdownFraction(const domain::AccountSnapshot& account) const;

  domain::RiskDecision checkDailyLoss(
      const domain::AccountSnapshot& account,
      const domain::CircuitBreakerState& breakers) const;

  domain::RiskDecision checkDrawdown(
      const domain::AccountSnapshot& account,
      const domain::CircuitBreakerState& breakers) const;

  // -------------------------------------------------------------------------
  // updateCircuitBreakers(account, breakers)
  // -------------------------------------------------------------------------
  // @brief  Returns a copy of breakers with any newly tripped latch set.
  //
  // @details
  // Latches are only ever set here, never cleared: the drawdown halt waits
  // for the caller's manual reset, and the daily halt expires because it is
  // keyed to the trading day. Repeated calls with the same inputs return
  // the same state.
  // -------------------------------------------------------------------------
  domain::CircuitBreakerState updateCircuitBreakers(
      const domain::AccountSnapshot& account,
      const domain::CircuitBreakerState& breakers) const;

  // --- Analytics ------------------------------------------------------------

  /// Explicit portfolio_returns, or the equity-weighted series derived from
  /// holdings (empty if any holding lacks a return series).
  domain::ReturnSeries portfolioReturns(
      const domain::PortfolioSnapshot& portfolio, double equity) const;

  // -------------------------------------------------------------------------
  // valueAtRisk(portfolio, equity)
  // -------------------------------------------------------------------------
  // @brief  Historical-simulation VaR at limits.var_confidence over the last
  //         var_lookback portfolio returns.
  //
  // @return A zero estimate for a flat portfolio with no explicit series;
  //         std::nullopt when the series is shorter than var_lookback.
  // -------------------------------------------------------------------------
  std::optional<VarEstimate> valueAtRisk(
      const domain::PortfolioSnapshot& portfolio, double equity) const;

  // -------------------------------------------------------------------------
  // beta(portfolio, equity)
  // -------------------------------------------------------------------------
  // @brief  OLS slope of portfolio returns on benchmark returns over
  //         beta_lookback periods.
  //
  // @return 0 for a flat portfolio with no explicit series; std::nullopt
  //         when either series is too short or the benchmark is constant.
  // -------------------------------------------------------------------------
  std::optional<double> beta(const domain::PortfolioSnapshot& portfolio,
                             double equity) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  static void validatePositions(const domain::PortfolioSnapshot& portfolio);

  const domain::RiskLimits limits_;
};

}  // namespace riskgate
