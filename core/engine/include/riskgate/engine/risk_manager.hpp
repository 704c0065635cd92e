#pragma once

#include "riskgate/domain/account_snapshot.hpp"
#include "riskgate/domain/circuit_breaker_state.hpp"
#include "riskgate/domain/portfolio_snapshot.hpp"
#include "riskgate/domain/position_state.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/sizing.hpp"
#include "riskgate/risk/portfolio_risk.hpp"
#include "riskgate/risk/position_sizer.hpp"
#include "riskgate/risk/stop_loss_manager.hpp"
#include "riskgate/time/time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// RiskSummary — read-only dashboard of the account's risk position
// -----------------------------------------------------------------------------
// Percentages are fractions (0.05 == 5%). exposure_pct is +infinity when
// equity is not positive. var and beta are std::nullopt when the history is
// too short to determine them. breakers is the state after applying this
// snapshot; can_trade is false while either breaker is active.
// -----------------------------------------------------------------------------
struct RiskSummary {
  double equity{0.0};
  double daily_pnl{0.0};
  double daily_pnl_pct{0.0};
  double drawdown{0.0};
  double drawdown_pct{0.0};
  double gross_exposure{0.0};
  double exposure_pct{0.0};
  std::size_t position_count{0};
  std::optional<VarEstimate> var;
  std::optional<double> beta;
  domain::CircuitBreakerState breakers;
  bool can_trade{true};
};

// -----------------------------------------------------------------------------
// RiskManager — single entry point of the risk engine
// -----------------------------------------------------------------------------
//
// @brief  Composes PositionSizer, StopLossManager and PortfolioRisk behind
//         the three questions the trading loop asks: how much, may I open,
//         must I exit.
//
// @details
// Built once from a validated RiskLimits value and never mutated. Every
// method is a pure function of its arguments and the limits, so one
// instance can be shared by any number of threads. A configuration reload
// means constructing a new RiskManager.
//
// canOpenPosition() runs the pre-trade checks in a fixed order and returns
// the first denial:
//
//   1. Drawdown breaker    (latched or breached now)
//   2. Daily-loss breaker  (latched for the trading day or breached now)
//   3. Portfolio exposure  (gross + proposed notional vs equity)
//   4. Position weight     (per-trade size, then resulting holding)
//   5. Correlation         (candidate vs every other held symbol)
//
// All caller-held state (trailing marks, start-of-day and peak equity,
// breaker latches) travels in the arguments and comes back in the results.
//
// Ownership:
//   Owns its components by value; each holds its own copy of the limits.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // @throws ConfigError if limits violate the RiskLimits invariants.
  explicit RiskManager(
      const domain::RiskLimits& limits,
      domain::SizingMode default_mode = domain::SizingMode::FixedFraction);

  // --- Sizing ---------------------------------------------------------------

  /// Quantity for a new trade using the configured default mode.
  std::int64_t calculatePositionSize(
      const std::string& symbol, double price, double account_equity,
      const domain::SizingParams& params = {}) const;

  std::int64_t calculatePositionSize(const std::string& symbol, double price,
                                     double account_equity,
                                     domain::SizingMode mode,
                                     const domain::SizingParams& params) const;

  // -------------------------------------------------------------------------
  // canOpenPosition(symbol, side, proposed_quantity, price, account,
  //                 portfolio, breakers)
  // -------------------------------------------------------------------------
  // @brief  Pre-trade gate. Returns approve() or the first failing check.
  //
  // @details
  // The proposed notional is proposed_quantity * price. Exposure and
  // weights are gross, so side does not change the outcome; it is part of
  // the request so that callers and telemetry see the full order intent.
  //
  // There is no per-call limits argument: the limits are the ones this
  // manager was constructed with. Gate against different limits by building
  // another RiskManager.
  //
  // @throws InvalidInputError if price is not positive, the quantity is
  //         negative, or a value is non-finite.
  // -------------------------------------------------------------------------
  domain::RiskDecision canOpenPosition(
      const std::string& symbol, domain::Side side, double proposed_quantity,
      double price, const domain::AccountSnapshot& account,
      const domain::PortfolioSnapshot& portfolio,
      const domain::CircuitBreakerState& breakers = {}) const;

  // --- Exits ----------------------------------------------------------------

  domain::ExitDecision shouldExitPosition(double entry_price,
                                          double current_price,
                                          domain::Side side,
                                          Timestamp entry_time, Timestamp now,
                                          double high_water_mark) const;

  domain::ExitDecision shouldExitPosition(const domain::PositionState& position,
                                          double current_price,
                                          Timestamp now) const;

  // --- Breakers and reporting -----------------------------------------------

  /// New breaker state with any latch tripped by this snapshot set.
  domain::CircuitBreakerState updateCircuitBreakers(
      const domain::AccountSnapshot& account,
      const domain::CircuitBreakerState& breakers) const;

  RiskSummary riskSummary(const domain::AccountSnapshot& account,
                          const domain::PortfolioSnapshot& portfolio,
                          const domain::CircuitBreakerState& breakers) const;

  const domain::RiskLimits& limits() const { return limits_; }
  domain::SizingMode defaultMode() const { return default_mode_; }

  const PositionSizer& positionSizer() const { return sizer_; }
  const StopLossManager& stopLossManager() const { return stop_loss_; }
  const PortfolioRisk& portfolioRisk() const { return portfolio_risk_; }

 private:
  static const domain::RiskLimits& validated(const domain::RiskLimits& limits);

  const domain::RiskLimits limits_;
  const domain::SizingMode default_mode_;
  const PositionSizer sizer_;
  const StopLossManager stop_loss_;
  const PortfolioRisk portfolio_risk_;
};

}  // namespace riskgate
