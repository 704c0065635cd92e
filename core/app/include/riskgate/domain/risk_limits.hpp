#pragma once

#include <chrono>
#include <cstddef>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — engine-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of risk parameters that govern sizing,
//         pre-trade gating and in-trade exits.
//
// @details
// Loaded once at process start by config::loadRiskLimits() (JSON file plus
// RISKGATE_* environment overrides) and copied by value into RiskManager.
// A reload means constructing a new RiskManager, never mutating this struct
// in place.
//
// All fractions are expressed relative to account equity (0.02 == 2%).
// All fields are non-negative; kelly_fraction lies in (0, 1] and
// var_confidence in (0, 1). validateRiskLimits() enforces this.
//
// For the exit triggers (stop_loss_pct, trailing_stop_pct, take_profit_pct,
// max_holding_duration) a value of zero disables the trigger. For the
// blocking limits zero is taken literally.
//
// Thread model:
//   Plain data with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct RiskLimits {
  // --- Sizing and pre-trade limits ------------------------------------------

  /// Largest single trade as a fraction of equity. Hard ceiling for every
  /// PositionSizer mode and the per-trade weight check in
  /// RiskManager::canOpenPosition().
  double max_position_size{0.02};

  /// Largest gross exposure (sum of |notional|) as a fraction of equity,
  /// including the proposed trade.
  double max_portfolio_exposure{0.5};

  /// Largest resulting holding in one symbol (existing + proposed) as a
  /// fraction of equity.
  double max_single_position_weight{0.10};

  /// Largest allowed Pearson correlation between the candidate symbol and
  /// any held symbol.
  double max_correlation{0.7};

  // --- Circuit breakers -----------------------------------------------------

  /// Daily loss (fraction of start-of-day equity) that blocks new opens for
  /// the rest of the trading day.
  double daily_loss_limit{0.05};

  /// Peak-to-current equity decline that halts trading until reset.
  double max_drawdown_limit{0.15};

  // --- Exit triggers --------------------------------------------------------

  double stop_loss_pct{0.02};
  double trailing_stop_pct{0.03};
  double take_profit_pct{0.05};
  std::chrono::milliseconds max_holding_duration{std::chrono::hours(24)};

  // --- Analytics ------------------------------------------------------------

  /// Confidence level for historical-simulation VaR.
  double var_confidence{0.95};

  /// Number of trailing return observations each statistic requires.
  std::size_t correlation_lookback{30};
  std::size_t beta_lookback{90};
  std::size_t var_lookback{30};

  // --- Sizing model parameters ----------------------------------------------

  /// Multiplier applied to the raw Kelly fraction (0.5 == half-Kelly).
  double kelly_fraction{0.5};

  /// Upper bound on the scaled Kelly fraction.
  double kelly_cap{0.20};

  /// Relative volatility (ATR / price) at which volatility-adjusted sizing
  /// equals fixed-fraction sizing. Higher volatility scales size down.
  double target_volatility{0.02};
};

}  // namespace domain
}  // namespace riskgate
