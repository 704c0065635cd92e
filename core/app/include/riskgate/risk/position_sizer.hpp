#pragma once

#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/sizing.hpp"

#include <cstdint>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// PositionSizer — trade parameters + account equity -> share quantity
// -----------------------------------------------------------------------------
//
// @brief  Computes how many shares/contracts a new trade may carry under one
//         of the closed set of SizingMode strategies.
//
// @details
// Every mode converts a fraction of equity into a whole quantity with
// floor(equity * fraction / price), then clamps the result to the hard
// ceiling floor(equity * limits.max_position_size / price). The ceiling is
// not advisory: no mode can return more, whatever its own model says.
//
//   FixedFraction      fraction = max_position_size
//
//   VolatilityAdjusted relative_vol = volatility / price
//                      fraction = max_position_size
//                                 * min(1, target_volatility / relative_vol)
//                      Zero volatility leaves the fixed-fraction result.
//
//   Kelly              f = win_rate - (1 - win_rate) / (avg_win / avg_loss)
//                      f <= 0 -> 0 shares (no statistical edge)
//                      fraction = min(f * kelly_fraction, kelly_cap)
//
//   Conservative       minimum over FixedFraction and every other mode whose
//                      parameters are present in SizingParams.
//
// Thread model:
//   Immutable after construction; size() is const and touches no shared
//   state, so any number of threads may call it concurrently.
//
// Ownership:
//   Holds a copy of the RiskLimits it was built with.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(const domain::RiskLimits& limits);

  // -------------------------------------------------------------------------
  // size(symbol, price, account_equity, mode, params)
  // -------------------------------------------------------------------------
  // @brief  Returns the recommended quantity (>= 0) for a new trade.
  //
  // @param  symbol          Instrument identifier; used in error messages.
  // @param  price           Current price. Must be positive and finite.
  // @param  account_equity  Total equity. Must be non-negative and finite.
  // @param  mode            Sizing strategy.
  // @param  params          Mode-specific inputs (see SizingParams).
  //
  // @throws InvalidInputError on a contract violation, including a mode
  //         whose required parameters are missing or out of range.
  // -------------------------------------------------------------------------
  std::int64_t size(const std::string& symbol, double price,
                    double account_equity, domain::SizingMode mode,
                    const domain::SizingParams& params = {}) const;

  // -------------------------------------------------------------------------
  // kellyFraction(win_rate, avg_win, avg_loss)
  // -------------------------------------------------------------------------
  // @brief  Scaled and capped Kelly fraction of equity; 0 when the raw
  //         Kelly fraction is not positive.
  //
  // @throws InvalidInputError if win_rate is outside [0, 1] or either
  //         average is not positive.
  // -------------------------------------------------------------------------
  double kellyFraction(double win_rate, double avg_win, double avg_loss) const;

  // Hard ceiling: floor(equity * max_position_size / price).
  std::int64_t maxQuantity(double price, double account_equity) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  std::int64_t fixedFractionSize(double price, double equity) const;
  std::int64_t volatilityAdjustedSize(double price, double equity,
                                      double volatility) const;
  std::int64_t kellySize(double price, double equity,
                         const domain::SizingParams& params) const;

  static std::int64_t toQuantity(double equity, double fraction, double price);

  const domain::RiskLimits limits_;
};

}  // namespace riskgate
