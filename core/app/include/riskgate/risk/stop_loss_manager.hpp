#pragma once

#include "riskgate/domain/position_state.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/time/time_utils.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// StopLossManager — in-trade exit evaluation
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an open position must be closed on this price
//         update, and why.
//
// @details
// Four independent triggers are evaluated in a fixed order; the first that
// fires determines the reason. Any exit closes the whole position, so the
// order only matters for the reported reason.
//
//   1. Take-profit    unrealized return >= take_profit_pct
//   2. Trailing stop  retrace from the high-water mark >= trailing_stop_pct
//   3. Stop-loss      unrealized return <= -stop_loss_pct
//   4. Time stop      held >= max_holding_duration AND return <= 0
//
// Unrealized return is measured in the position's favor:
//   Long:  (price - entry) / entry
//   Short: (entry - price) / entry
//
// High-water mark:
//   Long:  hwm = max(previous hwm, entry, price)
//   Short: hwm = min(previous hwm, entry, price)
// The mark starts at the entry price, so the trailing stop is armed from
// entry and bounds the loss even when the fixed stop-loss is disabled. The
// updated mark is returned in ExitDecision::position and the caller must
// pass it back on the next call. The component itself keeps nothing.
//
// A zero percentage or duration in RiskLimits disables that trigger.
//
// Thread model:
//   Immutable after construction; evaluate() is const and re-entrant.
// -----------------------------------------------------------------------------
class StopLossManager {
 public:
  explicit StopLossManager(const domain::RiskLimits& limits);

  // -------------------------------------------------------------------------
  // evaluate(entry_price, current_price, side, entry_time, now,
  //          high_water_mark)
  // -------------------------------------------------------------------------
  // @brief  Runs the trigger chain for one price observation.
  //
  // @param  high_water_mark  Mark carried over from the previous call; a
  //                          value <= 0 seeds it from entry_price.
  //
  // @return ExitDecision whose position carries entry_price, side,
  //         entry_time, the advanced high_water_mark and current_price.
  //
  // @throws InvalidInputError if either price is non-positive or
  //         non-finite.
  // -------------------------------------------------------------------------
  domain::ExitDecision evaluate(double entry_price, double current_price,
                                domain::Side side, Timestamp entry_time,
                                Timestamp now, double high_water_mark) const;

  // -------------------------------------------------------------------------
  // evaluate(position, current_price, now)
  // -------------------------------------------------------------------------
  // @brief  Convenience overload taking the caller's PositionState. The
  //         returned position is a copy of the input with high_water_mark
  //         and current_price updated; every other field is preserved.
  // -------------------------------------------------------------------------
  domain::ExitDecision evaluate(const domain::PositionState& position,
                                double current_price, Timestamp now) const;

  // Advances a high-water mark by one observation (pure helper).
  static double advanceHighWaterMark(domain::Side side, double entry_price,
                                     double previous_mark,
                                     double current_price);

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
};

}  // namespace riskgate
