#include "riskgate/risk/stop_loss_manager.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace riskgate {

StopLossManager::StopLossManager(const domain::RiskLimits& limits)
    : limits_(limits) {}

// -----------------------------------------------------------------------------
// advanceHighWaterMark(): monotonic in the favorable direction
// -----------------------------------------------------------------------------
double StopLossManager::advanceHighWaterMark(domain::Side side,
                                             double entry_price,
                                             double previous_mark,
                                             double current_price) {
  const double seed = previous_mark > 0.0 ? previous_mark : entry_price;
  if (side == domain::Side::Long) {
    return std::max({seed, entry_price, current_price});
  }
  return std::min({seed, entry_price, current_price});
}

// -----------------------------------------------------------------------------
// evaluate(): ordered trigger chain
// -----------------------------------------------------------------------------
domain::ExitDecision StopLossManager::evaluate(double entry_price,
                                               double current_price,
                                               domain::Side side,
                                               Timestamp entry_time,
                                               Timestamp now,
                                               double high_water_mark) const {
  if (!(entry_price > 0.0) || !std::isfinite(entry_price)) {
    throw InvalidInputError("Invalid entry price: " +
                            std::to_string(entry_price));
  }
  if (!(current_price > 0.0) || !std::isfinite(current_price)) {
    throw InvalidInputError("Invalid current price: " +
                            std::to_string(current_price));
  }

  const double sign = domain::directionSign(side);
  const double hwm = advanceHighWaterMark(side, entry_price, high_water_mark,
                                          current_price);

  domain::ExitDecision decision;
  decision.unrealized_return = sign * (current_price - entry_price) / entry_price;
  decision.position.side = side;
  decision.position.entry_price = entry_price;
  decision.position.entry_time = entry_time;
  decision.position.high_water_mark = hwm;
  decision.position.current_price = current_price;

  const double ret = decision.unrealized_return;

  // --- 1. Take-profit -------------------------------------------------------
  if (limits_.take_profit_pct > 0.0 && ret >= limits_.take_profit_pct) {
    decision.exit = true;
    decision.reason = domain::ExitReason::TakeProfit;
    return decision;
  }

  // --- 2. Trailing stop (mark seeded from entry, so armed from the start) ---
  if (limits_.trailing_stop_pct > 0.0) {
    const double retrace = sign * (hwm - current_price) / hwm;
    if (retrace >= limits_.trailing_stop_pct) {
      decision.exit = true;
      decision.reason = domain::ExitReason::TrailingStop;
      return decision;
    }
  }

  // --- 3. Fixed stop-loss ---------------------------------------------------
  if (limits_.stop_loss_pct > 0.0 && ret <= -limits_.stop_loss_pct) {
    decision.exit = true;
    decision.reason = domain::ExitReason::StopLoss;
    return decision;
  }

  // --- 4. Time stop: only stagnant or losing positions ----------------------
  if (limits_.max_holding_duration.count() > 0 &&
      now - entry_time >= limits_.max_holding_duration && ret <= 0.0) {
    decision.exit = true;
    decision.reason = domain::ExitReason::TimeStop;
    return decision;
  }

  return decision;
}

domain::ExitDecision StopLossManager::evaluate(
    const domain::PositionState& position, double current_price,
    Timestamp now) const {
  domain::ExitDecision decision =
      evaluate(position.entry_price, current_price, position.side,
               position.entry_time, now, position.high_water_mark);

  domain::PositionState updated = position;
  updated.high_water_mark = decision.position.high_water_mark;
  updated.current_price = current_price;
  decision.position = std::move(updated);
  return decision;
}

}  // namespace riskgate
