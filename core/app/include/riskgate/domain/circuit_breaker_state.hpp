#pragma once

#include <cstdint>
#include <limits>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// CircuitBreakerState — caller-held latches for the two trading breakers
// -----------------------------------------------------------------------------
//
// @brief  Records which breakers have tripped so the halt survives a
//         recovery in equity.
//
// @details
// The engine is stateless, so the latches travel with the caller like the
// trailing high-water mark does. RiskManager::updateCircuitBreakers()
// returns a new state with the latches set, and
// RiskManager::canOpenPosition() honors them.
//
//   drawdown_halted     Set when peak-to-current decline reaches
//                       max_drawdown_limit. Never cleared by the engine;
//                       only the caller clears it (manual reset).
//
//   daily_loss_halt_day UTC trading day (see trading_day()) on which the
//                       daily-loss breaker tripped, or kNoDay. Expires on
//                       its own when the account snapshot moves to a later
//                       day.
// -----------------------------------------------------------------------------
struct CircuitBreakerState {
  static constexpr std::int64_t kNoDay =
      std::numeric_limits<std::int64_t>::min();

  bool drawdown_halted{false};
  std::int64_t daily_loss_halt_day{kNoDay};

  bool dailyHaltActive(std::int64_t day) const {
    return daily_loss_halt_day != kNoDay && daily_loss_halt_day == day;
  }
};

}  // namespace domain
}  // namespace riskgate
