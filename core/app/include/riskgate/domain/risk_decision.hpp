#pragma once

#include "riskgate/domain/position_state.hpp"

#include <string>
#include <utility>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// DecisionReason
// -----------------------------------------------------------------------------
// Why RiskManager::canOpenPosition() allowed or blocked a trade. Listed in
// the order the checks run; the first failing check determines the reason.
// -----------------------------------------------------------------------------
enum class DecisionReason {
  Approved,
  DrawdownHalt,
  DailyLossLimit,
  ExposureLimit,
  PositionSizeLimit,
  PositionWeightLimit,
  CorrelationLimit,
  CorrelationUndetermined,
};

// Stable machine-readable code used on the wire and in logs.
inline const char* reasonCode(DecisionReason reason) {
  switch (reason) {
    case DecisionReason::Approved:                return "approved";
    case DecisionReason::DrawdownHalt:            return "max_drawdown";
    case DecisionReason::DailyLossLimit:          return "daily_loss_limit";
    case DecisionReason::ExposureLimit:           return "portfolio_exposure";
    case DecisionReason::PositionSizeLimit:       return "position_size";
    case DecisionReason::PositionWeightLimit:     return "position_weight";
    case DecisionReason::CorrelationLimit:        return "correlation";
    case DecisionReason::CorrelationUndetermined: return "correlation_undetermined";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RiskDecision — result of a pre-trade gate
// -----------------------------------------------------------------------------
//
// @brief  Allow/deny outcome with enough context to log and display it.
//
// @details
// A denial is the normal, expected outcome of a risk check, not an error.
// observed_value and limit_value say which limit was hit and by how much,
// in the limit's own units (fractions of equity, correlation coefficient).
// related_symbol names the held symbol that caused a correlation denial.
//
// Returned by value; the engine never stores decisions.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool allowed{true};
  DecisionReason reason{DecisionReason::Approved};
  std::string message{"approved"};
  double observed_value{0.0};
  double limit_value{0.0};
  std::string related_symbol;

  static RiskDecision approve() { return RiskDecision{}; }

  static RiskDecision deny(DecisionReason reason, std::string message,
                           double observed, double limit) {
    RiskDecision d;
    d.allowed = false;
    d.reason = reason;
    d.message = std::move(message);
    d.observed_value = observed;
    d.limit_value = limit;
    return d;
  }
};

// -----------------------------------------------------------------------------
// ExitReason
// -----------------------------------------------------------------------------
// Exit triggers in evaluation order. Hold means no trigger fired.
// -----------------------------------------------------------------------------
enum class ExitReason {
  Hold,
  TakeProfit,
  TrailingStop,
  StopLoss,
  TimeStop,
};

inline const char* exitReasonCode(ExitReason reason) {
  switch (reason) {
    case ExitReason::Hold:         return "hold";
    case ExitReason::TakeProfit:   return "take_profit";
    case ExitReason::TrailingStop: return "trailing_stop";
    case ExitReason::StopLoss:     return "stop_loss";
    case ExitReason::TimeStop:     return "time_stop";
  }
  return "unknown";
}

// Human-readable description of an exit reason.
inline const char* exitReasonMessage(ExitReason reason) {
  switch (reason) {
    case ExitReason::Hold:         return "hold";
    case ExitReason::TakeProfit:   return "target reached";
    case ExitReason::TrailingStop: return "trailing stop";
    case ExitReason::StopLoss:     return "stop-loss";
    case ExitReason::TimeStop:     return "time stop, no profit";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// ExitDecision — result of an in-trade evaluation
// -----------------------------------------------------------------------------
//
// @brief  Exit/hold outcome plus the updated position the caller must keep.
//
// @details
// position is a copy of the input PositionState with high_water_mark and
// current_price advanced to this tick. unrealized_return is signed in the
// position's favor (+0.02 == 2% profit whether long or short).
// -----------------------------------------------------------------------------
struct ExitDecision {
  bool exit{false};
  ExitReason reason{ExitReason::Hold};
  double unrealized_return{0.0};
  PositionState position;

  const char* message() const { return exitReasonMessage(reason); }
};

}  // namespace domain
}  // namespace riskgate
