#pragma once

#include "riskgate/time/time_utils.hpp"

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// AccountSnapshot — point-in-time view of the brokerage account
// -----------------------------------------------------------------------------
//
// @brief  Immutable value describing account equity at the moment a risk
//         decision is requested.
//
// @details
// Supplied fresh by the caller on every call; the engine never caches it.
//
// equity is marked to market, so the day's realized + unrealized P&L is
// equity - start_of_day_equity. peak_equity is the caller's running
// high-water mark of equity, used by the drawdown breaker. The engine uses
// max(peak_equity, equity), so a stale peak never produces a negative
// drawdown.
//
// A start_of_day_equity or peak_equity of zero means "unknown": the
// corresponding breaker cannot trip on that snapshot.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  double equity{0.0};               // Total account value, marked to market
  double cash{0.0};                 // Settled cash balance
  Timestamp timestamp{};            // When the snapshot was taken
  double start_of_day_equity{0.0};  // Equity at the open of the trading day
  double peak_equity{0.0};          // Highest equity observed by the caller

  double dailyPnl() const {
    return start_of_day_equity > 0.0 ? equity - start_of_day_equity : 0.0;
  }
};

}  // namespace domain
}  // namespace riskgate
