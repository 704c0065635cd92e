#pragma once

#include "riskgate/time/time_utils.hpp"

#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a position. Favorable price movement is up for Long and down
// for Short; every price-relative computation in the engine mirrors on it.
// -----------------------------------------------------------------------------
enum class Side {
  Long,
  Short,
};

// +1 for Long, -1 for Short.
inline double directionSign(Side side) {
  return side == Side::Long ? 1.0 : -1.0;
}

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Long:  return "long";
    case Side::Short: return "short";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// PositionState — caller-owned record of one open position
// -----------------------------------------------------------------------------
//
// @brief  Tracks the entry conditions and trailing high-water mark for a
//         single open symbol.
//
// @details
// The caller owns the authoritative copy. StopLossManager returns an updated
// copy in ExitDecision::position; the caller must store that copy and pass
// it back on the next tick, otherwise the trailing-stop guarantee breaks.
//
// high_water_mark is the most favorable price seen since entry: the highest
// price for a Long, the lowest for a Short. A value <= 0 means "not yet
// recorded" and is seeded from entry_price.
//
// current_price is the last mark supplied by the market-data collaborator.
// PortfolioRisk uses it for exposure and weights; when it is <= 0 the entry
// price is used instead.
//
// quantity is an absolute share/contract count; direction lives in side.
// -----------------------------------------------------------------------------
struct PositionState {
  std::string symbol;             // Instrument identifier (e.g. "AAPL")
  Side side{Side::Long};          // Long or Short
  double entry_price{0.0};        // Average entry price
  double quantity{0.0};           // Absolute quantity held
  Timestamp entry_time{};         // When the position was opened
  double high_water_mark{0.0};    // Most favorable price since entry
  double current_price{0.0};      // Last known mark

  double markPrice() const {
    return current_price > 0.0 ? current_price : entry_price;
  }

  // Signed notional: positive for longs, negative for shorts.
  double signedNotional() const {
    return directionSign(side) * quantity * markPrice();
  }
};

}  // namespace domain
}  // namespace riskgate
