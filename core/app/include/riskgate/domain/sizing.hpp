#pragma once

#include <optional>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// SizingMode
// -----------------------------------------------------------------------------
// Closed set of position-sizing strategies, selected per call.
//
//   FixedFraction       equity * max_position_size / price
//   VolatilityAdjusted  fixed fraction scaled down by relative volatility
//   Kelly               fractional Kelly from win rate and payoff ratio
//   Conservative        smallest of every method whose inputs are supplied
// -----------------------------------------------------------------------------
enum class SizingMode {
  FixedFraction,
  VolatilityAdjusted,
  Kelly,
  Conservative,
};

inline const char* sizingModeToString(SizingMode mode) {
  switch (mode) {
    case SizingMode::FixedFraction:      return "fixed_fraction";
    case SizingMode::VolatilityAdjusted: return "volatility_adjusted";
    case SizingMode::Kelly:              return "kelly";
    case SizingMode::Conservative:       return "conservative";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// SizingParams — mode-specific inputs
// -----------------------------------------------------------------------------
// volatility is an absolute measure in price units (typically ATR).
// win_rate is in [0, 1]; avg_win and avg_loss are positive amounts.
// VolatilityAdjusted requires volatility; Kelly requires all three trade
// statistics. Conservative uses whichever groups are present.
// -----------------------------------------------------------------------------
struct SizingParams {
  std::optional<double> volatility;
  std::optional<double> win_rate;
  std::optional<double> avg_win;
  std::optional<double> avg_loss;

  bool hasTradeStats() const {
    return win_rate.has_value() && avg_win.has_value() && avg_loss.has_value();
  }
};

}  // namespace domain
}  // namespace riskgate
