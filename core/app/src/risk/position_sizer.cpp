#include "riskgate/risk/position_sizer.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace riskgate {

namespace {

std::string describe(const std::string& symbol) {
  return symbol.empty() ? std::string("<unnamed>") : symbol;
}

}  // namespace

PositionSizer::PositionSizer(const domain::RiskLimits& limits)
    : limits_(limits) {}

// -----------------------------------------------------------------------------
// size(): validate, dispatch on mode, then apply the hard ceiling
// -----------------------------------------------------------------------------
std::int64_t PositionSizer::size(const std::string& symbol, double price,
                                 double account_equity,
                                 domain::SizingMode mode,
                                 const domain::SizingParams& params) const {
  if (!(price > 0.0) || !std::isfinite(price)) {
    throw InvalidInputError("Invalid price for " + describe(symbol) + ": " +
                            std::to_string(price));
  }
  if (account_equity < 0.0 || !std::isfinite(account_equity)) {
    throw InvalidInputError("Invalid account equity: " +
                            std::to_string(account_equity));
  }

  std::int64_t quantity = 0;

  switch (mode) {
    case domain::SizingMode::FixedFraction:
      quantity = fixedFractionSize(price, account_equity);
      break;

    case domain::SizingMode::VolatilityAdjusted:
      if (!params.volatility.has_value()) {
        throw InvalidInputError(
            "Volatility-adjusted sizing requires a volatility measure for " +
            describe(symbol));
      }
      quantity = volatilityAdjustedSize(price, account_equity,
                                        *params.volatility);
      break;

    case domain::SizingMode::Kelly:
      if (!params.hasTradeStats()) {
        throw InvalidInputError(
            "Kelly sizing requires win_rate, avg_win and avg_loss for " +
            describe(symbol));
      }
      quantity = kellySize(price, account_equity, params);
      break;

    case domain::SizingMode::Conservative:
      // The most conservative of every method the caller supplied inputs for.
      quantity = fixedFractionSize(price, account_equity);
      if (params.volatility.has_value()) {
        quantity = std::min(quantity, volatilityAdjustedSize(
                                          price, account_equity,
                                          *params.volatility));
      }
      if (params.hasTradeStats()) {
        quantity = std::min(quantity,
                            kellySize(price, account_equity, params));
      }
      break;
  }

  return std::clamp<std::int64_t>(quantity, 0,
                                  maxQuantity(price, account_equity));
}

// -----------------------------------------------------------------------------
// kellyFraction()
// -----------------------------------------------------------------------------
double PositionSizer::kellyFraction(double win_rate, double avg_win,
                                    double avg_loss) const {
  if (!(win_rate >= 0.0 && win_rate <= 1.0)) {
    throw InvalidInputError("Win rate out of range [0, 1]: " +
                            std::to_string(win_rate));
  }
  if (!(avg_win > 0.0) || !std::isfinite(avg_win)) {
    throw InvalidInputError("Average win must be positive: " +
                            std::to_string(avg_win));
  }
  if (!(avg_loss > 0.0) || !std::isfinite(avg_loss)) {
    throw InvalidInputError("Average loss must be positive: " +
                            std::to_string(avg_loss));
  }

  const double payoff_ratio = avg_win / avg_loss;
  const double raw = win_rate - (1.0 - win_rate) / payoff_ratio;
  if (raw <= 0.0) {
    return 0.0;
  }
  return std::min(raw * limits_.kelly_fraction, limits_.kelly_cap);
}

std::int64_t PositionSizer::maxQuantity(double price,
                                        double account_equity) const {
  return toQuantity(account_equity, limits_.max_position_size, price);
}

std::int64_t PositionSizer::fixedFractionSize(double price,
                                              double equity) const {
  return toQuantity(equity, limits_.max_position_size, price);
}

// -----------------------------------------------------------------------------
// volatilityAdjustedSize(): scale the fixed fraction by target / realized vol
// -----------------------------------------------------------------------------
std::int64_t PositionSizer::volatilityAdjustedSize(double price, double equity,
                                                   double volatility) const {
  if (volatility < 0.0 || !std::isfinite(volatility)) {
    throw InvalidInputError("Invalid volatility measure: " +
                            std::to_string(volatility));
  }

  const double relative_vol = volatility / price;
  double scale = 1.0;
  if (relative_vol > 0.0) {
    scale = std::min(1.0, limits_.target_volatility / relative_vol);
  }
  return toQuantity(equity, limits_.max_position_size * scale, price);
}

std::int64_t PositionSizer::kellySize(
    double price, double equity, const domain::SizingParams& params) const {
  const double fraction =
      kellyFraction(*params.win_rate, *params.avg_win, *params.avg_loss);
  return toQuantity(equity, fraction, price);
}

std::int64_t PositionSizer::toQuantity(double equity, double fraction,
                                       double price) {
  constexpr auto kMaxQuantity = std::numeric_limits<std::int64_t>::max();
  const double shares = std::floor(equity * fraction / price);
  if (!(shares > 0.0)) {
    return 0;
  }
  // 2^63 and above (including +inf) does not fit in int64_t.
  if (shares >= static_cast<double>(kMaxQuantity)) {
    return kMaxQuantity;
  }
  return static_cast<std::int64_t>(shares);
}

}  // namespace riskgate
