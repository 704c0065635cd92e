#include "riskgate/codec/json_codec.hpp"
#include "riskgate/risk/risk_errors.hpp"
#include "riskgate/time/time_utils.hpp"

#include <chrono>
#include <cstdint>

namespace riskgate {
namespace domain {

namespace {

// Leaves `out` untouched when the key is absent or null.
template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    it->get_to(out);
  }
}

void readOptional(const nlohmann::json& j, const char* key,
                  std::optional<double>& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<double>();
  }
}

}  // namespace

Side sideFromString(const std::string& text) {
  if (text == "long") {
    return Side::Long;
  }
  if (text == "short") {
    return Side::Short;
  }
  throw InvalidInputError("Unknown side: '" + text + "'");
}

SizingMode sizingModeFromString(const std::string& text) {
  if (text == "fixed_fraction") {
    return SizingMode::FixedFraction;
  }
  if (text == "volatility_adjusted") {
    return SizingMode::VolatilityAdjusted;
  }
  if (text == "kelly") {
    return SizingMode::Kelly;
  }
  if (text == "conservative") {
    return SizingMode::Conservative;
  }
  throw InvalidInputError("Unknown sizing mode: '" + text + "'");
}

// -----------------------------------------------------------------------------
// PositionState
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const PositionState& p) {
  j = nlohmann::json{
      {"symbol", p.symbol},
      {"side", sideToString(p.side)},
      {"entry_price", p.entry_price},
      {"quantity", p.quantity},
      {"entry_time_ms", timestamp_to_ms(p.entry_time)},
      {"high_water_mark", p.high_water_mark},
      {"current_price", p.current_price},
  };
}

void from_json(const nlohmann::json& j, PositionState& p) {
  j.at("symbol").get_to(p.symbol);
  p.side = sideFromString(j.at("side").get<std::string>());
  j.at("entry_price").get_to(p.entry_price);
  readOptional(j, "quantity", p.quantity);
  readOptional(j, "high_water_mark", p.high_water_mark);
  readOptional(j, "current_price", p.current_price);

  std::int64_t entry_ms = 0;
  readOptional(j, "entry_time_ms", entry_ms);
  p.entry_time = ms_to_timestamp(entry_ms);
}

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AccountSnapshot& a) {
  j = nlohmann::json{
      {"equity", a.equity},
      {"cash", a.cash},
      {"timestamp_ms", timestamp_to_ms(a.timestamp)},
      {"start_of_day_equity", a.start_of_day_equity},
      {"peak_equity", a.peak_equity},
  };
}

void from_json(const nlohmann::json& j, AccountSnapshot& a) {
  j.at("equity").get_to(a.equity);
  readOptional(j, "cash", a.cash);
  readOptional(j, "start_of_day_equity", a.start_of_day_equity);
  readOptional(j, "peak_equity", a.peak_equity);

  std::int64_t ts_ms = 0;
  readOptional(j, "timestamp_ms", ts_ms);
  a.timestamp = ms_to_timestamp(ts_ms);
}

// -----------------------------------------------------------------------------
// PortfolioSnapshot (decode only; the engine never emits one)
// -----------------------------------------------------------------------------
void from_json(const nlohmann::json& j, PortfolioSnapshot& p) {
  readOptional(j, "positions", p.positions);
  readOptional(j, "symbol_returns", p.symbol_returns);
  readOptional(j, "benchmark_returns", p.benchmark_returns);
  readOptional(j, "portfolio_returns", p.portfolio_returns);
}

// -----------------------------------------------------------------------------
// CircuitBreakerState: an absent or null halt day means "not latched"
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const CircuitBreakerState& s) {
  j = nlohmann::json{{"drawdown_halted", s.drawdown_halted}};
  if (s.daily_loss_halt_day == CircuitBreakerState::kNoDay) {
    j["daily_loss_halt_day"] = nullptr;
  } else {
    j["daily_loss_halt_day"] = s.daily_loss_halt_day;
  }
}

void from_json(const nlohmann::json& j, CircuitBreakerState& s) {
  readOptional(j, "drawdown_halted", s.drawdown_halted);
  readOptional(j, "daily_loss_halt_day", s.daily_loss_halt_day);
}

void from_json(const nlohmann::json& j, SizingParams& p) {
  readOptional(j, "volatility", p.volatility);
  readOptional(j, "win_rate", p.win_rate);
  readOptional(j, "avg_win", p.avg_win);
  readOptional(j, "avg_loss", p.avg_loss);
}

// -----------------------------------------------------------------------------
// Decisions
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RiskDecision& d) {
  j = nlohmann::json{
      {"allowed", d.allowed},
      {"reason", reasonCode(d.reason)},
      {"message", d.message},
      {"observed_value", d.observed_value},
      {"limit_value", d.limit_value},
  };
  if (!d.related_symbol.empty()) {
    j["related_symbol"] = d.related_symbol;
  }
}

void to_json(nlohmann::json& j, const ExitDecision& d) {
  j = nlohmann::json{
      {"exit", d.exit},
      {"reason", exitReasonCode(d.reason)},
      {"message", d.message()},
      {"unrealized_return", d.unrealized_return},
      {"position", d.position},
  };
}

// -----------------------------------------------------------------------------
// RiskLimits: configuration key names
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RiskLimits& l) {
  const double holding_hours =
      std::chrono::duration<double, std::ratio<3600>>(l.max_holding_duration)
          .count();
  j = nlohmann::json{
      {"max_position_size", l.max_position_size},
      {"max_portfolio_exposure", l.max_portfolio_exposure},
      {"max_single_position_weight", l.max_single_position_weight},
      {"max_correlation", l.max_correlation},
      {"daily_loss_limit", l.daily_loss_limit},
      {"max_drawdown_limit", l.max_drawdown_limit},
      {"stop_loss_percentage", l.stop_loss_pct},
      {"trailing_stop_percentage", l.trailing_stop_pct},
      {"take_profit_percentage", l.take_profit_pct},
      {"max_holding_hours", holding_hours},
      {"var_confidence", l.var_confidence},
      {"kelly_fraction", l.kelly_fraction},
      {"kelly_cap", l.kelly_cap},
      {"target_volatility", l.target_volatility},
      {"correlation_lookback", l.correlation_lookback},
      {"beta_lookback", l.beta_lookback},
      {"var_lookback", l.var_lookback},
  };
}

}  // namespace domain
}  // namespace riskgate
