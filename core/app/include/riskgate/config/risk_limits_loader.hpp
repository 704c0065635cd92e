#pragma once

#include "riskgate/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace riskgate {
namespace config {

// -----------------------------------------------------------------------------
// RiskLimits configuration loader
// -----------------------------------------------------------------------------
//
// @brief  Builds an immutable RiskLimits from a JSON file plus RISKGATE_*
//         environment overrides, and validates it.
//
// @details
// Recognized keys (JSON file and environment alike):
//
//   max_position_size          max_portfolio_exposure
//   max_single_position_weight max_correlation
//   daily_loss_limit           max_drawdown_limit
//   stop_loss_percentage       trailing_stop_percentage
//   take_profit_percentage     max_holding_hours
//   var_confidence             kelly_fraction
//   kelly_cap                  target_volatility
//   correlation_lookback       beta_lookback
//   var_lookback
//
// Keys not present keep their RiskLimits default. Unknown keys are logged to
// stderr and ignored. A key with the wrong JSON type, or a resulting struct
// that fails validateRiskLimits(), raises ConfigError.
//
// Environment overrides are named RISKGATE_<KEY> (upper-case) and are
// applied after the file. Their values are parsed as JSON scalars, so
// RISKGATE_VAR_LOOKBACK=60 and RISKGATE_MAX_CORRELATION=0.6 both work.
//
// Thread model:
//   Called once at start-up from main(); no shared state.
// -----------------------------------------------------------------------------

/// Looks up an environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// -------------------------------------------------------------------------
// validateRiskLimits(limits)
// -------------------------------------------------------------------------
// @brief  Enforces the RiskLimits invariants.
//
// @throws ConfigError naming the first offending field when a value is
//         negative or non-finite, kelly_fraction is outside (0, 1],
//         var_confidence is outside (0, 1), or a lookback is too short
//         for its statistic.
// -------------------------------------------------------------------------
void validateRiskLimits(const domain::RiskLimits& limits);

// -------------------------------------------------------------------------
// parseRiskLimits(document, base)
// -------------------------------------------------------------------------
// @brief  Overlays the keys present in `document` onto `base`.
//
// @details
// Does not validate; callers validate the final struct once every layer
// has been applied.
//
// @throws ConfigError if document is not an object or a key is mistyped.
// -------------------------------------------------------------------------
domain::RiskLimits parseRiskLimits(const nlohmann::json& document,
                                   domain::RiskLimits base = {});

/// Overlays RISKGATE_<KEY> values from `lookup` onto `base`.
domain::RiskLimits applyEnvironmentOverrides(domain::RiskLimits base,
                                             const EnvLookup& lookup);

// -------------------------------------------------------------------------
// loadRiskLimits(path, lookup)
// -------------------------------------------------------------------------
// @brief  Defaults, then the JSON file at `path` (skipped when empty), then
//         environment overrides, then validation.
//
// @throws ConfigError if the file cannot be read or parsed, or if the
//         result is invalid.
// -------------------------------------------------------------------------
domain::RiskLimits loadRiskLimits(const std::string& path,
                                  const EnvLookup& lookup);

/// loadRiskLimits() against the process environment (std::getenv).
domain::RiskLimits loadRiskLimits(const std::string& path);

}  // namespace config
}  // namespace riskgate
