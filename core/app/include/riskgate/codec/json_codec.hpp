#pragma once

#include "riskgate/domain/account_snapshot.hpp"
#include "riskgate/domain/circuit_breaker_state.hpp"
#include "riskgate/domain/portfolio_snapshot.hpp"
#include "riskgate/domain/position_state.hpp"
#include "riskgate/domain/risk_decision.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/domain/sizing.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for the wire and telemetry formats
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adl_serializer hooks (to_json / from_json found by
//         argument-dependent lookup) for the domain value types.
//
// @details
// Conventions:
//   - Timestamps are epoch milliseconds in `*_ms` integer fields.
//   - Enums travel as their lower-case codes ("long", "stop_loss", ...).
//   - Required fields are read with at(); a missing or mistyped field
//     surfaces as nlohmann::json::exception, which RiskService reports as
//     a bad_request.
//   - Optional fields fall back to the struct defaults.
//
// RiskLimits is encoded with the configuration key names so that the output
// of LIMITS can be fed back to the loader unchanged.
// -----------------------------------------------------------------------------

/// "long" / "short"; throws InvalidInputError for anything else.
Side sideFromString(const std::string& text);

/// "fixed_fraction" / "volatility_adjusted" / "kelly" / "conservative".
SizingMode sizingModeFromString(const std::string& text);

void to_json(nlohmann::json& j, const PositionState& p);
void from_json(const nlohmann::json& j, PositionState& p);

void to_json(nlohmann::json& j, const AccountSnapshot& a);
void from_json(const nlohmann::json& j, AccountSnapshot& a);

void from_json(const nlohmann::json& j, PortfolioSnapshot& p);

void to_json(nlohmann::json& j, const CircuitBreakerState& s);
void from_json(const nlohmann::json& j, CircuitBreakerState& s);

void from_json(const nlohmann::json& j, SizingParams& p);

void to_json(nlohmann::json& j, const RiskDecision& d);
void to_json(nlohmann::json& j, const ExitDecision& d);
void to_json(nlohmann::json& j, const RiskLimits& l);

}  // namespace domain
}  // namespace riskgate
