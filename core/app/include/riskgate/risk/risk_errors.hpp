#pragma once

#include <stdexcept>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// InvalidInputError
// -----------------------------------------------------------------------------
//
// @brief  Thrown when a caller violates an operation's input contract:
//         non-positive price, negative quantity or equity, out-of-range
//         trade statistics, non-finite values in a return series.
//
// @details
// The engine is deterministic, so retrying with the same input always fails
// the same way. The message names the offending parameter and value.
//
// Limit breaches are NOT errors; they come back as RiskDecision denials.
// Insufficient history is NOT an error; statistics return std::nullopt.
// -----------------------------------------------------------------------------
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(const std::string& what)
      : std::invalid_argument(what) {}
};

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Raised by the configuration loader for an unreadable file, malformed JSON,
// a wrongly-typed key or a value that violates the RiskLimits invariants.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace riskgate
