#include "riskgate/config/risk_limits_loader.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace riskgate {
namespace config {

namespace {

struct DoubleField {
  const char* key;
  double domain::RiskLimits::*member;
};

struct CountField {
  const char* key;
  std::size_t domain::RiskLimits::*member;
};

const DoubleField kDoubleFields[] = {
    {"max_position_size", &domain::RiskLimits::max_position_size},
    {"max_portfolio_exposure", &domain::RiskLimits::max_portfolio_exposure},
    {"max_single_position_weight",
     &domain::RiskLimits::max_single_position_weight},
    {"max_correlation", &domain::RiskLimits::max_correlation},
    {"daily_loss_limit", &domain::RiskLimits::daily_loss_limit},
    {"max_drawdown_limit", &domain::RiskLimits::max_drawdown_limit},
    {"stop_loss_percentage", &domain::RiskLimits::stop_loss_pct},
    {"trailing_stop_percentage", &domain::RiskLimits::trailing_stop_pct},
    {"take_profit_percentage", &domain::RiskLimits::take_profit_pct},
    {"var_confidence", &domain::RiskLimits::var_confidence},
    {"kelly_fraction", &domain::RiskLimits::kelly_fraction},
    {"kelly_cap", &domain::RiskLimits::kelly_cap},
    {"target_volatility", &domain::RiskLimits::target_volatility},
};

const CountField kCountFields[] = {
    {"correlation_lookback", &domain::RiskLimits::correlation_lookback},
    {"beta_lookback", &domain::RiskLimits::beta_lookback},
    {"var_lookback", &domain::RiskLimits::var_lookback},
};

constexpr const char* kHoldingHoursKey = "max_holding_hours";
constexpr const char* kEnvPrefix = "RISKGATE_";
constexpr double kMsPerHour = 3600.0 * 1000.0;
// One hundred years; keeps the millisecond conversion inside int64_t.
constexpr double kMaxHoldingHours = 100.0 * 365.0 * 24.0;

const DoubleField* findDoubleField(const std::string& key) {
  for (const auto& field : kDoubleFields) {
    if (key == field.key) {
      return &field;
    }
  }
  return nullptr;
}

const CountField* findCountField(const std::string& key) {
  for (const auto& field : kCountFields) {
    if (key == field.key) {
      return &field;
    }
  }
  return nullptr;
}

double readNumber(const std::string& key, const nlohmann::json& value) {
  if (!value.is_number()) {
    throw ConfigError("config key '" + key + "' must be a number, got " +
                      value.dump());
  }
  return value.get<double>();
}

std::size_t readCount(const std::string& key, const nlohmann::json& value) {
  if (!value.is_number_integer() ||
      (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
    throw ConfigError("config key '" + key +
                      "' must be a non-negative integer, got " + value.dump());
  }
  return value.get<std::size_t>();
}

std::string envName(const char* key) {
  std::string name = kEnvPrefix;
  for (const char* p = key; *p != '\0'; ++p) {
    name.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
  }
  return name;
}

void requireNonNegative(const char* key, double value) {
  if (!std::isfinite(value) || value < 0.0) {
    throw ConfigError(std::string("risk limit '") + key +
                      "' must be a finite non-negative number, got " +
                      std::to_string(value));
  }
}

void requireMinimum(const char* key, std::size_t value, std::size_t minimum) {
  if (value < minimum) {
    throw ConfigError(std::string("risk limit '") + key + "' must be at least " +
                      std::to_string(minimum) + ", got " +
                      std::to_string(value));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// validateRiskLimits()
// -----------------------------------------------------------------------------
void validateRiskLimits(const domain::RiskLimits& limits) {
  for (const auto& field : kDoubleFields) {
    requireNonNegative(field.key, limits.*(field.member));
  }

  if (!(limits.kelly_fraction > 0.0 && limits.kelly_fraction <= 1.0)) {
    throw ConfigError("risk limit 'kelly_fraction' must lie in (0, 1], got " +
                      std::to_string(limits.kelly_fraction));
  }
  if (!(limits.var_confidence > 0.0 && limits.var_confidence < 1.0)) {
    throw ConfigError("risk limit 'var_confidence' must lie in (0, 1), got " +
                      std::to_string(limits.var_confidence));
  }
  if (limits.max_holding_duration.count() < 0) {
    throw ConfigError("risk limit 'max_holding_hours' must be non-negative");
  }

  // Correlation and beta need two points for a variance; VaR needs one.
  requireMinimum("correlation_lookback", limits.correlation_lookback, 2);
  requireMinimum("beta_lookback", limits.beta_lookback, 2);
  requireMinimum("var_lookback", limits.var_lookback, 1);
}

// -----------------------------------------------------------------------------
// parseRiskLimits(): overlay the recognized keys of one JSON object
// -----------------------------------------------------------------------------
domain::RiskLimits parseRiskLimits(const nlohmann::json& document,
                                   domain::RiskLimits base) {
  if (!document.is_object()) {
    throw ConfigError("risk limits configuration must be a JSON object");
  }

  for (auto it = document.begin(); it != document.end(); ++it) {
    const std::string& key = it.key();
    const nlohmann::json& value = it.value();

    if (const DoubleField* field = findDoubleField(key)) {
      base.*(field->member) = readNumber(key, value);
    } else if (const CountField* field = findCountField(key)) {
      base.*(field->member) = readCount(key, value);
    } else if (key == kHoldingHoursKey) {
      const double hours = readNumber(key, value);
      if (!std::isfinite(hours) || hours < 0.0) {
        throw ConfigError("config key 'max_holding_hours' must be a finite "
                          "non-negative number, got " + value.dump());
      }
      if (hours > kMaxHoldingHours) {
        throw ConfigError("config key 'max_holding_hours' exceeds " +
                          std::to_string(kMaxHoldingHours) + ", got " +
                          value.dump());
      }
      base.max_holding_duration = std::chrono::milliseconds(
          static_cast<std::int64_t>(std::llround(hours * kMsPerHour)));
    } else {
      std::cerr << "[config] ignoring unknown key '" << key << "'\n";
    }
  }
  return base;
}

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides(): RISKGATE_<KEY> values parsed as JSON scalars
// -----------------------------------------------------------------------------
domain::RiskLimits applyEnvironmentOverrides(domain::RiskLimits base,
                                             const EnvLookup& lookup) {
  nlohmann::json overrides = nlohmann::json::object();

  auto collect = [&](const char* key) {
    const std::string name = envName(key);
    const char* raw = lookup(name.c_str());
    if (raw == nullptr) {
      return;
    }
    try {
      overrides[key] = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error&) {
      throw ConfigError("environment override " + name +
                        " is not a number: '" + raw + "'");
    }
    std::cout << "[config] override " << name << "=" << raw << "\n";
  };

  for (const auto& field : kDoubleFields) {
    collect(field.key);
  }
  for (const auto& field : kCountFields) {
    collect(field.key);
  }
  collect(kHoldingHoursKey);

  return parseRiskLimits(overrides, std::move(base));
}

// -----------------------------------------------------------------------------
// loadRiskLimits(): defaults → file → environment → validate
// -----------------------------------------------------------------------------
domain::RiskLimits loadRiskLimits(const std::string& path,
                                  const EnvLookup& lookup) {
  domain::RiskLimits limits;

  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) {
      throw ConfigError("cannot open config file: " + path);
    }

    nlohmann::json document;
    try {
      document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigError("malformed config file " + path + ": " + e.what());
    }
    limits = parseRiskLimits(document, limits);
    std::cout << "[config] loaded risk limits from " << path << "\n";
  }

  limits = applyEnvironmentOverrides(limits, lookup);
  validateRiskLimits(limits);
  return limits;
}

domain::RiskLimits loadRiskLimits(const std::string& path) {
  return loadRiskLimits(path,
                        [](const char* name) { return std::getenv(name); });
}

}  // namespace config
}  // namespace riskgate
