#pragma once

#include "riskgate/domain/position_state.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace riskgate {
namespace domain {

/// Ordered sequence of period returns, oldest first (0.01 == +1%).
using ReturnSeries = std::vector<double>;

// -----------------------------------------------------------------------------
// PortfolioSnapshot — holdings plus the return history needed for analytics
// -----------------------------------------------------------------------------
//
// @brief  Value object handed to PortfolioRisk and RiskManager by the
//         persistence collaborator.
//
// @details
// positions holds one PositionState per open symbol. symbol_returns maps a
// symbol (held or candidate) to its return series; series are aligned on
// their most recent element, so only the tails are compared.
//
// portfolio_returns is optional. When empty, PortfolioRisk derives the
// portfolio series from the positions' notional weights and symbol_returns.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  std::vector<PositionState> positions;
  std::unordered_map<std::string, ReturnSeries> symbol_returns;
  ReturnSeries benchmark_returns;
  ReturnSeries portfolio_returns;

  const PositionState* findPosition(const std::string& symbol) const {
    for (const auto& pos : positions) {
      if (pos.symbol == symbol) {
        return &pos;
      }
    }
    return nullptr;
  }

  const ReturnSeries* returnsFor(const std::string& symbol) const {
    auto it = symbol_returns.find(symbol);
    return it != symbol_returns.end() ? &it->second : nullptr;
  }
};

}  // namespace domain
}  // namespace riskgate
