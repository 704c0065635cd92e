#pragma once

#include "riskgate/domain/portfolio_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace riskgate {
namespace analytics {

// -----------------------------------------------------------------------------
// Return-series statistics
// -----------------------------------------------------------------------------
//
// @brief  Pure numeric helpers shared by PortfolioRisk: return conversion,
//         Pearson correlation, OLS beta and historical percentiles.
//
// @details
// Series are ordered oldest first and aligned on their most recent element.
// Each windowed statistic uses the last `window` observations of every input
// series. If any input is shorter than `window`, or the statistic is
// mathematically undefined on the window (zero variance), the result is
// std::nullopt: "undetermined", never a made-up number.
//
// Every function validates its inputs and throws InvalidInputError for a
// non-finite element or a zero window.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// simpleReturns(prices)
// -------------------------------------------------------------------------
// @brief  Converts a price history into period returns:
//         r[i] = prices[i+1] / prices[i] - 1.
//
// @return prices.size() - 1 returns (empty for fewer than two prices).
// @throws InvalidInputError if any price is non-positive or non-finite.
// -------------------------------------------------------------------------
domain::ReturnSeries simpleReturns(const std::vector<double>& prices);

// Throws InvalidInputError naming `what` if any element is non-finite.
void validateSeries(const domain::ReturnSeries& series, const char* what);

// -------------------------------------------------------------------------
// pearsonCorrelation(a, b, window)
// -------------------------------------------------------------------------
// @brief  Sample Pearson correlation of the last `window` elements of a
//         and b, clamped to [-1, 1].
//
// @return std::nullopt if either series is shorter than window or either
//         tail has zero variance.
// -------------------------------------------------------------------------
std::optional<double> pearsonCorrelation(const domain::ReturnSeries& a,
                                         const domain::ReturnSeries& b,
                                         std::size_t window);

// -------------------------------------------------------------------------
// olsBeta(y, x, window)
// -------------------------------------------------------------------------
// @brief  Slope of the least-squares regression of y on x over the last
//         `window` elements: cov(x, y) / var(x).
//
// @return std::nullopt if either series is shorter than window or x has
//         zero variance on the window.
// -------------------------------------------------------------------------
std::optional<double> olsBeta(const domain::ReturnSeries& y,
                              const domain::ReturnSeries& x,
                              std::size_t window);

// -------------------------------------------------------------------------
// historicalPercentile(returns, tail_probability, window)
// -------------------------------------------------------------------------
// @brief  Sorts the last `window` returns ascending and returns the element
//         at index floor(tail_probability * window), clamped to the last
//         index.
//
// @details
// Historical-simulation VaR calls this with tail_probability =
// 1 - confidence: at 95% over 30 observations the result is the second
// worst return.
//
// @return std::nullopt if returns is shorter than window.
// -------------------------------------------------------------------------
std::optional<double> historicalPercentile(const domain::ReturnSeries& returns,
                                           double tail_probability,
                                           std::size_t window);

}  // namespace analytics
}  // namespace riskgate
