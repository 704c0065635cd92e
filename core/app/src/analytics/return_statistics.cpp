#include "riskgate/analytics/return_statistics.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace riskgate {
namespace analytics {

namespace {

// Sums of squared deviations at or below this are treated as zero variance;
// rounding leaves residue of this order on a constant series.
constexpr double kMinVariance = 1e-18;

void requireWindow(std::size_t window) {
  if (window == 0) {
    throw InvalidInputError("Statistics window must be positive");
  }
}

// Mean of the last n elements of s. Caller guarantees s.size() >= n > 0.
double tailMean(const domain::ReturnSeries& s, std::size_t n) {
  double sum = 0.0;
  for (std::size_t i = s.size() - n; i < s.size(); ++i) {
    sum += s[i];
  }
  return sum / static_cast<double>(n);
}

}  // namespace

// -----------------------------------------------------------------------------
// simpleReturns
// -----------------------------------------------------------------------------
domain::ReturnSeries simpleReturns(const std::vector<double>& prices) {
  for (double p : prices) {
    if (!(p > 0.0) || !std::isfinite(p)) {
      throw InvalidInputError("Invalid price in history: " +
                              std::to_string(p));
    }
  }

  domain::ReturnSeries returns;
  if (prices.size() < 2) {
    return returns;
  }
  returns.reserve(prices.size() - 1);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    returns.push_back(prices[i] / prices[i - 1] - 1.0);
  }
  return returns;
}

// -----------------------------------------------------------------------------
// validateSeries
// -----------------------------------------------------------------------------
void validateSeries(const domain::ReturnSeries& series, const char* what) {
  for (std::size_t i = 0; i < series.size(); ++i) {
    if (!std::isfinite(series[i])) {
      throw InvalidInputError(std::string("Malformed return series '") +
                              what + "': non-finite value at index " +
                              std::to_string(i));
    }
  }
}

// -----------------------------------------------------------------------------
// pearsonCorrelation
// -----------------------------------------------------------------------------
std::optional<double> pearsonCorrelation(const domain::ReturnSeries& a,
                                         const domain::ReturnSeries& b,
                                         std::size_t window) {
  requireWindow(window);
  validateSeries(a, "a");
  validateSeries(b, "b");
  if (a.size() < window || b.size() < window) {
    return std::nullopt;
  }

  const double mean_a = tailMean(a, window);
  const double mean_b = tailMean(b, window);
  const std::size_t off_a = a.size() - window;
  const std::size_t off_b = b.size() - window;

  double cov = 0.0;
  double var_a = 0.0;
  double var_b = 0.0;
  for (std::size_t i = 0; i < window; ++i) {
    const double da = a[off_a + i] - mean_a;
    const double db = b[off_b + i] - mean_b;
    cov += da * db;
    var_a += da * da;
    var_b += db * db;
  }

  if (var_a <= kMinVariance || var_b <= kMinVariance) {
    return std::nullopt;
  }

  // Rounding can push |r| a hair past 1 for perfectly collinear input.
  const double r = cov / std::sqrt(var_a * var_b);
  return std::clamp(r, -1.0, 1.0);
}

// -----------------------------------------------------------------------------
// olsBeta
// -----------------------------------------------------------------------------
std::optional<double> olsBeta(const domain::ReturnSeries& y,
                              const domain::ReturnSeries& x,
                              std::size_t window) {
  requireWindow(window);
  validateSeries(y, "y");
  validateSeries(x, "x");
  if (y.size() < window || x.size() < window) {
    return std::nullopt;
  }

  const double mean_y = tailMean(y, window);
  const double mean_x = tailMean(x, window);
  const std::size_t off_y = y.size() - window;
  const std::size_t off_x = x.size() - window;

  double cov = 0.0;
  double var_x = 0.0;
  for (std::size_t i = 0; i < window; ++i) {
    const double dx = x[off_x + i] - mean_x;
    cov += dx * (y[off_y + i] - mean_y);
    var_x += dx * dx;
  }

  if (var_x <= kMinVariance) {
    return std::nullopt;
  }
  return cov / var_x;
}

// -----------------------------------------------------------------------------
// historicalPercentile
// -----------------------------------------------------------------------------
std::optional<double> historicalPercentile(const domain::ReturnSeries& returns,
                                           double tail_probability,
                                           std::size_t window) {
  requireWindow(window);
  validateSeries(returns, "returns");
  if (!(tail_probability >= 0.0 && tail_probability < 1.0)) {
    throw InvalidInputError("Tail probability out of range: " +
                            std::to_string(tail_probability));
  }
  if (returns.size() < window) {
    return std::nullopt;
  }

  std::vector<double> sorted(returns.end() - static_cast<std::ptrdiff_t>(window),
                             returns.end());
  std::sort(sorted.begin(), sorted.end());

  auto index = static_cast<std::size_t>(
      std::floor(tail_probability * static_cast<double>(window)));
  if (index >= sorted.size()) {
    index = sorted.size() - 1;
  }
  return sorted[index];
}

}  // namespace analytics
}  // namespace riskgate
