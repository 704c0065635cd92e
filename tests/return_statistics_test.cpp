// =============================================================================
// return_statistics_test.cpp
// =============================================================================
// Unit tests for the riskgate::analytics return-series helpers.
//
// Validates:
//   - simpleReturns() conversion and price validation
//   - pearsonCorrelation() on tails, clamping and zero-variance handling
//   - olsBeta() slope and the constant-benchmark case
//   - historicalPercentile() index selection
//   - Window and element validation
// =============================================================================

#include "riskgate/analytics/return_statistics.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace analytics = riskgate::analytics;
using riskgate::InvalidInputError;
using riskgate::domain::ReturnSeries;

TEST(ReturnStatisticsTest, SimpleReturnsFromPrices) {
  ReturnSeries r = analytics::simpleReturns({100.0, 110.0, 99.0});
  ASSERT_EQ(r.size(), 2u);
  EXPECT_NEAR(r[0], 0.10, 1e-12);
  EXPECT_NEAR(r[1], -0.10, 1e-12);

  EXPECT_TRUE(analytics::simpleReturns({100.0}).empty());
  EXPECT_THROW(analytics::simpleReturns({100.0, 0.0}), InvalidInputError);
}

TEST(ReturnStatisticsTest, CorrelationUsesOnlyTheTail) {
  // Only the last three elements of each series count.
  ReturnSeries a = {0.05, -0.05, 0.01, 0.02, -0.01};
  ReturnSeries b = {0.04, 0.02, -0.01, 0.01};

  auto corr = analytics::pearsonCorrelation(a, b, 3);
  ASSERT_TRUE(corr.has_value());
  EXPECT_NEAR(*corr, -0.5, 1e-9);

  ReturnSeries c = {0.03, 0.01, 0.02, -0.01};
  auto same = analytics::pearsonCorrelation(a, c, 3);
  ASSERT_TRUE(same.has_value());
  EXPECT_NEAR(*same, 1.0, 1e-12);
  EXPECT_LE(*same, 1.0);
}

TEST(ReturnStatisticsTest, CorrelationUndeterminedCases) {
  ReturnSeries a = {0.01, 0.02, -0.01, 0.03};
  ReturnSeries flat(4, 0.01);

  EXPECT_FALSE(analytics::pearsonCorrelation(a, flat, 4).has_value());
  EXPECT_FALSE(analytics::pearsonCorrelation(a, a, 5).has_value());
  EXPECT_THROW(analytics::pearsonCorrelation(a, a, 0), InvalidInputError);
}

TEST(ReturnStatisticsTest, BetaIsCovarianceOverVariance) {
  ReturnSeries x = {0.01, -0.02, 0.03, 0.00, -0.01};
  ReturnSeries y;
  for (double v : x) {
    y.push_back(-0.5 * v);
  }
  auto beta = analytics::olsBeta(y, x, 5);
  ASSERT_TRUE(beta.has_value());
  EXPECT_NEAR(*beta, -0.5, 1e-12);

  EXPECT_FALSE(analytics::olsBeta(y, ReturnSeries(5, 0.002), 5).has_value());
}

TEST(ReturnStatisticsTest, PercentileIndexIsFlooredAndClamped) {
  ReturnSeries r = {0.04, -0.02, 0.01, -0.06, 0.03,
                    0.00, -0.01, 0.02, 0.05, -0.03};

  // floor(0.1 * 10) == 1 -> second smallest.
  auto p10 = analytics::historicalPercentile(r, 0.1, 10);
  ASSERT_TRUE(p10.has_value());
  EXPECT_DOUBLE_EQ(*p10, -0.03);

  auto p0 = analytics::historicalPercentile(r, 0.0, 10);
  ASSERT_TRUE(p0.has_value());
  EXPECT_DOUBLE_EQ(*p0, -0.06);

  // Only the last four: {-0.01, 0.02, 0.05, -0.03}.
  auto tail = analytics::historicalPercentile(r, 0.0, 4);
  ASSERT_TRUE(tail.has_value());
  EXPECT_DOUBLE_EQ(*tail, -0.03);

  EXPECT_FALSE(analytics::historicalPercentile(r, 0.05, 30).has_value());
  EXPECT_THROW(analytics::historicalPercentile(r, 1.0, 10), InvalidInputError);
}

TEST(ReturnStatisticsTest, NonFiniteElementsAreRejected) {
  ReturnSeries bad = {0.01, std::numeric_limits<double>::quiet_NaN(), 0.02};
  EXPECT_THROW(analytics::validateSeries(bad, "bad"), InvalidInputError);
  EXPECT_THROW(analytics::pearsonCorrelation(bad, bad, 2), InvalidInputError);
}
