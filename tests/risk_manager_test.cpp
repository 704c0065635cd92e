// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for riskgate::RiskManager.
//
// Validates:
//   - Construction validates the limits
//   - Sizing delegates with the default or an explicit mode
//   - canOpenPosition(): check order, first denial wins, breakers honored
//   - The -6% daily loss scenario blocks every symbol
//   - shouldExitPosition() threads the high-water mark
//   - riskSummary() aggregates the dashboard values
//   - Concurrent callers see identical results
//
// Design: The fixture holds a healthy 100k account with one AAPL holding
// and return histories long enough for every statistic.
// =============================================================================

#include "riskgate/engine/risk_manager.hpp"
#include "riskgate/risk/risk_errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>
#include <vector>

using riskgate::RiskManager;
using riskgate::domain::AccountSnapshot;
using riskgate::domain::CircuitBreakerState;
using riskgate::domain::DecisionReason;
using riskgate::domain::ExitReason;
using riskgate::domain::PortfolioSnapshot;
using riskgate::domain::PositionState;
using riskgate::domain::ReturnSeries;
using riskgate::domain::RiskLimits;
using riskgate::domain::Side;
using riskgate::domain::SizingMode;
using riskgate::domain::SizingParams;

namespace {

ReturnSeries wave(std::size_t n, std::size_t period, double scale) {
  ReturnSeries r;
  for (std::size_t i = 0; i < n; ++i) {
    r.push_back(scale * (static_cast<double>(i % period) -
                         static_cast<double>(period - 1) / 2.0));
  }
  return r;
}

}  // namespace

class RiskManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    account.equity = 100000.0;
    account.cash = 85000.0;
    account.start_of_day_equity = 100000.0;
    account.peak_equity = 100000.0;
    account.timestamp = riskgate::ms_to_timestamp(1700000000000);

    PositionState aapl;
    aapl.symbol = "AAPL";
    aapl.side = Side::Long;
    aapl.entry_price = 150.0;
    aapl.current_price = 150.0;
    aapl.quantity = 50.0;
    portfolio.positions.push_back(aapl);

    portfolio.symbol_returns["AAPL"] = wave(100, 5, 0.01);
    portfolio.symbol_returns["XOM"] = wave(100, 3, 0.01);
    portfolio.symbol_returns["MSFT"] = wave(100, 5, 0.02);
    portfolio.benchmark_returns = wave(100, 5, 0.005);
  }

  RiskLimits limits;
  AccountSnapshot account;
  PortfolioSnapshot portfolio;
};

// -----------------------------------------------------------------------------
// 1. Construction and sizing
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, RejectsInvalidLimits) {
  limits.kelly_fraction = 2.0;
  EXPECT_THROW(RiskManager{limits}, riskgate::ConfigError);
}

TEST_F(RiskManagerTest, SizingUsesDefaultOrExplicitMode) {
  RiskManager manager(limits, SizingMode::Conservative);
  EXPECT_EQ(manager.defaultMode(), SizingMode::Conservative);
  EXPECT_EQ(manager.calculatePositionSize("AAPL", 175.0, 100000.0), 11);

  SizingParams vol;
  vol.volatility = 2.0;
  EXPECT_EQ(manager.calculatePositionSize("XYZ", 50.0, 100000.0,
                                          SizingMode::VolatilityAdjusted, vol),
            20);
}

// -----------------------------------------------------------------------------
// 2. canOpenPosition()
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ApprovesTradeWithinAllLimits) {
  RiskManager manager(limits);
  auto decision = manager.canOpenPosition("XOM", Side::Long, 11.0, 175.0,
                                          account, portfolio);
  EXPECT_TRUE(decision.allowed) << decision.message;
  EXPECT_EQ(decision.reason, DecisionReason::Approved);
}

TEST_F(RiskManagerTest, DecisionsUseTheManagersOwnLimits) {
  RiskManager standard(limits);
  limits.max_position_size = 0.01;
  RiskManager tight(limits);

  // 1925 notional is 1.925% of equity.
  EXPECT_TRUE(standard.canOpenPosition("XOM", Side::Long, 11.0, 175.0,
                                       account, portfolio)
                  .allowed);
  auto denied = tight.canOpenPosition("XOM", Side::Long, 11.0, 175.0, account,
                                      portfolio);
  EXPECT_FALSE(denied.allowed);
  EXPECT_EQ(denied.reason, DecisionReason::PositionSizeLimit);
  EXPECT_DOUBLE_EQ(standard.limits().max_position_size, 0.02);
}

TEST_F(RiskManagerTest, DailyLossOfSixPercentBlocksEverySymbol) {
  RiskManager manager(limits);
  account.equity = 94000.0;

  for (const char* symbol : {"XOM", "MSFT", "AAPL", "NEWCO"}) {
    auto decision = manager.canOpenPosition(symbol, Side::Long, 1.0, 100.0,
                                            account, portfolio);
    EXPECT_FALSE(decision.allowed) << symbol;
    EXPECT_EQ(decision.reason, DecisionReason::DailyLossLimit) << symbol;
    EXPECT_EQ(decision.message, "daily loss limit breached") << symbol;
  }
}

TEST_F(RiskManagerTest, DrawdownIsCheckedBeforeDailyLoss) {
  RiskManager manager(limits);
  account.peak_equity = 120000.0;
  account.equity = 94000.0;

  auto decision = manager.canOpenPosition("XOM", Side::Long, 1.0, 100.0,
                                          account, portfolio);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, DecisionReason::DrawdownHalt);
}

TEST_F(RiskManagerTest, LatchedBreakerBlocksAfterRecovery) {
  RiskManager manager(limits);
  CircuitBreakerState breakers;
  breakers.drawdown_halted = true;

  auto decision = manager.canOpenPosition("XOM", Side::Long, 1.0, 100.0,
                                          account, portfolio, breakers);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, DecisionReason::DrawdownHalt);
}

TEST_F(RiskManagerTest, ExposureIsCheckedBeforeWeight) {
  limits.max_portfolio_exposure = 0.08;
  RiskManager manager(limits);
  // 7.5% held + 1.925% proposed > 8%, and the trade itself is within 2%.
  auto decision = manager.canOpenPosition("XOM", Side::Long, 11.0, 175.0,
                                          account, portfolio);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, DecisionReason::ExposureLimit);
}

TEST_F(RiskManagerTest, OversizedTradeIsDenied) {
  RiskManager manager(limits);
  auto decision = manager.canOpenPosition("XOM", Side::Short, 20.0, 175.0,
                                          account, portfolio);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, DecisionReason::PositionSizeLimit);
}

TEST_F(RiskManagerTest, CorrelationIsTheLastCheck) {
  RiskManager manager(limits);
  auto decision = manager.canOpenPosition("MSFT", Side::Long, 5.0, 300.0,
                                          account, portfolio);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, DecisionReason::CorrelationLimit);
  EXPECT_EQ(decision.related_symbol, "AAPL");
}

TEST_F(RiskManagerTest, RejectsInvalidOrderInputs) {
  RiskManager manager(limits);
  EXPECT_THROW(manager.canOpenPosition("XOM", Side::Long, 1.0, 0.0, account,
                                       portfolio),
               riskgate::InvalidInputError);
  EXPECT_THROW(manager.canOpenPosition("XOM", Side::Long, -1.0, 100.0,
                                       account, portfolio),
               riskgate::InvalidInputError);
  EXPECT_THROW(manager.canOpenPosition("", Side::Long, 1.0, 100.0, account,
                                       portfolio),
               riskgate::InvalidInputError);
}

// -----------------------------------------------------------------------------
// 3. Exits and breakers
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ShouldExitThreadsHighWaterMark) {
  RiskManager manager(limits);
  PositionState pos = portfolio.positions.front();
  pos.entry_time = account.timestamp;
  const auto now = account.timestamp + std::chrono::minutes(5);

  auto first = manager.shouldExitPosition(pos, 154.0, now);
  EXPECT_FALSE(first.exit);
  EXPECT_DOUBLE_EQ(first.position.high_water_mark, 154.0);

  // 149 is 3.2% off the 154 high.
  auto second = manager.shouldExitPosition(first.position, 149.0, now);
  EXPECT_TRUE(second.exit);
  EXPECT_EQ(second.reason, ExitReason::TrailingStop);

  auto raw = manager.shouldExitPosition(175.0, 170.0, Side::Long,
                                        account.timestamp, now, 0.0);
  EXPECT_EQ(raw.reason, ExitReason::StopLoss);
}

TEST_F(RiskManagerTest, UpdateCircuitBreakersLatchesDailyHalt) {
  RiskManager manager(limits);
  account.equity = 94000.0;
  CircuitBreakerState state =
      manager.updateCircuitBreakers(account, CircuitBreakerState{});
  EXPECT_TRUE(
      state.dailyHaltActive(riskgate::trading_day(account.timestamp)));
  EXPECT_FALSE(state.drawdown_halted);
}

// -----------------------------------------------------------------------------
// 4. Summary
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, SummaryAggregatesDashboardValues) {
  RiskManager manager(limits);
  account.equity = 97000.0;
  account.peak_equity = 100000.0;

  auto summary = manager.riskSummary(account, portfolio, CircuitBreakerState{});
  EXPECT_DOUBLE_EQ(summary.equity, 97000.0);
  EXPECT_DOUBLE_EQ(summary.daily_pnl, -3000.0);
  EXPECT_NEAR(summary.daily_pnl_pct, -0.03, 1e-12);
  EXPECT_DOUBLE_EQ(summary.drawdown, 3000.0);
  EXPECT_NEAR(summary.drawdown_pct, 0.03, 1e-12);
  EXPECT_DOUBLE_EQ(summary.gross_exposure, 7500.0);
  EXPECT_NEAR(summary.exposure_pct, 7500.0 / 97000.0, 1e-12);
  EXPECT_EQ(summary.position_count, 1u);
  ASSERT_TRUE(summary.var.has_value());
  EXPECT_GT(summary.var->loss_amount, 0.0);
  ASSERT_TRUE(summary.beta.has_value());
  EXPECT_TRUE(summary.can_trade);
}

TEST_F(RiskManagerTest, SummaryReportsHaltAndUndeterminedStatistics) {
  RiskManager manager(limits);
  account.equity = 94000.0;
  portfolio.symbol_returns.clear();
  portfolio.benchmark_returns.clear();

  auto summary = manager.riskSummary(account, portfolio, CircuitBreakerState{});
  EXPECT_FALSE(summary.can_trade);
  EXPECT_FALSE(summary.var.has_value());
  EXPECT_FALSE(summary.beta.has_value());
}

// -----------------------------------------------------------------------------
// 5. Re-entrancy: one manager shared by several threads
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ConcurrentCallersGetIdenticalDecisions) {
  const RiskManager manager(limits);
  std::atomic<int> mismatches{0};

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        auto ok = manager.canOpenPosition("XOM", Side::Long, 11.0, 175.0,
                                          account, portfolio);
        auto no = manager.canOpenPosition("MSFT", Side::Long, 5.0, 300.0,
                                          account, portfolio);
        if (!ok.allowed || no.allowed) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
