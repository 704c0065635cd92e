// =============================================================================
// risk_service_test.cpp
// =============================================================================
// Unit tests for riskgate::RiskService (the JSON command surface).
//
// Validates:
//   - PING / LIMITS / SIZE / CAN_OPEN / SHOULD_EXIT / BREAKERS / VAR /
//     BETA / CORRELATION / RETURNS / SUMMARY responses
//   - Error envelope: bad_request, invalid_input, unknown_command
//   - Undetermined statistics encode as null with "determined": false
//   - Missing timestamps are filled from the ITimeProvider
//   - Denials, exits and tripped breakers reach the telemetry sink
//
// Design: A SimulationTimeProvider drives "now"; telemetry is captured in a
// vector. No sockets are involved.
// =============================================================================

#include "riskgate/engine/risk_manager.hpp"
#include "riskgate/engine/risk_service.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using nlohmann::json;

namespace {

constexpr std::int64_t kHourMs = 60LL * 60 * 1000;
constexpr std::int64_t kNowMs = 1700000000000;

json account(double equity, double start_of_day = 100000.0,
             double peak = 100000.0) {
  return json{{"equity", equity},
              {"cash", equity},
              {"start_of_day_equity", start_of_day},
              {"peak_equity", peak}};
}

}  // namespace

class RiskServiceTest : public ::testing::Test {
 protected:
  RiskServiceTest()
      : clock(kNowMs),
        manager(riskgate::domain::RiskLimits{}),
        service(manager, clock,
                [this](const std::string& event) {
                  telemetry.push_back(json::parse(event));
                }) {}

  json call(const json& request) {
    return json::parse(service.executeCommand(request.dump()));
  }

  riskgate::SimulationTimeProvider clock;
  riskgate::RiskManager manager;
  riskgate::RiskService service;
  std::vector<json> telemetry;
};

// -----------------------------------------------------------------------------
// 1. Envelope
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, PingRespondsPong) {
  json r = call({{"command", "PING"}});
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["response"], "PONG");
}

TEST_F(RiskServiceTest, MalformedJsonIsBadRequest) {
  json r = json::parse(service.executeCommand("{not json"));
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error"], "bad_request");
}

TEST_F(RiskServiceTest, InvalidUtf8IsBadRequestNotException) {
  std::string reply;
  ASSERT_NO_THROW(reply = service.executeCommand("\xff"));
  json r = json::parse(reply);
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error"], "bad_request");

  // Truncated two-byte sequence inside an otherwise valid envelope.
  const std::string truncated = "{\"command\": \"PING\", \"x\": \"x\xc3\"}";
  ASSERT_NO_THROW(reply = service.executeCommand(truncated));
  EXPECT_EQ(json::parse(reply)["error"], "bad_request");
}

TEST_F(RiskServiceTest, MissingCommandOrFieldIsBadRequest) {
  EXPECT_EQ(call(json{{"symbol", "AAPL"}})["error"], "bad_request");
  EXPECT_EQ(call({{"command", "SIZE"}, {"symbol", "AAPL"}})["error"],
            "bad_request");
  EXPECT_EQ(call({{"command", "SIZE"},
                  {"symbol", "AAPL"},
                  {"price", "cheap"},
                  {"equity", 100000.0}})["error"],
            "bad_request");
}

TEST_F(RiskServiceTest, UnknownCommandIsReported) {
  json r = call({{"command", "HALT"}});
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error"], "unknown_command");
}

TEST_F(RiskServiceTest, EngineContractViolationIsInvalidInput) {
  json r = call({{"command", "SIZE"},
                 {"symbol", "AAPL"},
                 {"price", -1.0},
                 {"equity", 100000.0}});
  EXPECT_EQ(r["status"], "error");
  EXPECT_EQ(r["error"], "invalid_input");
  EXPECT_FALSE(r["message"].get<std::string>().empty());
}

// -----------------------------------------------------------------------------
// 2. LIMITS and SIZE
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, LimitsUseConfigurationKeys) {
  json r = call({{"command", "LIMITS"}});
  EXPECT_EQ(r["status"], "ok");
  EXPECT_DOUBLE_EQ(r["limits"]["max_position_size"].get<double>(), 0.02);
  EXPECT_DOUBLE_EQ(r["limits"]["stop_loss_percentage"].get<double>(), 0.02);
  EXPECT_DOUBLE_EQ(r["limits"]["max_holding_hours"].get<double>(), 24.0);
  EXPECT_EQ(r["default_mode"], "fixed_fraction");
}

TEST_F(RiskServiceTest, SizeReturnsQuantityAndCeiling) {
  json r = call({{"command", "SIZE"},
                 {"symbol", "AAPL"},
                 {"price", 175.0},
                 {"equity", 100000.0}});
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["quantity"], 11);
  EXPECT_EQ(r["max_quantity"], 11);
  EXPECT_EQ(r["mode"], "fixed_fraction");

  json kelly = call({{"command", "SIZE"},
                     {"symbol", "AAPL"},
                     {"price", 175.0},
                     {"equity", 100000.0},
                     {"mode", "kelly"},
                     {"params",
                      {{"win_rate", 0.25}, {"avg_win", 300.0},
                       {"avg_loss", 100.0}}}});
  EXPECT_EQ(kelly["quantity"], 0);
}

// -----------------------------------------------------------------------------
// 3. CAN_OPEN
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, CanOpenApprovesWithoutTelemetry) {
  json r = call({{"command", "CAN_OPEN"},
                 {"symbol", "AAPL"},
                 {"side", "long"},
                 {"quantity", 11},
                 {"price", 175.0},
                 {"account", account(100000.0)}});
  EXPECT_EQ(r["status"], "ok");
  EXPECT_TRUE(r["decision"]["allowed"].get<bool>());
  EXPECT_EQ(r["decision"]["reason"], "approved");
  EXPECT_TRUE(telemetry.empty());
}

TEST_F(RiskServiceTest, CanOpenDenialIsPublished) {
  json r = call({{"command", "CAN_OPEN"},
                 {"symbol", "AAPL"},
                 {"side", "long"},
                 {"quantity", 1},
                 {"price", 175.0},
                 {"account", account(94000.0)}});
  EXPECT_FALSE(r["decision"]["allowed"].get<bool>());
  EXPECT_EQ(r["decision"]["reason"], "daily_loss_limit");
  EXPECT_EQ(r["decision"]["message"], "daily loss limit breached");

  ASSERT_EQ(telemetry.size(), 1u);
  EXPECT_EQ(telemetry[0]["type"], "risk_denial");
  EXPECT_EQ(telemetry[0]["symbol"], "AAPL");
  // No timestamp_ms on the account: stamped from the clock.
  EXPECT_EQ(telemetry[0]["timestamp_ms"], kNowMs);
}

TEST_F(RiskServiceTest, CanOpenHonorsBreakerState) {
  json r = call({{"command", "CAN_OPEN"},
                 {"symbol", "AAPL"},
                 {"side", "short"},
                 {"quantity", 1},
                 {"price", 175.0},
                 {"account", account(100000.0)},
                 {"breakers", {{"drawdown_halted", true}}}});
  EXPECT_FALSE(r["decision"]["allowed"].get<bool>());
  EXPECT_EQ(r["decision"]["reason"], "max_drawdown");
}

TEST_F(RiskServiceTest, UnknownSideIsInvalidInput) {
  json r = call({{"command", "CAN_OPEN"},
                 {"symbol", "AAPL"},
                 {"side", "sideways"},
                 {"quantity", 1},
                 {"price", 175.0},
                 {"account", account(100000.0)}});
  EXPECT_EQ(r["error"], "invalid_input");
}

// -----------------------------------------------------------------------------
// 4. SHOULD_EXIT
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, ShouldExitReturnsUpdatedPosition) {
  json position = {{"symbol", "AAPL"},
                   {"side", "long"},
                   {"entry_price", 175.0},
                   {"quantity", 11},
                   {"entry_time_ms", kNowMs}};

  json hold = call({{"command", "SHOULD_EXIT"},
                    {"position", position},
                    {"current_price", 172.0}});
  EXPECT_FALSE(hold["decision"]["exit"].get<bool>());
  EXPECT_DOUBLE_EQ(
      hold["decision"]["position"]["high_water_mark"].get<double>(), 175.0);
  EXPECT_TRUE(telemetry.empty());

  json exit = call({{"command", "SHOULD_EXIT"},
                    {"position", hold["decision"]["position"]},
                    {"current_price", 170.0},
                    {"now_ms", kNowMs + 1000}});
  EXPECT_TRUE(exit["decision"]["exit"].get<bool>());
  EXPECT_EQ(exit["decision"]["reason"], "stop_loss");
  EXPECT_EQ(exit["decision"]["message"], "stop-loss");

  ASSERT_EQ(telemetry.size(), 1u);
  EXPECT_EQ(telemetry[0]["type"], "exit_signal");
  EXPECT_EQ(telemetry[0]["timestamp_ms"], kNowMs + 1000);
}

TEST_F(RiskServiceTest, TimeStopUsesSimulatedClock) {
  json position = {{"symbol", "AAPL"},
                   {"side", "long"},
                   {"entry_price", 100.0},
                   {"quantity", 10},
                   {"entry_time_ms", kNowMs}};

  clock.advance_by(25 * kHourMs);
  json r = call({{"command", "SHOULD_EXIT"},
                 {"position", position},
                 {"current_price", 99.9}});
  EXPECT_TRUE(r["decision"]["exit"].get<bool>());
  EXPECT_EQ(r["decision"]["reason"], "time_stop");
}

// -----------------------------------------------------------------------------
// 5. BREAKERS
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, BreakersTripOnceAndStayLatched) {
  json first = call({{"command", "BREAKERS"}, {"account", account(94000.0)}});
  EXPECT_EQ(first["status"], "ok");
  EXPECT_FALSE(first["can_trade"].get<bool>());
  EXPECT_FALSE(first["breakers"]["daily_loss_halt_day"].is_null());
  ASSERT_EQ(telemetry.size(), 1u);
  EXPECT_EQ(telemetry[0]["type"], "circuit_breaker");
  EXPECT_TRUE(telemetry[0]["daily_loss_tripped"].get<bool>());

  // Same state fed back: no new trip, still halted after a recovery.
  json second = call({{"command", "BREAKERS"},
                      {"account", account(99500.0)},
                      {"breakers", first["breakers"]}});
  EXPECT_FALSE(second["can_trade"].get<bool>());
  EXPECT_EQ(second["breakers"], first["breakers"]);
  EXPECT_EQ(telemetry.size(), 1u);

  // The next trading day the daily halt has expired.
  clock.advance_by(24 * kHourMs);
  json next_day = call({{"command", "BREAKERS"},
                        {"account", account(99500.0, 99500.0)},
                        {"breakers", first["breakers"]}});
  EXPECT_TRUE(next_day["can_trade"].get<bool>());
}

// -----------------------------------------------------------------------------
// 6. Analytics
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, UndeterminedStatisticsAreNull) {
  json portfolio = {{"portfolio_returns", {0.01, -0.02, 0.005}},
                    {"benchmark_returns", {0.01, -0.01, 0.0}},
                    {"symbol_returns",
                     {{"AAPL", {0.01, 0.02}}, {"MSFT", {0.02, 0.01}}}}};

  json var = call({{"command", "VAR"},
                   {"equity", 100000.0},
                   {"portfolio", portfolio}});
  EXPECT_EQ(var["status"], "ok");
  EXPECT_FALSE(var["determined"].get<bool>());
  EXPECT_TRUE(var["var"].is_null());

  json beta = call({{"command", "BETA"},
                    {"equity", 100000.0},
                    {"portfolio", portfolio}});
  EXPECT_FALSE(beta["determined"].get<bool>());
  EXPECT_TRUE(beta["beta"].is_null());

  json corr = call({{"command", "CORRELATION"},
                    {"a", "AAPL"},
                    {"b", "MSFT"},
                    {"portfolio", portfolio}});
  EXPECT_FALSE(corr["determined"].get<bool>());
  EXPECT_TRUE(corr["correlation"].is_null());
}

TEST_F(RiskServiceTest, VarIsDeterminedWithFullHistory) {
  std::vector<double> returns(27, 0.001);
  returns.push_back(-0.05);
  returns.push_back(-0.04);
  returns.push_back(-0.03);

  json r = call({{"command", "VAR"},
                 {"equity", 200000.0},
                 {"portfolio", {{"portfolio_returns", returns}}}});
  EXPECT_TRUE(r["determined"].get<bool>());
  EXPECT_DOUBLE_EQ(r["var"]["percentile_return"].get<double>(), -0.04);
  EXPECT_NEAR(r["var"]["loss_amount"].get<double>(), 8000.0, 1e-6);
}

TEST_F(RiskServiceTest, ReturnsConvertsPrices) {
  json r = call({{"command", "RETURNS"}, {"prices", {100.0, 110.0, 99.0}}});
  ASSERT_EQ(r["returns"].size(), 2u);
  EXPECT_NEAR(r["returns"][0].get<double>(), 0.10, 1e-12);

  json bad = call({{"command", "RETURNS"}, {"prices", {100.0, -1.0}}});
  EXPECT_EQ(bad["error"], "invalid_input");
}

// -----------------------------------------------------------------------------
// 7. SUMMARY
// -----------------------------------------------------------------------------
TEST_F(RiskServiceTest, SummaryForFlatAccount) {
  json r = call({{"command", "SUMMARY"}, {"account", account(100000.0)}});
  EXPECT_EQ(r["status"], "ok");
  const json& s = r["summary"];
  EXPECT_DOUBLE_EQ(s["equity"].get<double>(), 100000.0);
  EXPECT_DOUBLE_EQ(s["exposure_pct"].get<double>(), 0.0);
  EXPECT_EQ(s["position_count"], 0);
  EXPECT_TRUE(s["var_determined"].get<bool>());
  EXPECT_DOUBLE_EQ(s["beta"].get<double>(), 0.0);
  EXPECT_TRUE(s["can_trade"].get<bool>());
  EXPECT_TRUE(s["limits"].is_object());
}

TEST_F(RiskServiceTest, SummaryWithZeroEquityReportsNullExposure) {
  json r = call({{"command", "SUMMARY"},
                 {"account", account(0.0, 0.0, 0.0)}});
  EXPECT_TRUE(r["summary"]["exposure_pct"].is_null());
}
