// =============================================================================
// admission_engine_test.cpp
// =============================================================================
// Tests for riskgate::AdmissionEngine and its JSON command interface.
//
// Validates:
//   - start() / stop() / destructor, idempotent
//   - start(reconciler) hydrates positions before any order is admitted
//   - PING, STATUS, HALT, RESUME
//   - SUBMIT / EXECUTE / CANCEL / ORDER / MARK / PNL / QUERY replies
//   - MARK refuses non-positive values without applying either mark
//   - CANCEL_ALL and ACTIVE with strategy and symbol filters
//   - Malformed or unknown commands produce an "error" reply and touch no
//     state
//
// Design: Each test builds its own engine with empty IPC endpoints, so no
// sockets are opened and executeCommand() is driven directly.
// =============================================================================

#include "riskgate/engine/admission_engine.hpp"
#include "riskgate/risk/i_reconciler.hpp"
#include "riskgate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

using nlohmann::json;
using riskgate::AdmissionEngine;
using riskgate::EngineConfig;
using riskgate::domain::Decimal;
using riskgate::domain::ExchangeConfig;
using riskgate::domain::Position;

namespace {

EngineConfig makeConfig() {
  EngineConfig config;
  config.engine_name = "riskgate-test";
  config.risk_limits.position_limits["BTC-USD"] = Decimal{10};
  config.risk_limits.position_limits["ETH-USD"] = Decimal{100};
  config.risk_limits.max_daily_loss = Decimal{1000};

  ExchangeConfig binance;
  binance.name = "Binance";
  binance.orders_per_second = 10;
  binance.queries_per_minute = 2;
  config.exchanges.push_back(binance);
  return config;
}

json submitCommand(const std::string& symbol, const std::string& side,
                   const std::string& quantity, const std::string& price,
                   const std::string& id = "") {
  json order{{"symbol", symbol}, {"side", side}, {"quantity", quantity},
             {"price", price}};
  if (!id.empty()) {
    order["id"] = id;
  }
  return json{{"cmd", "SUBMIT"},
              {"strategy", "momentum_strategy"},
              {"exchange", "Binance"},
              {"order", order}};
}

}  // namespace

class AdmissionEngineTest : public ::testing::Test {
 protected:
  json send(const char* cmd) { return json::parse(engine.executeCommand(cmd)); }
  json send(const json& cmd) { return json::parse(engine.executeCommand(cmd.dump())); }

  riskgate::SimulationTimeProvider sim_clock{1'700'000'000'000};
  AdmissionEngine engine{makeConfig(), sim_clock};
};

// -----------------------------------------------------------------------------
// 1. start() and stop() are idempotent; the destructor stops a running
//    engine.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, StartStopIdempotent) {
  EXPECT_FALSE(engine.isRunning());
  EXPECT_NO_FATAL_FAILURE(engine.stop());

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.isRunning());

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());

  {
    AdmissionEngine scoped(makeConfig(), sim_clock);
    scoped.start();
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 2. Reconciled positions are the baseline for the position limit.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, ReconcilerHydratesPositions) {
  Position held;
  held.symbol = "BTC-USD";
  held.net_quantity = Decimal{8};
  held.average_price = Decimal{30000};
  riskgate::StaticReconciler reconciler({held});

  engine.start(&reconciler);

  auto pos = engine.registry().position("BTC-USD");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->net_quantity, Decimal{8});

  json reply = send(submitCommand("BTC-USD", "BUY", "3", "30000"));
  EXPECT_EQ(reply["status"], "rejected");
  EXPECT_EQ(reply["rejection"]["code"], "PositionLimitExceeded");
  EXPECT_EQ(reply["rejection"]["observed"], "11");
}

// -----------------------------------------------------------------------------
// 3. Plain operator commands.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, PlainCommands) {
  json ping = send("PING");
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  EXPECT_EQ(send("HALT")["status"], "ok");
  EXPECT_TRUE(engine.controller().isHalted());

  json refused = send(submitCommand("BTC-USD", "BUY", "1", "100"));
  EXPECT_EQ(refused["rejection"]["code"], "TradingHalted");

  json status = send("STATUS");
  EXPECT_EQ(status["engine"], "riskgate-test");
  EXPECT_EQ(status["halted"], true);
  EXPECT_EQ(status["rejected"]["TradingHalted"], 1);

  EXPECT_EQ(send("RESUME")["status"], "ok");
  EXPECT_FALSE(engine.controller().isHalted());
}

// -----------------------------------------------------------------------------
// 4. SUBMIT → ORDER → EXECUTE → CANCEL (refused) through JSON.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, OrderFlowThroughCommands) {
  json submitted = send(submitCommand("BTC-USD", "BUY", "1", "100"));
  ASSERT_EQ(submitted["status"], "ok");
  const std::string id = submitted["order"]["id"].get<std::string>();
  EXPECT_EQ(id, "ORD-1");
  EXPECT_EQ(submitted["order"]["status"], "PENDING");
  EXPECT_EQ(submitted["order"]["strategy_id"], "momentum_strategy");

  json lookup = send(json{{"cmd", "ORDER"}, {"order_id", id}});
  EXPECT_EQ(lookup["order"]["status"], "PENDING");

  json executed =
      send(json{{"cmd", "EXECUTE"}, {"order_id", id}, {"fill_price", "100"}});
  ASSERT_EQ(executed["status"], "ok");
  EXPECT_EQ(executed["order"]["status"], "EXECUTED");
  EXPECT_EQ(executed["order"]["executed_price"], "100.05");
  EXPECT_EQ(executed["order"]["commission"], "1");

  json late = send(json{{"cmd", "CANCEL"}, {"order_id", id}});
  EXPECT_EQ(late["status"], "rejected");
  EXPECT_EQ(late["rejection"]["code"], "InvalidTransition");
  EXPECT_EQ(late["rejection"]["from"], "EXECUTED");
  EXPECT_EQ(late["rejection"]["attempted"], "CANCELED");

  json status = send("STATUS");
  EXPECT_EQ(status["accepted"], 1);
  EXPECT_EQ(status["open_orders"], 0);
  ASSERT_EQ(status["positions"].size(), 1u);
  EXPECT_EQ(status["positions"][0]["symbol"], "BTC-USD");
}

TEST_F(AdmissionEngineTest, CancelWithReason) {
  send(submitCommand("ETH-USD", "SELL", "2", "2000", "client-1"));

  json canceled = send(
      json{{"cmd", "CANCEL"}, {"order_id", "client-1"}, {"reason", "venue timeout"}});
  ASSERT_EQ(canceled["status"], "ok");
  EXPECT_EQ(canceled["order"]["status"], "CANCELED");
  EXPECT_EQ(canceled["order"]["cancel_reason"], "venue timeout");
  EXPECT_EQ(engine.registry().summary().open_reservations, 0u);
}

// -----------------------------------------------------------------------------
// 5. MARK and PNL feed the portfolio breakers.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, MarkAndPnlCommands) {
  json marked = send(json{{"cmd", "MARK"}, {"portfolio_value", 100000}});
  EXPECT_EQ(marked["status"], "ok");
  EXPECT_EQ(marked["summary"]["portfolio_value"], "100000");

  send(json{{"cmd", "MARK"}, {"portfolio_value", "90000"}});
  json drawn = send(submitCommand("ETH-USD", "BUY", "1", "10"));
  EXPECT_EQ(drawn["rejection"]["code"], "DrawdownBreached");

  json priced = send(json{{"cmd", "MARK"}, {"symbol", "ETH-USD"}, {"price", "2100"}});
  EXPECT_EQ(priced["status"], "ok");

  json pnl = send(json{{"cmd", "PNL"}, {"amount", "-250.5"}});
  EXPECT_EQ(pnl["summary"]["daily_pnl"], "-250.5");
}

// -----------------------------------------------------------------------------
// 6. QUERY meters the query bucket (2 per minute here).
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, QueryCommandIsRateLimited) {
  json query{{"cmd", "QUERY"}, {"exchange", "Binance"}};
  EXPECT_EQ(send(query)["status"], "ok");
  EXPECT_EQ(send(query)["status"], "ok");

  json limited = send(query);
  EXPECT_EQ(limited["status"], "rejected");
  EXPECT_EQ(limited["rejection"]["code"], "RateLimitExceeded");
  EXPECT_NEAR(limited["rejection"]["retry_after_ms"].get<double>(), 30000.0, 1.0);
}

// -----------------------------------------------------------------------------
// 7. Malformed and unknown commands are errors and change nothing.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, MalformedCommandsAreErrors) {
  auto before = engine.registry().snapshot();

  EXPECT_EQ(send("FLY")["status"], "error");
  EXPECT_EQ(send("{ not json")["status"], "error");
  EXPECT_EQ(send(json{{"cmd", "LAUNCH"}})["status"], "error");
  EXPECT_EQ(send(json{{"cmd", "SUBMIT"}, {"strategy", "s"}})["status"], "error");

  json bad_side = submitCommand("BTC-USD", "HOLD", "1", "100");
  EXPECT_EQ(send(bad_side)["status"], "error");

  json bad_number = submitCommand("BTC-USD", "BUY", "one", "100");
  EXPECT_EQ(send(bad_number)["status"], "error");

  EXPECT_EQ(send(json{{"cmd", "EXECUTE"}, {"order_id", "x"}})["status"], "error");
  EXPECT_EQ(send(json{{"cmd", "ORDER"}, {"order_id", "missing"}})["status"], "error");

  EXPECT_EQ(engine.registry().snapshot(), before);
  EXPECT_TRUE(engine.lifecycle().orders().empty());
  EXPECT_EQ(engine.controller().stats().accepted, 0u);
}

// -----------------------------------------------------------------------------
// 8. MARK with a non-positive value is an error and applies neither mark.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, MarkRejectsNonPositiveValues) {
  send(json{{"cmd", "MARK"}, {"portfolio_value", "100000"}});

  json zero = send(json{{"cmd", "MARK"}, {"portfolio_value", "0"}});
  EXPECT_EQ(zero["status"], "error");

  json negative = send(json{{"cmd", "MARK"}, {"portfolio_value", "-5"}});
  EXPECT_EQ(negative["status"], "error");

  json bad_price = send(json{{"cmd", "MARK"},
                             {"portfolio_value", "50000"},
                             {"symbol", "ETH-USD"},
                             {"price", "0"}});
  EXPECT_EQ(bad_price["status"], "error");

  auto summary = engine.registry().summary();
  EXPECT_EQ(summary.portfolio_value, Decimal{100000});
  EXPECT_EQ(summary.peak_value, Decimal{100000});
  EXPECT_TRUE(engine.registry().snapshot().marks.empty());
}

// -----------------------------------------------------------------------------
// 9. ACTIVE lists Pending orders; CANCEL_ALL sweeps the matching ones.
// -----------------------------------------------------------------------------
TEST_F(AdmissionEngineTest, CancelAllAndActiveCommands) {
  send(submitCommand("BTC-USD", "BUY", "1", "100", "btc-1"));
  send(submitCommand("ETH-USD", "BUY", "1", "2000", "eth-1"));
  send(submitCommand("ETH-USD", "SELL", "1", "2100", "eth-2"));
  send(json{{"cmd", "EXECUTE"}, {"order_id", "eth-2"}, {"fill_price", "2100"}});

  json active = send(json{{"cmd", "ACTIVE"}});
  ASSERT_EQ(active["status"], "ok");
  ASSERT_EQ(active["orders"].size(), 2u);
  EXPECT_EQ(active["orders"][0]["id"], "btc-1");
  EXPECT_EQ(active["orders"][1]["id"], "eth-1");

  json eth_only = send(json{{"cmd", "ACTIVE"}, {"symbol", "ETH-USD"}});
  ASSERT_EQ(eth_only["orders"].size(), 1u);
  EXPECT_EQ(eth_only["orders"][0]["id"], "eth-1");

  json other = send(json{{"cmd", "ACTIVE"}, {"strategy", "mean_reversion"}});
  EXPECT_TRUE(other["orders"].empty());

  json swept = send(json{{"cmd", "CANCEL_ALL"},
                         {"strategy", "momentum_strategy"},
                         {"symbol", "ETH-USD"},
                         {"reason", "flatten"}});
  ASSERT_EQ(swept["status"], "ok");
  ASSERT_EQ(swept["orders"].size(), 1u);
  EXPECT_EQ(swept["orders"][0]["id"], "eth-1");
  EXPECT_EQ(swept["orders"][0]["status"], "CANCELED");
  EXPECT_EQ(swept["orders"][0]["cancel_reason"], "flatten");

  json rest = send(json{{"cmd", "CANCEL_ALL"}});
  ASSERT_EQ(rest["orders"].size(), 1u);
  EXPECT_EQ(rest["orders"][0]["id"], "btc-1");
  EXPECT_EQ(rest["orders"][0]["cancel_reason"], "canceled by operator");

  EXPECT_TRUE(send(json{{"cmd", "ACTIVE"}})["orders"].empty());
  EXPECT_EQ(engine.registry().summary().open_reservations, 0u);
}
