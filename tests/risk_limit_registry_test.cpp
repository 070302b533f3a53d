// =============================================================================
// risk_limit_registry_test.cpp
// =============================================================================
// Unit tests for riskgate::RiskLimitRegistry.
//
// Validates:
//   - Each limit in isolation, with the observed value and limit reported
//   - The fixed evaluation order when an order breaks several limits
//   - Pending reservations count towards the position cap
//   - A rejected check leaves the registry exactly as it was
//   - commit() fill accounting (increase, decrease, flat, reversal) and the
//     daily PnL it feeds
//   - rollback() releases a reservation exactly once
//   - Day and drawdown-window rollover on the simulated clock
//   - Concurrent admissions never jointly exceed a position cap
//   - Limits are decided exactly for values whose intermediate products
//     leave the Decimal range, and such orders are never admitted
//   - Slots for new symbols and strategies appear only on acceptance
// =============================================================================

#include "riskgate/risk/risk_limit_registry.hpp"
#include "riskgate/time/simulation_time_provider.hpp"
#include "riskgate/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using riskgate::RegistrySnapshot;
using riskgate::RiskLimitRegistry;
using riskgate::RiskSummary;
using riskgate::domain::Decimal;
using riskgate::domain::ErrorCode;
using riskgate::domain::Order;
using riskgate::domain::Position;
using riskgate::domain::RiskLimits;
using riskgate::domain::Side;

namespace {

// Noon UTC, so twelve hours later is the next trading day.
constexpr std::int64_t kNoon = 19676 * riskgate::kMillisPerDay +
                               12 * riskgate::kMillisPerHour;

Decimal dec(const char* text) { return Decimal::parse(text).value(); }

Order makeOrder(const std::string& id, const std::string& symbol, Side side,
                Decimal quantity, Decimal price) {
  Order o;
  o.id = id;
  o.strategy_id = "default";
  o.exchange = "Binance";
  o.symbol = symbol;
  o.side = side;
  o.quantity = quantity;
  o.price = price;
  return o;
}

Position makePosition(const std::string& symbol, Decimal qty, Decimal avg) {
  Position p;
  p.symbol = symbol;
  p.net_quantity = qty;
  p.average_price = avg;
  return p;
}

}  // namespace

class RiskLimitRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    limits.position_limits["BTC-USD"] = Decimal{10};
    limits.position_limits["ETH-USD"] = Decimal{100};
    limits.max_order_quantity["BTC-USD"] = Decimal{5};
    limits.default_max_order_quantity = Decimal{1000};
    limits.max_position_value_pct = Decimal{20};
    limits.max_drawdown_pct = Decimal{5};
    limits.drawdown_window_days = 1;
    limits.max_daily_loss = Decimal{1000};
    limits.strategy_exposure_limits["alpha"] = Decimal{50000};
  }

  RiskLimits limits;
  riskgate::SimulationTimeProvider clock{kNoon};
};

// -----------------------------------------------------------------------------
// 1. Holding 8 BTC with a cap of 10: BUY 3 is refused (projected 11),
//    BUY 2 reaches the cap exactly and passes.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, PositionLimitCountsCommittedPosition) {
  RiskLimitRegistry registry(limits, clock);
  registry.hydratePosition(makePosition("BTC-USD", Decimal{8}, Decimal{30000}));

  auto rejection = registry.check(
      makeOrder("A", "BTC-USD", Side::Buy, Decimal{3}, Decimal{30000}), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::PositionLimitExceeded);
  EXPECT_EQ(rejection->observed, Decimal{11});
  EXPECT_EQ(rejection->limit, Decimal{10});

  EXPECT_FALSE(registry
                   .check(makeOrder("B", "BTC-USD", Side::Buy, Decimal{2},
                                    Decimal{30000}),
                          "s0")
                   .has_value());
}

// -----------------------------------------------------------------------------
// 2. Pending reservations in the order's direction count; the opposite side
//    does not.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, PendingReservationsCountTowardsCap) {
  RiskLimitRegistry registry(limits, clock);

  EXPECT_FALSE(registry.check(makeOrder("B1", "BTC-USD", Side::Buy, Decimal{5}, Decimal{100}), "s0"));
  EXPECT_FALSE(registry.check(makeOrder("B2", "BTC-USD", Side::Buy, Decimal{5}, Decimal{100}), "s0"));

  auto rejection = registry.check(
      makeOrder("B3", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::PositionLimitExceeded);
  EXPECT_EQ(rejection->observed, Decimal{11});

  EXPECT_FALSE(registry.check(makeOrder("S1", "BTC-USD", Side::Sell, Decimal{5}, Decimal{100}), "s0"));

  RegistrySnapshot snap = registry.snapshot();
  EXPECT_EQ(snap.instruments.at("BTC-USD").pending_buy, Decimal{10});
  EXPECT_EQ(snap.instruments.at("BTC-USD").pending_sell, Decimal{5});
  EXPECT_EQ(snap.reservations.size(), 3u);
}

// -----------------------------------------------------------------------------
// 3. Max order quantity, per symbol and by default.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, MaxOrderQuantity) {
  RiskLimitRegistry registry(limits, clock);

  auto listed = registry.check(
      makeOrder("A", "BTC-USD", Side::Buy, Decimal{6}, Decimal{100}), "s0");
  ASSERT_TRUE(listed.has_value());
  EXPECT_EQ(listed->code, ErrorCode::MaxOrderQuantityExceeded);
  EXPECT_EQ(listed->limit, Decimal{5});

  auto unlisted = registry.check(
      makeOrder("B", "ETH-USD", Side::Sell, Decimal{1001}, Decimal{100}), "s0");
  ASSERT_TRUE(unlisted.has_value());
  EXPECT_EQ(unlisted->code, ErrorCode::MaxOrderQuantityExceeded);
  EXPECT_EQ(unlisted->limit, Decimal{1000});
}

// -----------------------------------------------------------------------------
// 4. Instruments without a position limit: uncapped by default, refused in
//    strict mode.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, UnknownInstrumentLenientAndStrict) {
  {
    RiskLimitRegistry registry(limits, clock);
    EXPECT_FALSE(registry.check(makeOrder("A", "DOGE-USD", Side::Buy, Decimal{500}, dec("0.1")), "s0"));
    EXPECT_FALSE(registry.check(makeOrder("B", "DOGE-USD", Side::Buy, Decimal{500}, dec("0.1")), "s0"));
  }

  limits.reject_unknown_instruments = true;
  RiskLimitRegistry strict(limits, clock);
  auto rejection = strict.check(
      makeOrder("A", "DOGE-USD", Side::Buy, Decimal{1}, dec("0.1")), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::UnknownInstrument);
}

// -----------------------------------------------------------------------------
// 5. Position value as a share of the portfolio, once a mark exists.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, PortfolioValuePercentage) {
  RiskLimitRegistry registry(limits, clock);

  // No mark yet: skipped.
  EXPECT_FALSE(registry.check(makeOrder("A", "ETH-USD", Side::Buy, Decimal{10}, Decimal{2500}), "s0"));
  ASSERT_TRUE(registry.rollback("A"));

  registry.markPortfolio(Decimal{100000});

  auto rejection = registry.check(
      makeOrder("B", "ETH-USD", Side::Buy, Decimal{10}, Decimal{2500}), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::PortfolioValueLimitExceeded);
  EXPECT_EQ(rejection->observed, Decimal{25});
  EXPECT_EQ(rejection->limit, Decimal{20});

  EXPECT_FALSE(registry.check(makeOrder("C", "ETH-USD", Side::Buy, Decimal{8}, Decimal{2500}), "s0"));
}

// -----------------------------------------------------------------------------
// 6. Drawdown trips every instrument until the window rolls over; a new
//    window's first mark resets the peak.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, DrawdownBreakerAndWindowRollover) {
  RiskLimitRegistry registry(limits, clock);
  registry.markPortfolio(Decimal{100000});
  registry.markPortfolio(Decimal{95000});

  // Exactly 5%: not strictly greater.
  EXPECT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));

  registry.markPortfolio(Decimal{94000});
  for (const char* symbol : {"BTC-USD", "ETH-USD", "DOGE-USD"}) {
    auto rejection = registry.check(
        makeOrder(std::string("D-") + symbol, symbol, Side::Sell, Decimal{1},
                  Decimal{100}),
        "s0");
    ASSERT_TRUE(rejection.has_value()) << symbol;
    EXPECT_EQ(rejection->code, ErrorCode::DrawdownBreached) << symbol;
    EXPECT_EQ(rejection->observed, Decimal{6});
  }

  // Peak does not fall back within the window.
  registry.markPortfolio(Decimal{96000});
  EXPECT_EQ(registry.summary().peak_value, Decimal{100000});

  clock.advance_by(12 * riskgate::kMillisPerHour);
  EXPECT_FALSE(registry.check(makeOrder("B", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));

  registry.markPortfolio(Decimal{90000});
  RiskSummary s = registry.summary();
  EXPECT_EQ(s.peak_value, Decimal{90000});
  EXPECT_TRUE(s.drawdown_pct.isZero());
}

// -----------------------------------------------------------------------------
// 7. Daily loss at the maximum refuses everything until the next day.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, DailyLossBreakerAndDayRollover) {
  RiskLimitRegistry registry(limits, clock);

  registry.recordRealizedPnl(Decimal{-999});
  EXPECT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));

  registry.recordRealizedPnl(Decimal{-1});
  for (const char* symbol : {"BTC-USD", "ETH-USD"}) {
    auto rejection = registry.check(
        makeOrder(std::string("L-") + symbol, symbol, Side::Buy, Decimal{1},
                  Decimal{100}),
        "s0");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->code, ErrorCode::DailyLossBreached);
    EXPECT_EQ(rejection->observed, Decimal{1000});
  }

  clock.advance_by(12 * riskgate::kMillisPerHour);
  EXPECT_TRUE(registry.summary().daily_pnl.isZero());
  EXPECT_FALSE(registry.check(makeOrder("B", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));
}

// -----------------------------------------------------------------------------
// 8. Strategy exposure: committed at mark + reserved + this order.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, StrategyExposureLimit) {
  RiskLimitRegistry registry(limits, clock);

  EXPECT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{30000}), "alpha"));
  EXPECT_EQ(registry.strategyExposure("alpha"), Decimal{30000});

  auto rejection = registry.check(
      makeOrder("B", "BTC-USD", Side::Buy, Decimal{1}, Decimal{30000}), "alpha");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::StrategyExposureExceeded);
  EXPECT_EQ(rejection->observed, Decimal{60000});
  EXPECT_EQ(rejection->limit, Decimal{50000});

  // Other strategies are unaffected.
  EXPECT_FALSE(registry.check(makeOrder("C", "BTC-USD", Side::Buy, Decimal{1}, Decimal{30000}), "beta"));

  ASSERT_TRUE(registry.commit("A", Decimal{30000}, Decimal{}));
  EXPECT_EQ(registry.strategyExposure("alpha"), Decimal{30000});
  EXPECT_FALSE(registry.check(makeOrder("D", "BTC-USD", Side::Buy, Decimal{1}, Decimal{20000}), "alpha"));

  // A new mark revalues the committed leg.
  registry.markPrice("BTC-USD", Decimal{40000});
  EXPECT_EQ(registry.strategyExposure("alpha"), Decimal{60000});
}

// -----------------------------------------------------------------------------
// 9. The first failing limit in evaluation order is the one reported.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, EvaluationOrderReportsFirstFailure) {
  RiskLimitRegistry registry(limits, clock);
  registry.hydratePosition(makePosition("BTC-USD", Decimal{8}, Decimal{100}));

  // Quantity before position.
  auto r1 = registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{6}, Decimal{100}), "s0");
  ASSERT_TRUE(r1.has_value());
  EXPECT_EQ(r1->code, ErrorCode::MaxOrderQuantityExceeded);

  // Position before the portfolio breakers.
  registry.markPortfolio(Decimal{100000});
  registry.markPortfolio(Decimal{50000});
  registry.recordRealizedPnl(Decimal{-5000});
  auto r2 = registry.check(makeOrder("B", "BTC-USD", Side::Buy, Decimal{3}, Decimal{100}), "s0");
  ASSERT_TRUE(r2.has_value());
  EXPECT_EQ(r2->code, ErrorCode::PositionLimitExceeded);

  // Portfolio value before drawdown.
  auto r3 = registry.check(makeOrder("C", "ETH-USD", Side::Buy, Decimal{11}, Decimal{1000}), "alpha");
  ASSERT_TRUE(r3.has_value());
  EXPECT_EQ(r3->code, ErrorCode::PortfolioValueLimitExceeded);

  // Drawdown before daily loss.
  auto r5 = registry.check(makeOrder("E", "ETH-USD", Side::Buy, Decimal{1}, Decimal{100}), "alpha");
  ASSERT_TRUE(r5.has_value());
  EXPECT_EQ(r5->code, ErrorCode::DrawdownBreached);

  // Next day: a fresh window clears the drawdown, a fresh loss trips the
  // daily breaker.
  clock.advance_by(12 * riskgate::kMillisPerHour);
  registry.recordRealizedPnl(Decimal{-5000});
  registry.markPortfolio(Decimal{50000});
  auto r6 = registry.check(makeOrder("F", "ETH-USD", Side::Buy, Decimal{1}, Decimal{100}), "alpha");
  ASSERT_TRUE(r6.has_value());
  EXPECT_EQ(r6->code, ErrorCode::DailyLossBreached);
}

// -----------------------------------------------------------------------------
// 10. commit(): weighted average, partial close, reversal; daily PnL is
//     realized PnL net of commission.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, CommitFillAccounting) {
  RiskLimitRegistry registry(limits, clock);

  auto fill = [&registry](const std::string& id, Side side, int qty,
                          int price) {
    ASSERT_FALSE(registry.check(makeOrder(id, "ETH-USD", side, Decimal{qty},
                                          Decimal{price}),
                                "s0"));
    ASSERT_TRUE(registry.commit(id, Decimal{price}, Decimal{1}));
  };

  fill("F1", Side::Buy, 2, 100);
  fill("F2", Side::Buy, 2, 200);
  auto pos = registry.position("ETH-USD");
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->net_quantity, Decimal{4});
  EXPECT_EQ(pos->average_price, Decimal{150});

  fill("F3", Side::Sell, 1, 250);
  pos = registry.position("ETH-USD");
  EXPECT_EQ(pos->net_quantity, Decimal{3});
  EXPECT_EQ(pos->average_price, Decimal{150});
  EXPECT_EQ(pos->realized_pnl, Decimal{100});

  // Reversal: close 3 at a 100 loss each, open 2 short at 50.
  fill("F4", Side::Sell, 5, 50);
  pos = registry.position("ETH-USD");
  EXPECT_EQ(pos->net_quantity, Decimal{-2});
  EXPECT_EQ(pos->average_price, Decimal{50});
  EXPECT_EQ(pos->realized_pnl, Decimal{-200});

  EXPECT_EQ(registry.summary().daily_pnl, Decimal{-204});
  EXPECT_EQ(registry.summary().open_reservations, 0u);
}

TEST_F(RiskLimitRegistryTest, ClosingToFlatResetsAveragePrice) {
  RiskLimitRegistry registry(limits, clock);

  ASSERT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));
  ASSERT_TRUE(registry.commit("A", Decimal{100}, Decimal{}));
  ASSERT_FALSE(registry.check(makeOrder("B", "BTC-USD", Side::Sell, Decimal{1}, Decimal{110}), "s0"));
  ASSERT_TRUE(registry.commit("B", Decimal{110}, Decimal{}));

  auto pos = registry.position("BTC-USD");
  ASSERT_TRUE(pos.has_value());
  EXPECT_TRUE(pos->net_quantity.isZero());
  EXPECT_TRUE(pos->average_price.isZero());
  EXPECT_EQ(pos->realized_pnl, Decimal{10});
}

// -----------------------------------------------------------------------------
// 11. A rejected check changes nothing.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, RejectedCheckLeavesStateUnchanged) {
  RiskLimitRegistry registry(limits, clock);
  registry.hydratePosition(makePosition("BTC-USD", Decimal{8}, Decimal{100}));
  ASSERT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "alpha"));

  RegistrySnapshot before = registry.snapshot();

  EXPECT_TRUE(registry.check(makeOrder("B", "BTC-USD", Side::Buy, Decimal{2}, Decimal{100}), "alpha"));
  EXPECT_TRUE(registry.check(makeOrder("C", "ETH-USD", Side::Buy, Decimal{1}, Decimal{60000}), "alpha"));
  EXPECT_TRUE(registry.check(makeOrder("D", "BTC-USD", Side::Sell, Decimal{6}, Decimal{100}), "beta"));

  EXPECT_EQ(registry.snapshot(), before);
}

// -----------------------------------------------------------------------------
// 12. rollback() and commit() settle a reservation exactly once.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, ReservationSettlesOnce) {
  RiskLimitRegistry registry(limits, clock);
  RegistrySnapshot empty = registry.snapshot();

  ASSERT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{2}, Decimal{100}), "alpha"));
  EXPECT_NE(registry.snapshot(), empty);

  EXPECT_TRUE(registry.rollback("A"));
  EXPECT_EQ(registry.snapshot(), empty);

  EXPECT_FALSE(registry.rollback("A"));
  EXPECT_FALSE(registry.commit("A", Decimal{100}, Decimal{}));
  EXPECT_FALSE(registry.commit("never-seen", Decimal{100}, Decimal{}));
}

TEST_F(RiskLimitRegistryTest, DuplicateReservationIdIsRefused) {
  RiskLimitRegistry registry(limits, clock);
  ASSERT_FALSE(registry.check(makeOrder("A", "BTC-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0"));

  auto rejection = registry.check(
      makeOrder("A", "ETH-USD", Side::Buy, Decimal{1}, Decimal{100}), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::DuplicateOrderId);
}

// -----------------------------------------------------------------------------
// 13. Exposures in summary() use the latest mark.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, SummaryValuesPositionsAtMark) {
  RiskLimitRegistry registry(limits, clock);
  registry.hydratePosition(makePosition("BTC-USD", Decimal{2}, Decimal{30000}));
  registry.hydratePosition(makePosition("ETH-USD", Decimal{-10}, Decimal{2000}));
  registry.hydratePosition(makePosition("SOL-USD", Decimal{}, Decimal{}));
  registry.markPrice("BTC-USD", Decimal{31000});

  RiskSummary s = registry.summary();
  EXPECT_EQ(s.gross_exposure, Decimal{82000});
  EXPECT_EQ(s.net_exposure, Decimal{42000});
  EXPECT_EQ(s.long_exposure, Decimal{62000});
  EXPECT_EQ(s.short_exposure, Decimal{-20000});

  EXPECT_EQ(registry.positions().size(), 2u);
}

// -----------------------------------------------------------------------------
// 14. Concurrent admissions on one instrument stop exactly at the cap.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, ConcurrentChecksNeverExceedCap) {
  RiskLimitRegistry registry(limits, clock);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 20;
  std::atomic<int> accepted{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&registry, &accepted, t] {
      for (int i = 0; i < kPerThread; ++i) {
        std::string id = "T" + std::to_string(t) + "-" + std::to_string(i);
        if (!registry.check(makeOrder(id, "BTC-USD", Side::Buy, Decimal{1},
                                      Decimal{100}),
                            "s" + std::to_string(t))) {
          accepted.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(accepted.load(), 10);
  EXPECT_EQ(registry.snapshot().instruments.at("BTC-USD").pending_buy,
            Decimal{10});
}

// -----------------------------------------------------------------------------
// 15. Large books: 1,000,000 @ 1000 against a 2e9 portfolio is 50% of it,
//     refused under a 20% cap even though value * 100 leaves the Decimal
//     range.
// -----------------------------------------------------------------------------
TEST(RiskLimitRegistryLargeValueTest, PortfolioPercentageDecidedExactly) {
  riskgate::SimulationTimeProvider clock{kNoon};
  RiskLimits big;
  big.max_position_value_pct = Decimal{20};
  RiskLimitRegistry registry(big, clock);
  registry.markPortfolio(Decimal::fromUnits(2000000000));

  auto rejection = registry.check(
      makeOrder("A", "XYZ", Side::Buy, Decimal{1000000}, Decimal{1000}), "s0");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::PortfolioValueLimitExceeded);
  EXPECT_EQ(rejection->observed, Decimal{50});
  EXPECT_EQ(rejection->limit, Decimal{20});

  // 400,000 @ 1000 is exactly 20%: at the cap, admitted.
  EXPECT_FALSE(registry.check(
      makeOrder("B", "XYZ", Side::Buy, Decimal{400000}, Decimal{1000}), "s0"));
}

TEST(RiskLimitRegistryLargeValueTest, UnrepresentableNotionalIsNeverAdmitted) {
  riskgate::SimulationTimeProvider clock{kNoon};
  RiskLimits big;
  big.strategy_exposure_limits["alpha"] = Decimal{500000};
  RiskLimitRegistry registry(big, clock);
  RegistrySnapshot empty = registry.snapshot();

  // 1,000,000 @ 100,000 = 1e11, beyond the Decimal range.
  auto rejection = registry.check(
      makeOrder("A", "XYZ", Side::Buy, Decimal{1000000}, Decimal{100000}),
      "alpha");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::InvalidOrder);
  EXPECT_EQ(registry.snapshot(), empty);
  EXPECT_EQ(registry.strategyExposure("alpha"), Decimal{});
}

TEST(RiskLimitRegistryLargeValueTest, ExposureSumBeyondRangeIsRefused) {
  riskgate::SimulationTimeProvider clock{kNoon};
  RiskLimits big;
  big.strategy_exposure_limits["alpha"] = Decimal::fromUnits(90000000000);
  RiskLimitRegistry registry(big, clock);

  // Each order is 5e10 of notional; two of them no longer fit in a Decimal.
  ASSERT_FALSE(registry.check(
      makeOrder("A", "XYZ", Side::Buy, Decimal{500000}, Decimal{100000}),
      "alpha"));
  RegistrySnapshot before = registry.snapshot();

  auto rejection = registry.check(
      makeOrder("B", "XYZ", Side::Buy, Decimal{500000}, Decimal{100000}),
      "alpha");
  ASSERT_TRUE(rejection.has_value());
  EXPECT_EQ(rejection->code, ErrorCode::StrategyExposureExceeded);
  EXPECT_EQ(rejection->observed, Decimal::largest());
  EXPECT_EQ(registry.snapshot(), before);
}

// -----------------------------------------------------------------------------
// 16. A rejected order for a symbol or strategy never seen before leaves no
//     slot behind; an accepted one creates exactly one of each.
// -----------------------------------------------------------------------------
TEST_F(RiskLimitRegistryTest, RejectedNewKeysCreateNoSlots) {
  RiskLimitRegistry registry(limits, clock);
  ASSERT_EQ(registry.instrumentSlotCount(), 0u);
  ASSERT_EQ(registry.strategySlotCount(), 0u);

  for (int i = 0; i < 50; ++i) {
    std::string n = std::to_string(i);
    auto rejection = registry.check(
        makeOrder("R" + n, "SYM-" + n, Side::Buy, Decimal{5000}, Decimal{1}),
        "strategy-" + n);
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->code, ErrorCode::MaxOrderQuantityExceeded);
  }
  EXPECT_EQ(registry.instrumentSlotCount(), 0u);
  EXPECT_EQ(registry.strategySlotCount(), 0u);

  ASSERT_FALSE(registry.check(
      makeOrder("A", "SOL-USD", Side::Buy, Decimal{1}, Decimal{20}), "gamma"));
  EXPECT_EQ(registry.instrumentSlotCount(), 1u);
  EXPECT_EQ(registry.strategySlotCount(), 1u);

  // Known symbol, new strategy, rejected: still only the accepted slots.
  EXPECT_TRUE(registry.check(
      makeOrder("B", "SOL-USD", Side::Buy, Decimal{5000}, Decimal{20}), "delta"));
  EXPECT_EQ(registry.instrumentSlotCount(), 1u);
  EXPECT_EQ(registry.strategySlotCount(), 1u);
}
