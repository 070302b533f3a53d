#pragma once

#include "riskgate/domain/decimal.hpp"
#include "riskgate/domain/order.hpp"
#include "riskgate/domain/position.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/domain/risk_limits.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// Reservation — exposure held by an accepted, not yet settled order
// -----------------------------------------------------------------------------
struct Reservation {
  domain::OrderId order_id;
  std::string strategy_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  domain::Decimal quantity;
  domain::Decimal notional;  // price * quantity at admission
};

bool operator==(const Reservation& a, const Reservation& b);

// -----------------------------------------------------------------------------
// RiskSummary — portfolio-level view for operators and telemetry
// -----------------------------------------------------------------------------
// Exposures value each committed position at the instrument's last mark
// (last executed price unless markPrice() supplied a newer one).
// -----------------------------------------------------------------------------
struct RiskSummary {
  domain::Decimal gross_exposure;  // sum |qty * mark|
  domain::Decimal net_exposure;    // sum qty * mark
  domain::Decimal long_exposure;   // sum over long positions
  domain::Decimal short_exposure;  // sum over short positions (negative)
  domain::Decimal portfolio_value; // last markPortfolio() value
  domain::Decimal peak_value;      // peak inside the current window
  domain::Decimal drawdown_pct;
  domain::Decimal daily_pnl;       // realized, net of commission, today
  std::size_t open_reservations{0};
};

// -----------------------------------------------------------------------------
// RegistrySnapshot — complete comparable registry state
// -----------------------------------------------------------------------------
// Instruments and strategies that hold nothing (flat, no reservation, no
// realized PnL) are omitted, so a slot created while evaluating a rejected
// order does not make two otherwise identical snapshots differ.
// -----------------------------------------------------------------------------
struct RegistrySnapshot {
  struct Instrument {
    domain::Position position;
    domain::Decimal pending_buy;
    domain::Decimal pending_sell;
  };

  struct Strategy {
    std::map<std::string, domain::Decimal> net_quantity;  // per symbol
    domain::Decimal reserved_notional;
  };

  std::map<std::string, Instrument> instruments;
  std::map<std::string, Strategy> strategies;
  std::map<domain::OrderId, Reservation> reservations;
  std::map<std::string, domain::Decimal> marks;

  bool has_portfolio_mark{false};
  domain::Decimal portfolio_value;
  domain::Decimal peak_value;
  std::int64_t window_index{0};
  domain::Decimal daily_pnl;
  std::int64_t day_index{0};
};

bool operator==(const RegistrySnapshot::Instrument& a,
                const RegistrySnapshot::Instrument& b);
bool operator==(const RegistrySnapshot::Strategy& a,
                const RegistrySnapshot::Strategy& b);
bool operator==(const RegistrySnapshot& a, const RegistrySnapshot& b);
inline bool operator!=(const RegistrySnapshot& a, const RegistrySnapshot& b) {
  return !(a == b);
}

// -----------------------------------------------------------------------------
// RiskLimitRegistry — pre-trade limits and the portfolio state behind them
// -----------------------------------------------------------------------------
//
// @brief  Evaluates a candidate order against every configured limit and,
//         on acceptance, reserves the position and exposure it may consume.
//
// @details
// check() evaluates limits in a fixed order and stops at the first failure:
//
//   1. Max order quantity    quantity > max_order_quantity[symbol]
//                            (default_max_order_quantity when unlisted)
//   2. Position limit        |projected| > position_limits[symbol]
//                            BUY:  projected = net + pending_buy + qty
//                            SELL: projected = net - pending_sell - qty
//                            Unlisted symbols pass with a one-time warning,
//                            or fail with UnknownInstrument in strict mode.
//   3. Position value        |projected| * price * 100 / portfolio_value
//                            > max_position_value_pct. Skipped until
//                            markPortfolio() has supplied a positive value.
//   4. Drawdown              (peak - value) * 100 / peak > max_drawdown_pct
//                            inside the current drawdown window. Trips for
//                            every instrument until the window rolls over.
//   5. Daily loss            -daily_pnl >= max_daily_loss for today.
//   6. Strategy exposure     committed + reserved + notional
//                            > strategy_exposure_limits[strategy]
//                            committed = sum |net_qty * mark| per symbol.
//
// Pending reservations in the order's direction count towards the position
// check so two concurrent admissions cannot jointly exceed a cap.
//
// A rejected check changes nothing, including the slot table: the first
// order for a new symbol or strategy is evaluated against a private empty
// slot that is published only if the order is accepted. An accepted check
// records a Reservation under the order id; it is later released by exactly
// one of commit() (execution) or rollback() (cancellation).
//
// The percentage limits are decided with Decimal::compareProducts, so they
// hold for any position value. Any other intermediate that leaves the
// Decimal range rejects the order with InvalidOrder; check() never throws
// on arithmetic.
//
// Fill accounting (commit) follows the usual three cases:
//   - Increasing:  average_price becomes the quantity-weighted average.
//   - Decreasing:  realized_pnl += closed * (fill - avg) * direction.
//   - Reversal:    close the old position fully, open the remainder at the
//                  fill price.
// The realized PnL delta, less commission, is added to today's daily PnL.
//
// Thread model (lock order, outermost first):
//   1. slots_mutex_       shared_mutex, held to find or create a slot, and
//                         exclusively across the whole check of an order
//                         that names a symbol or strategy not yet tracked.
//   2. instrument + strategy slot mutexes, taken together via scoped_lock.
//   3. reservations_mutex_
//   4. portfolio_mutex_   shared_mutex over marks, drawdown and daily PnL.
//   warned_mutex_ is a leaf and is never held while taking another lock.
//
// Orders for different instruments and strategies never share a lock on the
// hot path except the reader side of portfolio_mutex_.
//
// Ownership:
//   Owned by AdmissionEngine. Holds a reference to the clock, which must
//   outlive it.
// -----------------------------------------------------------------------------
class RiskLimitRegistry {
 public:
  RiskLimitRegistry(const domain::RiskLimits& limits,
                    const ITimeProvider& clock);

  RiskLimitRegistry(const RiskLimitRegistry&) = delete;
  RiskLimitRegistry& operator=(const RiskLimitRegistry&) = delete;
  RiskLimitRegistry(RiskLimitRegistry&&) = delete;
  RiskLimitRegistry& operator=(RiskLimitRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // check(order, strategy_id)
  // -------------------------------------------------------------------------
  // @param  order        Candidate order; id, symbol, side, price and
  //                      quantity are read.
  // @param  strategy_id  Strategy whose exposure the order consumes.
  //
  // @return std::nullopt on acceptance (a Reservation now exists under
  //         order.id), otherwise the first failing limit. An id that
  //         already holds a reservation fails with DuplicateOrderId.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  domain::CheckResult check(const domain::Order& order,
                            const std::string& strategy_id);

  // -------------------------------------------------------------------------
  // commit(order_id, executed_price, commission)
  // -------------------------------------------------------------------------
  // @brief  Converts a reservation into a committed fill.
  //
  // @return false if no reservation exists for order_id (already settled
  //         or never accepted). State is unchanged in that case.
  //
  // @throws std::overflow_error if the fill would take the position or its
  //         average price out of the Decimal range. Nothing is changed and
  //         the reservation stays open.
  // -------------------------------------------------------------------------
  bool commit(const domain::OrderId& order_id,
              domain::Decimal executed_price,
              domain::Decimal commission);

  // Releases a reservation without a fill. false if none exists.
  bool rollback(const domain::OrderId& order_id);

  // -------------------------------------------------------------------------
  // hydratePosition(position)
  // -------------------------------------------------------------------------
  // @brief  Seeds a committed position reported by reconciliation.
  //
  // @details
  // Warm-up only: called by AdmissionEngine::start() before orders flow.
  // Overwrites the instrument's committed position; pending quantities are
  // untouched. The position's average price becomes the instrument's mark
  // if it has none yet.
  // -------------------------------------------------------------------------
  void hydratePosition(const domain::Position& position);

  // Adds externally settled PnL (fees, funding, manual trades) to today's
  // daily PnL. Negative amounts are losses.
  void recordRealizedPnl(domain::Decimal amount);

  // -------------------------------------------------------------------------
  // markPortfolio(value)
  // -------------------------------------------------------------------------
  // @brief  Records the portfolio's current mark-to-market value.
  //
  // @details
  // Within one drawdown window the peak only rises. The first mark in a new
  // window resets the peak to that mark, which clears a tripped drawdown
  // breaker.
  // -------------------------------------------------------------------------
  void markPortfolio(domain::Decimal value);

  // Updates the price used to value committed positions of one symbol.
  void markPrice(const std::string& symbol, domain::Decimal price);

  std::optional<domain::Position> position(const std::string& symbol) const;
  std::vector<domain::Position> positions() const;

  // Committed plus reserved notional for one strategy.
  domain::Decimal strategyExposure(const std::string& strategy_id) const;

  RiskSummary summary() const;
  RegistrySnapshot snapshot() const;

  // Symbols and strategies with a slot. Grows on accepted orders and
  // hydrated positions only.
  std::size_t instrumentSlotCount() const;
  std::size_t strategySlotCount() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  struct InstrumentSlot {
    mutable std::mutex mutex;
    domain::Position position;
    domain::Decimal pending_buy;
    domain::Decimal pending_sell;
  };

  struct StrategySlot {
    mutable std::mutex mutex;
    std::unordered_map<std::string, domain::Decimal> net_quantity;
    domain::Decimal reserved_notional;
  };

  InstrumentSlot& instrumentSlot(const std::string& symbol);
  StrategySlot& strategySlot(const std::string& strategy_id);
  InstrumentSlot* findInstrument(const std::string& symbol) const;
  StrategySlot* findStrategy(const std::string& strategy_id) const;

  // Caller holds both slot locks. Evaluates and, on acceptance, records the
  // reservation and applies it to the slots.
  domain::CheckResult evaluateAndReserve(const domain::Order& order,
                                         const std::string& strategy_id,
                                         InstrumentSlot& instrument,
                                         StrategySlot& strategy);

  // Caller holds both slot locks.
  domain::CheckResult evaluate(const domain::Order& order,
                               const std::string& strategy_id,
                               const InstrumentSlot& instrument,
                               const StrategySlot& strategy);

  // Caller holds the strategy slot lock and a portfolio_mutex_ lock.
  domain::Decimal committedExposure(const StrategySlot& strategy) const;

  // Caller holds portfolio_mutex_ exclusively.
  void rollDayIfNeeded(std::int64_t day_index);

  void warnUnknownInstrument(const std::string& symbol);

  static void applyFill(domain::Position& pos,
                        domain::Decimal signed_fill_qty,
                        domain::Decimal fill_price);

  std::int64_t currentDay() const;
  std::int64_t currentWindow() const;

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;

  mutable std::shared_mutex slots_mutex_;
  std::unordered_map<std::string, std::unique_ptr<InstrumentSlot>> instruments_;
  std::unordered_map<std::string, std::unique_ptr<StrategySlot>> strategies_;

  mutable std::mutex reservations_mutex_;
  std::unordered_map<domain::OrderId, Reservation> reservations_;

  mutable std::shared_mutex portfolio_mutex_;
  std::unordered_map<std::string, domain::Decimal> marks_;
  bool has_portfolio_mark_{false};
  domain::Decimal portfolio_value_;
  domain::Decimal peak_value_;
  std::int64_t window_index_{0};
  domain::Decimal daily_pnl_;
  std::int64_t day_index_{0};

  std::mutex warned_mutex_;
  std::unordered_set<std::string> warned_symbols_;
};

}  // namespace riskgate
