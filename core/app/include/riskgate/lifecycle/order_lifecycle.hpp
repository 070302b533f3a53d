#pragma once

#include "riskgate/cost/cost_model.hpp"
#include "riskgate/domain/order.hpp"
#include "riskgate/domain/order_status.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/lifecycle/i_transition_sink.hpp"
#include "riskgate/risk/risk_limit_registry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// OrderLifecycle — order state machine and audit book
// -----------------------------------------------------------------------------
//
// @brief  Owns the authoritative copy of every admitted order and moves it
//         through Pending → Executed | Canceled.
//
// @details
// Every transition is compare-and-transition under the order's own mutex:
//
//   1. Look up the order. Unknown id → UnknownOrder.
//   2. Lock it. If its status cannot move to the requested state →
//      InvalidTransition(from, attempted); nothing changes.
//   3. Settle the registry reservation (commit on execute, rollback on
//      cancel) while still holding the lock.
//   4. Write the new status, unlock, notify sinks.
//
// Because the lock covers step 3, execute() and cancel() racing on the same
// order cannot both succeed, and the reservation is settled exactly once.
//
// Orders are never erased. Terminal orders stay available through order()
// and orders() for audit.
//
// Thread model:
//   The id → record map is guarded by a shared_mutex (shared to look up,
//   exclusive to insert). Each record has its own mutex, so transitions on
//   different orders run in parallel. Sinks are called with no lifecycle
//   lock held.
//
// Ownership:
//   Owned by AdmissionEngine. Holds references to the RiskLimitRegistry and
//   CostModel, which must outlive it. Sinks are non-owning pointers.
// -----------------------------------------------------------------------------
class OrderLifecycle {
 public:
  OrderLifecycle(RiskLimitRegistry& registry, const CostModel& cost_model);

  OrderLifecycle(const OrderLifecycle&) = delete;
  OrderLifecycle& operator=(const OrderLifecycle&) = delete;
  OrderLifecycle(OrderLifecycle&&) = delete;
  OrderLifecycle& operator=(OrderLifecycle&&) = delete;

  // -------------------------------------------------------------------------
  // submit(order)
  // -------------------------------------------------------------------------
  // @brief  Records an accepted order as Pending.
  //
  // @details
  // Called by the AdmissionController only after RiskLimitRegistry::check()
  // has accepted the order and reserved its exposure. The status, executed
  // price, commission and cancel reason of the argument are reset.
  //
  // @return The stored Pending order, or DuplicateOrderId.
  // -------------------------------------------------------------------------
  domain::OrderResult submit(const domain::Order& order);

  // -------------------------------------------------------------------------
  // execute(order_id, fill_price)
  // -------------------------------------------------------------------------
  // @brief  Pending → Executed. Prices the fill through the CostModel and
  //         commits the reservation at the executed price.
  //
  // @return The executed order, or InvalidOrder (fill_price <= 0, or a
  //         fill whose executed price or PnL is out of Decimal range; the
  //         order then stays Pending), UnknownOrder, InvalidTransition.
  // -------------------------------------------------------------------------
  domain::OrderResult execute(const domain::OrderId& order_id,
                              domain::Decimal fill_price);

  // -------------------------------------------------------------------------
  // cancel(order_id, reason)
  // -------------------------------------------------------------------------
  // @brief  Pending → Canceled. Rolls back the reservation.
  //
  // @details
  // Venue-side execution failures are reported through cancel() with the
  // failure as the reason.
  //
  // @return The canceled order, or UnknownOrder, InvalidTransition.
  // -------------------------------------------------------------------------
  domain::OrderResult cancel(const domain::OrderId& order_id,
                             const std::string& reason);

  std::optional<domain::Order> order(const domain::OrderId& order_id) const;
  bool contains(const domain::OrderId& order_id) const;

  // Every order ever submitted, in submission order.
  std::vector<domain::Order> orders() const;

  // Pending orders in submission order. An empty filter matches any value.
  std::vector<domain::Order> activeOrders(const std::string& strategy_id = "",
                                          const std::string& symbol = "") const;

  // -------------------------------------------------------------------------
  // cancelAll(strategy_id, symbol, reason)
  // -------------------------------------------------------------------------
  // @brief  Cancels every Pending order matching the filters (empty matches
  //         any value), each through cancel() so sinks and the registry see
  //         one transition per order.
  //
  // Orders executed or canceled concurrently are skipped.
  //
  // @return The orders this call canceled, in submission order.
  // -------------------------------------------------------------------------
  std::vector<domain::Order> cancelAll(const std::string& strategy_id,
                                       const std::string& symbol,
                                       const std::string& reason);

  std::size_t openOrderCount() const { return open_count_.load(); }

  // Sinks are notified in registration order. Adding the same sink twice
  // is a no-op.
  void addSink(ITransitionSink* sink);
  void removeSink(ITransitionSink* sink);

  // -------------------------------------------------------------------------
  // canTransition(from, to)
  // -------------------------------------------------------------------------
  // Legal transitions:
  //   Pending  → Executed, Canceled
  //   Executed → (none, terminal)
  //   Canceled → (none, terminal)
  // -------------------------------------------------------------------------
  static bool canTransition(domain::OrderStatus from, domain::OrderStatus to);
  static bool isTerminal(domain::OrderStatus status);

 private:
  struct Record {
    mutable std::mutex mutex;
    std::uint64_t sequence{0};
    domain::Order order;
  };

  Record* find(const domain::OrderId& order_id) const;
  std::vector<Record*> recordsInSequence() const;

  static bool matches(const domain::Order& order,
                      const std::string& strategy_id,
                      const std::string& symbol);

  void notify(const domain::Order& order, domain::OrderStatus from,
              domain::OrderStatus to);

  static domain::Rejection unknownOrder(const domain::OrderId& order_id);
  static domain::Rejection invalidTransition(const domain::Order& order,
                                             domain::OrderStatus attempted);

  RiskLimitRegistry& registry_;
  const CostModel& cost_model_;

  mutable std::shared_mutex orders_mutex_;
  std::unordered_map<domain::OrderId, std::unique_ptr<Record>> orders_;
  std::uint64_t next_sequence_{0};  // guarded by orders_mutex_

  std::atomic<std::size_t> open_count_{0};

  mutable std::shared_mutex sinks_mutex_;
  std::vector<ITransitionSink*> sinks_;
};

}  // namespace riskgate
