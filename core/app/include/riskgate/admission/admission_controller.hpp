#pragma once

#include "riskgate/concurrent/order_id_generator.hpp"
#include "riskgate/domain/order.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/lifecycle/order_lifecycle.hpp"
#include "riskgate/ratelimit/rate_limiter.hpp"
#include "riskgate/risk/risk_limit_registry.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// AdmissionStats — counters since construction
// -----------------------------------------------------------------------------
struct AdmissionStats {
  std::uint64_t accepted{0};
  std::array<std::uint64_t, domain::kErrorCodeCount> rejected{};

  std::uint64_t rejectedFor(domain::ErrorCode code) const {
    return rejected[static_cast<std::size_t>(code)];
  }

  std::uint64_t totalRejected() const {
    std::uint64_t total = 0;
    for (std::uint64_t n : rejected) {
      total += n;
    }
    return total;
  }
};

// -----------------------------------------------------------------------------
// AdmissionController — the single entry point for new orders
// -----------------------------------------------------------------------------
//
// @brief  Runs a candidate order through every gate and, if all pass, hands
//         it to the OrderLifecycle as Pending.
//
// @details
// submitOrder() evaluates, in order:
//
//   1. Kill switch            halted → TradingHalted
//   2. Candidate validation   empty symbol, price <= 0, quantity <= 0,
//                             price * quantity out of Decimal range
//                             → InvalidOrder
//   3. Identifier             empty id → next OrderIdGenerator value not
//                             already known to the lifecycle;
//                             id already known → DuplicateOrderId
//   4. RateLimiter            tryAcquire(exchange, Order)
//   5. RiskLimitRegistry      check(order, strategy_id), reserving on accept
//   6. OrderLifecycle         submit(order) → Pending
//
// The first failure is returned unchanged from the component that raised
// it. Nothing is left behind by a rejected candidate: a rate token taken in
// step 4 is refunded when step 5 or 6 fails, and a reservation made in
// step 5 is rolled back when step 6 fails.
//
// Nothing here throws on a rejection; every outcome is an OrderResult.
//
// Kill switch:
//   haltTrading() refuses every subsequent submission until
//   resumeTrading(). Orders already Pending can still be executed or
//   canceled, so an operator can flatten the book while halted.
//
// Thread model:
//   Safe to call from any number of threads. The controller itself keeps
//   only atomics (halt flag, counters); all serialization happens inside
//   the components it calls.
//
// Ownership:
//   Owned by AdmissionEngine. Holds references to the components, which
//   must outlive it.
// -----------------------------------------------------------------------------
class AdmissionController {
 public:
  AdmissionController(RateLimiter& rate_limiter,
                      RiskLimitRegistry& registry,
                      OrderLifecycle& lifecycle,
                      OrderIdGenerator& id_gen);

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;
  AdmissionController(AdmissionController&&) = delete;
  AdmissionController& operator=(AdmissionController&&) = delete;

  // -------------------------------------------------------------------------
  // submitOrder(candidate, strategy_id, exchange)
  // -------------------------------------------------------------------------
  // @param  candidate    id (may be empty), symbol, side, price, quantity.
  //                      Its strategy_id and exchange are overwritten by
  //                      the arguments.
  // @param  strategy_id  Strategy whose exposure cap applies.
  // @param  exchange     Venue whose rate limits apply.
  //
  // @return The Pending order on acceptance, else the first Rejection.
  // -------------------------------------------------------------------------
  domain::OrderResult submitOrder(const domain::Order& candidate,
                                  const std::string& strategy_id,
                                  const std::string& exchange);

  // Pass-throughs to the OrderLifecycle; failures are counted in stats().
  domain::OrderResult execute(const domain::OrderId& order_id,
                              domain::Decimal fill_price);
  domain::OrderResult cancel(const domain::OrderId& order_id,
                             const std::string& reason);

  // Operator sweep; see OrderLifecycle::cancelAll(). Allowed while halted.
  std::vector<domain::Order> cancelAll(const std::string& strategy_id,
                                       const std::string& symbol,
                                       const std::string& reason);

  // -------------------------------------------------------------------------
  // queryAllowed(exchange)
  // -------------------------------------------------------------------------
  // @brief  Meters a non-order API call (balances, order status, market
  //         data) against the exchange's queries_per_minute bucket.
  //
  // Not affected by the kill switch.
  // -------------------------------------------------------------------------
  domain::CheckResult queryAllowed(const std::string& exchange);

  // -------------------------------------------------------------------------
  // haltTrading() / resumeTrading()
  // -------------------------------------------------------------------------
  // Operator kill switch. Thread-safety: atomic; safe from any thread.
  // -------------------------------------------------------------------------
  void haltTrading();
  void resumeTrading();
  bool isHalted() const;

  AdmissionStats stats() const;

 private:
  static domain::CheckResult validate(const domain::Order& candidate);

  domain::OrderResult rejected(const domain::Order& order,
                               domain::Rejection rejection);
  void count(domain::ErrorCode code);

  RateLimiter& rate_limiter_;
  RiskLimitRegistry& registry_;
  OrderLifecycle& lifecycle_;
  OrderIdGenerator& id_gen_;

  std::atomic<bool> halt_trading_{false};

  std::atomic<std::uint64_t> accepted_{0};
  std::array<std::atomic<std::uint64_t>, domain::kErrorCodeCount> rejected_{};
};

}  // namespace riskgate
