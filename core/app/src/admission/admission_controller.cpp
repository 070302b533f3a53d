#include "riskgate/admission/admission_controller.hpp"

#include <iostream>

namespace riskgate {

using domain::ErrorCode;

AdmissionController::AdmissionController(RateLimiter& rate_limiter,
                                         RiskLimitRegistry& registry,
                                         OrderLifecycle& lifecycle,
                                         OrderIdGenerator& id_gen)
    : rate_limiter_(rate_limiter),
      registry_(registry),
      lifecycle_(lifecycle),
      id_gen_(id_gen) {}

// -----------------------------------------------------------------------------
// validate: shape checks that need no shared state
// -----------------------------------------------------------------------------
domain::CheckResult AdmissionController::validate(
    const domain::Order& candidate) {
  domain::Rejection r;
  r.code = ErrorCode::InvalidOrder;

  if (candidate.symbol.empty()) {
    r.message = "symbol must not be empty";
    return r;
  }
  if (!candidate.price.isPositive()) {
    r.message = "price must be positive, got " + candidate.price.toString();
    r.observed = candidate.price;
    return r;
  }
  if (!candidate.quantity.isPositive()) {
    r.message = "quantity must be positive, got " +
                candidate.quantity.toString();
    r.observed = candidate.quantity;
    return r;
  }
  if (!domain::Decimal::tryMultiply(candidate.price, candidate.quantity)) {
    r.message = "notional of " + candidate.quantity.toString() + " @ " +
                candidate.price.toString() + " is out of range";
    r.observed = candidate.quantity;
    return r;
  }
  return std::nullopt;
}

void AdmissionController::count(ErrorCode code) {
  rejected_[static_cast<std::size_t>(code)].fetch_add(
      1, std::memory_order_relaxed);
}

domain::OrderResult AdmissionController::rejected(const domain::Order& order,
                                                  domain::Rejection rejection) {
  count(rejection.code);
  std::cerr << "[AdmissionController] REJECTED " << toString(rejection.code)
            << " id=" << (order.id.empty() ? "<unassigned>" : order.id)
            << " " << toString(order.side) << " " << order.quantity << " "
            << order.symbol << " @ " << order.price << ": "
            << rejection.message << "\n";
  return rejection;
}

// -----------------------------------------------------------------------------
// submitOrder: halt → validate → id → rate limit → risk → lifecycle
// -----------------------------------------------------------------------------
domain::OrderResult AdmissionController::submitOrder(
    const domain::Order& candidate,
    const std::string& strategy_id,
    const std::string& exchange) {
  domain::Order order = candidate;
  order.strategy_id = strategy_id;
  order.exchange = exchange;

  // --- Kill switch ------------------------------------------------------------
  if (halt_trading_.load()) {
    domain::Rejection r;
    r.code = ErrorCode::TradingHalted;
    r.message = "trading is halted";
    return rejected(order, std::move(r));
  }

  if (auto invalid = validate(order)) {
    return rejected(order, std::move(*invalid));
  }

  // --- Identifier ---------------------------------------------------------------
  if (order.id.empty()) {
    // Generated ids share the namespace with client ids; skip any taken.
    do {
      order.id = id_gen_.next_id();
    } while (lifecycle_.contains(order.id));
  } else if (lifecycle_.contains(order.id)) {
    domain::Rejection r;
    r.code = ErrorCode::DuplicateOrderId;
    r.message = "order id " + order.id + " already exists";
    return rejected(order, std::move(r));
  }

  // --- Rate limit -----------------------------------------------------------------
  if (auto limited = rate_limiter_.tryAcquire(exchange, RequestKind::Order)) {
    return rejected(order, std::move(*limited));
  }

  // --- Risk limits --------------------------------------------------------------
  if (auto breach = registry_.check(order, strategy_id)) {
    rate_limiter_.refund(exchange, RequestKind::Order);
    return rejected(order, std::move(*breach));
  }

  // --- Lifecycle ------------------------------------------------------------------
  domain::OrderResult result = lifecycle_.submit(order);
  if (auto* failure = std::get_if<domain::Rejection>(&result)) {
    registry_.rollback(order.id);
    rate_limiter_.refund(exchange, RequestKind::Order);
    return rejected(order, std::move(*failure));
  }

  accepted_.fetch_add(1, std::memory_order_relaxed);
  std::cout << "[AdmissionController] ACCEPTED id=" << order.id << " "
            << toString(order.side) << " " << order.quantity << " "
            << order.symbol << " @ " << order.price << " strategy="
            << strategy_id << " exchange=" << exchange << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// Lifecycle pass-throughs
// -----------------------------------------------------------------------------
domain::OrderResult AdmissionController::execute(
    const domain::OrderId& order_id, domain::Decimal fill_price) {
  domain::OrderResult result = lifecycle_.execute(order_id, fill_price);
  if (const auto* failure = std::get_if<domain::Rejection>(&result)) {
    count(failure->code);
    std::cerr << "[AdmissionController] execute failed for id=" << order_id
              << ": " << failure->message << "\n";
  }
  return result;
}

domain::OrderResult AdmissionController::cancel(const domain::OrderId& order_id,
                                                const std::string& reason) {
  domain::OrderResult result = lifecycle_.cancel(order_id, reason);
  if (const auto* failure = std::get_if<domain::Rejection>(&result)) {
    count(failure->code);
    std::cerr << "[AdmissionController] cancel failed for id=" << order_id
              << ": " << failure->message << "\n";
  }
  return result;
}

std::vector<domain::Order> AdmissionController::cancelAll(
    const std::string& strategy_id, const std::string& symbol,
    const std::string& reason) {
  return lifecycle_.cancelAll(strategy_id, symbol, reason);
}

domain::CheckResult AdmissionController::queryAllowed(
    const std::string& exchange) {
  domain::CheckResult result =
      rate_limiter_.tryAcquire(exchange, RequestKind::Query);
  if (result) {
    count(result->code);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void AdmissionController::haltTrading() {
  halt_trading_ = true;
  std::cerr << "[AdmissionController] CRITICAL: trading halted by operator. "
               "New orders will be rejected.\n";
}

void AdmissionController::resumeTrading() {
  halt_trading_ = false;
  std::cout << "[AdmissionController] Trading resumed.\n";
}

bool AdmissionController::isHalted() const {
  return halt_trading_.load();
}

AdmissionStats AdmissionController::stats() const {
  AdmissionStats s;
  s.accepted = accepted_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < rejected_.size(); ++i) {
    s.rejected[i] = rejected_[i].load(std::memory_order_relaxed);
  }
  return s;
}

}  // namespace riskgate
