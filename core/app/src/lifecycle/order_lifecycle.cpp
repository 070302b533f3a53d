#include "riskgate/lifecycle/order_lifecycle.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <variant>

namespace riskgate {

using domain::OrderStatus;

OrderLifecycle::OrderLifecycle(RiskLimitRegistry& registry,
                               const CostModel& cost_model)
    : registry_(registry), cost_model_(cost_model) {}

// -----------------------------------------------------------------------------
// State machine
// -----------------------------------------------------------------------------
bool OrderLifecycle::canTransition(OrderStatus from, OrderStatus to) {
  switch (from) {
    case OrderStatus::Pending:
      return to == OrderStatus::Executed || to == OrderStatus::Canceled;

    case OrderStatus::Executed:
    case OrderStatus::Canceled:
      return false;
  }
  return false;
}

bool OrderLifecycle::isTerminal(OrderStatus status) {
  return status == OrderStatus::Executed || status == OrderStatus::Canceled;
}

domain::Rejection OrderLifecycle::unknownOrder(const domain::OrderId& order_id) {
  domain::Rejection r;
  r.code = domain::ErrorCode::UnknownOrder;
  r.message = "unknown order id " + order_id;
  return r;
}

domain::Rejection OrderLifecycle::invalidTransition(
    const domain::Order& order, OrderStatus attempted) {
  domain::Rejection r;
  r.code = domain::ErrorCode::InvalidTransition;
  r.message = "order " + order.id + " cannot move from " +
              toString(order.status) + " to " + toString(attempted);
  r.from = order.status;
  r.attempted = attempted;
  return r;
}

OrderLifecycle::Record* OrderLifecycle::find(
    const domain::OrderId& order_id) const {
  std::shared_lock lock(orders_mutex_);
  auto it = orders_.find(order_id);
  return it != orders_.end() ? it->second.get() : nullptr;
}

// -----------------------------------------------------------------------------
// submit: register the accepted order as Pending
// -----------------------------------------------------------------------------
domain::OrderResult OrderLifecycle::submit(const domain::Order& order) {
  auto record = std::make_unique<Record>();
  record->order = order;
  record->order.status = OrderStatus::Pending;
  record->order.executed_price = domain::Decimal{};
  record->order.commission = domain::Decimal{};
  record->order.cancel_reason.clear();

  domain::Order snapshot = record->order;
  {
    std::unique_lock lock(orders_mutex_);
    if (orders_.count(order.id) != 0) {
      domain::Rejection r;
      r.code = domain::ErrorCode::DuplicateOrderId;
      r.message = "order id " + order.id + " already exists";
      return r;
    }
    record->sequence = next_sequence_++;
    orders_.emplace(order.id, std::move(record));
  }
  ++open_count_;

  notify(snapshot, OrderStatus::Pending, OrderStatus::Pending);
  return snapshot;
}

// -----------------------------------------------------------------------------
// execute: Pending → Executed, commit the reservation
// -----------------------------------------------------------------------------
domain::OrderResult OrderLifecycle::execute(const domain::OrderId& order_id,
                                            domain::Decimal fill_price) {
  if (!fill_price.isPositive()) {
    domain::Rejection r;
    r.code = domain::ErrorCode::InvalidOrder;
    r.message = "fill price must be positive, got " + fill_price.toString();
    r.observed = fill_price;
    return r;
  }

  Record* record = find(order_id);
  if (record == nullptr) {
    return unknownOrder(order_id);
  }

  domain::Order snapshot;
  {
    std::lock_guard lock(record->mutex);
    domain::Order& order = record->order;
    if (!canTransition(order.status, OrderStatus::Executed)) {
      return invalidTransition(order, OrderStatus::Executed);
    }

    AdjustedFill fill;
    try {
      fill = cost_model_.apply(order, fill_price);
      if (!registry_.commit(order.id, fill.executed_price, fill.commission)) {
        std::cerr << "[OrderLifecycle] WARNING: no reservation to commit for "
                     "order_id=" << order.id << ".\n";
      }
    } catch (const std::overflow_error& e) {
      // Neither the registry nor the order has changed; it stays Pending.
      domain::Rejection r;
      r.code = domain::ErrorCode::InvalidOrder;
      r.message = "fill of order " + order.id + " @ " + fill_price.toString() +
                  " is out of range: " + e.what();
      r.observed = fill_price;
      return r;
    }

    order.status = OrderStatus::Executed;
    order.executed_price = fill.executed_price;
    order.commission = fill.commission;
    snapshot = order;
  }
  --open_count_;

  notify(snapshot, OrderStatus::Pending, OrderStatus::Executed);
  return snapshot;
}

// -----------------------------------------------------------------------------
// cancel: Pending → Canceled, release the reservation
// -----------------------------------------------------------------------------
domain::OrderResult OrderLifecycle::cancel(const domain::OrderId& order_id,
                                           const std::string& reason) {
  Record* record = find(order_id);
  if (record == nullptr) {
    return unknownOrder(order_id);
  }

  domain::Order snapshot;
  {
    std::lock_guard lock(record->mutex);
    domain::Order& order = record->order;
    if (!canTransition(order.status, OrderStatus::Canceled)) {
      return invalidTransition(order, OrderStatus::Canceled);
    }

    if (!registry_.rollback(order.id)) {
      std::cerr << "[OrderLifecycle] WARNING: no reservation to release for "
                   "order_id=" << order.id << ".\n";
    }

    order.status = OrderStatus::Canceled;
    order.cancel_reason = reason;
    snapshot = order;
  }
  --open_count_;

  notify(snapshot, OrderStatus::Pending, OrderStatus::Canceled);
  return snapshot;
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderLifecycle::order(
    const domain::OrderId& order_id) const {
  Record* record = find(order_id);
  if (record == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  return record->order;
}

bool OrderLifecycle::contains(const domain::OrderId& order_id) const {
  return find(order_id) != nullptr;
}

std::vector<OrderLifecycle::Record*> OrderLifecycle::recordsInSequence() const {
  std::vector<Record*> records;
  {
    std::shared_lock lock(orders_mutex_);
    records.reserve(orders_.size());
    for (const auto& [id, record] : orders_) {
      records.push_back(record.get());
    }
  }
  std::sort(records.begin(), records.end(),
            [](const Record* a, const Record* b) {
              return a->sequence < b->sequence;
            });
  return records;
}

std::vector<domain::Order> OrderLifecycle::orders() const {
  std::vector<Record*> records = recordsInSequence();

  std::vector<domain::Order> result;
  result.reserve(records.size());
  for (const Record* record : records) {
    std::lock_guard lock(record->mutex);
    result.push_back(record->order);
  }
  return result;
}

std::vector<domain::Order> OrderLifecycle::activeOrders(
    const std::string& strategy_id, const std::string& symbol) const {
  std::vector<domain::Order> result;
  for (const Record* record : recordsInSequence()) {
    std::lock_guard lock(record->mutex);
    const domain::Order& order = record->order;
    if (order.status == OrderStatus::Pending &&
        matches(order, strategy_id, symbol)) {
      result.push_back(order);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// cancelAll: cancel every matching Pending order
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderLifecycle::cancelAll(
    const std::string& strategy_id, const std::string& symbol,
    const std::string& reason) {
  std::vector<domain::Order> canceled;
  for (const domain::Order& order : activeOrders(strategy_id, symbol)) {
    domain::OrderResult result = cancel(order.id, reason);
    // An order executed or canceled since the listing is skipped.
    if (auto* done = std::get_if<domain::Order>(&result)) {
      canceled.push_back(std::move(*done));
    }
  }

  std::cout << "[OrderLifecycle] canceled " << canceled.size()
            << " order(s) strategy=" << (strategy_id.empty() ? "*" : strategy_id)
            << " symbol=" << (symbol.empty() ? "*" : symbol) << " reason="
            << reason << "\n";
  return canceled;
}

bool OrderLifecycle::matches(const domain::Order& order,
                             const std::string& strategy_id,
                             const std::string& symbol) {
  return (strategy_id.empty() || order.strategy_id == strategy_id) &&
         (symbol.empty() || order.symbol == symbol);
}

// -----------------------------------------------------------------------------
// Sinks
// -----------------------------------------------------------------------------
void OrderLifecycle::addSink(ITransitionSink* sink) {
  if (sink == nullptr) {
    return;
  }
  std::unique_lock lock(sinks_mutex_);
  if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
    sinks_.push_back(sink);
  }
}

void OrderLifecycle::removeSink(ITransitionSink* sink) {
  std::unique_lock lock(sinks_mutex_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void OrderLifecycle::notify(const domain::Order& order, OrderStatus from,
                            OrderStatus to) {
  std::vector<ITransitionSink*> sinks;
  {
    std::shared_lock lock(sinks_mutex_);
    sinks = sinks_;
  }

  for (ITransitionSink* sink : sinks) {
    try {
      sink->onTransition(order, from, to);
    } catch (const std::exception& e) {
      std::cerr << "[OrderLifecycle] ERROR: transition sink failed for "
                   "order_id=" << order.id << " (" << toString(from) << " -> "
                << toString(to) << "): " << e.what() << "\n";
    }
  }
}

}  // namespace riskgate
