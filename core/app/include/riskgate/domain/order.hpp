#pragma once

#include "riskgate/domain/decimal.hpp"
#include "riskgate/domain/order_status.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Opaque, unique order identifier. Upstream callers may supply their own
// (e.g. a client order id); when they do not, the AdmissionController assigns
// one from the OrderIdGenerator ("ORD-1", "ORD-2", ...).
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Trading direction. A closed set: there is no way to build an order with an
// unrecognised side string.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// Accepts "BUY"/"SELL" in any case.
std::optional<Side> parseSide(std::string_view text);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The admitted order record. Candidate orders arriving at the
// AdmissionController use the same struct with status ignored.
//
// @details
// Created by AdmissionController on acceptance; after that only the
// OrderLifecycle mutates its authoritative copy. Copies handed to callers and
// transition sinks are snapshots.
//
// Invariants enforced at admission:
//   price > 0, quantity > 0, symbol non-empty.
//
// executed_price and commission are zero until the order is Executed.
// cancel_reason is empty unless the order is Canceled.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;                   // Unique identifier
  std::string strategy_id;      // Strategy whose exposure this order consumes
  std::string exchange;         // Venue whose rate limits apply
  std::string symbol;           // Instrument (e.g. "BTC-USD")
  Side side{Side::Buy};
  Decimal price;                // Limit / reference price
  Decimal quantity;             // Order size
  OrderStatus status{OrderStatus::Pending};
  Decimal executed_price;       // Slippage-adjusted price once Executed
  Decimal commission;           // Commission charged once Executed
  std::string cancel_reason;

  // Notional value at the order's reference price.
  Decimal notional() const { return price * quantity; }
};

}  // namespace domain
}  // namespace riskgate
