#pragma once

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an admitted order can occupy.
//
// @details
//
//   (admission accepted)
//          │
//          ▼
//       Pending ──── execute(fill) ───> Executed
//          │
//          └──────── cancel(reason) ──> Canceled
//
// Terminal states: Executed, Canceled. Transitions are monotone; nothing
// leaves a terminal state and nothing re-enters Pending. The OrderLifecycle
// enforces the graph and keeps terminal orders for audit.
//
// Rejected candidates never become orders, so there is no Rejected state:
// the rejection is returned to the caller as a domain::Rejection instead.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,   // Admitted, reservation held, awaiting venue outcome
  Executed,  // Filled and committed; terminal
  Canceled,  // Canceled or failed at the venue; terminal
};

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending:  return "PENDING";
    case OrderStatus::Executed: return "EXECUTED";
    case OrderStatus::Canceled: return "CANCELED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace riskgate
