#pragma once

#include "riskgate/domain/order.hpp"
#include "riskgate/domain/order_status.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstdint>
#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// OrderTransitionEvent
// -----------------------------------------------------------------------------
// Responsibility: One successful lifecycle transition, including the initial
// admission (from == to == Pending).
// Published by the engine's transition sink onto the telemetry queue.
// -----------------------------------------------------------------------------
struct OrderTransitionEvent {
  domain::Order order;  // Snapshot after the transition
  domain::OrderStatus from{domain::OrderStatus::Pending};
  domain::OrderStatus to{domain::OrderStatus::Pending};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// AdmissionRejectEvent
// -----------------------------------------------------------------------------
// Responsibility: A candidate refused by the AdmissionController. The
// candidate never became an order, so only its identifying fields are kept.
// -----------------------------------------------------------------------------
struct AdmissionRejectEvent {
  domain::OrderId order_id;  // May be empty if none was supplied or assigned
  std::string strategy_id;
  std::string exchange;
  std::string symbol;
  domain::Rejection rejection;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace riskgate
