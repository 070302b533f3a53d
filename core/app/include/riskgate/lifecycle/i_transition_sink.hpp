#pragma once

#include "riskgate/domain/order.hpp"
#include "riskgate/domain/order_status.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// ITransitionSink — downstream observer of order state changes
// -----------------------------------------------------------------------------
//
// @brief  Receives every successful lifecycle transition: persistence,
//         telemetry, audit logs.
//
// @details
// onTransition() is called synchronously on the thread that performed the
// transition, after the order's lock has been released. The initial
// admission is reported with from == to == Pending.
//
// A sink that throws a std::exception is logged and skipped. The transition
// it was told about is never undone.
//
// Implementations must be safe to call from several admission threads at
// once.
// -----------------------------------------------------------------------------
class ITransitionSink {
 public:
  virtual ~ITransitionSink() = default;

  virtual void onTransition(const domain::Order& order,
                            domain::OrderStatus from,
                            domain::OrderStatus to) = 0;
};

}  // namespace riskgate
