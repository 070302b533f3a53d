#pragma once

#include "riskgate/domain/cost_model_params.hpp"
#include "riskgate/domain/decimal.hpp"
#include "riskgate/domain/order.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// AdjustedFill — result of pricing a venue fill
// -----------------------------------------------------------------------------
struct AdjustedFill {
  domain::Decimal executed_price;  // Fill price after slippage
  domain::Decimal commission;      // Transaction cost charged on the fill
  domain::Decimal slippage_cost;   // |executed_price - fill_price| * quantity
};

// -----------------------------------------------------------------------------
// CostModel — deterministic slippage and commission
// -----------------------------------------------------------------------------
//
// @brief  Turns the raw fill price reported by a venue into the price and
//         costs booked against the position.
//
// @details
//   fixed_bps:  executed = fill * (1 + bps / 10000)   for BUY
//               executed = fill * (1 - bps / 10000)   for SELL
//               A buyer pays more and a seller receives less.
//   none:       executed = fill
//
//   commission = max(minimum_commission,
//                    commission_rate * executed * quantity)
//
// Example: bps = 5, BUY 1 @ 100.00 → executed 100.05,
//          commission max(1.0, 0.001 * 100.05) = 1.0.
//
// Thread model:
//   Immutable after construction. apply() is a pure function and may be
//   called concurrently from any thread.
// -----------------------------------------------------------------------------
class CostModel {
 public:
  explicit CostModel(const domain::CostModelParams& params);

  // -------------------------------------------------------------------------
  // apply(order, fill_price)
  // -------------------------------------------------------------------------
  // @param  order       Supplies side and quantity; nothing else is read.
  // @param  fill_price  Price reported by the venue (> 0).
  //
  // @return The adjusted fill. Identical inputs always yield identical
  //         outputs.
  // @throws std::overflow_error if the executed price, commission or
  //         slippage cost does not fit in a Decimal.
  // -------------------------------------------------------------------------
  AdjustedFill apply(const domain::Order& order,
                     domain::Decimal fill_price) const;

  const domain::CostModelParams& params() const { return params_; }

 private:
  domain::CostModelParams params_;
};

}  // namespace riskgate
