#pragma once

#include "riskgate/domain/decimal.hpp"

#include <string>
#include <tuple>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-symbol committed position
// -----------------------------------------------------------------------------
//
// @brief  Net position, average entry price and realized PnL for a single
//         instrument.
//
// @details
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat
//
// average_price is the weighted average entry of the open position. It moves
// when the position grows, stays put when it shrinks, and resets to the fill
// price when a fill crosses zero.
//
// realized_pnl accumulates closed_qty * (fill_price - average_price) for
// longs and the mirror image for shorts.
//
// Only committed (executed) fills are reflected here. Quantity reserved by
// pending orders is tracked separately by the RiskLimitRegistry.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  Decimal net_quantity;   // Signed: +long, -short, 0=flat
  Decimal average_price;  // Weighted avg entry price of current position
  Decimal realized_pnl;   // Cumulative realized profit/loss
};

inline bool operator==(const Position& a, const Position& b) {
  return std::tie(a.symbol, a.net_quantity, a.average_price, a.realized_pnl) ==
         std::tie(b.symbol, b.net_quantity, b.average_price, b.realized_pnl);
}
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

}  // namespace domain
}  // namespace riskgate
