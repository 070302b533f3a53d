#pragma once

#include "riskgate/domain/decimal.hpp"

#include <string>
#include <unordered_map>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — admission limits, immutable after load
// -----------------------------------------------------------------------------
//
// @brief  The typed form of the `risk_limits` section (plus
//         `trading_parameters.max_order_quantity`) of the engine config.
//
// @details
// Copied into RiskLimitRegistry at construction and never modified while
// orders are being admitted.
//
// Defaults for instruments and strategies without an entry:
//   - position_limits:          uncapped, one warning per symbol, unless
//                               reject_unknown_instruments is set
//   - max_order_quantity:       default_max_order_quantity
//   - strategy_exposure_limits: uncapped
//
// Percentages are expressed in percent (5.0 means 5%).
//
// Trading-day boundary: days roll over at day_rollover_hour_utc:00 UTC.
// Drawdown windows are consecutive blocks of drawdown_window_days trading
// days counted from the Unix epoch.
// -----------------------------------------------------------------------------
struct RiskLimits {
  std::unordered_map<std::string, Decimal> position_limits;
  std::unordered_map<std::string, Decimal> max_order_quantity;
  Decimal default_max_order_quantity{1000000};

  Decimal max_position_value_pct{20};
  Decimal max_drawdown_pct{5};
  int drawdown_window_days{1};
  Decimal max_daily_loss{100000};

  std::unordered_map<std::string, Decimal> strategy_exposure_limits;

  bool reject_unknown_instruments{false};
  int day_rollover_hour_utc{0};
};

}  // namespace domain
}  // namespace riskgate
