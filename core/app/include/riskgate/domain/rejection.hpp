#pragma once

#include "riskgate/domain/decimal.hpp"
#include "riskgate/domain/order.hpp"
#include "riskgate/domain/order_status.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode — typed reasons an order is refused or a transition fails
// -----------------------------------------------------------------------------
//
// @details
// The limit codes are listed in the order the RiskLimitRegistry evaluates
// them. None of these are fatal: every one is returned to the caller as a
// Rejection value.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  // Admission preconditions
  InvalidOrder,
  DuplicateOrderId,
  TradingHalted,
  UnknownExchange,
  ExchangeTradingDisabled,
  RateLimitExceeded,

  // Risk limits, in evaluation order
  MaxOrderQuantityExceeded,
  UnknownInstrument,
  PositionLimitExceeded,
  PortfolioValueLimitExceeded,
  DrawdownBreached,
  DailyLossBreached,
  StrategyExposureExceeded,

  // Lifecycle
  UnknownOrder,
  InvalidTransition,
};

inline constexpr std::size_t kErrorCodeCount =
    static_cast<std::size_t>(ErrorCode::InvalidTransition) + 1;

inline const char* toString(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::InvalidOrder:                return "InvalidOrder";
    case E::DuplicateOrderId:            return "DuplicateOrderId";
    case E::TradingHalted:               return "TradingHalted";
    case E::UnknownExchange:             return "UnknownExchange";
    case E::ExchangeTradingDisabled:     return "ExchangeTradingDisabled";
    case E::RateLimitExceeded:           return "RateLimitExceeded";
    case E::MaxOrderQuantityExceeded:    return "MaxOrderQuantityExceeded";
    case E::UnknownInstrument:           return "UnknownInstrument";
    case E::PositionLimitExceeded:       return "PositionLimitExceeded";
    case E::PortfolioValueLimitExceeded: return "PortfolioValueLimitExceeded";
    case E::DrawdownBreached:            return "DrawdownBreached";
    case E::DailyLossBreached:           return "DailyLossBreached";
    case E::StrategyExposureExceeded:    return "StrategyExposureExceeded";
    case E::UnknownOrder:                return "UnknownOrder";
    case E::InvalidTransition:           return "InvalidTransition";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Rejection
// -----------------------------------------------------------------------------
//
// @brief  Why an admission or lifecycle request was refused.
//
// @details
// observed / limit carry the values that failed the check (e.g. projected
// position 11 vs limit 10) so that logs and test assertions can name the
// exact threshold. retry_after is only meaningful for RateLimitExceeded.
// from / attempted are only set for InvalidTransition.
// -----------------------------------------------------------------------------
struct Rejection {
  ErrorCode code{ErrorCode::InvalidOrder};
  std::string message;
  Decimal observed;
  Decimal limit;
  std::chrono::milliseconds retry_after{0};
  std::optional<OrderStatus> from;
  std::optional<OrderStatus> attempted;
};

// Empty on acceptance; carries the reason otherwise.
using CheckResult = std::optional<Rejection>;

// Either the resulting order snapshot or the reason the request failed.
using OrderResult = std::variant<Order, Rejection>;

}  // namespace domain
}  // namespace riskgate
