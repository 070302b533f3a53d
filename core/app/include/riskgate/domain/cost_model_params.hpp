#pragma once

#include "riskgate/domain/decimal.hpp"

#include <optional>
#include <string_view>

namespace riskgate {
namespace domain {

// Closed set of slippage models. `None` passes the venue fill price through.
enum class SlippageType {
  FixedBps,
  None,
};

inline const char* toString(SlippageType t) {
  switch (t) {
    case SlippageType::FixedBps: return "fixed_bps";
    case SlippageType::None:     return "none";
  }
  return "unknown";
}

std::optional<SlippageType> parseSlippageType(std::string_view text);

// -----------------------------------------------------------------------------
// CostModelParams — `trading_parameters.slippage_model` and
// `trading_parameters.transaction_costs`
// -----------------------------------------------------------------------------
struct CostModelParams {
  SlippageType slippage_type{SlippageType::FixedBps};
  Decimal slippage_value{5};  // basis points for FixedBps
  Decimal commission_rate{Decimal::fromRaw(100000)};  // 0.001
  Decimal minimum_commission{1};
};

}  // namespace domain
}  // namespace riskgate
