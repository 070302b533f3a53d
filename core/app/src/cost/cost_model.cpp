#include "riskgate/cost/cost_model.hpp"

#include <stdexcept>

namespace riskgate {

namespace {

const domain::Decimal kBasisPointsPerUnit{10000};

}  // namespace

CostModel::CostModel(const domain::CostModelParams& params) : params_(params) {
  if (params_.slippage_value.isNegative() ||
      params_.commission_rate.isNegative() ||
      params_.minimum_commission.isNegative()) {
    throw std::invalid_argument("CostModel: negative cost parameter");
  }
}

AdjustedFill CostModel::apply(const domain::Order& order,
                              domain::Decimal fill_price) const {
  AdjustedFill result;

  switch (params_.slippage_type) {
    case domain::SlippageType::FixedBps: {
      // Scale the factor down first so fill_price is never multiplied by
      // ten thousand.
      const domain::Decimal offset = params_.slippage_value / kBasisPointsPerUnit;
      const domain::Decimal factor = order.side == domain::Side::Buy
                                         ? domain::Decimal{1} + offset
                                         : domain::Decimal{1} - offset;
      result.executed_price = fill_price * factor;
      break;
    }
    case domain::SlippageType::None:
      result.executed_price = fill_price;
      break;
  }

  domain::Decimal proportional =
      params_.commission_rate * result.executed_price * order.quantity;
  result.commission = domain::max(params_.minimum_commission, proportional);
  result.slippage_cost =
      (result.executed_price - fill_price).abs() * order.quantity;

  return result;
}

}  // namespace riskgate
