#pragma once

#include "riskgate/domain/decimal.hpp"
#include "riskgate/domain/order.hpp"
#include "riskgate/domain/position.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/events/event.hpp"
#include "riskgate/risk/risk_limit_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace riskgate {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json conversions shared by the config loader, the IPC
//         command handler and the telemetry publisher.
//
// @details
// Decimals are written as JSON strings ("100.05") so no precision is lost
// in transit. On input both forms are accepted: a decimal string is parsed
// exactly; a JSON number is rounded to 8 fractional digits.
//
// Errors:
//   decimalFromJson() throws std::invalid_argument for anything that is
//   neither a number nor a decimal string, or lies outside Decimal's range. Missing keys surface as
//   nlohmann::json::exception from at().
// -----------------------------------------------------------------------------
domain::Decimal decimalFromJson(const nlohmann::json& j);

nlohmann::json toJson(domain::Decimal value);
nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::Rejection& rejection);
nlohmann::json toJson(const RiskSummary& summary);

// Telemetry payload; carries a "type" discriminator equal to
// telemetryTopic(event).
nlohmann::json toJson(const Event& event);

// "order_transition" or "admission_reject". Also the first frame of each
// PUB message, so subscribers can filter by prefix.
const char* telemetryTopic(const Event& event);

// -----------------------------------------------------------------------------
// orderFromJson(j)
// -----------------------------------------------------------------------------
// @brief  Builds a candidate order from a SUBMIT command.
//
// Keys: "symbol", "side" ("BUY"/"SELL"), "price", "quantity", optional "id".
// strategy and exchange are routed separately and not read here.
//
// @throws std::invalid_argument on an unknown side or a malformed number,
//         nlohmann::json::exception on a missing key.
// -----------------------------------------------------------------------------
domain::Order orderFromJson(const nlohmann::json& j);

}  // namespace riskgate
