#include "riskgate/serialization/json_codec.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace riskgate {

using nlohmann::json;

domain::Decimal decimalFromJson(const json& j) {
  if (j.is_number_integer()) {
    // Integers go through the exact parser so large values are range-checked.
    if (auto d = domain::Decimal::parse(j.dump())) {
      return *d;
    }
    throw std::invalid_argument("number out of range: " + j.dump());
  }
  if (j.is_number_float()) {
    try {
      return domain::Decimal::fromDouble(j.get<double>());
    } catch (const std::overflow_error&) {
      throw std::invalid_argument("number out of range: " + j.dump());
    }
  }
  if (j.is_string()) {
    const auto& text = j.get_ref<const std::string&>();
    if (auto d = domain::Decimal::parse(text)) {
      return *d;
    }
    throw std::invalid_argument("not a decimal number: \"" + text + "\"");
  }
  throw std::invalid_argument("expected a number, got " + j.dump());
}

json toJson(domain::Decimal value) { return value.toString(); }

json toJson(const domain::Order& order) {
  json j;
  j["id"] = order.id;
  j["strategy_id"] = order.strategy_id;
  j["exchange"] = order.exchange;
  j["symbol"] = order.symbol;
  j["side"] = toString(order.side);
  j["price"] = toJson(order.price);
  j["quantity"] = toJson(order.quantity);
  j["status"] = toString(order.status);
  if (order.status == domain::OrderStatus::Executed) {
    j["executed_price"] = toJson(order.executed_price);
    j["commission"] = toJson(order.commission);
  }
  if (order.status == domain::OrderStatus::Canceled) {
    j["cancel_reason"] = order.cancel_reason;
  }
  return j;
}

json toJson(const domain::Position& position) {
  json j;
  j["symbol"] = position.symbol;
  j["net_quantity"] = toJson(position.net_quantity);
  j["average_price"] = toJson(position.average_price);
  j["realized_pnl"] = toJson(position.realized_pnl);
  return j;
}

json toJson(const domain::Rejection& rejection) {
  json j;
  j["code"] = toString(rejection.code);
  j["message"] = rejection.message;
  j["observed"] = toJson(rejection.observed);
  j["limit"] = toJson(rejection.limit);
  if (rejection.code == domain::ErrorCode::RateLimitExceeded) {
    j["retry_after_ms"] = rejection.retry_after.count();
  }
  if (rejection.from) {
    j["from"] = toString(*rejection.from);
  }
  if (rejection.attempted) {
    j["attempted"] = toString(*rejection.attempted);
  }
  return j;
}

json toJson(const RiskSummary& summary) {
  json j;
  j["gross_exposure"] = toJson(summary.gross_exposure);
  j["net_exposure"] = toJson(summary.net_exposure);
  j["long_exposure"] = toJson(summary.long_exposure);
  j["short_exposure"] = toJson(summary.short_exposure);
  j["portfolio_value"] = toJson(summary.portfolio_value);
  j["peak_value"] = toJson(summary.peak_value);
  j["drawdown_pct"] = toJson(summary.drawdown_pct);
  j["daily_pnl"] = toJson(summary.daily_pnl);
  j["open_reservations"] = summary.open_reservations;
  return j;
}

namespace {

std::int64_t epochMillis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             ts.time_since_epoch())
      .count();
}

}  // namespace

const char* telemetryTopic(const Event& event) {
  return std::holds_alternative<OrderTransitionEvent>(event)
             ? "order_transition"
             : "admission_reject";
}

json toJson(const Event& event) {
  json j;
  j["type"] = telemetryTopic(event);
  if (const auto* e = std::get_if<OrderTransitionEvent>(&event)) {
    j["order"] = toJson(e->order);
    j["from"] = toString(e->from);
    j["to"] = toString(e->to);
    j["timestamp_ms"] = epochMillis(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  } else if (const auto* e = std::get_if<AdmissionRejectEvent>(&event)) {
    j["order_id"] = e->order_id;
    j["strategy_id"] = e->strategy_id;
    j["exchange"] = e->exchange;
    j["symbol"] = e->symbol;
    j["rejection"] = toJson(e->rejection);
    j["timestamp_ms"] = epochMillis(e->timestamp);
    j["sequence_id"] = e->sequence_id;
  }
  return j;
}

domain::Order orderFromJson(const json& j) {
  domain::Order order;
  order.id = j.value("id", std::string{});
  order.symbol = j.at("symbol").get<std::string>();

  const std::string side = j.at("side").get<std::string>();
  auto parsed = domain::parseSide(side);
  if (!parsed) {
    throw std::invalid_argument("unknown side: " + side);
  }
  order.side = *parsed;
  order.price = decimalFromJson(j.at("price"));
  order.quantity = decimalFromJson(j.at("quantity"));
  return order;
}

}  // namespace riskgate
