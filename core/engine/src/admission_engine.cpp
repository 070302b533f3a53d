#include "riskgate/engine/admission_engine.hpp"
#include "riskgate/serialization/json_codec.hpp"

#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace riskgate {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Constructor: build components in dependency order
// -----------------------------------------------------------------------------
AdmissionEngine::AdmissionEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock), telemetry_sink_(*this) {
  registry_ = std::make_unique<RiskLimitRegistry>(config_.risk_limits, clock_);
  rate_limiter_ = std::make_unique<RateLimiter>(config_.exchanges, clock_);
  cost_model_ = std::make_unique<CostModel>(config_.cost_model);
  lifecycle_ = std::make_unique<OrderLifecycle>(*registry_, *cost_model_);
  controller_ = std::make_unique<AdmissionController>(
      *rate_limiter_, *registry_, *lifecycle_, id_gen_);

  lifecycle_->addSink(&telemetry_sink_);
}

AdmissionEngine::~AdmissionEngine() {
  stop();
  lifecycle_->removeSink(&telemetry_sink_);
}

// -----------------------------------------------------------------------------
// start(): reconciliation gate, then IPC
// -----------------------------------------------------------------------------
void AdmissionEngine::start(IReconciler* reconciler) {
  if (running_) {
    return;
  }

  if (reconciler != nullptr) {
    auto positions = reconciler->reconcilePositions();
    for (const auto& pos : positions) {
      registry_->hydratePosition(pos);
    }
    std::cout << "[AdmissionEngine] Reconciliation complete: "
              << positions.size() << " position(s) hydrated.\n";
  }

  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.telemetry_endpoint);
    ipc_server_->start();

    std::unique_lock lock(telemetry_mutex_);
    telemetry_target_ = ipc_server_.get();
  }

  running_ = true;

  std::cout << "[AdmissionEngine] " << config_.engine_name << " started. "
            << config_.exchanges.size() << " exchange(s), "
            << config_.risk_limits.position_limits.size()
            << " position limit(s)" << (ipc_server_ ? ", IPC enabled" : "")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): detach telemetry, then join the IPC thread
// -----------------------------------------------------------------------------
void AdmissionEngine::stop() {
  if (!running_) {
    return;
  }

  {
    std::unique_lock lock(telemetry_mutex_);
    telemetry_target_ = nullptr;
  }
  // Not under telemetry_mutex_: the IPC thread may be publishing from inside
  // executeCommand() and must be able to finish before it is joined.
  ipc_server_.reset();

  running_ = false;

  std::cout << "[AdmissionEngine] stopped. " << lifecycle_->openOrderCount()
            << " order(s) still pending.\n";
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
void AdmissionEngine::publish(Event event) {
  std::shared_lock lock(telemetry_mutex_);
  if (telemetry_target_ != nullptr) {
    telemetry_target_->pushTelemetry(std::move(event));
  }
}

void AdmissionEngine::TelemetrySink::onTransition(const domain::Order& order,
                                                  domain::OrderStatus from,
                                                  domain::OrderStatus to) {
  OrderTransitionEvent e;
  e.order = order;
  e.from = from;
  e.to = to;
  e.timestamp = engine_.clock_.now();
  e.sequence_id = engine_.telemetry_sequence_.fetch_add(1);
  engine_.publish(std::move(e));
}

// -----------------------------------------------------------------------------
// executeCommand(): plain commands first, then JSON
// -----------------------------------------------------------------------------
std::string AdmissionEngine::executeCommand(const std::string& cmd) {
  json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response = statusReply();
  } else if (cmd == "HALT") {
    controller_->haltTrading();
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "RESUME") {
    controller_->resumeTrading();
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else {
    try {
      json request = json::parse(cmd);
      response = handleJsonCommand(request);
    } catch (const json::exception& e) {
      response = json::object();
      response["status"] = "error";
      response["response"] = std::string("Malformed command: ") + e.what();
    } catch (const std::invalid_argument& e) {
      response = json::object();
      response["status"] = "error";
      response["response"] = std::string("Invalid argument: ") + e.what();
    } catch (const std::overflow_error& e) {
      response = json::object();
      response["status"] = "error";
      response["response"] = std::string("Out of range: ") + e.what();
    }
  }

  return response.dump();
}

json AdmissionEngine::handleJsonCommand(const json& request) {
  if (!request.is_object() || !request.contains("cmd")) {
    json error;
    error["status"] = "error";
    error["response"] = "Unknown command: " + request.dump();
    return error;
  }

  const std::string name = request.at("cmd").get<std::string>();

  if (name == "SUBMIT") {
    return handleSubmit(request);
  }
  if (name == "EXECUTE") {
    return orderReply(controller_->execute(
        request.at("order_id").get<std::string>(),
        decimalFromJson(request.at("fill_price"))));
  }
  if (name == "CANCEL") {
    return orderReply(controller_->cancel(
        request.at("order_id").get<std::string>(),
        request.value("reason", std::string("canceled by operator"))));
  }
  if (name == "CANCEL_ALL") {
    std::vector<domain::Order> canceled = controller_->cancelAll(
        request.value("strategy", std::string()),
        request.value("symbol", std::string()),
        request.value("reason", std::string("canceled by operator")));
    json reply;
    reply["status"] = "ok";
    reply["orders"] = ordersJson(canceled);
    return reply;
  }
  if (name == "ACTIVE") {
    json reply;
    reply["status"] = "ok";
    reply["orders"] = ordersJson(lifecycle_->activeOrders(
        request.value("strategy", std::string()),
        request.value("symbol", std::string())));
    return reply;
  }
  if (name == "ORDER") {
    const std::string id = request.at("order_id").get<std::string>();
    json reply;
    if (auto order = lifecycle_->order(id)) {
      reply["status"] = "ok";
      reply["order"] = toJson(*order);
    } else {
      reply["status"] = "error";
      reply["response"] = "Unknown order: " + id;
    }
    return reply;
  }
  if (name == "MARK") {
    // Validate both marks before applying either.
    std::optional<domain::Decimal> portfolio_value;
    if (request.contains("portfolio_value")) {
      portfolio_value = decimalFromJson(request.at("portfolio_value"));
      if (!portfolio_value->isPositive()) {
        json error;
        error["status"] = "error";
        error["response"] = "portfolio_value must be positive, got " +
                            portfolio_value->toString();
        return error;
      }
    }
    std::optional<domain::Decimal> price;
    if (request.contains("symbol")) {
      price = decimalFromJson(request.at("price"));
      if (!price->isPositive()) {
        json error;
        error["status"] = "error";
        error["response"] = "price must be positive, got " + price->toString();
        return error;
      }
    }

    if (portfolio_value) {
      registry_->markPortfolio(*portfolio_value);
    }
    if (price) {
      registry_->markPrice(request.at("symbol").get<std::string>(), *price);
    }
    json reply;
    reply["status"] = "ok";
    reply["summary"] = toJson(registry_->summary());
    return reply;
  }
  if (name == "PNL") {
    registry_->recordRealizedPnl(decimalFromJson(request.at("amount")));
    json reply;
    reply["status"] = "ok";
    reply["summary"] = toJson(registry_->summary());
    return reply;
  }
  if (name == "QUERY") {
    json reply;
    if (auto limited =
            controller_->queryAllowed(request.at("exchange").get<std::string>())) {
      reply["status"] = "rejected";
      reply["rejection"] = toJson(*limited);
    } else {
      reply["status"] = "ok";
    }
    return reply;
  }

  json error;
  error["status"] = "error";
  error["response"] = "Unknown command: " + name;
  return error;
}

// -----------------------------------------------------------------------------
// handleSubmit(): decode, admit, report rejections on the telemetry feed
// -----------------------------------------------------------------------------
json AdmissionEngine::handleSubmit(const json& request) {
  domain::Order candidate = orderFromJson(request.at("order"));
  const std::string strategy = request.at("strategy").get<std::string>();
  const std::string exchange = request.at("exchange").get<std::string>();

  domain::OrderResult result =
      controller_->submitOrder(candidate, strategy, exchange);

  if (const auto* rejection = std::get_if<domain::Rejection>(&result)) {
    AdmissionRejectEvent e;
    e.order_id = candidate.id;
    e.strategy_id = strategy;
    e.exchange = exchange;
    e.symbol = candidate.symbol;
    e.rejection = *rejection;
    e.timestamp = clock_.now();
    e.sequence_id = telemetry_sequence_.fetch_add(1);
    publish(std::move(e));
  }
  return orderReply(result);
}

json AdmissionEngine::ordersJson(const std::vector<domain::Order>& orders) {
  json list = json::array();
  for (const domain::Order& order : orders) {
    list.push_back(toJson(order));
  }
  return list;
}

json AdmissionEngine::orderReply(const domain::OrderResult& result) {
  json reply;
  if (const auto* order = std::get_if<domain::Order>(&result)) {
    reply["status"] = "ok";
    reply["order"] = toJson(*order);
  } else {
    reply["status"] = "rejected";
    reply["rejection"] = toJson(std::get<domain::Rejection>(result));
  }
  return reply;
}

// -----------------------------------------------------------------------------
// statusReply(): engine state for operators
// -----------------------------------------------------------------------------
json AdmissionEngine::statusReply() const {
  json reply;
  reply["status"] = "ok";
  reply["engine"] = config_.engine_name;
  reply["halted"] = controller_->isHalted();
  reply["open_orders"] = lifecycle_->openOrderCount();

  json positions = json::array();
  for (const auto& pos : registry_->positions()) {
    positions.push_back(toJson(pos));
  }
  reply["positions"] = std::move(positions);
  reply["summary"] = toJson(registry_->summary());

  AdmissionStats stats = controller_->stats();
  json rejected = json::object();
  for (std::size_t i = 0; i < domain::kErrorCodeCount; ++i) {
    if (stats.rejected[i] != 0) {
      rejected[toString(static_cast<domain::ErrorCode>(i))] = stats.rejected[i];
    }
  }
  reply["accepted"] = stats.accepted;
  reply["rejected"] = std::move(rejected);
  return reply;
}

}  // namespace riskgate
