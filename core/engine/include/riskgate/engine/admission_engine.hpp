#pragma once

#include "riskgate/admission/admission_controller.hpp"
#include "riskgate/concurrent/order_id_generator.hpp"
#include "riskgate/config/config_loader.hpp"
#include "riskgate/cost/cost_model.hpp"
#include "riskgate/lifecycle/i_transition_sink.hpp"
#include "riskgate/lifecycle/order_lifecycle.hpp"
#include "riskgate/network/ipc_server.hpp"
#include "riskgate/ratelimit/rate_limiter.hpp"
#include "riskgate/risk/i_reconciler.hpp"
#include "riskgate/risk/risk_limit_registry.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// AdmissionEngine — top-level owner of the admission pipeline
// -----------------------------------------------------------------------------
//
// @brief  Builds every component from an EngineConfig, wires them together
//         and exposes a start/stop lifecycle plus a string command interface.
//
// @details
// Ownership tree:
//
//   AdmissionEngine
//    ├── config_              (EngineConfig, immutable)
//    ├── registry_            (RiskLimitRegistry)
//    ├── rate_limiter_        (RateLimiter)
//    ├── cost_model_          (CostModel)
//    ├── lifecycle_           (OrderLifecycle → registry_, cost_model_)
//    ├── id_gen_              (OrderIdGenerator)
//    ├── controller_          (AdmissionController → all of the above)
//    ├── telemetry_sink_      (ITransitionSink feeding the IPC queue)
//    └── ipc_server_          (optional, created in start())
//
// Members are declared in dependency order, so destruction runs from the
// IPC server back to the registry.
//
// All components are built in the constructor, so the engine can admit
// orders (through controller() or executeCommand()) even without start().
// start() adds the warm-up gate (position reconciliation) and the IPC
// server.
//
// Thread model:
//   start()/stop() must be called from one owning thread. executeCommand()
//   runs on the IPC thread, and controller() may be used from any number of
//   caller threads at the same time.
// -----------------------------------------------------------------------------
class AdmissionEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Parsed configuration (copied).
  // @param  clock   Time source for rate limiting and day boundaries. Must
  //                 outlive the engine.
  //
  // @throws std::invalid_argument if the configuration is rejected by a
  //         component (e.g. a non-positive rate limit).
  // -------------------------------------------------------------------------
  AdmissionEngine(EngineConfig config, const ITimeProvider& clock);

  // Destructor calls stop() for RAII safety.
  ~AdmissionEngine();

  AdmissionEngine(const AdmissionEngine&) = delete;
  AdmissionEngine& operator=(const AdmissionEngine&) = delete;
  AdmissionEngine(AdmissionEngine&&) = delete;
  AdmissionEngine& operator=(AdmissionEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  // @brief  Warm-up gate, then IPC.
  //
  // @details
  //   1. If reconciler is non-null, every reported position is hydrated
  //      into the RiskLimitRegistry.
  //   2. If both IPC endpoints are configured, the IpcServer is started
  //      and transition telemetry begins flowing.
  //
  // Idempotent.
  //
  // @throws zmq::error_t if an IPC endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // Stops the IPC server. Idempotent.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Handles one operator or client request and returns a JSON reply.
  //
  // @details
  // Plain commands:
  //   PING    → {"status":"ok","response":"PONG"}
  //   STATUS  → halt flag, open orders, positions, risk summary, counters
  //   HALT    → activates the kill switch
  //   RESUME  → clears the kill switch
  //
  // JSON commands, {"cmd": <name>, ...}:
  //   SUBMIT      strategy, exchange, order{id?, symbol, side, price, quantity}
  //   EXECUTE     order_id, fill_price
  //   CANCEL      order_id, reason?
  //   CANCEL_ALL  strategy?, symbol?, reason?  → "orders" canceled
  //   ACTIVE      strategy?, symbol?           → "orders" still Pending
  //   ORDER       order_id
  //   MARK        portfolio_value? and/or symbol + price, all > 0
  //   PNL         amount
  //   QUERY       exchange
  //
  // Replies carry "status": "ok", "rejected" (with a "rejection" object) or
  // "error" for commands that could not be understood. Malformed input
  // never reaches the admission components.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  AdmissionController& controller() { return *controller_; }
  RiskLimitRegistry& registry() { return *registry_; }
  OrderLifecycle& lifecycle() { return *lifecycle_; }
  RateLimiter& rateLimiter() { return *rate_limiter_; }
  const EngineConfig& config() const { return config_; }

 private:
  // Forwards every transition to the IPC telemetry queue while the server
  // is running.
  class TelemetrySink : public ITransitionSink {
   public:
    explicit TelemetrySink(AdmissionEngine& engine) : engine_(engine) {}
    void onTransition(const domain::Order& order, domain::OrderStatus from,
                      domain::OrderStatus to) override;

   private:
    AdmissionEngine& engine_;
  };

  nlohmann::json handleJsonCommand(const nlohmann::json& request);
  nlohmann::json handleSubmit(const nlohmann::json& request);
  nlohmann::json statusReply() const;

  // Reply for a transition result.
  static nlohmann::json orderReply(const domain::OrderResult& result);
  static nlohmann::json ordersJson(const std::vector<domain::Order>& orders);

  void publish(Event event);

  const EngineConfig config_;
  const ITimeProvider& clock_;

  std::unique_ptr<RiskLimitRegistry> registry_;
  std::unique_ptr<RateLimiter> rate_limiter_;
  std::unique_ptr<CostModel> cost_model_;
  std::unique_ptr<OrderLifecycle> lifecycle_;
  OrderIdGenerator id_gen_;
  std::unique_ptr<AdmissionController> controller_;
  TelemetrySink telemetry_sink_;

  std::unique_ptr<IpcServer> ipc_server_;
  // Non-null only while ipc_server_ is running. stop() takes the lock
  // exclusively before tearing the server down.
  std::shared_mutex telemetry_mutex_;
  IpcServer* telemetry_target_{nullptr};
  std::atomic<std::uint64_t> telemetry_sequence_{0};

  bool running_{false};
};

}  // namespace riskgate
