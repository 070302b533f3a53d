#pragma once

#include "riskgate/domain/cost_model_params.hpp"
#include "riskgate/domain/exchange_config.hpp"
#include "riskgate/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// ConfigError — invalid or unreadable configuration
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// ZeroMQ endpoints. Either left empty disables the IPC server.
struct IpcConfig {
  std::string command_endpoint;
  std::string telemetry_endpoint;
};

// -----------------------------------------------------------------------------
// EngineConfig — typed form of the engine configuration document
// -----------------------------------------------------------------------------
//
// Document layout (key names are the external contract):
//
//   {
//     "engine_name": "...",
//     "risk_limits": {
//       "position_limits": { "BTC-USD": 10.0, ... },
//       "max_drawdown_pct": 5.0,
//       "drawdown_window_days": 1,
//       "max_daily_loss": 100000,
//       "max_position_value_pct": 20.0,
//       "strategy_exposure_limits": { "momentum_strategy": 500000, ... },
//       "reject_unknown_instruments": false,
//       "day_rollover_hour_utc": 0
//     },
//     "exchanges": [
//       { "name": "Binance", "enabled": true, "trading_enabled": true,
//         "rate_limits": { "orders_per_second": 10,
//                          "queries_per_minute": 1200 } }
//     ],
//     "trading_parameters": {
//       "max_order_quantity": { "BTC-USD": 5.0, "default": 1000000 },
//       "slippage_model": { "type": "fixed_bps", "value": 5 },
//       "transaction_costs": { "commission_rate": 0.001,
//                              "minimum_commission": 1.0 }
//     },
//     "ipc": { "command_endpoint": "tcp://127.0.0.1:5556",
//              "telemetry_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// Every section and key is optional; absent keys keep the defaults of the
// domain structs. Decimal values may be JSON numbers or decimal strings.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string engine_name{"riskgate"};
  domain::RiskLimits risk_limits;
  std::vector<domain::ExchangeConfig> exchanges;
  domain::CostModelParams cost_model;
  IpcConfig ipc;
};

// -----------------------------------------------------------------------------
// parseConfig(document)
// -----------------------------------------------------------------------------
// @throws ConfigError naming the offending key for a wrong type, a
//         malformed number, a negative limit, an unknown slippage type, a
//         non-positive rate limit, a duplicate exchange name, or an
//         out-of-range rollover hour / window length.
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& document);

// Parses JSON text. Syntax errors are reported as ConfigError.
EngineConfig parseConfigText(const std::string& text);

// Reads and parses a file. An unreadable file is a ConfigError.
EngineConfig loadConfigFile(const std::string& path);

}  // namespace riskgate
