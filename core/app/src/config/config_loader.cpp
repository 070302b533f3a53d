#include "riskgate/config/config_loader.hpp"
#include "riskgate/serialization/json_codec.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace riskgate {

using nlohmann::json;

namespace {

const json* member(const json& object, const char* key, const std::string& path) {
  if (!object.is_object()) {
    throw ConfigError(path + ": expected an object");
  }
  auto it = object.find(key);
  return it != object.end() && !it->is_null() ? &*it : nullptr;
}

domain::Decimal readDecimal(const json& value, const std::string& path) {
  try {
    return decimalFromJson(value);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

domain::Decimal readNonNegative(const json& value, const std::string& path) {
  domain::Decimal d = readDecimal(value, path);
  if (d.isNegative()) {
    throw ConfigError(path + ": must not be negative, got " + d.toString());
  }
  return d;
}

bool readBool(const json& value, const std::string& path) {
  if (!value.is_boolean()) {
    throw ConfigError(path + ": expected true or false");
  }
  return value.get<bool>();
}

int readInt(const json& value, const std::string& path) {
  if (!value.is_number_integer()) {
    throw ConfigError(path + ": expected an integer");
  }
  return value.get<int>();
}

std::string readString(const json& value, const std::string& path) {
  if (!value.is_string()) {
    throw ConfigError(path + ": expected a string");
  }
  return value.get<std::string>();
}

double readRate(const json& value, const std::string& path) {
  domain::Decimal d = readDecimal(value, path);
  if (!d.isPositive()) {
    throw ConfigError(path + ": must be positive, got " + d.toString());
  }
  return d.toDouble();
}

void readDecimalMap(const json& object, const std::string& path,
                    std::unordered_map<std::string, domain::Decimal>& out) {
  if (!object.is_object()) {
    throw ConfigError(path + ": expected an object");
  }
  for (const auto& [key, value] : object.items()) {
    out[key] = readNonNegative(value, path + "." + key);
  }
}

// --- risk_limits -------------------------------------------------------------
void parseRiskLimits(const json& section, domain::RiskLimits& limits) {
  const std::string path = "risk_limits";

  if (auto* v = member(section, "position_limits", path)) {
    readDecimalMap(*v, path + ".position_limits", limits.position_limits);
  }
  if (auto* v = member(section, "max_drawdown_pct", path)) {
    limits.max_drawdown_pct = readNonNegative(*v, path + ".max_drawdown_pct");
  }
  if (auto* v = member(section, "drawdown_window_days", path)) {
    limits.drawdown_window_days = readInt(*v, path + ".drawdown_window_days");
    if (limits.drawdown_window_days < 1) {
      throw ConfigError(path + ".drawdown_window_days: must be at least 1");
    }
  }
  if (auto* v = member(section, "max_daily_loss", path)) {
    limits.max_daily_loss = readNonNegative(*v, path + ".max_daily_loss");
  }
  if (auto* v = member(section, "max_position_value_pct", path)) {
    limits.max_position_value_pct =
        readNonNegative(*v, path + ".max_position_value_pct");
  }
  if (auto* v = member(section, "strategy_exposure_limits", path)) {
    readDecimalMap(*v, path + ".strategy_exposure_limits",
                   limits.strategy_exposure_limits);
  }
  if (auto* v = member(section, "reject_unknown_instruments", path)) {
    limits.reject_unknown_instruments =
        readBool(*v, path + ".reject_unknown_instruments");
  }
  if (auto* v = member(section, "day_rollover_hour_utc", path)) {
    limits.day_rollover_hour_utc = readInt(*v, path + ".day_rollover_hour_utc");
    if (limits.day_rollover_hour_utc < 0 || limits.day_rollover_hour_utc > 23) {
      throw ConfigError(path + ".day_rollover_hour_utc: must be within 0..23");
    }
  }
}

// --- exchanges -----------------------------------------------------------------
std::vector<domain::ExchangeConfig> parseExchanges(const json& section) {
  if (!section.is_array()) {
    throw ConfigError("exchanges: expected an array");
  }

  std::vector<domain::ExchangeConfig> exchanges;
  std::unordered_set<std::string> seen;

  for (std::size_t i = 0; i < section.size(); ++i) {
    const json& entry = section[i];
    const std::string path = "exchanges[" + std::to_string(i) + "]";

    domain::ExchangeConfig ex;
    const json* name = member(entry, "name", path);
    if (name == nullptr) {
      throw ConfigError(path + ".name: missing");
    }
    ex.name = readString(*name, path + ".name");
    if (ex.name.empty() || !seen.insert(ex.name).second) {
      throw ConfigError(path + ".name: empty or duplicate exchange name '" +
                        ex.name + "'");
    }

    if (auto* v = member(entry, "enabled", path)) {
      ex.enabled = readBool(*v, path + ".enabled");
    }
    if (auto* v = member(entry, "trading_enabled", path)) {
      ex.trading_enabled = readBool(*v, path + ".trading_enabled");
    }
    if (auto* limits = member(entry, "rate_limits", path)) {
      const std::string rl = path + ".rate_limits";
      if (auto* v = member(*limits, "orders_per_second", rl)) {
        ex.orders_per_second = readRate(*v, rl + ".orders_per_second");
      }
      if (auto* v = member(*limits, "queries_per_minute", rl)) {
        ex.queries_per_minute = readRate(*v, rl + ".queries_per_minute");
      }
    }
    exchanges.push_back(std::move(ex));
  }
  return exchanges;
}

// --- trading_parameters --------------------------------------------------------
void parseTradingParameters(const json& section, EngineConfig& config) {
  const std::string path = "trading_parameters";

  if (auto* v = member(section, "max_order_quantity", path)) {
    readDecimalMap(*v, path + ".max_order_quantity",
                   config.risk_limits.max_order_quantity);
    auto def = config.risk_limits.max_order_quantity.find("default");
    if (def != config.risk_limits.max_order_quantity.end()) {
      config.risk_limits.default_max_order_quantity = def->second;
      config.risk_limits.max_order_quantity.erase(def);
    }
  }

  if (auto* model = member(section, "slippage_model", path)) {
    const std::string sp = path + ".slippage_model";
    if (auto* v = member(*model, "type", sp)) {
      std::string type = readString(*v, sp + ".type");
      auto parsed = domain::parseSlippageType(type);
      if (!parsed) {
        throw ConfigError(sp + ".type: unknown slippage model '" + type + "'");
      }
      config.cost_model.slippage_type = *parsed;
    }
    if (auto* v = member(*model, "value", sp)) {
      config.cost_model.slippage_value = readNonNegative(*v, sp + ".value");
    }
  }

  if (auto* costs = member(section, "transaction_costs", path)) {
    const std::string tc = path + ".transaction_costs";
    if (auto* v = member(*costs, "commission_rate", tc)) {
      config.cost_model.commission_rate =
          readNonNegative(*v, tc + ".commission_rate");
    }
    if (auto* v = member(*costs, "minimum_commission", tc)) {
      config.cost_model.minimum_commission =
          readNonNegative(*v, tc + ".minimum_commission");
    }
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& document) {
  if (!document.is_object()) {
    throw ConfigError("configuration root must be an object");
  }

  EngineConfig config;

  if (auto* v = member(document, "engine_name", "root")) {
    config.engine_name = readString(*v, "engine_name");
  }
  if (auto* v = member(document, "risk_limits", "root")) {
    parseRiskLimits(*v, config.risk_limits);
  }
  if (auto* v = member(document, "exchanges", "root")) {
    config.exchanges = parseExchanges(*v);
  }
  if (auto* v = member(document, "trading_parameters", "root")) {
    parseTradingParameters(*v, config);
  }
  if (auto* ipc = member(document, "ipc", "root")) {
    if (auto* v = member(*ipc, "command_endpoint", "ipc")) {
      config.ipc.command_endpoint = readString(*v, "ipc.command_endpoint");
    }
    if (auto* v = member(*ipc, "telemetry_endpoint", "ipc")) {
      config.ipc.telemetry_endpoint = readString(*v, "ipc.telemetry_endpoint");
    }
  }
  return config;
}

EngineConfig parseConfigText(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  return parseConfig(document);
}

EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  std::ostringstream text;
  text << in.rdbuf();
  return parseConfigText(text.str());
}

}  // namespace riskgate
