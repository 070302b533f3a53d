#pragma once

#include <string>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// ExchangeConfig — one entry of the `exchanges` config list
// -----------------------------------------------------------------------------
// Connectivity fields (api_url, ws_url) belong to the exchange clients and
// are not carried here; the admission core only needs the switches and the
// rate limits.
// -----------------------------------------------------------------------------
struct ExchangeConfig {
  std::string name;
  bool enabled{true};
  bool trading_enabled{true};
  double orders_per_second{10.0};
  double queries_per_minute{1200.0};
};

}  // namespace domain
}  // namespace riskgate
