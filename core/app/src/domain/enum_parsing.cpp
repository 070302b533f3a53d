#include "riskgate/domain/cost_model_params.hpp"
#include "riskgate/domain/order.hpp"

#include <cctype>
#include <string>

namespace riskgate {
namespace domain {

namespace {

std::string lower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

std::optional<Side> parseSide(std::string_view text) {
  std::string s = lower(text);
  if (s == "buy") {
    return Side::Buy;
  }
  if (s == "sell") {
    return Side::Sell;
  }
  return std::nullopt;
}

std::optional<SlippageType> parseSlippageType(std::string_view text) {
  std::string s = lower(text);
  if (s == "fixed_bps") {
    return SlippageType::FixedBps;
  }
  if (s == "none") {
    return SlippageType::None;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace riskgate
