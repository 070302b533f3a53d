#pragma once

#include "riskgate/time/i_time_provider.hpp"

namespace riskgate {

// Reads std::chrono::system_clock. The clock main() hands to the engine.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskgate
