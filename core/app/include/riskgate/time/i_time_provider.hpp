#pragma once

#include <chrono>
#include <cstdint>

namespace riskgate {

// Epoch-based UTC instant. Telemetry events are stamped with it.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ITimeProvider — the clock every time-dependent check reads
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for token refills, trading-day and drawdown-window
//         boundaries, and telemetry timestamps.
//
// @details
// RateLimiter, RiskLimitRegistry and AdmissionEngine take a
// `const ITimeProvider&` and never read std::chrono clocks themselves. The
// executable passes a LiveTimeProvider; tests pass a SimulationTimeProvider
// and move it by hand to hit exact refill amounts and UTC rollovers.
//
// Implementations must tolerate concurrent now_ms() calls. The provider
// must outlive every component holding a reference to it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01T00:00:00Z.
  virtual std::int64_t now_ms() const = 0;

  Timestamp now() const {
    return Timestamp{std::chrono::milliseconds(now_ms())};
  }
};

}  // namespace riskgate
