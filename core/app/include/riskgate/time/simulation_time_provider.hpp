#pragma once

#include "riskgate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — hand-cranked clock
// -----------------------------------------------------------------------------
//
// @brief  Stands still until set_time() or advance_by() is called.
//
// @details
// Scenarios such as "eleven orders inside one millisecond", "wait exactly
// retry_after" or "cross the 00:00 UTC rollover" become deterministic.
// The reading is atomic, so one thread may move the clock while admission
// threads read it.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms) : now_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Jumps to an absolute epoch time. Keeping it monotonic is up to the
  // caller; a day index that moves backwards still counts as a rollover.
  void set_time(std::int64_t epoch_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> now_ms_{0};
};

}  // namespace riskgate
