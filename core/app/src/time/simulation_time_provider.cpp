#include "riskgate/time/simulation_time_provider.hpp"

namespace riskgate {

std::int64_t SimulationTimeProvider::now_ms() const { return now_ms_.load(); }

void SimulationTimeProvider::set_time(std::int64_t epoch_ms) {
  now_ms_.store(epoch_ms);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  now_ms_.fetch_add(delta_ms);
}

}  // namespace riskgate
