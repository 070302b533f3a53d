#include "riskgate/time/live_time_provider.hpp"

namespace riskgate {

std::int64_t LiveTimeProvider::now_ms() const {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  return duration_cast<milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace riskgate
