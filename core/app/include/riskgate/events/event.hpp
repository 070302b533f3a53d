#pragma once

#include "riskgate/events/event_types.hpp"

#include <variant>

namespace riskgate {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of telemetry events carried from admission threads to the IPC
// thread. std::variant keeps them as value types in a single queue without
// heap allocation or a common base class.
// -----------------------------------------------------------------------------
using Event = std::variant<OrderTransitionEvent, AdmissionRejectEvent>;

}  // namespace riskgate
