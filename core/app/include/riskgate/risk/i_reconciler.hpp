#pragma once

#include "riskgate/domain/position.hpp"

#include <utility>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// IReconciler — source of positions held before the engine started
// -----------------------------------------------------------------------------
//
// @brief  Reports the committed positions an exchange (or journal) already
//         holds, so position limits are evaluated against the real baseline
//         instead of assuming flat.
//
// @details
// Called exactly once, synchronously, from AdmissionEngine::start() before
// any order is admitted. Each returned position is passed to
// RiskLimitRegistry::hydratePosition().
//
// Ownership:
//   The engine receives a non-owning pointer in start() and drops it once
//   start() returns.
//
// Thread model:
//   Called from the thread that calls start(). Implementations may perform
//   I/O but must return promptly.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual std::vector<domain::Position> reconcilePositions() = 0;
};

// -----------------------------------------------------------------------------
// StaticReconciler — reconciler over a fixed list of positions
// -----------------------------------------------------------------------------
// Used by tests and by deployments that restore positions from a snapshot
// file rather than querying a venue.
// -----------------------------------------------------------------------------
class StaticReconciler : public IReconciler {
 public:
  explicit StaticReconciler(std::vector<domain::Position> positions)
      : positions_(std::move(positions)) {}

  std::vector<domain::Position> reconcilePositions() override {
    return positions_;
  }

 private:
  std::vector<domain::Position> positions_;
};

}  // namespace riskgate
