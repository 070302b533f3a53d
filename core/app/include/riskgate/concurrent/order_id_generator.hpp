#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace riskgate {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe source of order identifiers
// -----------------------------------------------------------------------------
//
// @brief  Produces "<prefix><n>" identifiers with n starting at 1 and
//         increasing by one per call.
//
// @details
// Used by the AdmissionController for candidates that arrive without an
// identifier. fetch_add(relaxed) is enough: the only requirement is that no
// two calls observe the same counter value.
//
// Ownership:
//   Owned by AdmissionEngine as a value member and injected by reference.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::string prefix = "ORD-")
      : prefix_(std::move(prefix)) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // Thread-safety: Safe to call concurrently from any thread.
  std::string next_id() {
    return prefix_ +
           std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace riskgate
