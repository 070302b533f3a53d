#pragma once

#include "riskgate/domain/exchange_config.hpp"
#include "riskgate/domain/rejection.hpp"
#include "riskgate/time/i_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskgate {

// Which API budget a request draws from.
enum class RequestKind {
  Order,  // order placement: `orders_per_second`
  Query,  // any other REST call: `queries_per_minute`
};

inline const char* toString(RequestKind kind) {
  return kind == RequestKind::Order ? "order" : "query";
}

// -----------------------------------------------------------------------------
// BucketSnapshot — observable state of one token bucket
// -----------------------------------------------------------------------------
struct BucketSnapshot {
  std::string exchange;
  RequestKind kind{RequestKind::Order};
  double capacity{0.0};
  double tokens{0.0};
  std::int64_t last_refill_ms{0};
};

bool operator==(const BucketSnapshot& a, const BucketSnapshot& b);
inline bool operator!=(const BucketSnapshot& a, const BucketSnapshot& b) {
  return !(a == b);
}

// -----------------------------------------------------------------------------
// RateLimiter — per-exchange token buckets
// -----------------------------------------------------------------------------
//
// @brief  Enforces each exchange's `orders_per_second` and
//         `queries_per_minute` ceilings before a request leaves the engine.
//
// @details
// Every configured exchange gets two buckets:
//
//   kind   capacity               refill
//   Order  orders_per_second      orders_per_second / 1000 per ms
//   Query  queries_per_minute     queries_per_minute / 60000 per ms
//
// Buckets start full. Refill is lazy: on each access the bucket adds
// elapsed_ms * rate tokens (capped at capacity) and moves its timestamp
// forward. No timer thread exists, so idle exchanges cost nothing.
//
// tryAcquire() is atomic per bucket: it either removes exactly one token or
// removes nothing and reports how long until a whole token is available.
// The caller decides whether to retry; the limiter never sleeps.
//
// Thread model:
//   The exchange table is built in the constructor and never modified, so
//   lookups take no lock. Each bucket has its own mutex: requests to
//   different exchanges, or to the order and query budgets of one exchange,
//   never contend.
//
// Ownership:
//   Owned by AdmissionEngine. Holds a reference to the clock, which must
//   outlive it.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  exchanges  One entry per venue. Disabled venues (enabled=false)
  //                    are left out and behave like unknown venues.
  // @param  clock      Time source for lazy refill.
  //
  // @throws std::invalid_argument on a non-positive rate or a duplicate
  //         exchange name.
  // -------------------------------------------------------------------------
  RateLimiter(const std::vector<domain::ExchangeConfig>& exchanges,
              const ITimeProvider& clock);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // -------------------------------------------------------------------------
  // tryAcquire(exchange, kind)
  // -------------------------------------------------------------------------
  // @return std::nullopt when a token was taken. Otherwise a Rejection:
  //         - UnknownExchange          no enabled venue with this name
  //         - ExchangeTradingDisabled  kind == Order and trading_enabled is
  //                                    false for the venue
  //         - RateLimitExceeded        bucket empty; retry_after > 0 is the
  //                                    time until one whole token exists
  //
  // Thread-safety: Safe from any thread.
  // Side-effects:  Refills the bucket; takes one token on success only.
  // -------------------------------------------------------------------------
  domain::CheckResult tryAcquire(const std::string& exchange,
                                 RequestKind kind);

  // -------------------------------------------------------------------------
  // refund(exchange, kind)
  // -------------------------------------------------------------------------
  // @brief  Returns one token taken by tryAcquire() for a request that was
  //         refused before it reached the venue.
  //
  // @details
  // The AdmissionController calls this when the risk check rejects an order
  // after the rate check passed, so a rejected order leaves the bucket as
  // it found it. Tokens stay capped at capacity.
  // -------------------------------------------------------------------------
  void refund(const std::string& exchange, RequestKind kind);

  bool knowsExchange(const std::string& exchange) const;

  std::optional<BucketSnapshot> snapshot(const std::string& exchange,
                                         RequestKind kind) const;

  // All buckets, sorted by exchange then kind.
  std::vector<BucketSnapshot> snapshot() const;

 private:
  struct Bucket {
    mutable std::mutex mutex;
    double capacity{0.0};
    double refill_per_ms{0.0};
    double tokens{0.0};
    std::int64_t last_refill_ms{0};

    // Caller holds mutex.
    void refill(std::int64_t now_ms);
  };

  struct Venue {
    domain::ExchangeConfig config;
    Bucket orders;
    Bucket queries;

    Bucket& bucket(RequestKind kind) {
      return kind == RequestKind::Order ? orders : queries;
    }
    const Bucket& bucket(RequestKind kind) const {
      return kind == RequestKind::Order ? orders : queries;
    }
  };

  static BucketSnapshot describe(const std::string& exchange,
                                 RequestKind kind, const Bucket& bucket);

  const ITimeProvider& clock_;

  // Built once in the constructor; read-only afterwards.
  std::unordered_map<std::string, std::unique_ptr<Venue>> venues_;
};

}  // namespace riskgate
