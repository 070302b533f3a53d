#include "riskgate/ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace riskgate {

namespace {

// Absorbs refill rounding so that waiting exactly retry_after always yields
// a whole token.
constexpr double kTokenEpsilon = 1e-9;

domain::Rejection makeRejection(domain::ErrorCode code, std::string message) {
  domain::Rejection r;
  r.code = code;
  r.message = std::move(message);
  return r;
}

}  // namespace

bool operator==(const BucketSnapshot& a, const BucketSnapshot& b) {
  return std::tie(a.exchange, a.kind, a.capacity, a.tokens, a.last_refill_ms) ==
         std::tie(b.exchange, b.kind, b.capacity, b.tokens, b.last_refill_ms);
}

// -----------------------------------------------------------------------------
// Constructor: one pair of full buckets per enabled exchange
// -----------------------------------------------------------------------------
RateLimiter::RateLimiter(const std::vector<domain::ExchangeConfig>& exchanges,
                         const ITimeProvider& clock)
    : clock_(clock) {
  const std::int64_t now = clock_.now_ms();

  for (const auto& cfg : exchanges) {
    if (!cfg.enabled) {
      continue;
    }
    if (cfg.orders_per_second <= 0.0 || cfg.queries_per_minute <= 0.0) {
      throw std::invalid_argument("RateLimiter: non-positive rate limit for " +
                                  cfg.name);
    }

    auto venue = std::make_unique<Venue>();
    venue->config = cfg;

    venue->orders.capacity = cfg.orders_per_second;
    venue->orders.refill_per_ms = cfg.orders_per_second / 1000.0;
    venue->orders.tokens = venue->orders.capacity;
    venue->orders.last_refill_ms = now;

    venue->queries.capacity = cfg.queries_per_minute;
    venue->queries.refill_per_ms = cfg.queries_per_minute / 60000.0;
    venue->queries.tokens = venue->queries.capacity;
    venue->queries.last_refill_ms = now;

    if (!venues_.emplace(cfg.name, std::move(venue)).second) {
      throw std::invalid_argument("RateLimiter: duplicate exchange " +
                                  cfg.name);
    }
  }
}

// -----------------------------------------------------------------------------
// Bucket::refill: lazy continuous refill, capped at capacity
// -----------------------------------------------------------------------------
void RateLimiter::Bucket::refill(std::int64_t now_ms) {
  // A clock that steps backwards adds nothing and keeps the newer stamp.
  if (now_ms <= last_refill_ms) {
    return;
  }
  double elapsed = static_cast<double>(now_ms - last_refill_ms);
  tokens = std::min(capacity, tokens + elapsed * refill_per_ms);
  last_refill_ms = now_ms;
}

// -----------------------------------------------------------------------------
// tryAcquire
// -----------------------------------------------------------------------------
domain::CheckResult RateLimiter::tryAcquire(const std::string& exchange,
                                            RequestKind kind) {
  auto it = venues_.find(exchange);
  if (it == venues_.end()) {
    return makeRejection(domain::ErrorCode::UnknownExchange,
                         "exchange '" + exchange + "' is not configured");
  }

  Venue& venue = *it->second;
  if (kind == RequestKind::Order && !venue.config.trading_enabled) {
    return makeRejection(domain::ErrorCode::ExchangeTradingDisabled,
                         "trading is disabled on " + exchange);
  }

  Bucket& bucket = venue.bucket(kind);
  std::lock_guard lock(bucket.mutex);
  bucket.refill(clock_.now_ms());

  if (bucket.tokens >= 1.0 - kTokenEpsilon) {
    bucket.tokens = std::max(0.0, bucket.tokens - 1.0);
    return std::nullopt;
  }

  // Time until the deficit is refilled, rounded up to a whole millisecond
  // and never zero, so a caller that waits retry_after is guaranteed a token.
  double deficit = 1.0 - bucket.tokens;
  auto wait_ms = static_cast<std::int64_t>(
      std::ceil(deficit / bucket.refill_per_ms));
  wait_ms = std::max<std::int64_t>(wait_ms, 1);

  std::ostringstream msg;
  msg << exchange << " " << toString(kind) << " rate limit of "
      << bucket.capacity << (kind == RequestKind::Order ? "/s" : "/min")
      << " exceeded; retry after " << wait_ms << " ms";

  domain::Rejection r = makeRejection(domain::ErrorCode::RateLimitExceeded,
                                      msg.str());
  r.limit = domain::Decimal::fromDouble(bucket.capacity);
  r.retry_after = std::chrono::milliseconds(wait_ms);
  return r;
}

// -----------------------------------------------------------------------------
// refund
// -----------------------------------------------------------------------------
void RateLimiter::refund(const std::string& exchange, RequestKind kind) {
  auto it = venues_.find(exchange);
  if (it == venues_.end()) {
    return;
  }

  Bucket& bucket = it->second->bucket(kind);
  std::lock_guard lock(bucket.mutex);
  bucket.tokens = std::min(bucket.capacity, bucket.tokens + 1.0);
}

bool RateLimiter::knowsExchange(const std::string& exchange) const {
  return venues_.count(exchange) != 0;
}

// -----------------------------------------------------------------------------
// snapshots
// -----------------------------------------------------------------------------
BucketSnapshot RateLimiter::describe(const std::string& exchange,
                                     RequestKind kind, const Bucket& bucket) {
  std::lock_guard lock(bucket.mutex);
  BucketSnapshot s;
  s.exchange = exchange;
  s.kind = kind;
  s.capacity = bucket.capacity;
  s.tokens = bucket.tokens;
  s.last_refill_ms = bucket.last_refill_ms;
  return s;
}

std::optional<BucketSnapshot> RateLimiter::snapshot(const std::string& exchange,
                                                    RequestKind kind) const {
  auto it = venues_.find(exchange);
  if (it == venues_.end()) {
    return std::nullopt;
  }
  return describe(exchange, kind, it->second->bucket(kind));
}

std::vector<BucketSnapshot> RateLimiter::snapshot() const {
  std::vector<BucketSnapshot> result;
  result.reserve(venues_.size() * 2);
  for (const auto& [name, venue] : venues_) {
    result.push_back(describe(name, RequestKind::Order, venue->orders));
    result.push_back(describe(name, RequestKind::Query, venue->queries));
  }
  std::sort(result.begin(), result.end(),
            [](const BucketSnapshot& a, const BucketSnapshot& b) {
              return std::tie(a.exchange, a.kind) < std::tie(b.exchange, b.kind);
            });
  return result;
}

}  // namespace riskgate
