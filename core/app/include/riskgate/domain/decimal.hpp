#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace riskgate {
namespace domain {

// -----------------------------------------------------------------------------
// Decimal — exact fixed-point number for prices, quantities and money
// -----------------------------------------------------------------------------
//
// @brief  Signed decimal with 8 fractional digits stored as a scaled int64.
//
// @details
// Every price, quantity, notional, limit and PnL in the engine is a Decimal.
// Binary floating point cannot represent values such as 0.1 or 100.05
// exactly, so limit comparisons like "8 + 3 > 10" or "position == 10.0"
// could flip on rounding noise. With a fixed scale these comparisons are
// exact for every value with at most 8 decimal places.
//
// Representation:
//   value = raw / kScale, kScale = 10^8
//   Range: roughly +/- 9.2e10 (largest()), so notionals up to ~92 billion.
//
// Arithmetic:
//   + and - are exact. * and / compute in 128-bit intermediates and round
//   half away from zero to the nearest 1e-8. A result outside the range
//   throws std::overflow_error; division by zero throws std::domain_error.
//   The try*() forms return std::nullopt instead, for paths that must not
//   throw (admission checks).
//
// Thread model:
//   Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr std::int64_t kScale = 100000000;
  static constexpr int kFractionDigits = 8;

  constexpr Decimal() = default;

  // Integer constructor, so limits can be written as Decimal(10).
  constexpr Decimal(int units) : raw_(static_cast<std::int64_t>(units) * kScale) {}

  static constexpr Decimal fromRaw(std::int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
  }

  static constexpr Decimal fromUnits(std::int64_t units) {
    return fromRaw(units * kScale);
  }

  static constexpr Decimal largest() {
    return fromRaw(std::numeric_limits<std::int64_t>::max());
  }

  // Rounds to the nearest 1e-8. Used for config numbers and JSON input.
  // @throws std::overflow_error if value is not finite or out of range.
  static Decimal fromDouble(double value);

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses "-12.5", "100", "0.00000001" style literals.
  //
  // @return The value, or std::nullopt if the text is not a plain decimal
  //         literal, has more than 8 fractional digits, or overflows.
  // -------------------------------------------------------------------------
  static std::optional<Decimal> parse(std::string_view text);

  constexpr std::int64_t raw() const { return raw_; }
  double toDouble() const { return static_cast<double>(raw_) / kScale; }

  // Shortest exact rendering: "100.05", "1", "-0.10005".
  std::string toString() const;

  constexpr bool isZero() const { return raw_ == 0; }
  constexpr bool isPositive() const { return raw_ > 0; }
  constexpr bool isNegative() const { return raw_ < 0; }

  Decimal abs() const { return raw_ < 0 ? -*this : *this; }

  Decimal operator-() const {
    if (raw_ == std::numeric_limits<std::int64_t>::min()) {
      throw std::overflow_error("Decimal negation out of range");
    }
    return fromRaw(-raw_);
  }

  Decimal& operator+=(Decimal other) { return *this = *this + other; }
  Decimal& operator-=(Decimal other) { return *this = *this - other; }

  static std::optional<Decimal> tryAdd(Decimal a, Decimal b);
  static std::optional<Decimal> trySubtract(Decimal a, Decimal b);
  static std::optional<Decimal> tryMultiply(Decimal a, Decimal b);
  static std::optional<Decimal> tryDivide(Decimal a, Decimal b);

  // -------------------------------------------------------------------------
  // compareProducts(a, b, c, d)
  // -------------------------------------------------------------------------
  // Sign of (a * b) - (c * d), computed exactly in 128 bits. Lets limit
  // checks such as "value / portfolio > pct / 100" be decided without an
  // intermediate that could leave the Decimal range.
  //
  // @return -1, 0 or 1. Never throws.
  // -------------------------------------------------------------------------
  static int compareProducts(Decimal a, Decimal b, Decimal c, Decimal d);

  friend Decimal operator+(Decimal a, Decimal b);
  friend Decimal operator-(Decimal a, Decimal b);
  friend Decimal operator*(Decimal a, Decimal b);
  friend Decimal operator/(Decimal a, Decimal b);

  friend constexpr bool operator==(Decimal a, Decimal b) { return a.raw_ == b.raw_; }
  friend constexpr bool operator!=(Decimal a, Decimal b) { return a.raw_ != b.raw_; }
  friend constexpr bool operator<(Decimal a, Decimal b) { return a.raw_ < b.raw_; }
  friend constexpr bool operator<=(Decimal a, Decimal b) { return a.raw_ <= b.raw_; }
  friend constexpr bool operator>(Decimal a, Decimal b) { return a.raw_ > b.raw_; }
  friend constexpr bool operator>=(Decimal a, Decimal b) { return a.raw_ >= b.raw_; }

 private:
  std::int64_t raw_{0};
};

inline constexpr Decimal max(Decimal a, Decimal b) { return a < b ? b : a; }
inline constexpr Decimal min(Decimal a, Decimal b) { return b < a ? b : a; }

std::ostream& operator<<(std::ostream& os, Decimal value);

}  // namespace domain
}  // namespace riskgate
