#include "riskgate/domain/decimal.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace riskgate {
namespace domain {

namespace {

__extension__ typedef __int128 Wide;

constexpr std::int64_t kMaxRaw = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinRaw = std::numeric_limits<std::int64_t>::min();

// 2^63 as a double; every finite double below it in magnitude converts.
constexpr double kRawLimit = 9223372036854775808.0;

// Integer division rounding half away from zero. The quotient is returned
// wide; the caller range-checks it.
Wide divideRounded(Wide numerator, Wide denominator) {
  Wide quotient = numerator / denominator;
  Wide remainder = numerator % denominator;
  Wide abs_rem = remainder < 0 ? -remainder : remainder;
  Wide abs_den = denominator < 0 ? -denominator : denominator;

  if (2 * abs_rem >= abs_den) {
    quotient += ((numerator < 0) != (denominator < 0)) ? -1 : 1;
  }
  return quotient;
}

std::optional<Decimal> narrow(Wide raw) {
  if (raw > kMaxRaw || raw < kMinRaw) {
    return std::nullopt;
  }
  return Decimal::fromRaw(static_cast<std::int64_t>(raw));
}

}  // namespace

// -----------------------------------------------------------------------------
// fromDouble
// -----------------------------------------------------------------------------
Decimal Decimal::fromDouble(double value) {
  const double scaled = std::round(value * kScale);
  if (!std::isfinite(scaled) || scaled >= kRawLimit || scaled < -kRawLimit) {
    throw std::overflow_error("Decimal: " + std::to_string(value) +
                              " is outside the representable range");
  }
  return fromRaw(static_cast<std::int64_t>(scaled));
}

// -----------------------------------------------------------------------------
// parse: [+-]digits[.digits], at most kFractionDigits after the point
// -----------------------------------------------------------------------------
std::optional<Decimal> Decimal::parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  std::size_t pos = 0;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    pos = 1;
  }

  std::int64_t integer_part = 0;
  std::int64_t fraction_part = 0;
  int integer_digits = 0;
  int fraction_digits = 0;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }

    int digit = c - '0';
    if (seen_point) {
      if (++fraction_digits > kFractionDigits) {
        return std::nullopt;
      }
      fraction_part = fraction_part * 10 + digit;
    } else {
      if (integer_part > (kMaxRaw / kScale - digit) / 10) {
        return std::nullopt;
      }
      integer_part = integer_part * 10 + digit;
      ++integer_digits;
    }
  }

  if (integer_digits == 0 && fraction_digits == 0) {
    return std::nullopt;
  }

  for (int i = fraction_digits; i < kFractionDigits; ++i) {
    fraction_part *= 10;
  }

  if (integer_part == kMaxRaw / kScale && fraction_part > kMaxRaw % kScale) {
    return std::nullopt;
  }

  std::int64_t raw = integer_part * kScale + fraction_part;
  return fromRaw(negative ? -raw : raw);
}

// -----------------------------------------------------------------------------
// toString: trailing fractional zeros are dropped
// -----------------------------------------------------------------------------
std::string Decimal::toString() const {
  // Work on the unsigned magnitude so INT64_MIN does not overflow.
  std::uint64_t magnitude = raw_ < 0
                                ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1
                                : static_cast<std::uint64_t>(raw_);
  std::uint64_t units = magnitude / kScale;
  std::uint64_t fraction = magnitude % kScale;

  std::string out = raw_ < 0 ? "-" : "";
  out += std::to_string(units);

  if (fraction != 0) {
    std::string digits = std::to_string(fraction);
    digits.insert(0, kFractionDigits - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    out += '.';
    out += digits;
  }
  return out;
}

// -----------------------------------------------------------------------------
// Checked arithmetic through 128-bit intermediates
// -----------------------------------------------------------------------------
std::optional<Decimal> Decimal::tryAdd(Decimal a, Decimal b) {
  return narrow(static_cast<Wide>(a.raw_) + b.raw_);
}

std::optional<Decimal> Decimal::trySubtract(Decimal a, Decimal b) {
  return narrow(static_cast<Wide>(a.raw_) - b.raw_);
}

std::optional<Decimal> Decimal::tryMultiply(Decimal a, Decimal b) {
  Wide product = static_cast<Wide>(a.raw_) * static_cast<Wide>(b.raw_);
  return narrow(divideRounded(product, kScale));
}

std::optional<Decimal> Decimal::tryDivide(Decimal a, Decimal b) {
  if (b.raw_ == 0) {
    return std::nullopt;
  }
  Wide numerator = static_cast<Wide>(a.raw_) * kScale;
  return narrow(divideRounded(numerator, b.raw_));
}

int Decimal::compareProducts(Decimal a, Decimal b, Decimal c, Decimal d) {
  // |raw| < 2^63, so each product is below 2^126 and the comparison is exact.
  Wide left = static_cast<Wide>(a.raw_) * b.raw_;
  Wide right = static_cast<Wide>(c.raw_) * d.raw_;
  return left < right ? -1 : (left > right ? 1 : 0);
}

Decimal operator+(Decimal a, Decimal b) {
  if (auto sum = Decimal::tryAdd(a, b)) {
    return *sum;
  }
  throw std::overflow_error("Decimal addition out of range: " + a.toString() +
                            " + " + b.toString());
}

Decimal operator-(Decimal a, Decimal b) {
  if (auto difference = Decimal::trySubtract(a, b)) {
    return *difference;
  }
  throw std::overflow_error("Decimal subtraction out of range: " +
                            a.toString() + " - " + b.toString());
}

Decimal operator*(Decimal a, Decimal b) {
  if (auto product = Decimal::tryMultiply(a, b)) {
    return *product;
  }
  throw std::overflow_error("Decimal multiplication out of range: " +
                            a.toString() + " * " + b.toString());
}

Decimal operator/(Decimal a, Decimal b) {
  if (b.raw_ == 0) {
    throw std::domain_error("Decimal division by zero");
  }
  if (auto quotient = Decimal::tryDivide(a, b)) {
    return *quotient;
  }
  throw std::overflow_error("Decimal division out of range: " + a.toString() +
                            " / " + b.toString());
}

std::ostream& operator<<(std::ostream& os, Decimal value) {
  return os << value.toString();
}

}  // namespace domain
}  // namespace riskgate
