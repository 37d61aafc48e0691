#pragma once

#include <bigdec/integer.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace bigdec {

  // The value sign * coefficient * 10^exponent.
  //
  // Every instance is canonical: the coefficient is non-negative with no
  // trailing decimal zeros, and zero is always (positive, 0, 0).  Equal
  // values therefore have identical fields.
  class decimal {
  public:
    using sign_type = integer::sign_type;

    static constexpr int default_division_precision = 40;
    static constexpr int division_guard_digits = 5;
    static constexpr int default_significant_digits = 20;
    static constexpr int default_fraction_digits = 20;

  private:
    sign_type sign_ = sign_type::positive;
    integer coefficient_;
    int64_t exponent_ = 0;

  public:
    decimal() = default;
    // A negative coefficient is folded into the sign.
    decimal(integer coefficient, int64_t exponent,
            sign_type sign = sign_type::positive);
    // Parses decimal or scientific text; see parse().
    explicit decimal(std::string_view str);
    // Converts through the shortest round-trip text of value.
    explicit decimal(double value);

    static decimal
    one();

    sign_type
    sign() const;
    const integer&
    coefficient() const;
    int64_t
    exponent() const;
    bool
    is_zero() const;
    bool
    is_negative() const;

    decimal
    operator-() const;
    decimal
    abs() const;

    friend decimal
    operator+(const decimal& a, const decimal& b);
    friend decimal
    operator-(const decimal& a, const decimal& b);
    friend decimal
    operator*(const decimal& a, const decimal& b);
    friend decimal
    operator/(const decimal& a, const decimal& b);

    decimal&
    operator+=(const decimal& other);
    decimal&
    operator-=(const decimal& other);
    decimal&
    operator*=(const decimal& other);
    decimal&
    operator/=(const decimal& other);

    // Quotient rounded half-up to `precision` significant digits.  The
    // quotient is computed with division_guard_digits extra digits before
    // rounding, which is accurate to the last requested digit in practice
    // but is not a proven error bound.
    decimal
    div(const decimal& divisor,
        int precision = default_division_precision) const;

    // Integer power.  Negative powers are the reciprocal of the positive
    // power, computed with div() at `precision`.
    decimal
    pow(int64_t n, int precision = default_division_precision) const;
    // Throws invalid_exponent_error unless n is an integer.
    decimal
    pow(const decimal& n, int precision = default_division_precision) const;

    // -1, 0 or 1.
    int
    compare(const decimal& other) const;
    std::strong_ordering
    operator<=>(const decimal& other) const;
    bool
    operator==(const decimal& other) const;

    // Nearest double.  Magnitudes beyond the double range saturate to
    // infinity; magnitudes below it become zero.
    double
    to_double() const;
    explicit
    operator double() const;

    // Scientific notation, e.g. "-1.23456e+400", rounded half-up to
    // `significant_digits`.  Zero is "0".
    std::string
    to_string(int significant_digits = default_significant_digits) const;
    // Fixed-point notation with `fraction_digits` digits after the point.
    // The fraction is truncated, not rounded.
    std::string
    to_fixed(int fraction_digits = default_fraction_digits) const;

    friend std::ostream&
    operator<<(std::ostream& os, const decimal& d) {
      return os << d.to_string();
    }
  };

} // namespace bigdec

template <>
struct std::hash<bigdec::decimal> {
  std::size_t
  operator()(const bigdec::decimal& d) const noexcept {
    std::size_t seed = std::hash<bigdec::integer>{}(d.coefficient());
    seed ^= std::hash<int64_t>{}(d.exponent()) + 0x9e3779b9 + (seed << 6) +
            (seed >> 2);
    seed ^= std::hash<int>{}(static_cast<int>(d.sign())) + 0x9e3779b9 +
            (seed << 6) + (seed >> 2);
    return seed;
  }
};
