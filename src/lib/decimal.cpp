#include <bigdec/decimal.hpp>

#include <bigdec/error.hpp>

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace bigdec {

  namespace {

    using sign_type = decimal::sign_type;

    sign_type
    flip(sign_type sign) {
      return sign == sign_type::positive ? sign_type::negative
                                         : sign_type::positive;
    }

    sign_type
    product_sign(sign_type a, sign_type b) {
      return a == b ? sign_type::positive : sign_type::negative;
    }

    // Exponent arithmetic; results must stay within int64_t.
    int64_t
    checked_add(int64_t a, int64_t b) {
      if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
          (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        throw std::overflow_error("decimal: exponent out of range");
      }
      return a + b;
    }

    int64_t
    checked_sub(int64_t a, int64_t b) {
      if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) ||
          (b > 0 && a < std::numeric_limits<int64_t>::min() + b)) {
        throw std::overflow_error("decimal: exponent out of range");
      }
      return a - b;
    }

    // Distance between two exponents, hi >= lo.  Always fits in uint64_t.
    uint64_t
    exponent_gap(int64_t hi, int64_t lo) {
      return static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo);
    }

    // Align two coefficients to the same exponent (the smaller one).
    // Returns the aligned coefficients and the common exponent.
    struct aligned {
      integer a;
      integer b;
      int64_t exponent;
    };

    aligned
    align_exponents(const integer& coef_a, int64_t exp_a, const integer& coef_b,
                    int64_t exp_b) {
      if (exp_a == exp_b) { return {coef_a, coef_b, exp_a}; }
      if (exp_a < exp_b) {
        return {coef_a,
                coef_b.scaled_by_pow10(
                    static_cast<std::size_t>(exponent_gap(exp_b, exp_a))),
                exp_a};
      }
      return {coef_a.scaled_by_pow10(
                  static_cast<std::size_t>(exponent_gap(exp_a, exp_b))),
              coef_b, exp_b};
    }

    // Orders two nonzero magnitudes.  When the exponents are further apart
    // than the digits of the lower one, the answer needs no alignment.
    std::strong_ordering
    magnitude_order(const integer& coef_a, int64_t exp_a, const integer& coef_b,
                    int64_t exp_b) {
      if (exp_a < exp_b &&
          exponent_gap(exp_b, exp_a) >= coef_a.digit_count()) {
        return std::strong_ordering::less;
      }
      if (exp_b < exp_a &&
          exponent_gap(exp_a, exp_b) >= coef_b.digit_count()) {
        return std::strong_ordering::greater;
      }
      auto [ca, cb, exp] = align_exponents(coef_a, exp_a, coef_b, exp_b);
      return ca <=> cb;
    }

    integer
    signed_coefficient(const decimal& d) {
      return d.is_negative() ? -d.coefficient() : d.coefficient();
    }

    // Square-and-multiply; exact.
    decimal
    power(const decimal& base, uint64_t n) {
      decimal result = decimal::one();
      decimal factor = base;
      while (n != 0) {
        if ((n & 1) != 0) { result *= factor; }
        n >>= 1;
        if (n != 0) { factor *= factor; }
      }
      return result;
    }

  } // namespace

  decimal::decimal(integer coefficient, int64_t exponent, sign_type sign)
      : sign_(sign), coefficient_(std::move(coefficient)), exponent_(exponent) {
    if (coefficient_.is_negative()) {
      coefficient_ = coefficient_.abs();
      sign_ = flip(sign_);
    }

    if (coefficient_.is_zero()) {
      sign_ = sign_type::positive;
      exponent_ = 0;
      return;
    }

    std::size_t zeros = coefficient_.trailing_zero_digits();
    if (zeros != 0) {
      coefficient_ = coefficient_.divided_by_pow10(zeros);
      exponent_ = checked_add(exponent_, static_cast<int64_t>(zeros));
    }
  }

  decimal
  decimal::one() {
    return decimal(integer(int64_t{1}), 0);
  }

  decimal::sign_type
  decimal::sign() const {
    return sign_;
  }

  const integer&
  decimal::coefficient() const {
    return coefficient_;
  }

  int64_t
  decimal::exponent() const {
    return exponent_;
  }

  bool
  decimal::is_zero() const {
    return coefficient_.is_zero();
  }

  bool
  decimal::is_negative() const {
    return sign_ == sign_type::negative;
  }

  decimal
  decimal::operator-() const {
    if (is_zero()) { return *this; }
    decimal result = *this;
    result.sign_ = flip(sign_);
    return result;
  }

  decimal
  decimal::abs() const {
    decimal result = *this;
    result.sign_ = sign_type::positive;
    return result;
  }

  decimal
  operator+(const decimal& a, const decimal& b) {
    if (a.is_zero()) { return b; }
    if (b.is_zero()) { return a; }

    auto [sa, sb, exp] = align_exponents(
        signed_coefficient(a), a.exponent_, signed_coefficient(b), b.exponent_);
    integer sum = sa + sb;
    if (sum.is_zero()) { return decimal(); }
    return decimal(std::move(sum), exp);
  }

  decimal
  operator-(const decimal& a, const decimal& b) {
    return a + (-b);
  }

  decimal
  operator*(const decimal& a, const decimal& b) {
    if (a.is_zero() || b.is_zero()) { return decimal(); }
    return decimal(a.coefficient_ * b.coefficient_,
                   checked_add(a.exponent_, b.exponent_),
                   product_sign(a.sign_, b.sign_));
  }

  decimal
  operator/(const decimal& a, const decimal& b) {
    return a.div(b);
  }

  decimal&
  decimal::operator+=(const decimal& other) {
    *this = *this + other;
    return *this;
  }

  decimal&
  decimal::operator-=(const decimal& other) {
    *this = *this - other;
    return *this;
  }

  decimal&
  decimal::operator*=(const decimal& other) {
    *this = *this * other;
    return *this;
  }

  decimal&
  decimal::operator/=(const decimal& other) {
    *this = *this / other;
    return *this;
  }

  decimal
  decimal::div(const decimal& divisor, int precision) const {
    if (precision < 1) {
      throw std::invalid_argument("decimal: division precision must be at "
                                  "least 1, got " +
                                  std::to_string(precision));
    }
    if (divisor.is_zero()) {
      throw division_by_zero_error("decimal: division by zero");
    }
    if (is_zero()) { return decimal(); }

    // Scale the dividend so the raw quotient carries precision + guard
    // digits even when the divisor has more digits than the dividend.
    auto guard = static_cast<std::size_t>(precision + division_guard_digits);
    std::size_t dividend_digits = coefficient_.digit_count();
    std::size_t divisor_digits = divisor.coefficient_.digit_count();
    if (divisor_digits > dividend_digits) {
      guard += divisor_digits - dividend_digits;
    }

    integer quotient =
        coefficient_.scaled_by_pow10(guard) / divisor.coefficient_;
    int64_t exponent = checked_sub(exponent_, divisor.exponent_);
    sign_type sign = product_sign(sign_, divisor.sign_);

    auto keep = static_cast<std::size_t>(precision);
    std::size_t digits = quotient.digit_count();
    if (digits <= keep) {
      return decimal(std::move(quotient),
                     checked_sub(exponent, static_cast<int64_t>(guard)), sign);
    }

    // Round half-up on the dropped digits.
    std::size_t drop = digits - keep;
    integer unit = integer::pow10(drop);
    auto [kept, dropped] = divmod(quotient, unit);
    if (dropped + dropped >= unit) { kept += integer(int64_t{1}); }
    return decimal(
        std::move(kept),
        checked_add(exponent, static_cast<int64_t>(drop) -
                                  static_cast<int64_t>(guard)),
        sign);
  }

  decimal
  decimal::pow(int64_t n, int precision) const {
    if (n == 0) { return one(); }
    if (n > 0) { return power(*this, static_cast<uint64_t>(n)); }
    // Handle INT64_MIN: cast to uint64_t before negating to avoid UB.
    uint64_t magnitude = static_cast<uint64_t>(-(n + 1)) + 1;
    return one().div(power(*this, magnitude), precision);
  }

  decimal
  decimal::pow(const decimal& n, int precision) const {
    if (n.exponent_ < 0) {
      throw invalid_exponent_error("decimal: exponent must be an integer, "
                                   "got " +
                                   n.to_string());
    }
    // Anything with more than 18 digits cannot be a usable power.
    if (n.exponent_ > 18 ||
        static_cast<int64_t>(n.coefficient_.digit_count()) + n.exponent_ > 18) {
      throw invalid_exponent_error("decimal: exponent out of range: " +
                                   n.to_string());
    }
    auto magnitude = static_cast<int64_t>(n.coefficient_.scaled_by_pow10(
        static_cast<std::size_t>(n.exponent_)));
    return pow(n.is_negative() ? -magnitude : magnitude, precision);
  }

  int
  decimal::compare(const decimal& other) const {
    auto cmp = *this <=> other;
    if (cmp == std::strong_ordering::less) { return -1; }
    if (cmp == std::strong_ordering::greater) { return 1; }
    return 0;
  }

  std::strong_ordering
  decimal::operator<=>(const decimal& other) const {
    if (is_zero() && other.is_zero()) { return std::strong_ordering::equal; }
    if (is_zero()) {
      return other.is_negative() ? std::strong_ordering::greater
                                 : std::strong_ordering::less;
    }
    if (other.is_zero()) {
      return is_negative() ? std::strong_ordering::less
                           : std::strong_ordering::greater;
    }
    if (sign_ != other.sign_) {
      return sign_ == sign_type::positive ? std::strong_ordering::greater
                                          : std::strong_ordering::less;
    }
    auto cmp = magnitude_order(coefficient_, exponent_, other.coefficient_,
                               other.exponent_);
    if (sign_ == sign_type::negative) { return 0 <=> cmp; }
    return cmp;
  }

  bool
  decimal::operator==(const decimal& other) const {
    // Canonical form makes structural equality numeric equality.
    return sign_ == other.sign_ && exponent_ == other.exponent_ &&
           coefficient_ == other.coefficient_;
  }

  double
  decimal::to_double() const {
    if (is_zero()) { return 0.0; }

    std::string text =
        coefficient_.to_string() + "e" + std::to_string(exponent_);
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
      bool large =
          exponent_ > -static_cast<int64_t>(coefficient_.digit_count());
      value = large ? std::numeric_limits<double>::infinity() : 0.0;
    } else if (ec != std::errc{}) {
      throw std::runtime_error("decimal: cannot convert '" + text +
                               "' to double");
    }
    return is_negative() ? -value : value;
  }

  decimal::
  operator double() const {
    return to_double();
  }

} // namespace bigdec
