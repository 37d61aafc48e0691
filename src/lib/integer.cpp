#include <bigdec/integer.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace bigdec {

  namespace {

    using limb_vector = std::vector<uint32_t>;

    constexpr uint64_t base = integer::limb_base;

    constexpr uint32_t small_pow10[integer::limb_digits] = {
        1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000};

    void
    trim(limb_vector& mag) {
      while (!mag.empty() && mag.back() == 0) {
        mag.pop_back();
      }
    }

    std::strong_ordering
    magnitude_compare(const limb_vector& a, const limb_vector& b) {
      if (a.size() != b.size()) { return a.size() <=> b.size(); }
      for (auto i = a.size(); i-- > 0;) {
        if (a[i] != b[i]) { return a[i] <=> b[i]; }
      }
      return std::strong_ordering::equal;
    }

    limb_vector
    magnitude_add(const limb_vector& a, const limb_vector& b) {
      limb_vector result;
      std::size_t len = std::max(a.size(), b.size());
      result.reserve(len + 1);
      uint64_t carry = 0;
      for (std::size_t i = 0; i < len; ++i) {
        uint64_t sum = carry;
        if (i < a.size()) { sum += a[i]; }
        if (i < b.size()) { sum += b[i]; }
        result.push_back(static_cast<uint32_t>(sum % base));
        carry = sum / base;
      }
      if (carry != 0) { result.push_back(static_cast<uint32_t>(carry)); }
      return result;
    }

    // Subtract b from a where |a| >= |b|.  Caller must ensure this.
    limb_vector
    magnitude_sub(const limb_vector& a, const limb_vector& b) {
      limb_vector result;
      result.reserve(a.size());
      int64_t borrow = 0;
      for (std::size_t i = 0; i < a.size(); ++i) {
        int64_t diff = static_cast<int64_t>(a[i]) - borrow;
        if (i < b.size()) { diff -= b[i]; }
        if (diff < 0) {
          diff += static_cast<int64_t>(base);
          borrow = 1;
        } else {
          borrow = 0;
        }
        result.push_back(static_cast<uint32_t>(diff));
      }
      trim(result);
      return result;
    }

    // Schoolbook O(n*m) multiplication.
    limb_vector
    magnitude_mul(const limb_vector& a, const limb_vector& b) {
      if (a.empty() || b.empty()) { return {}; }
      limb_vector result(a.size() + b.size(), 0);
      for (std::size_t i = 0; i < a.size(); ++i) {
        uint64_t carry = 0;
        for (std::size_t j = 0; j < b.size(); ++j) {
          uint64_t product =
              static_cast<uint64_t>(a[i]) * b[j] + result[i + j] + carry;
          result[i + j] = static_cast<uint32_t>(product % base);
          carry = product / base;
        }
        result[i + b.size()] = static_cast<uint32_t>(carry);
      }
      trim(result);
      return result;
    }

    // mag = mag * factor, factor <= base.
    void
    magnitude_mul_small(limb_vector& mag, uint32_t factor) {
      uint64_t carry = 0;
      for (auto& limb : mag) {
        uint64_t product = static_cast<uint64_t>(limb) * factor + carry;
        limb = static_cast<uint32_t>(product % base);
        carry = product / base;
      }
      if (carry != 0) { mag.push_back(static_cast<uint32_t>(carry)); }
      trim(mag);
    }

    // mag = mag / divisor, returns the remainder.  divisor must be nonzero.
    uint32_t
    magnitude_div_small(limb_vector& mag, uint32_t divisor) {
      uint64_t remainder = 0;
      for (auto i = mag.size(); i-- > 0;) {
        uint64_t cur = remainder * base + mag[i];
        mag[i] = static_cast<uint32_t>(cur / divisor);
        remainder = cur % divisor;
      }
      trim(mag);
      return static_cast<uint32_t>(remainder);
    }

    // Knuth, TAOCP vol. 2, 4.3.1, algorithm D, in base 10^9.
    // Returns {quotient, remainder}.
    std::pair<limb_vector, limb_vector>
    magnitude_divmod(const limb_vector& a, const limb_vector& b) {
      if (b.empty()) { throw std::domain_error("integer: division by zero"); }

      if (magnitude_compare(a, b) == std::strong_ordering::less) {
        return {{}, a};
      }

      if (b.size() == 1) {
        limb_vector quotient = a;
        uint32_t rem = magnitude_div_small(quotient, b[0]);
        if (rem == 0) { return {quotient, {}}; }
        return {quotient, {rem}};
      }

      const std::size_t n = b.size();
      const std::size_t m = a.size() - n;

      // D1: scale so the divisor's top limb is at least base / 2.
      auto scale = static_cast<uint32_t>(base / (uint64_t{b.back()} + 1));
      limb_vector u = a;
      limb_vector v = b;
      magnitude_mul_small(u, scale);
      magnitude_mul_small(v, scale);
      u.resize(a.size() + 1, 0);

      limb_vector quotient(m + 1, 0);

      for (std::size_t j = m + 1; j-- > 0;) {
        // D3: estimate the quotient limb.
        uint64_t numerator = uint64_t{u[j + n]} * base + u[j + n - 1];
        uint64_t q_hat = numerator / v[n - 1];
        uint64_t r_hat = numerator % v[n - 1];
        while (q_hat >= base ||
               q_hat * v[n - 2] > r_hat * base + u[j + n - 2]) {
          --q_hat;
          r_hat += v[n - 1];
          if (r_hat >= base) { break; }
        }

        // D4: multiply and subtract.
        uint64_t carry = 0;
        int64_t borrow = 0;
        for (std::size_t i = 0; i < n; ++i) {
          uint64_t product = q_hat * v[i] + carry;
          carry = product / base;
          int64_t diff = static_cast<int64_t>(u[i + j]) -
                         static_cast<int64_t>(product % base) - borrow;
          if (diff < 0) {
            diff += static_cast<int64_t>(base);
            borrow = 1;
          } else {
            borrow = 0;
          }
          u[i + j] = static_cast<uint32_t>(diff);
        }
        int64_t top = static_cast<int64_t>(u[j + n]) -
                      static_cast<int64_t>(carry) - borrow;

        // D5/D6: the estimate was one too large; add the divisor back.
        if (top < 0) {
          --q_hat;
          uint64_t add_carry = 0;
          for (std::size_t i = 0; i < n; ++i) {
            uint64_t sum = uint64_t{u[i + j]} + v[i] + add_carry;
            u[i + j] = static_cast<uint32_t>(sum % base);
            add_carry = sum / base;
          }
          top += static_cast<int64_t>(add_carry);
        }
        u[j + n] = static_cast<uint32_t>(top);
        quotient[j] = static_cast<uint32_t>(q_hat);
      }

      // D8: unscale the remainder.
      limb_vector remainder(u.begin(),
                            u.begin() + static_cast<std::ptrdiff_t>(n));
      trim(remainder);
      magnitude_div_small(remainder, scale);
      trim(quotient);
      return {quotient, remainder};
    }

    limb_vector
    magnitude_from_uint64(uint64_t value) {
      limb_vector mag;
      while (value != 0) {
        mag.push_back(static_cast<uint32_t>(value % base));
        value /= base;
      }
      return mag;
    }

    uint64_t
    magnitude_to_uint64(const limb_vector& mag, const char* what) {
      uint64_t value = 0;
      for (auto i = mag.size(); i-- > 0;) {
        if (value > (std::numeric_limits<uint64_t>::max() - mag[i]) / base) {
          throw std::overflow_error(
              std::string("integer: value too large for ") + what);
        }
        value = value * base + mag[i];
      }
      return value;
    }

  } // namespace

  integer::integer(std::string_view str) {
    if (str.empty()) { throw std::invalid_argument("integer: empty string"); }

    std::size_t pos = 0;
    bool negative = false;
    if (str[0] == '-' || str[0] == '+') {
      negative = str[0] == '-';
      pos = 1;
    }

    if (pos == str.size()) {
      throw std::invalid_argument("integer: no digits in '" + std::string(str) +
                                  "'");
    }

    for (std::size_t i = pos; i < str.size(); ++i) {
      if (str[i] < '0' || str[i] > '9') {
        throw std::invalid_argument("integer: invalid character in '" +
                                    std::string(str) + "'");
      }
    }

    // Consume limb_digits characters at a time from the least significant end.
    limbs_.reserve((str.size() - pos) / limb_digits + 1);
    std::size_t end = str.size();
    while (end > pos) {
      std::size_t begin =
          end - pos > static_cast<std::size_t>(limb_digits) ? end - limb_digits
                                                            : pos;
      uint32_t limb = 0;
      for (std::size_t i = begin; i < end; ++i) {
        limb = limb * 10 + static_cast<uint32_t>(str[i] - '0');
      }
      limbs_.push_back(limb);
      end = begin;
    }
    trim(limbs_);

    if (negative && !limbs_.empty()) { sign_ = sign_type::negative; }
  }

  integer::integer(uint64_t value) : limbs_(magnitude_from_uint64(value)) {}

  integer::integer(int64_t value) {
    if (value < 0) {
      sign_ = sign_type::negative;
      // Handle INT64_MIN: cast to uint64_t before negating to avoid UB.
      limbs_ = magnitude_from_uint64(static_cast<uint64_t>(-(value + 1)) + 1);
    } else {
      limbs_ = magnitude_from_uint64(static_cast<uint64_t>(value));
    }
  }

  integer
  integer::pow10(std::size_t n) {
    integer result;
    result.limbs_.assign(n / limb_digits, 0);
    result.limbs_.push_back(small_pow10[n % limb_digits]);
    return result;
  }

  std::string
  integer::to_string() const {
    if (limbs_.empty()) { return "0"; }

    std::string digits;
    digits.reserve(limbs_.size() * limb_digits + 1);
    if (sign_ == sign_type::negative) { digits.push_back('-'); }
    digits += std::to_string(limbs_.back());
    for (auto i = limbs_.size() - 1; i-- > 0;) {
      std::string limb = std::to_string(limbs_[i]);
      digits.append(static_cast<std::size_t>(limb_digits) - limb.size(), '0');
      digits += limb;
    }
    return digits;
  }

  bool
  integer::is_zero() const {
    return limbs_.empty();
  }

  bool
  integer::is_negative() const {
    return sign_ == sign_type::negative;
  }

  integer::sign_type
  integer::sign() const {
    return sign_;
  }

  std::size_t
  integer::digit_count() const {
    if (limbs_.empty()) { return 1; }
    std::size_t count = (limbs_.size() - 1) * limb_digits;
    for (uint32_t top = limbs_.back(); top != 0; top /= 10) {
      ++count;
    }
    return count;
  }

  std::size_t
  integer::trailing_zero_digits() const {
    std::size_t count = 0;
    for (uint32_t limb : limbs_) {
      if (limb == 0) {
        count += limb_digits;
        continue;
      }
      for (; limb % 10 == 0; limb /= 10) {
        ++count;
      }
      return count;
    }
    return 0;
  }

  integer
  integer::abs() const {
    integer result = *this;
    result.sign_ = sign_type::positive;
    return result;
  }

  integer
  integer::scaled_by_pow10(std::size_t n) const {
    if (limbs_.empty() || n == 0) { return *this; }
    integer result;
    result.sign_ = sign_;
    result.limbs_.reserve(limbs_.size() + n / limb_digits + 1);
    result.limbs_.assign(n / limb_digits, 0);
    result.limbs_.insert(result.limbs_.end(), limbs_.begin(), limbs_.end());
    magnitude_mul_small(result.limbs_, small_pow10[n % limb_digits]);
    return result;
  }

  integer
  integer::divided_by_pow10(std::size_t n) const {
    std::size_t whole = n / limb_digits;
    if (whole >= limbs_.size()) { return integer(); }
    integer result;
    result.limbs_.assign(limbs_.begin() + static_cast<std::ptrdiff_t>(whole),
                         limbs_.end());
    magnitude_div_small(result.limbs_, small_pow10[n % limb_digits]);
    if (!result.limbs_.empty()) { result.sign_ = sign_; }
    return result;
  }

  integer
  integer::operator-() const {
    if (limbs_.empty()) { return *this; }
    integer result = *this;
    result.sign_ = (sign_ == sign_type::positive) ? sign_type::negative
                                                  : sign_type::positive;
    return result;
  }

  integer
  integer::operator+() const {
    return *this;
  }

  std::strong_ordering
  integer::operator<=>(const integer& other) const {
    if (sign_ != other.sign_) {
      return sign_ == sign_type::positive ? std::strong_ordering::greater
                                          : std::strong_ordering::less;
    }
    auto mag_cmp = magnitude_compare(limbs_, other.limbs_);
    if (sign_ == sign_type::negative) { return 0 <=> mag_cmp; }
    return mag_cmp;
  }

  bool
  integer::operator==(const integer& other) const {
    return sign_ == other.sign_ && limbs_ == other.limbs_;
  }

  integer
  operator+(const integer& a, const integer& b) {
    using sign_type = integer::sign_type;

    // Same sign: add magnitudes, keep sign.
    if (a.sign_ == b.sign_) {
      integer result;
      result.limbs_ = magnitude_add(a.limbs_, b.limbs_);
      if (!result.limbs_.empty()) { result.sign_ = a.sign_; }
      return result;
    }

    // Different signs: subtract smaller magnitude from larger.
    auto cmp = magnitude_compare(a.limbs_, b.limbs_);
    if (cmp == std::strong_ordering::equal) { return integer(); }

    integer result;
    if (cmp == std::strong_ordering::greater) {
      result.limbs_ = magnitude_sub(a.limbs_, b.limbs_);
      result.sign_ = a.sign_;
    } else {
      result.limbs_ = magnitude_sub(b.limbs_, a.limbs_);
      result.sign_ = b.sign_;
    }
    if (result.limbs_.empty()) { result.sign_ = sign_type::positive; }
    return result;
  }

  integer
  operator-(const integer& a, const integer& b) {
    return a + (-b);
  }

  integer
  operator*(const integer& a, const integer& b) {
    using sign_type = integer::sign_type;
    if (a.limbs_.empty() || b.limbs_.empty()) { return integer(); }

    integer result;
    result.limbs_ = magnitude_mul(a.limbs_, b.limbs_);
    result.sign_ =
        (a.sign_ == b.sign_) ? sign_type::positive : sign_type::negative;
    return result;
  }

  std::pair<integer, integer>
  divmod(const integer& a, const integer& b) {
    using sign_type = integer::sign_type;
    auto [q, r] = magnitude_divmod(a.limbs_, b.limbs_);

    std::pair<integer, integer> result;
    result.first.limbs_ = std::move(q);
    if (!result.first.limbs_.empty() && a.sign_ != b.sign_) {
      result.first.sign_ = sign_type::negative;
    }
    result.second.limbs_ = std::move(r);
    if (!result.second.limbs_.empty()) { result.second.sign_ = a.sign_; }
    return result;
  }

  integer
  operator/(const integer& a, const integer& b) {
    return divmod(a, b).first;
  }

  integer
  operator%(const integer& a, const integer& b) {
    return divmod(a, b).second;
  }

  integer&
  integer::operator+=(const integer& other) {
    *this = *this + other;
    return *this;
  }

  integer&
  integer::operator-=(const integer& other) {
    *this = *this - other;
    return *this;
  }

  integer&
  integer::operator*=(const integer& other) {
    *this = *this * other;
    return *this;
  }

  integer&
  integer::operator/=(const integer& other) {
    *this = *this / other;
    return *this;
  }

  integer&
  integer::operator%=(const integer& other) {
    *this = *this % other;
    return *this;
  }

  integer::
  operator int64_t() const {
    uint64_t abs_val = magnitude_to_uint64(limbs_, "int64_t");
    if (sign_ == sign_type::negative) {
      if (abs_val > static_cast<uint64_t>(INT64_MAX) + 1) {
        throw std::overflow_error("integer: value too large for int64_t");
      }
      return -static_cast<int64_t>(abs_val - 1) - 1;
    }
    if (abs_val > static_cast<uint64_t>(INT64_MAX)) {
      throw std::overflow_error("integer: value too large for int64_t");
    }
    return static_cast<int64_t>(abs_val);
  }

  integer::
  operator uint64_t() const {
    if (sign_ == sign_type::negative) {
      throw std::overflow_error("integer: negative value cannot convert to "
                                "uint64_t");
    }
    return magnitude_to_uint64(limbs_, "uint64_t");
  }

  integer::
  operator double() const {
    double result = 0.0;
    for (auto i = limbs_.size(); i-- > 0;) {
      result = result * static_cast<double>(base) + limbs_[i];
    }
    if (sign_ == sign_type::negative) { result = -result; }
    return result;
  }

} // namespace bigdec
