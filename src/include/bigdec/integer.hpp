#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bigdec {

  // Arbitrary-precision signed integer.  The magnitude is stored as
  // base-10^9 limbs, least significant first, with no leading zero limbs;
  // zero is always positive.
  class integer {
  public:
    enum class sign_type : uint8_t { positive, negative };

    static constexpr uint32_t limb_base = 1000000000;
    static constexpr int limb_digits = 9;

  private:
    sign_type sign_ = sign_type::positive;
    std::vector<uint32_t> limbs_;

  public:
    integer() = default;
    explicit integer(int64_t value);
    explicit integer(uint64_t value);
    explicit integer(std::string_view str);

    // 10^n.
    static integer
    pow10(std::size_t n);

    std::string
    to_string() const;
    bool
    is_zero() const;
    bool
    is_negative() const;
    sign_type
    sign() const;

    // Number of decimal digits in the magnitude (1 for zero).
    std::size_t
    digit_count() const;
    // Number of trailing decimal zeros in the magnitude (0 for zero).
    std::size_t
    trailing_zero_digits() const;

    integer
    abs() const;
    // *this * 10^n.
    integer
    scaled_by_pow10(std::size_t n) const;
    // *this / 10^n, truncated toward zero.
    integer
    divided_by_pow10(std::size_t n) const;

    integer
    operator-() const;
    integer
    operator+() const;

    friend integer
    operator+(const integer& a, const integer& b);
    friend integer
    operator-(const integer& a, const integer& b);
    friend integer
    operator*(const integer& a, const integer& b);
    friend integer
    operator/(const integer& a, const integer& b);
    friend integer
    operator%(const integer& a, const integer& b);

    // Truncating division.  The remainder takes the sign of the dividend.
    friend std::pair<integer, integer>
    divmod(const integer& a, const integer& b);

    integer&
    operator+=(const integer& other);
    integer&
    operator-=(const integer& other);
    integer&
    operator*=(const integer& other);
    integer&
    operator/=(const integer& other);
    integer&
    operator%=(const integer& other);

    std::strong_ordering
    operator<=>(const integer& other) const;
    bool
    operator==(const integer& other) const;

    explicit
    operator int64_t() const;
    explicit
    operator uint64_t() const;
    explicit
    operator double() const;

    friend std::ostream&
    operator<<(std::ostream& os, const integer& i) {
      return os << i.to_string();
    }
  };

  std::pair<integer, integer>
  divmod(const integer& a, const integer& b);

} // namespace bigdec

template <>
struct std::hash<bigdec::integer> {
  std::size_t
  operator()(const bigdec::integer& i) const noexcept {
    std::size_t seed = std::hash<int>{}(static_cast<int>(i.sign()));
    std::string s = i.to_string();
    seed ^=
        std::hash<std::string>{}(s) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};
