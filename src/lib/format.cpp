#include <bigdec/decimal.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bigdec {

  namespace {

    // "d" or "d.ddd" from a run of significant digits.
    std::string
    mantissa(const std::string& digits) {
      std::string result(1, digits[0]);
      if (digits.size() > 1) {
        result += '.';
        result.append(digits, 1, std::string::npos);
      }
      return result;
    }

    // "e+N" / "e-N" for exponent + offset.  The sum may fall outside
    // int64_t, so it is formed on magnitudes.
    std::string
    exponent_suffix(int64_t exponent, uint64_t offset) {
      if (exponent >= 0) {
        return "e+" + std::to_string(static_cast<uint64_t>(exponent) + offset);
      }
      uint64_t magnitude = static_cast<uint64_t>(-(exponent + 1)) + 1;
      if (offset >= magnitude) {
        return "e+" + std::to_string(offset - magnitude);
      }
      return "e-" + std::to_string(magnitude - offset);
    }

    // Round `digits` half-up to `keep` digits.  Returns true when the carry
    // ran off the front (e.g. 999 -> 1000), in which case `digits` holds
    // the leading `keep` digits of the carried value.
    bool
    round_digits(std::string& digits, std::size_t keep) {
      bool round_up = digits[keep] >= '5';
      digits.resize(keep);
      if (!round_up) { return false; }

      for (auto i = keep; i-- > 0;) {
        if (digits[i] != '9') {
          ++digits[i];
          return false;
        }
        digits[i] = '0';
      }
      digits.insert(digits.begin(), '1');
      digits.resize(keep);
      return true;
    }

  } // namespace

  std::string
  decimal::to_string(int significant_digits) const {
    if (significant_digits < 1) {
      throw std::invalid_argument("decimal: significant digits must be at "
                                  "least 1, got " +
                                  std::to_string(significant_digits));
    }
    if (is_zero()) { return "0"; }

    std::string digits = coefficient_.to_string();
    // Order of magnitude is exponent_ + offset.
    uint64_t offset = digits.size() - 1;

    auto keep = static_cast<std::size_t>(significant_digits);
    if (digits.size() > keep && round_digits(digits, keep)) { ++offset; }

    std::string result = is_negative() ? "-" : "";
    result += mantissa(digits);
    result += exponent_suffix(exponent_, offset);
    return result;
  }

  std::string
  decimal::to_fixed(int fraction_digits) const {
    if (fraction_digits < 0) {
      throw std::invalid_argument("decimal: fraction digits must not be "
                                  "negative, got " +
                                  std::to_string(fraction_digits));
    }
    auto places = static_cast<std::size_t>(fraction_digits);
    if (is_zero()) { return "0." + std::string(places, '0'); }

    std::string digits = coefficient_.to_string();
    std::string result = is_negative() ? "-" : "";

    if (exponent_ >= 0) {
      result += digits;
      result.append(static_cast<std::size_t>(exponent_), '0');
      result += '.';
      result.append(places, '0');
      return result;
    }

    // The point falls `shift` digits from the right of the coefficient.
    auto shift = static_cast<std::size_t>(-(exponent_ + 1)) + 1;
    std::string fraction;
    if (shift < digits.size()) {
      result.append(digits, 0, digits.size() - shift);
      fraction = digits.substr(digits.size() - shift);
    } else {
      result += '0';
      std::size_t leading_zeros = shift - digits.size();
      if (leading_zeros < places) {
        fraction.assign(leading_zeros, '0');
        fraction += digits;
      }
    }
    fraction.resize(places, '0');

    result += '.';
    result += fraction;
    return result;
  }

} // namespace bigdec
