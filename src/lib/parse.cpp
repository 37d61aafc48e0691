#include <bigdec/parse.hpp>

#include <bigdec/error.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace bigdec {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    std::string_view
    trim(std::string_view text) {
      while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
      }
      while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
      }
      return text;
    }

    [[noreturn]] void
    invalid_format(std::string_view text, const char* reason) {
      throw parse_error(parse_error::kind::invalid_format,
                        "decimal: " + std::string(reason) + " in '" +
                            std::string(text) + "'");
    }

    std::string_view
    scan_digits(std::string_view text, std::size_t& pos) {
      std::size_t start = pos;
      while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
      }
      return text.substr(start, pos - start);
    }

  } // namespace

  decimal
  parse(std::string_view text) {
    std::string_view str = trim(text);
    if (str.empty()) {
      throw parse_error(parse_error::kind::empty_input,
                        "decimal: empty string");
    }

    std::size_t pos = 0;
    auto sign = decimal::sign_type::positive;
    if (str[pos] == '-' || str[pos] == '+') {
      if (str[pos] == '-') { sign = decimal::sign_type::negative; }
      ++pos;
    }

    std::string_view whole = scan_digits(str, pos);
    std::string_view fraction;
    if (pos < str.size() && str[pos] == '.') {
      ++pos;
      fraction = scan_digits(str, pos);
    }
    if (whole.empty() && fraction.empty()) { invalid_format(str, "no digits"); }

    int64_t exponent = 0;
    if (pos < str.size() && (str[pos] == 'e' || str[pos] == 'E')) {
      ++pos;
      bool negative_exponent = false;
      if (pos < str.size() && (str[pos] == '-' || str[pos] == '+')) {
        negative_exponent = str[pos] == '-';
        ++pos;
      }
      std::string_view exponent_digits = scan_digits(str, pos);
      if (exponent_digits.empty()) {
        invalid_format(str, "missing exponent digits");
      }
      auto [ptr, ec] = std::from_chars(
          exponent_digits.data(),
          exponent_digits.data() + exponent_digits.size(), exponent);
      if (ec != std::errc{}) { invalid_format(str, "exponent out of range"); }
      if (negative_exponent) { exponent = -exponent; }
    }

    if (pos != str.size()) { invalid_format(str, "invalid character"); }

    std::string digits;
    digits.reserve(whole.size() + fraction.size());
    digits += whole;
    digits += fraction;

    auto fraction_digits = static_cast<int64_t>(fraction.size());
    if (exponent < std::numeric_limits<int64_t>::min() + fraction_digits) {
      invalid_format(str, "exponent out of range");
    }
    integer coefficient(digits);
    try {
      return decimal(std::move(coefficient), exponent - fraction_digits, sign);
    } catch (const std::overflow_error&) {
      // Stripping trailing zeros pushed the exponent past int64_t.
      invalid_format(str, "exponent out of range");
    }
  }

  decimal
  from_double(double value) {
    if (!std::isfinite(value)) {
      throw parse_error(parse_error::kind::unsupported_input,
                        "decimal: cannot convert non-finite number");
    }
    // Shortest round-trip form, e.g. "0.1", "1e+300", "-2.5e-10".
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
      throw parse_error(parse_error::kind::unsupported_input,
                        "decimal: cannot format number");
    }
    return parse(std::string_view(buf, static_cast<std::size_t>(ptr - buf)));
  }

  decimal
  from_integer(const integer& value) {
    return decimal(value, 0);
  }

  decimal
  from(const decimal_input& input) {
    return std::visit(
        [](const auto& value) -> decimal {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string_view>) {
            return parse(value);
          } else if constexpr (std::is_same_v<T, double>) {
            return from_double(value);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return from_integer(integer(value));
          } else if constexpr (std::is_same_v<T, integer>) {
            return from_integer(value);
          } else {
            return value;
          }
        },
        input);
  }

  decimal::decimal(std::string_view str) : decimal(parse(str)) {}

  decimal::decimal(double value) : decimal(from_double(value)) {}

} // namespace bigdec
