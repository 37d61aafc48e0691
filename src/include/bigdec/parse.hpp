#pragma once

#include <bigdec/decimal.hpp>
#include <bigdec/integer.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

namespace bigdec {

  // Anything a decimal can be built from.  Native integers select the
  // int64_t alternative and convert exactly.
  using decimal_input =
      std::variant<std::string_view, double, int64_t, integer, decimal>;

  // Parses [+-](digits[.digits] | .digits)([eE][+-]digits)?, ignoring
  // surrounding whitespace.  Throws parse_error.
  decimal
  parse(std::string_view text);

  // Parses the shortest text that round-trips value.  Throws parse_error for
  // NaN and infinities.
  decimal
  from_double(double value);

  decimal
  from_integer(const integer& value);

  decimal
  from(const decimal_input& input);

} // namespace bigdec
