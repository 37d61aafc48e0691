#pragma once

#include <stdexcept>
#include <string>

namespace bigdec {

  // Raised when text or a native value cannot be turned into a decimal.
  class parse_error : public std::invalid_argument {
  public:
    enum class kind { invalid_format, empty_input, unsupported_input };

    parse_error(kind k, const std::string& what)
        : std::invalid_argument(what), kind_(k) {}

    kind
    code() const noexcept {
      return kind_;
    }

  private:
    kind kind_;
  };

  class division_by_zero_error : public std::domain_error {
  public:
    using std::domain_error::domain_error;
  };

  // Raised by pow() for an exponent that is not an integer.
  class invalid_exponent_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

} // namespace bigdec
