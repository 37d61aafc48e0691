#include <bigdec/error.hpp>
#include <bigdec/parse.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

using bigdec::decimal;
using bigdec::integer;
using bigdec::parse_error;

namespace {

  parse_error::kind
  failure_kind(std::string_view text) {
    try {
      (void)bigdec::parse(text);
    } catch (const parse_error& e) {
      return e.code();
    }
    FAIL("expected parse_error for '" << text << "'");
    return parse_error::kind::unsupported_input;
  }

  bool
  fields_are(const decimal& d, const char* coefficient, int64_t exponent,
             bool negative = false) {
    return d.coefficient().to_string() == coefficient &&
           d.exponent() == exponent && d.is_negative() == negative;
  }

} // namespace

TEST_CASE("parse plain and fractional forms", "[parse]") {
  SECTION("integer") { CHECK(fields_are(bigdec::parse("12345"), "12345", 0)); }
  SECTION("fraction") {
    CHECK(fields_are(bigdec::parse("12345.6789"), "123456789", -4));
  }
  SECTION("leading point") {
    CHECK(fields_are(bigdec::parse(".5"), "5", -1));
    CHECK(fields_are(bigdec::parse("-.025"), "25", -3, true));
  }
  SECTION("trailing point") { CHECK(fields_are(bigdec::parse("7."), "7", 0)); }
  SECTION("explicit plus sign") {
    CHECK(fields_are(bigdec::parse("+1.5"), "15", -1));
  }
  SECTION("trailing zeros are normalized away") {
    CHECK(fields_are(bigdec::parse("1200"), "12", 2));
    CHECK(fields_are(bigdec::parse("1.500"), "15", -1));
  }
  SECTION("leading zeros are ignored") {
    CHECK(fields_are(bigdec::parse("000.000123"), "123", -6));
  }
  SECTION("zero forms are canonical zero") {
    for (const char* text : {"0", "-0", "+0.000", ".0", "0e500", "-0.0e-9"}) {
      INFO(text);
      decimal d = bigdec::parse(text);
      CHECK(d.is_zero());
      CHECK(d.exponent() == 0);
      CHECK_FALSE(d.is_negative());
    }
  }
}

TEST_CASE("parse scientific forms", "[parse]") {
  CHECK(fields_are(bigdec::parse("1.23e400"), "123", 398));
  CHECK(fields_are(bigdec::parse("4.56E399"), "456", 397));
  CHECK(fields_are(bigdec::parse("-1.23e+4"), "123", 2, true));
  CHECK(fields_are(bigdec::parse("5e-3"), "5", -3));
  CHECK(fields_are(bigdec::parse("1e1000"), "1", 1000));
  CHECK(fields_are(bigdec::parse(".1e-999"), "1", -1000));
  CHECK(fields_are(bigdec::parse("2.50e0"), "25", -1));
}

TEST_CASE("parse trims surrounding whitespace", "[parse]") {
  CHECK(bigdec::parse("  42\t") == bigdec::parse("42"));
  CHECK(bigdec::parse("\n-1.5e2 ") == bigdec::parse("-150"));
}

TEST_CASE("parse rejects malformed text", "[parse]") {
  SECTION("empty input") {
    CHECK(failure_kind("") == parse_error::kind::empty_input);
    CHECK(failure_kind("   \t\n") == parse_error::kind::empty_input);
  }
  SECTION("invalid format") {
    for (const char* text :
         {".", "-", "+.", "abc", "1.2.3", "1e", "1e+", "e5", "--1", "1 2",
          "0x10", "1,000", "1e5.5", "NaN", "inf", "1_000"}) {
      INFO(text);
      CHECK(failure_kind(text) == parse_error::kind::invalid_format);
    }
  }
  SECTION("exponent beyond 64 bits") {
    CHECK(failure_kind("1e99999999999999999999") ==
          parse_error::kind::invalid_format);
  }
  SECTION("parse_error is an invalid_argument") {
    CHECK_THROWS_AS(bigdec::parse("x"), std::invalid_argument);
    CHECK_THROWS_AS(decimal(std::string_view("")), parse_error);
  }
}

TEST_CASE("parse keeps the exponent within 64 bits", "[parse]") {
  constexpr int64_t max = std::numeric_limits<int64_t>::max();
  constexpr int64_t min = std::numeric_limits<int64_t>::min();

  SECTION("largest and smallest exponents are accepted") {
    CHECK(fields_are(bigdec::parse("1e9223372036854775807"), "1", max));
    CHECK(fields_are(bigdec::parse("1.5e-9223372036854775807"), "15", min));
  }
  SECTION("trailing zeros that overflow the exponent") {
    CHECK(failure_kind("10e9223372036854775807") ==
          parse_error::kind::invalid_format);
    CHECK(failure_kind("-50.0e9223372036854775807") ==
          parse_error::kind::invalid_format);
  }
  SECTION("fraction digits that underflow the exponent") {
    CHECK(failure_kind("0.11e-9223372036854775807") ==
          parse_error::kind::invalid_format);
    CHECK(failure_kind("1e-9223372036854775808") ==
          parse_error::kind::invalid_format);
  }
}

TEST_CASE("conversion from double", "[parse]") {
  SECTION("zero") {
    CHECK(bigdec::from_double(0.0).is_zero());
    CHECK(bigdec::from_double(-0.0).is_zero());
  }
  SECTION("shortest round-trip digits") {
    CHECK(fields_are(bigdec::from_double(0.1), "1", -1));
    CHECK(fields_are(bigdec::from_double(-2.25), "225", -2, true));
    CHECK(fields_are(bigdec::from_double(1e20), "1", 20));
    CHECK(fields_are(bigdec::from_double(1.5e-10), "15", -11));
    CHECK(fields_are(bigdec::from_double(123456.789), "123456789", -3));
  }
  SECTION("extremes keep every significant digit") {
    decimal max = bigdec::from_double(std::numeric_limits<double>::max());
    CHECK(fields_are(max, "17976931348623157", 292));
    CHECK(max.to_double() == std::numeric_limits<double>::max());

    decimal lowest = bigdec::from_double(std::numeric_limits<double>::lowest());
    CHECK(lowest == -max);
  }
  SECTION("constructor routes through the same conversion") {
    CHECK(decimal(0.1) == bigdec::parse("0.1"));
  }
  SECTION("non-finite values are unsupported") {
    try {
      (void)bigdec::from_double(std::numeric_limits<double>::quiet_NaN());
      FAIL("expected parse_error");
    } catch (const parse_error& e) {
      CHECK(e.code() == parse_error::kind::unsupported_input);
    }
    CHECK_THROWS_AS(bigdec::from_double(std::numeric_limits<double>::infinity()),
                    parse_error);
  }
}

TEST_CASE("conversion from integer", "[parse]") {
  CHECK(fields_are(bigdec::from_integer(integer("-1230000")), "123", 4, true));
  CHECK(bigdec::from_integer(integer()).is_zero());

  std::string big = "9" + std::string(1200, '0') + "1";
  CHECK(fields_are(bigdec::from_integer(integer(big)), big.c_str(), 0));
}

TEST_CASE("from dispatches on the input kind", "[parse]") {
  CHECK(bigdec::from("2.5e3") == bigdec::parse("2500"));
  CHECK(bigdec::from(std::string("-7")) == bigdec::parse("-7"));
  CHECK(bigdec::from(0.5) == bigdec::parse("0.5"));
  CHECK(bigdec::from(integer(int64_t{-42})) == bigdec::parse("-42"));
  CHECK(bigdec::from(5) == bigdec::parse("5"));
  CHECK(bigdec::from(-1200) == bigdec::parse("-1.2e3"));
  CHECK(bigdec::from(std::numeric_limits<int64_t>::min()) ==
        bigdec::parse("-9223372036854775808"));

  decimal existing = bigdec::parse("1.23e400");
  CHECK(bigdec::from(existing) == existing);

  CHECK_THROWS_AS(bigdec::from(" "), parse_error);
}
