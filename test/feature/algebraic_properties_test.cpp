#include <bigdec/error.hpp>
#include <bigdec/parse.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using bigdec::decimal;
using bigdec::integer;
using bigdec::parse;

namespace {

  std::vector<decimal>
  samples() {
    std::vector<decimal> values;
    for (const char* text :
         {"0", "1", "-1", "0.1", "1.23e400", "-4.56e399", "-7.25e-300",
          "123456789012345678901234567890", "9.99e999",
          "3.14159265358979323846", "-0.000000000000000000000000000001"}) {
      values.push_back(parse(text));
    }
    return values;
  }

  bool
  is_canonical(const decimal& d) {
    if (d.coefficient().is_zero()) {
      return d.exponent() == 0 && !d.is_negative();
    }
    return !d.coefficient().is_negative() &&
           d.coefficient().trailing_zero_digits() == 0;
  }

} // namespace

TEST_CASE("every result is canonical", "[property]") {
  auto values = samples();
  for (const auto& a : values) {
    for (const auto& b : values) {
      INFO(a << " op " << b);
      CHECK(is_canonical(a + b));
      CHECK(is_canonical(a - b));
      CHECK(is_canonical(a * b));
      if (!b.is_zero()) { CHECK(is_canonical(a.div(b, 12))); }
    }
  }
}

TEST_CASE("additive identity and inverse", "[property]") {
  for (const auto& x : samples()) {
    INFO(x);
    CHECK(x + decimal() == x);
    CHECK(x + (-x) == decimal());
    CHECK(x - x == decimal());
  }
}

TEST_CASE("addition and multiplication commute and associate", "[property]") {
  auto values = samples();
  for (const auto& a : values) {
    for (const auto& b : values) {
      INFO(a << ", " << b);
      CHECK(a + b == b + a);
      CHECK(a * b == b * a);
    }
  }

  // Associativity over a smaller triple grid; products of the largest
  // samples grow to thousands of digits.
  std::vector<decimal> small{parse("0.1"), parse("-7.25e-300"),
                             parse("1.23e400"), parse("-42")};
  for (const auto& a : small) {
    for (const auto& b : small) {
      for (const auto& c : small) {
        INFO(a << ", " << b << ", " << c);
        CHECK((a + b) + c == a + (b + c));
        CHECK((a * b) * c == a * (b * c));
      }
    }
  }
}

TEST_CASE("ordering agrees with subtraction", "[property]") {
  auto values = samples();
  for (const auto& a : values) {
    for (const auto& b : values) {
      INFO(a << " vs " << b);
      decimal diff = a - b;
      if (diff.is_zero()) {
        CHECK(a == b);
      } else if (diff.is_negative()) {
        CHECK(a < b);
      } else {
        CHECK(a > b);
      }
    }
  }
}

TEST_CASE("division is an approximate inverse of multiplication",
          "[property]") {
  auto values = samples();
  for (int precision : {5, 20, 40}) {
    // Half a unit in the last requested digit, rounded up to a full unit.
    decimal tolerance(integer(int64_t{1}), 1 - precision);
    for (const auto& a : values) {
      for (const auto& b : values) {
        if (b.is_zero()) { continue; }
        INFO(a << " / " << b << " at " << precision);
        decimal back = a.div(b, precision) * b;
        CHECK((back - a).abs() <= a.abs() * tolerance);
      }
    }
  }
}

TEST_CASE("division by zero always fails", "[property]") {
  for (const auto& a : samples()) {
    INFO(a);
    CHECK_THROWS_AS(a.div(decimal(), 10), bigdec::division_by_zero_error);
  }
}

TEST_CASE("cube equals repeated multiplication", "[property]") {
  for (const char* text : {"0", "7", "-7", "123456789123456789", "-1e400",
                           "2.5", "-0.003"}) {
    decimal a = parse(text);
    INFO(text);
    CHECK(a.pow(3) == a * a * a);
  }
}

TEST_CASE("text round trip preserves the value", "[property]") {
  for (const auto& x : samples()) {
    INFO(x);
    CHECK(parse(x.to_string(60)) == x);
  }
}
