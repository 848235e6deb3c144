#include <cassert>
#include <cmath>
#include <cstdio>
#include <string>

#include "value_support.h"

namespace value_test {

void assert_close(double actual, double expected, double tol, std::string_view context) {
  if (std::isnan(actual) || std::fabs(actual - expected) > tol) {
    std::fprintf(stderr, "value assert_close failed: context=%.*s actual=%.17g expected=%.17g tol=%.17g\n",
                 static_cast<int>(context.size()), context.data(), actual, expected, tol);
    assert(false);
  }
}

void expect_text(const mpfloat::Float& value, std::string_view expected, int base) {
  const auto actual = value.to_string(base);
  if (actual != expected) {
    std::fprintf(stderr, "value text mismatch: base=%d expected=%.*s actual=%s\n", base,
                 static_cast<int>(expected.size()), expected.data(), actual.c_str());
  }
  assert(actual == expected);
}

}  // namespace value_test
