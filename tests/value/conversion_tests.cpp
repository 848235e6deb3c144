#include <cassert>
#include <climits>
#include <cmath>
#include <functional>

#include "mpfloat/error_flags.h"
#include "value_support.h"

namespace value_test {
namespace {

using mpfloat::ErrorFlags;
using mpfloat::Float;
using mpfloat::Rational;
using mpfloat::RoundingMode;

void test_to_double() {
  assert(Float::from_long(3, 64).to_double() == 3.0);

  const auto third = Float::from_rational(Rational(1, 3), 200);
  assert(third.to_double() == 1.0 / 3.0);
  assert(third.to_double(RoundingMode::TowardPositiveInfinity) > third.to_double());
  assert(third.to_double(RoundingMode::TowardZero) <= third.to_double());

  assert(std::isnan(Float().to_double()));
  assert(std::isinf(Float::from_string("-@Inf@")->to_double()));
  assert(Float::from_string("-@Inf@")->to_double() < 0.0);
  const double negative_zero = Float::from_double(-0.0).to_double();
  assert(negative_zero == 0.0 && std::signbit(negative_zero));
}

void test_to_double_2exp() {
  auto parts = Float::from_double(12.0).to_double_2exp();
  assert(parts.mantissa == 0.75 && parts.exponent == 4);

  parts = Float::from_double(-0.5).to_double_2exp();
  assert(parts.mantissa == -0.5 && parts.exponent == 0);

  parts = Float::from_long(1).to_double_2exp();
  assert(parts.mantissa == 0.5 && parts.exponent == 1);

  parts = Float::from_double(0.0).to_double_2exp();
  assert(parts.mantissa == 0.0 && parts.exponent == 0);

  const auto huge = Float::from_string("1p5000", 2, 64);
  assert(huge);
  parts = huge->to_double_2exp();
  assert(parts.mantissa == 0.5 && parts.exponent == 5001);
}

void test_to_long_rounding() {
  assert(Float::from_double(2.5).to_long() == 2);
  assert(Float::from_double(3.5).to_long() == 4);
  assert(Float::from_double(-2.5).to_long() == -2);
  assert(Float::from_double(2.7).to_long(RoundingMode::TowardZero) == 2);
  assert(Float::from_double(-2.7).to_long(RoundingMode::TowardZero) == -2);
  assert(Float::from_double(2.1).to_long(RoundingMode::AwayFromZero) == 3);
  assert(Float::from_double(2.1).to_long(RoundingMode::TowardPositiveInfinity) == 3);
  assert(Float::from_double(-2.1).to_long(RoundingMode::TowardNegativeInfinity) == -3);
  assert(Float::from_double(7.9).to_ulong(RoundingMode::TowardZero) == 7UL);
}

void test_out_of_range_integers_saturate() {
  ErrorFlags::clear();
  assert(Float::from_double(1e30).to_long() == LONG_MAX);
  assert(ErrorFlags::take().is_range_error());
  assert(Float::from_double(-1e30).to_long() == LONG_MIN);
  assert(Float::from_double(1e30).to_ulong() == ULONG_MAX);
  assert(Float::from_double(-1.0).to_ulong() == 0UL);
  assert(ErrorFlags::take().is_range_error());

  assert(Float().to_long() == 0);
  assert(ErrorFlags::take().is_range_error());
}

void test_to_string() {
  expect_text(Float::from_double(42.0), "42");
  expect_text(Float::from_double(-3.25), "-3.25");
  expect_text(Float::from_double(0.0625), "0.0625");
  expect_text(Float::from_double(1e20), "100000000000000000000");
  expect_text(Float::from_double(1.5), "1.1", 2);
  expect_text(Float::from_double(1.5), "1.8", 16);
  expect_text(Float::from_double(255.0), "ff", 16);
  expect_text(Float::from_double(255.0), "FF", -16);

  expect_text(Float(), "@NaN@");
  expect_text(*Float::from_string("@Inf@"), "@Inf@");
  expect_text(*Float::from_string("-@Inf@"), "-@Inf@");
  expect_text(Float::from_double(0.0), "0");
  expect_text(Float::from_double(-0.0), "-0");

  assert(Float::from_double(2.0 / 3.0).to_string(10, 3) == "0.667");
  assert(Float::from_double(2.0 / 3.0).to_string(10, 3, RoundingMode::TowardZero) == "0.666");
  assert(Float::from_double(1234.5).to_string(10, 2) == "1200");

  assert(throws_contract_violation([] { (void)Float::from_double(1.0).to_string(1); }));
  assert(throws_contract_violation([] { (void)Float::from_double(1.0).to_string(-40); }));
  assert(throws_contract_violation([] { (void)Float::from_double(1.0).to_string(63); }));
}

void test_to_string_round_trip() {
  for (const double sample : {3.14159, -3.14159, 0.0, 42.0}) {
    const auto original = Float::from_double(sample, 53);
    const auto reparsed = Float::from_string(original.to_string(), 10, 53);
    assert(reparsed);
    assert_close(reparsed->to_double(), sample, 1e-10, "decimal round trip");
    assert(*reparsed == original);
  }
  for (const int base : {2, 7, 16, 36, 62}) {
    const auto original = Float::from_rational(Rational(-22, 7), 120);
    const auto reparsed = Float::from_string(original.to_string(base), base, 120);
    assert(reparsed && *reparsed == original);
  }
}

void test_fits_in_range() {
  const auto forty_two = Float::from_double(42.0);
  assert(forty_two.fits_in_long() && forty_two.fits_in_ulong());
  assert(forty_two.fits_in_int64() && forty_two.fits_in_uint64());

  const auto fractional = Float::from_double(2.5);
  assert(!fractional.fits_in_long() && !fractional.fits_in_ulong());
  assert(!fractional.fits_in_int64() && !fractional.fits_in_uint64());

  const auto minus_one = Float::from_long(-1);
  assert(minus_one.fits_in_long() && minus_one.fits_in_int64());
  assert(!minus_one.fits_in_ulong() && !minus_one.fits_in_uint64());

  const auto negative_zero = Float::from_double(-0.0);
  assert(negative_zero.fits_in_ulong() && negative_zero.fits_in_uint64());

  const auto two_pow_63 = Float::from_ulong(1UL << 63, 64);
  assert(!two_pow_63.fits_in_long() && !two_pow_63.fits_in_int64());
  assert(two_pow_63.fits_in_ulong() && two_pow_63.fits_in_uint64());

  const auto int64_min = Float::from_long(LONG_MIN, 64);
  assert(int64_min.fits_in_long() && int64_min.fits_in_int64());

  const auto two_pow_64 = Float::from_double(18446744073709551616.0);
  assert(!two_pow_64.fits_in_ulong() && !two_pow_64.fits_in_uint64());

  const auto uint64_max = Float::from_ulong(ULONG_MAX, 64);
  assert(uint64_max.fits_in_uint64());
  assert(!Float::from_ulong(ULONG_MAX, 32).fits_in_uint64());

  for (const auto& special : {Float(), *Float::from_string("@Inf@"), *Float::from_string("-@Inf@")}) {
    assert(!special.fits_in_long() && !special.fits_in_ulong());
    assert(!special.fits_in_int64() && !special.fits_in_uint64());
  }
}

void test_to_rational() {
  assert(*Float::from_double(0.75).to_rational() == Rational(3, 4));
  assert(*Float::from_double(-6.0).to_rational() == Rational(-6, 1));
  assert(Float::from_double(-0.0).to_rational()->sign() == 0);
  assert(!Float().to_rational());
  assert(!Float::from_string("@Inf@")->to_rational());
}

void test_hash_follows_equality() {
  const std::hash<Float> hasher{};
  assert(hasher(Float::from_double(1.5, 53)) == hasher(Float::from_double(1.5, 200)));
  assert(hasher(Float::from_double(0.0)) == hasher(Float::from_double(-0.0)));
  assert(hasher(Float()) == hasher(*Float::from_string("@NaN@", 10, 300)));
  assert(Float::from_double(1.5).hash() == hasher(Float::from_double(1.5)));
}

}  // namespace

void run_conversion_tests() {
  test_to_double();
  test_to_double_2exp();
  test_to_long_rounding();
  test_out_of_range_integers_saturate();
  test_to_string();
  test_to_string_round_trip();
  test_fits_in_range();
  test_to_rational();
  test_hash_follows_equality();
}

}  // namespace value_test
