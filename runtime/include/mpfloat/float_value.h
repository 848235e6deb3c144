#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mpfloat/big_integer.h"
#include "mpfloat/rational.h"
#include "mpfloat/rounding_mode.h"

namespace mpfloat {

struct FloatStorage;

// Arbitrary-precision binary float with value semantics.
//
// Copies share one FloatStorage until one of them mutates; the mutator
// clones first, so a write through one copy is never visible through
// another. Each value keeps the precision it was built with; later changes
// to Defaults do not reach it.
//
// Not thread-safe: two copies that share storage must not be mutated from
// different threads without external synchronization.
class Float {
 public:
  struct Double2Exp {
    double mantissa = 0.0;
    long exponent = 0;
  };

  // NaN at Defaults::precision().
  Float();
  Float(const Float& other) = default;
  Float& operator=(const Float& other) = default;
  ~Float() = default;

  // NaN at `precision`.
  static Float with_precision(long precision);

  // Absent precision means Defaults::precision() at the time of the call.
  // The rounding mode defaults to Nearest, not to Defaults::rounding_mode().
  static Float from_double(double value, std::optional<long> precision = std::nullopt,
                           RoundingMode rounding = RoundingMode::Nearest);
  static Float from_long(long value, std::optional<long> precision = std::nullopt,
                         RoundingMode rounding = RoundingMode::Nearest);
  static Float from_ulong(unsigned long value, std::optional<long> precision = std::nullopt,
                          RoundingMode rounding = RoundingMode::Nearest);
  static Float from_integer(const BigInteger& value, std::optional<long> precision = std::nullopt,
                            RoundingMode rounding = RoundingMode::Nearest);
  static Float from_rational(const Rational& value, std::optional<long> precision = std::nullopt,
                             RoundingMode rounding = RoundingMode::Nearest);
  // Base 0 auto-detects from the prefix ("0x", "0b"). Absent unless the
  // whole text is a valid number in `base`; an embedded NUL makes it invalid.
  static std::optional<Float> from_string(std::string_view text, int base = 10,
                                          std::optional<long> precision = std::nullopt,
                                          RoundingMode rounding = RoundingMode::Nearest);

  long precision() const;
  // Rounds the current value into the new precision (default rounding mode).
  void set_precision(long precision);

  // Assignment. The ternary result is 0 when exact, > 0 when the stored
  // value is above the source, < 0 when below.
  int set(const Float& other, RoundingMode rounding = RoundingMode::Nearest);
  int set(const BigInteger& value, RoundingMode rounding = RoundingMode::Nearest);
  int set(const Rational& value, RoundingMode rounding = RoundingMode::Nearest);
  int set_long(long value, RoundingMode rounding = RoundingMode::Nearest);
  int set_ulong(unsigned long value, RoundingMode rounding = RoundingMode::Nearest);
  int set_double(double value, RoundingMode rounding = RoundingMode::Nearest);
  // True iff the whole text is valid in `base`. On false the numeric
  // content is unspecified; precision and validity are kept.
  bool set_string(std::string_view text, int base = 10, RoundingMode rounding = RoundingMode::Nearest);

  // Both sides end up owning their storage exclusively, the same state any
  // other mutator leaves behind, so a swapped value never aliases a copy.
  void swap(Float& other);

  double to_double(RoundingMode rounding = RoundingMode::Nearest) const;
  // mantissa * 2^exponent == value, 0.5 <= |mantissa| < 1; (0.0, 0) for zero.
  Double2Exp to_double_2exp(RoundingMode rounding = RoundingMode::Nearest) const;
  // Out-of-range magnitudes saturate (and raise RangeError); NaN gives 0.
  long to_long(RoundingMode rounding = RoundingMode::Nearest) const;
  unsigned long to_ulong(RoundingMode rounding = RoundingMode::Nearest) const;
  // Positional text in `base` (2..62, or -36..-2 for upper-case digits).
  // digits == 0 picks enough digits to read the value back exactly.
  // There is no exponent notation: the exponent is spelled out as zeros, so
  // a magnitude near the engine's exponent limits (about 2^(2^30)) renders
  // as a string hundreds of megabytes long.
  std::string to_string(int base = 10, std::size_t digits = 0,
                        RoundingMode rounding = RoundingMode::Nearest) const;
  // Absent for NaN and infinities.
  std::optional<Rational> to_rational() const;

  bool fits_in_long() const;
  bool fits_in_ulong() const;
  bool fits_in_int64() const;
  bool fits_in_uint64() const;

  // Three-way comparison. The result is 0 (and RangeError is raised) when
  // either side is NaN; callers must not rely on it in that case.
  int compare(const Float& other) const;
  int compare(const BigInteger& value) const;
  int compare(const Rational& value) const;
  int compare_double(double value) const;
  int compare_long(long value) const;

  // True iff both agree on their first `bits` significant bits. NaN is never
  // equal. bits == 0 throws ContractViolation.
  bool is_equal(const Float& other, unsigned long bits) const;

  // -1 / 0 / +1; both zeros give 0.
  int sign() const;
  bool is_zero() const;
  bool is_negative() const;
  bool is_positive() const;
  bool is_nan() const;
  bool is_infinity() const;
  // Finite, zero included.
  bool is_regular() const;

  std::size_t hash() const;

  bool storage_is_unique() const;

 private:
  friend struct FloatAccess;

  explicit Float(std::shared_ptr<FloatStorage> storage);
  FloatStorage& mutable_storage();

  std::shared_ptr<FloatStorage> storage;
};

// IEEE-style partial order: every relation involving NaN is false,
// NaN == NaN included. != is the negation of ==.
bool operator==(const Float& lhs, const Float& rhs);
bool operator!=(const Float& lhs, const Float& rhs);
bool operator<(const Float& lhs, const Float& rhs);
bool operator<=(const Float& lhs, const Float& rhs);
bool operator>(const Float& lhs, const Float& rhs);
bool operator>=(const Float& lhs, const Float& rhs);

inline void swap(Float& lhs, Float& rhs) {
  lhs.swap(rhs);
}

}  // namespace mpfloat

namespace std {

template <>
struct hash<mpfloat::Float> {
  std::size_t operator()(const mpfloat::Float& value) const { return value.hash(); }
};

}  // namespace std
