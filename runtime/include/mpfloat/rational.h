#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <gmp.h>

#include "mpfloat/big_integer.h"

namespace mpfloat {

// Value wrapper over a GMP rational, kept canonical (lowest terms, positive
// denominator). A zero denominator throws ContractViolation.
class Rational {
 public:
  Rational();
  Rational(long numerator, unsigned long denominator);
  Rational(const BigInteger& numerator, const BigInteger& denominator);
  Rational(const Rational& other);
  Rational& operator=(const Rational& other);
  Rational(Rational&& other) noexcept;
  Rational& operator=(Rational&& other) noexcept;
  ~Rational();

  // "num/den" or "num" in `base` (0 or 2..62). Absent on malformed text or
  // zero denominator.
  static std::optional<Rational> from_string(std::string_view text, int base = 10);

  BigInteger numerator() const;
  BigInteger denominator() const;
  int sign() const;
  std::string to_string(int base = 10) const;

  mpq_srcptr raw() const { return value; }
  mpq_ptr raw() { return value; }

  friend bool operator==(const Rational& lhs, const Rational& rhs);
  friend bool operator!=(const Rational& lhs, const Rational& rhs) { return !(lhs == rhs); }

 private:
  mpq_t value;
};

}  // namespace mpfloat
