#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <gmp.h>

namespace mpfloat {

// Value wrapper over a GMP integer. Only the surface the float layer needs.
class BigInteger {
 public:
  BigInteger();
  explicit BigInteger(long value);
  BigInteger(const BigInteger& other);
  BigInteger& operator=(const BigInteger& other);
  BigInteger(BigInteger&& other) noexcept;
  BigInteger& operator=(BigInteger&& other) noexcept;
  ~BigInteger();

  // Base 0 (auto-detect prefix) or 2..62. Absent on malformed text.
  static std::optional<BigInteger> from_string(std::string_view text, int base = 10);

  int sign() const;
  // Number of significant bits of |value|; 0 for zero.
  std::size_t bit_length() const;
  std::string to_string(int base = 10) const;

  mpz_srcptr raw() const { return value; }
  mpz_ptr raw() { return value; }

  friend bool operator==(const BigInteger& lhs, const BigInteger& rhs);
  friend bool operator!=(const BigInteger& lhs, const BigInteger& rhs) { return !(lhs == rhs); }

 private:
  mpz_t value;
};

}  // namespace mpfloat
