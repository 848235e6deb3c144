#include "mpfloat/rational.h"

#include <memory>

#include "base_check.h"
#include "mpfloat/errors.h"

namespace mpfloat {

Rational::Rational() {
  mpq_init(value);
}

Rational::Rational(long numerator, unsigned long denominator) {
  if (denominator == 0) {
    throw ContractViolation("rational with zero denominator");
  }
  mpq_init(value);
  mpq_set_si(value, numerator, denominator);
  mpq_canonicalize(value);
}

Rational::Rational(const BigInteger& numerator, const BigInteger& denominator) {
  if (denominator.sign() == 0) {
    throw ContractViolation("rational with zero denominator");
  }
  mpq_init(value);
  mpz_set(mpq_numref(value), numerator.raw());
  mpz_set(mpq_denref(value), denominator.raw());
  mpq_canonicalize(value);
}

Rational::Rational(const Rational& other) {
  mpq_init(value);
  mpq_set(value, other.value);
}

Rational& Rational::operator=(const Rational& other) {
  if (this != &other) {
    mpq_set(value, other.value);
  }
  return *this;
}

Rational::Rational(Rational&& other) noexcept {
  mpq_init(value);
  mpq_swap(value, other.value);
}

Rational& Rational::operator=(Rational&& other) noexcept {
  if (this != &other) {
    mpq_swap(value, other.value);
  }
  return *this;
}

Rational::~Rational() {
  mpq_clear(value);
}

std::optional<Rational> Rational::from_string(std::string_view text, int base) {
  if (text.empty() || text.find('\0') != std::string_view::npos ||
      (base != 0 && (base < 2 || base > 62))) {
    return std::nullopt;
  }
  const std::string owned(text);
  Rational out;
  if (mpq_set_str(out.value, owned.c_str(), base) != 0) {
    return std::nullopt;
  }
  if (mpz_sgn(mpq_denref(out.value)) == 0) {
    return std::nullopt;
  }
  mpq_canonicalize(out.value);
  return out;
}

BigInteger Rational::numerator() const {
  BigInteger out;
  mpz_set(out.raw(), mpq_numref(value));
  return out;
}

BigInteger Rational::denominator() const {
  BigInteger out;
  mpz_set(out.raw(), mpq_denref(value));
  return out;
}

int Rational::sign() const {
  return mpq_sgn(value);
}

std::string Rational::to_string(int base) const {
  check_render_base(base);
  const auto radix = base < 0 ? -base : base;
  const auto size =
      mpz_sizeinbase(mpq_numref(value), radix) + mpz_sizeinbase(mpq_denref(value), radix) + 3;
  std::unique_ptr<char[]> buffer(new char[size]);
  mpq_get_str(buffer.get(), base, value);
  return std::string(buffer.get());
}

bool operator==(const Rational& lhs, const Rational& rhs) {
  return mpq_equal(lhs.value, rhs.value) != 0;
}

}  // namespace mpfloat
