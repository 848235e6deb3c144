#include "mpfloat/big_integer.h"

#include <memory>

#include "base_check.h"

namespace mpfloat {

BigInteger::BigInteger() {
  mpz_init(value);
}

BigInteger::BigInteger(long v) {
  mpz_init_set_si(value, v);
}

BigInteger::BigInteger(const BigInteger& other) {
  mpz_init_set(value, other.value);
}

BigInteger& BigInteger::operator=(const BigInteger& other) {
  if (this != &other) {
    mpz_set(value, other.value);
  }
  return *this;
}

// The moved-from object keeps a valid zero so its destructor stays safe.
BigInteger::BigInteger(BigInteger&& other) noexcept {
  mpz_init(value);
  mpz_swap(value, other.value);
}

BigInteger& BigInteger::operator=(BigInteger&& other) noexcept {
  if (this != &other) {
    mpz_swap(value, other.value);
  }
  return *this;
}

BigInteger::~BigInteger() {
  mpz_clear(value);
}

std::optional<BigInteger> BigInteger::from_string(std::string_view text, int base) {
  if (text.empty() || text.find('\0') != std::string_view::npos ||
      (base != 0 && (base < 2 || base > 62))) {
    return std::nullopt;
  }
  const std::string owned(text);
  BigInteger out;
  if (mpz_set_str(out.value, owned.c_str(), base) != 0) {
    return std::nullopt;
  }
  return out;
}

int BigInteger::sign() const {
  return mpz_sgn(value);
}

std::size_t BigInteger::bit_length() const {
  if (mpz_sgn(value) == 0) {
    return 0;
  }
  return mpz_sizeinbase(value, 2);
}

std::string BigInteger::to_string(int base) const {
  check_render_base(base);
  const auto size = mpz_sizeinbase(value, base < 0 ? -base : base) + 2;
  std::unique_ptr<char[]> buffer(new char[size]);
  mpz_get_str(buffer.get(), base, value);
  return std::string(buffer.get());
}

bool operator==(const BigInteger& lhs, const BigInteger& rhs) {
  return mpz_cmp(lhs.value, rhs.value) == 0;
}

}  // namespace mpfloat
