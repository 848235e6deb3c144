namespace mpfloat {

int Float::compare(const Float& other) const {
  return mpfr_cmp(storage->value, other.storage->value);
}

int Float::compare(const BigInteger& value) const {
  return mpfr_cmp_z(storage->value, value.raw());
}

int Float::compare(const Rational& value) const {
  return mpfr_cmp_q(storage->value, value.raw());
}

int Float::compare_double(double value) const {
  return mpfr_cmp_d(storage->value, value);
}

int Float::compare_long(long value) const {
  return mpfr_cmp_si(storage->value, value);
}

bool Float::is_equal(const Float& other, unsigned long bits) const {
  if (bits == 0) {
    throw ContractViolation("is_equal needs at least one bit");
  }
  if (mpfr_nan_p(storage->value) || mpfr_nan_p(other.storage->value)) {
    return false;
  }
  return mpfr_eq(storage->value, other.storage->value, bits) != 0;
}

int Float::sign() const {
  if (mpfr_nan_p(storage->value)) {
    return 0;
  }
  const int s = mpfr_sgn(storage->value);
  return s < 0 ? -1 : (s > 0 ? 1 : 0);
}

bool Float::is_zero() const {
  return mpfr_zero_p(storage->value) != 0;
}

bool Float::is_negative() const {
  return sign() < 0;
}

bool Float::is_positive() const {
  return sign() > 0;
}

bool Float::is_nan() const {
  return mpfr_nan_p(storage->value) != 0;
}

bool Float::is_infinity() const {
  return mpfr_inf_p(storage->value) != 0;
}

bool Float::is_regular() const {
  return mpfr_number_p(storage->value) != 0;
}

// Every relation with a NaN operand is false, so NaN is checked before the
// engine ever sees the pair.
bool operator==(const Float& lhs, const Float& rhs) {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  return lhs.compare(rhs) == 0;
}

bool operator!=(const Float& lhs, const Float& rhs) {
  return !(lhs == rhs);
}

bool operator<(const Float& lhs, const Float& rhs) {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  return lhs.compare(rhs) < 0;
}

bool operator<=(const Float& lhs, const Float& rhs) {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  return lhs.compare(rhs) <= 0;
}

bool operator>(const Float& lhs, const Float& rhs) {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  return lhs.compare(rhs) > 0;
}

bool operator>=(const Float& lhs, const Float& rhs) {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  return lhs.compare(rhs) >= 0;
}

}  // namespace mpfloat
