namespace mpfloat {

int Float::set(const Float& other, RoundingMode rounding) {
  // When the two share storage, `other` keeps the original after we clone.
  auto& target = mutable_storage();
  return mpfr_set(target.value, other.storage->value, engine_rounding(rounding));
}

int Float::set(const BigInteger& value, RoundingMode rounding) {
  return mpfr_set_z(mutable_storage().value, value.raw(), engine_rounding(rounding));
}

int Float::set(const Rational& value, RoundingMode rounding) {
  return mpfr_set_q(mutable_storage().value, value.raw(), engine_rounding(rounding));
}

int Float::set_long(long value, RoundingMode rounding) {
  return mpfr_set_si(mutable_storage().value, value, engine_rounding(rounding));
}

int Float::set_ulong(unsigned long value, RoundingMode rounding) {
  return mpfr_set_ui(mutable_storage().value, value, engine_rounding(rounding));
}

int Float::set_double(double value, RoundingMode rounding) {
  return mpfr_set_d(mutable_storage().value, value, engine_rounding(rounding));
}

bool Float::set_string(std::string_view text, int base, RoundingMode rounding) {
  check_parse_base(base);
  auto& target = mutable_storage();
  if (text.empty() || text.find('\0') != std::string_view::npos) {
    return false;
  }
  const std::string owned(text);
  return mpfr_set_str(target.value, owned.c_str(), base, engine_rounding(rounding)) == 0;
}

}  // namespace mpfloat
