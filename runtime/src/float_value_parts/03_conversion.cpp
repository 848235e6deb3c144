namespace mpfloat {

namespace {

// mpfr_get_str digits with an implicit radix point before the first one;
// the value is 0.digits * base^exponent.
std::string positional_text(std::string digits, mpfr_exp_t exponent) {
  const auto length = static_cast<mpfr_exp_t>(digits.size());
  std::string out;
  if (exponent <= 0) {
    out = "0.";
    out.append(static_cast<std::size_t>(-exponent), '0');
    out += digits;
  } else if (exponent < length) {
    out = digits.substr(0, static_cast<std::size_t>(exponent));
    out.push_back('.');
    out += digits.substr(static_cast<std::size_t>(exponent));
  } else {
    out = std::move(digits);
    out.append(static_cast<std::size_t>(exponent - length), '0');
    return out;
  }
  while (out.back() == '0') {
    out.pop_back();
  }
  if (out.back() == '.') {
    out.pop_back();
  }
  return out;
}

}  // namespace

double Float::to_double(RoundingMode rounding) const {
  return mpfr_get_d(storage->value, engine_rounding(rounding));
}

Float::Double2Exp Float::to_double_2exp(RoundingMode rounding) const {
  Double2Exp out;
  if (mpfr_zero_p(storage->value)) {
    return out;
  }
  long exponent = 0;
  out.mantissa = mpfr_get_d_2exp(&exponent, storage->value, engine_rounding(rounding));
  out.exponent = mpfr_regular_p(storage->value) ? exponent : 0;
  return out;
}

long Float::to_long(RoundingMode rounding) const {
  return mpfr_get_si(storage->value, engine_rounding(rounding));
}

unsigned long Float::to_ulong(RoundingMode rounding) const {
  return mpfr_get_ui(storage->value, engine_rounding(rounding));
}

std::string Float::to_string(int base, std::size_t digits, RoundingMode rounding) const {
  check_render_base(base);
  const auto value = storage->value;
  if (mpfr_nan_p(value)) {
    return "@NaN@";
  }
  if (mpfr_inf_p(value)) {
    return mpfr_signbit(value) ? "-@Inf@" : "@Inf@";
  }
  if (mpfr_zero_p(value)) {
    return mpfr_signbit(value) ? "-0" : "0";
  }

  // Negative bases render in the positive base, then upper-case the digits.
  const int engine_base = base < 0 ? -base : base;
  mpfr_exp_t exponent = 0;
  char* raw = mpfr_get_str(nullptr, &exponent, engine_base, digits, value, engine_rounding(rounding));
  if (!raw) {
    throw ContractViolation("engine rejected rendering in base " + std::to_string(base));
  }
  std::string mantissa(raw);
  mpfr_free_str(raw);
  if (base < 0) {
    std::transform(mantissa.begin(), mantissa.end(), mantissa.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  }

  const bool negative = !mantissa.empty() && mantissa.front() == '-';
  if (negative) {
    mantissa.erase(0, 1);
  }
  auto out = positional_text(std::move(mantissa), exponent);
  return negative ? "-" + out : out;
}

std::optional<Rational> Float::to_rational() const {
  if (!mpfr_number_p(storage->value)) {
    return std::nullopt;
  }
  Rational out;
  mpfr_get_q(out.raw(), storage->value);
  return out;
}

bool Float::fits_in_long() const {
  return mpfr_integer_p(storage->value) && mpfr_fits_slong_p(storage->value, MPFR_RNDN);
}

bool Float::fits_in_ulong() const {
  return mpfr_integer_p(storage->value) && mpfr_fits_ulong_p(storage->value, MPFR_RNDN);
}

// Bounds are powers of two, so they are compared exactly whatever the
// value's precision: -2^63 <= v < 2^63.
bool Float::fits_in_int64() const {
  const auto value = storage->value;
  return mpfr_integer_p(value) && mpfr_cmp_si_2exp(value, -1, 63) >= 0 &&
         mpfr_cmp_si_2exp(value, 1, 63) < 0;
}

bool Float::fits_in_uint64() const {
  const auto value = storage->value;
  return mpfr_integer_p(value) && mpfr_sgn(value) >= 0 && mpfr_cmp_ui_2exp(value, 1, 64) < 0;
}

std::size_t Float::hash() const {
  const auto value = storage->value;
  if (mpfr_nan_p(value)) {
    return static_cast<std::size_t>(0x7ff8000000000001ULL);
  }
  if (mpfr_inf_p(value)) {
    return static_cast<std::size_t>(mpfr_signbit(value) ? 0xfff0000000000000ULL : 0x7ff0000000000000ULL);
  }
  Rational exact;
  mpfr_get_q(exact.raw(), value);
  return std::hash<std::string>{}(exact.to_string(16));
}

}  // namespace mpfloat
