#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <gmp.h>
#include <mpfr.h>

#include "float_access.h"
#include "mpfloat/defaults.h"
#include "mpfloat/errors.h"
#include "mpfloat/float_storage.h"
#include "mpfloat/float_value.h"

namespace mpfloat {

Float::Float() : storage(FloatStorage::create(Defaults::precision())) {}

Float::Float(std::shared_ptr<FloatStorage> storage) : storage(std::move(storage)) {}

Float Float::with_precision(long precision) {
  return Float(FloatStorage::create(precision));
}

// Constructors have no result channel, so the ternaries below are dropped.
Float Float::from_double(double value, std::optional<long> precision, RoundingMode rounding) {
  Float out(FloatStorage::create(resolve_precision(precision)));
  (void)mpfr_set_d(out.storage->value, value, engine_rounding(rounding));
  return out;
}

Float Float::from_long(long value, std::optional<long> precision, RoundingMode rounding) {
  Float out(FloatStorage::create(resolve_precision(precision)));
  (void)mpfr_set_si(out.storage->value, value, engine_rounding(rounding));
  return out;
}

Float Float::from_ulong(unsigned long value, std::optional<long> precision, RoundingMode rounding) {
  Float out(FloatStorage::create(resolve_precision(precision)));
  (void)mpfr_set_ui(out.storage->value, value, engine_rounding(rounding));
  return out;
}

Float Float::from_integer(const BigInteger& value, std::optional<long> precision,
                          RoundingMode rounding) {
  Float out(FloatStorage::create(resolve_precision(precision)));
  (void)mpfr_set_z(out.storage->value, value.raw(), engine_rounding(rounding));
  return out;
}

Float Float::from_rational(const Rational& value, std::optional<long> precision,
                           RoundingMode rounding) {
  Float out(FloatStorage::create(resolve_precision(precision)));
  (void)mpfr_set_q(out.storage->value, value.raw(), engine_rounding(rounding));
  return out;
}

std::optional<Float> Float::from_string(std::string_view text, int base, std::optional<long> precision,
                                        RoundingMode rounding) {
  check_parse_base(base);
  auto storage = FloatStorage::create(resolve_precision(precision));
  if (text.empty() || text.find('\0') != std::string_view::npos) {
    return std::nullopt;
  }
  const std::string owned(text);
  if (mpfr_set_str(storage->value, owned.c_str(), base, engine_rounding(rounding)) != 0) {
    return std::nullopt;
  }
  return Float(std::move(storage));
}

FloatStorage& Float::mutable_storage() {
  if (storage.use_count() > 1) {
    storage = FloatStorage::clone(*storage);
  }
  return *storage;
}

bool Float::storage_is_unique() const {
  return storage.use_count() == 1;
}

long Float::precision() const {
  return storage->precision();
}

void Float::set_precision(long precision) {
  check_precision(precision);
  mutable_storage().set_precision(precision);
}

void Float::swap(Float& other) {
  if (this == &other) {
    return;
  }
  mutable_storage();
  other.mutable_storage();
  std::swap(storage, other.storage);
}

}  // namespace mpfloat
