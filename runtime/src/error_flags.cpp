#include "mpfloat/error_flags.h"

#include <gmp.h>
#include <mpfr.h>

namespace mpfloat {

static_assert(static_cast<std::uint32_t>(ErrorFlag::Underflow) == MPFR_FLAGS_UNDERFLOW,
              "underflow bit must match the engine");
static_assert(static_cast<std::uint32_t>(ErrorFlag::Overflow) == MPFR_FLAGS_OVERFLOW,
              "overflow bit must match the engine");
static_assert(static_cast<std::uint32_t>(ErrorFlag::NaN) == MPFR_FLAGS_NAN,
              "nan bit must match the engine");
static_assert(static_cast<std::uint32_t>(ErrorFlag::RangeError) == MPFR_FLAGS_ERANGE,
              "range-error bit must match the engine");
static_assert(static_cast<std::uint32_t>(ErrorFlag::DivideByZero) == MPFR_FLAGS_DIVBY0,
              "divide-by-zero bit must match the engine");

ErrorFlags::ErrorFlags(std::initializer_list<ErrorFlag> flags) {
  for (const auto flag : flags) {
    insert(flag);
  }
}

std::string ErrorFlags::to_string() const {
  if (empty()) {
    return "none";
  }
  std::string out;
  auto append = [&out](bool present, const char* name) {
    if (!present) {
      return;
    }
    if (!out.empty()) {
      out.push_back('|');
    }
    out += name;
  };
  append(is_underflow(), "underflow");
  append(is_overflow(), "overflow");
  append(is_nan(), "nan");
  append(is_range_error(), "range_error");
  append(is_divide_by_zero(), "divide_by_zero");
  return out;
}

ErrorFlags ErrorFlags::current() {
  return ErrorFlags(static_cast<std::uint32_t>(mpfr_flags_test(kKnownMask)));
}

void ErrorFlags::clear() {
  mpfr_flags_clear(kKnownMask);
}

ErrorFlags ErrorFlags::take() {
  const auto flags = current();
  clear();
  return flags;
}

void ErrorFlags::raise(ErrorFlags flags) {
  mpfr_flags_set(flags.raw());
}

}  // namespace mpfloat
