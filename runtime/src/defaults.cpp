#include "mpfloat/defaults.h"

#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "mpfloat/env_config.h"
#include "mpfloat/float_storage.h"

namespace mpfloat {

namespace {

struct DefaultsState {
  std::mutex mutex;
  long precision = 53;
  RoundingMode rounding = RoundingMode::Nearest;
};

long engine_default_precision() {
  return static_cast<long>(mpfr_get_default_prec());
}

DefaultsState& defaults_state() {
  static DefaultsState* state = [] {
    auto* seeded = new DefaultsState();
    seeded->precision = engine_default_precision();

    if (const char* raw = std::getenv("MPFLOAT_DEFAULT_PRECISION"); raw && *raw != '\0') {
      if (const auto precision = parse_precision_setting(raw)) {
        seeded->precision = *precision;
      } else {
        std::fprintf(stderr, "[mpfloat-config] ignoring MPFLOAT_DEFAULT_PRECISION=%s (expected %ld..%ld)\n",
                     raw, precision_min(), precision_max());
      }
    }
    if (const char* raw = std::getenv("MPFLOAT_DEFAULT_ROUNDING"); raw && *raw != '\0') {
      if (const auto mode = parse_rounding_setting(raw)) {
        seeded->rounding = *mode;
      } else {
        std::fprintf(stderr, "[mpfloat-config] ignoring MPFLOAT_DEFAULT_ROUNDING=%s (unknown mode)\n", raw);
      }
    }
    return seeded;
  }();
  return *state;
}

}  // namespace

long Defaults::precision() {
  auto& state = defaults_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.precision;
}

void Defaults::set_precision(long precision) {
  check_precision(precision);
  auto& state = defaults_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.precision = precision;
}

RoundingMode Defaults::rounding_mode() {
  auto& state = defaults_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.rounding;
}

void Defaults::set_rounding_mode(RoundingMode mode) {
  auto& state = defaults_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.rounding = mode;
}

void Defaults::reset() {
  auto& state = defaults_state();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.precision = engine_default_precision();
  state.rounding = RoundingMode::Nearest;
}

}  // namespace mpfloat
