#pragma once

#include <cstddef>
#include <memory>

#include <gmp.h>
#include <mpfr.h>

#include "mpfloat/rounding_mode.h"

namespace mpfloat {

long precision_min();
long precision_max();

// Throws ContractViolation unless precision_min() <= precision <= precision_max().
void check_precision(long precision);

mpfr_rnd_t engine_rounding(RoundingMode mode);

// Exclusive owner of one engine float. Never copied: sharing happens one
// level up through std::shared_ptr, and Float clones before it mutates a
// shared instance.
struct FloatStorage {
  explicit FloatStorage(long precision);
  ~FloatStorage();
  FloatStorage(const FloatStorage&) = delete;
  FloatStorage& operator=(const FloatStorage&) = delete;

  // New NaN at `precision` (validated).
  static std::shared_ptr<FloatStorage> create(long precision);
  // New storage with the precision and exact bits of `source`.
  static std::shared_ptr<FloatStorage> clone(const FloatStorage& source);

  long precision() const;
  // Rounds the current value into `precision` bits with the process-wide
  // default rounding mode.
  void set_precision(long precision);

  // Process-wide counters: live engine objects, clones performed so far.
  static std::size_t live_count();
  static std::size_t clone_count();

  mpfr_t value;
};

}  // namespace mpfloat
