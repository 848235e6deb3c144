#pragma once

#include "mpfloat/rounding_mode.h"

namespace mpfloat {

// Process-wide defaults, consulted only when a value is constructed without
// an explicit precision, or when a caller asks for the default rounding mode
// by name. Changing them never touches values that already exist.
//
// Reads and writes are serialized by an internal mutex. The first access
// seeds the state from MPFLOAT_DEFAULT_PRECISION / MPFLOAT_DEFAULT_ROUNDING.
class Defaults {
 public:
  static long precision();
  // Throws ContractViolation when outside [precision_min(), precision_max()].
  static void set_precision(long precision);

  static RoundingMode rounding_mode();
  static void set_rounding_mode(RoundingMode mode);

  // Back to the engine's built-in precision and Nearest, ignoring the
  // environment.
  static void reset();
};

}  // namespace mpfloat
