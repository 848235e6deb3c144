#pragma once

#include <string>

#include "mpfloat/errors.h"

namespace mpfloat {

// Parsing accepts 0 (prefix auto-detect) or 2..62.
inline void check_parse_base(int base) {
  if (base != 0 && (base < 2 || base > 62)) {
    throw ContractViolation("parse base " + std::to_string(base) + " outside {0} or [2, 62]");
  }
}

// Rendering accepts 2..62, or -36..-2 for upper-case digits.
inline void check_render_base(int base) {
  if (!((base >= 2 && base <= 62) || (base >= -36 && base <= -2))) {
    throw ContractViolation("render base " + std::to_string(base) + " outside [2, 62] or [-36, -2]");
  }
}

}  // namespace mpfloat
