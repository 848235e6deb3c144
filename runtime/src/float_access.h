#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "base_check.h"
#include "mpfloat/defaults.h"
#include "mpfloat/errors.h"
#include "mpfloat/float_storage.h"
#include "mpfloat/float_value.h"

namespace mpfloat {

// Lets the library wrap a freshly parsed storage into a Float.
struct FloatAccess {
  static Float adopt(std::shared_ptr<FloatStorage> storage) { return Float(std::move(storage)); }
};

inline long resolve_precision(const std::optional<long>& precision) {
  return precision ? *precision : Defaults::precision();
}

}  // namespace mpfloat
