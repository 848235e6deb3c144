#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mpfloat {

enum class RoundingMode {
  Nearest,
  TowardZero,
  TowardPositiveInfinity,
  TowardNegativeInfinity,
  AwayFromZero,
  Faithful,
};

// Engine codes are passed as plain ints so this header stays engine-agnostic.
int rounding_mode_to_engine(RoundingMode mode);

// Total over all ints: codes the engine does not define map to Nearest.
RoundingMode rounding_mode_from_engine(int code);

std::string rounding_mode_name(RoundingMode mode);

// Accepts the names produced by rounding_mode_name() and the engine's
// short codes ("RNDN", "RNDZ", ...). Case-insensitive.
std::optional<RoundingMode> rounding_mode_from_name(std::string_view name);

}  // namespace mpfloat
