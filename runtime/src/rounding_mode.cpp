#include "mpfloat/rounding_mode.h"

#include <algorithm>
#include <cctype>

#include <gmp.h>
#include <mpfr.h>

namespace mpfloat {

int rounding_mode_to_engine(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::Nearest:
      return MPFR_RNDN;
    case RoundingMode::TowardZero:
      return MPFR_RNDZ;
    case RoundingMode::TowardPositiveInfinity:
      return MPFR_RNDU;
    case RoundingMode::TowardNegativeInfinity:
      return MPFR_RNDD;
    case RoundingMode::AwayFromZero:
      return MPFR_RNDA;
    case RoundingMode::Faithful:
      return MPFR_RNDF;
  }
  return MPFR_RNDN;
}

RoundingMode rounding_mode_from_engine(int code) {
  switch (code) {
    case MPFR_RNDN:
      return RoundingMode::Nearest;
    case MPFR_RNDZ:
      return RoundingMode::TowardZero;
    case MPFR_RNDU:
      return RoundingMode::TowardPositiveInfinity;
    case MPFR_RNDD:
      return RoundingMode::TowardNegativeInfinity;
    case MPFR_RNDA:
      return RoundingMode::AwayFromZero;
    case MPFR_RNDF:
      return RoundingMode::Faithful;
    default:
      return RoundingMode::Nearest;
  }
}

std::string rounding_mode_name(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::Nearest:
      return "nearest";
    case RoundingMode::TowardZero:
      return "toward_zero";
    case RoundingMode::TowardPositiveInfinity:
      return "toward_positive_infinity";
    case RoundingMode::TowardNegativeInfinity:
      return "toward_negative_infinity";
    case RoundingMode::AwayFromZero:
      return "away_from_zero";
    case RoundingMode::Faithful:
      return "faithful";
  }
  return "nearest";
}

std::optional<RoundingMode> rounding_mode_from_name(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lowered == "nearest" || lowered == "rndn") {
    return RoundingMode::Nearest;
  }
  if (lowered == "toward_zero" || lowered == "rndz") {
    return RoundingMode::TowardZero;
  }
  if (lowered == "toward_positive_infinity" || lowered == "rndu") {
    return RoundingMode::TowardPositiveInfinity;
  }
  if (lowered == "toward_negative_infinity" || lowered == "rndd") {
    return RoundingMode::TowardNegativeInfinity;
  }
  if (lowered == "away_from_zero" || lowered == "rnda") {
    return RoundingMode::AwayFromZero;
  }
  if (lowered == "faithful" || lowered == "rndf") {
    return RoundingMode::Faithful;
  }
  return std::nullopt;
}

}  // namespace mpfloat
