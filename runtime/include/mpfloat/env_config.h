#pragma once

#include <cstdlib>
#include <optional>
#include <string>

#include "mpfloat/rounding_mode.h"

namespace mpfloat {

// Canonical env-flag parser. Every MPFLOAT_* toggle goes through here so the
// accepted spellings stay the same across the library.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

// Parses a precision setting. Absent when unset, empty, not a whole decimal
// number, or outside the engine's precision bounds.
std::optional<long> parse_precision_setting(const char* raw);

// Parses a rounding mode setting by name. Absent when unset, empty or unknown.
std::optional<RoundingMode> parse_rounding_setting(const char* raw);

bool storage_trace_enabled();

}  // namespace mpfloat
