#include "mpfloat/env_config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "mpfloat/float_storage.h"

namespace mpfloat {

std::optional<long> parse_precision_setting(const char* raw) {
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  for (const char* cursor = raw; *cursor != '\0'; ++cursor) {
    if (!std::isdigit(static_cast<unsigned char>(*cursor))) {
      return std::nullopt;
    }
  }
  errno = 0;
  char* end = nullptr;
  const long parsed = std::strtol(raw, &end, 10);
  if (errno == ERANGE || end == raw || *end != '\0') {
    return std::nullopt;
  }
  if (parsed < precision_min() || parsed > precision_max()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<RoundingMode> parse_rounding_setting(const char* raw) {
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  return rounding_mode_from_name(raw);
}

bool storage_trace_enabled() {
  static const bool enabled = env_flag_enabled("MPFLOAT_TRACE_STORAGE", false);
  return enabled;
}

}  // namespace mpfloat
