#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>

#include "mpfloat/float_value.h"

namespace mpfloat {

struct ParsePrefixResult {
  Float value;
  std::size_t consumed = 0;
  int ternary = 0;
};

// Parses the longest numeric prefix of `text` (leading whitespace allowed).
// Parsing stops at an embedded NUL. Absent when no character could be
// consumed.
std::optional<ParsePrefixResult> parse_prefix(std::string_view text, int base = 10,
                                              std::optional<long> precision = std::nullopt,
                                              RoundingMode rounding = RoundingMode::Nearest);

// Writes to_string(base, digits, rounding) and a newline. Returns the bytes
// written, 0 when the stream was not usable.
std::size_t write_float(std::ostream& out, const Float& value, int base = 10, std::size_t digits = 0,
                        RoundingMode rounding = RoundingMode::Nearest);

// Reads one line and parses all of it. Absent on EOF, an empty line or
// malformed text.
std::optional<Float> read_float(std::istream& in, int base = 10,
                                std::optional<long> precision = std::nullopt,
                                RoundingMode rounding = RoundingMode::Nearest);

std::ostream& operator<<(std::ostream& out, const Float& value);

}  // namespace mpfloat
