#include "mpfloat/float_io.h"

#include <string>
#include <utility>

#include <gmp.h>
#include <mpfr.h>

#include "float_access.h"

namespace mpfloat {

std::optional<ParsePrefixResult> parse_prefix(std::string_view text, int base,
                                              std::optional<long> precision, RoundingMode rounding) {
  check_parse_base(base);
  auto storage = FloatStorage::create(resolve_precision(precision));
  if (text.empty()) {
    return std::nullopt;
  }
  // The engine reads a C string, so nothing past an embedded NUL is consumed.
  const std::string owned(text.substr(0, text.find('\0')));
  if (owned.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const int ternary = mpfr_strtofr(storage->value, owned.c_str(), &end, base, engine_rounding(rounding));
  if (end == owned.c_str()) {
    return std::nullopt;
  }
  ParsePrefixResult result{FloatAccess::adopt(std::move(storage)),
                           static_cast<std::size_t>(end - owned.c_str()), ternary};
  return result;
}

std::size_t write_float(std::ostream& out, const Float& value, int base, std::size_t digits,
                        RoundingMode rounding) {
  if (!out.good()) {
    return 0;
  }
  const auto text = value.to_string(base, digits, rounding);
  out << text << '\n';
  if (!out.good()) {
    return 0;
  }
  return text.size() + 1;
}

std::optional<Float> read_float(std::istream& in, int base, std::optional<long> precision,
                                RoundingMode rounding) {
  check_parse_base(base);
  std::string line;
  if (!std::getline(in, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.empty()) {
    return std::nullopt;
  }
  return Float::from_string(line, base, precision, rounding);
}

std::ostream& operator<<(std::ostream& out, const Float& value) {
  return out << value.to_string();
}

}  // namespace mpfloat
