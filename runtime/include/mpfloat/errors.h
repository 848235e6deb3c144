#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mpfloat {

// Raised for contract violations by the caller: precision or base out of
// range, zero tolerance width, zero denominator. Raised before any state
// is touched.
struct ContractViolation : public std::logic_error {
  explicit ContractViolation(std::string msg) : std::logic_error(std::move(msg)) {}
};

}  // namespace mpfloat
