#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>

namespace mpfloat {

// Bit values mirror the engine's flag register so raw patterns read from
// the engine can be wrapped without translation.
enum class ErrorFlag : std::uint32_t {
  Underflow = 1U,
  Overflow = 2U,
  NaN = 4U,
  RangeError = 16U,
  DivideByZero = 32U,
};

class ErrorFlags {
 public:
  static constexpr std::uint32_t kKnownMask = 1U | 2U | 4U | 16U | 32U;

  constexpr ErrorFlags() = default;
  constexpr explicit ErrorFlags(std::uint32_t raw) : bits(raw & kKnownMask) {}
  ErrorFlags(std::initializer_list<ErrorFlag> flags);

  constexpr std::uint32_t raw() const { return bits; }
  constexpr bool empty() const { return bits == 0U; }
  constexpr bool contains(ErrorFlag flag) const {
    return (bits & static_cast<std::uint32_t>(flag)) != 0U;
  }
  constexpr bool contains(ErrorFlags other) const { return (bits & other.bits) == other.bits; }

  void insert(ErrorFlag flag) { bits |= static_cast<std::uint32_t>(flag); }
  void remove(ErrorFlag flag) { bits &= ~static_cast<std::uint32_t>(flag); }

  constexpr bool is_underflow() const { return contains(ErrorFlag::Underflow); }
  constexpr bool is_overflow() const { return contains(ErrorFlag::Overflow); }
  constexpr bool is_nan() const { return contains(ErrorFlag::NaN); }
  constexpr bool is_range_error() const { return contains(ErrorFlag::RangeError); }
  constexpr bool is_divide_by_zero() const { return contains(ErrorFlag::DivideByZero); }

  // "overflow|nan", or "none" for the empty set.
  std::string to_string() const;

  // Engine flag register access. The register is shared by every value in
  // the calling thread (per-thread when the engine is built thread-safe).
  static ErrorFlags current();
  static void clear();
  static ErrorFlags take();
  static void raise(ErrorFlags flags);

  friend constexpr bool operator==(ErrorFlags lhs, ErrorFlags rhs) { return lhs.bits == rhs.bits; }
  friend constexpr bool operator!=(ErrorFlags lhs, ErrorFlags rhs) { return lhs.bits != rhs.bits; }
  friend constexpr ErrorFlags operator|(ErrorFlags lhs, ErrorFlags rhs) {
    return ErrorFlags(lhs.bits | rhs.bits);
  }
  friend constexpr ErrorFlags operator&(ErrorFlags lhs, ErrorFlags rhs) {
    return ErrorFlags(lhs.bits & rhs.bits);
  }

 private:
  std::uint32_t bits = 0U;
};

}  // namespace mpfloat
