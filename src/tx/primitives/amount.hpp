#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace txforge::primitives {

using Amount = std::uint64_t;  // Amounts denominated in sompi (1e-8 KAS).

inline constexpr Amount kSompiPerKas = 100'000'000ULL;
// Upper bound for any single amount or sum; above the 28.7B KAS emission cap.
inline constexpr Amount kMaxSompi = 29'000'000'000ULL * kSompiPerKas;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxSompi; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (a > kMaxSompi - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

inline bool CheckedMul(Amount a, std::uint64_t b, Amount* out) noexcept {
  if (!MoneyRange(a)) {
    return false;
  }
  if (b == 0) {
    if (out) {
      *out = 0;
    }
    return true;
  }
  if (a > kMaxSompi / b) {
    return false;
  }
  if (out) {
    *out = static_cast<Amount>(a * b);
  }
  return true;
}

// Computes a * numerator / denominator without intermediate overflow for
// the small ratios used by fee policy (bps, percent, permille). Rounds
// toward zero unless round_up is set.
bool CheckedMulDiv(Amount a, std::uint64_t numerator, std::uint64_t denominator, Amount* out,
                   bool round_up = false) noexcept;

// Adds b to a, pinning the result at kMaxSompi instead of failing.
Amount SaturatingAdd(Amount a, Amount b) noexcept;

// Parses a base-unit integer ("12500", no sign, no fraction).
bool ParseSompi(std::string_view text, Amount* out, std::string* error);

// Parses a KAS decimal ("1.5", "0.00000001") exactly into sompi. More than
// eight fractional digits is rejected rather than rounded.
bool ParseKasAmount(std::string_view text, Amount* out, std::string* error);

std::string FormatKas(Amount sompi);

}  // namespace txforge::primitives
