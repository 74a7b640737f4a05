#include "primitives/amount.hpp"

#include <cctype>

namespace txforge::primitives {

namespace {

bool AccumulateDigits(std::string_view digits, Amount* value) {
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    Amount next = 0;
    if (!CheckedMul(*value, 10, &next) ||
        !CheckedAdd(next, static_cast<Amount>(c - '0'), &next)) {
      return false;
    }
    *value = next;
  }
  return true;
}

}  // namespace

bool CheckedMulDiv(Amount a, std::uint64_t numerator, std::uint64_t denominator, Amount* out,
                   bool round_up) noexcept {
  if (denominator == 0 || !MoneyRange(a)) {
    return false;
  }
  const Amount quotient = a / denominator;
  const Amount remainder = a % denominator;
  Amount whole = 0;
  if (!CheckedMul(quotient, numerator, &whole)) {
    return false;
  }
  // remainder < denominator, so this product stays small for policy ratios.
  if (numerator != 0 && remainder > UINT64_MAX / numerator) {
    return false;
  }
  const std::uint64_t partial_num = remainder * numerator;
  Amount partial = partial_num / denominator;
  if (round_up && partial_num % denominator != 0) {
    ++partial;
  }
  Amount result = 0;
  if (!CheckedAdd(whole, partial, &result)) {
    return false;
  }
  if (out) {
    *out = result;
  }
  return true;
}

Amount SaturatingAdd(Amount a, Amount b) noexcept {
  Amount sum = 0;
  if (!CheckedAdd(a, b, &sum)) {
    return kMaxSompi;
  }
  return sum;
}

bool ParseSompi(std::string_view text, Amount* out, std::string* error) {
  if (text.empty()) {
    if (error) *error = "empty amount";
    return false;
  }
  Amount value = 0;
  if (!AccumulateDigits(text, &value)) {
    if (error) *error = "amount must be a non-negative integer within range";
    return false;
  }
  if (out) {
    *out = value;
  }
  return true;
}

bool ParseKasAmount(std::string_view text, Amount* out, std::string* error) {
  if (text.empty()) {
    if (error) *error = "empty amount";
    return false;
  }
  const auto dot = text.find('.');
  std::string_view whole = text.substr(0, dot);
  std::string_view fraction =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    if (error) *error = "malformed KAS amount";
    return false;
  }
  if (fraction.size() > 8) {
    if (error) *error = "KAS amount has more than 8 decimal places";
    return false;
  }
  Amount kas = 0;
  Amount frac = 0;
  if (!AccumulateDigits(whole, &kas) || !AccumulateDigits(fraction, &frac)) {
    if (error) *error = "malformed KAS amount";
    return false;
  }
  for (std::size_t i = fraction.size(); i < 8; ++i) {
    frac *= 10;
  }
  Amount sompi = 0;
  if (!CheckedMul(kas, kSompiPerKas, &sompi) || !CheckedAdd(sompi, frac, &sompi)) {
    if (error) *error = "KAS amount out of range";
    return false;
  }
  if (out) {
    *out = sompi;
  }
  return true;
}

std::string FormatKas(Amount sompi) {
  std::string frac = std::to_string(sompi % kSompiPerKas);
  frac.insert(0, 8 - frac.size(), '0');
  while (frac.size() > 1 && frac.back() == '0') {
    frac.pop_back();
  }
  return std::to_string(sompi / kSompiPerKas) + "." + frac;
}

}  // namespace txforge::primitives
