#include <cstdlib>
#include <iostream>
#include <string>

#include "primitives/amount.hpp"
#include "primitives/serialize.hpp"

using namespace txforge::primitives;

int main() {
  {
    Amount value = 0;
    if (!ParseKasAmount("1.5", &value, nullptr) || value != 150'000'000ULL) {
      std::cerr << "1.5 KAS should parse to 150000000 sompi, got " << value << "\n";
      return EXIT_FAILURE;
    }
    if (!ParseKasAmount("0.00000001", &value, nullptr) || value != 1) {
      std::cerr << "smallest KAS fraction should parse to 1 sompi\n";
      return EXIT_FAILURE;
    }
    if (!ParseKasAmount(".25", &value, nullptr) || value != 25'000'000ULL) {
      std::cerr << "leading-dot KAS amount should parse\n";
      return EXIT_FAILURE;
    }
    std::string error;
    if (ParseKasAmount("0.000000001", &value, &error) || error.empty()) {
      std::cerr << "nine decimal places must be rejected, not rounded\n";
      return EXIT_FAILURE;
    }
    for (const char* bad : {"", ".", "-1", "1e8", "1.2.3", " 1"}) {
      if (ParseKasAmount(bad, &value, nullptr)) {
        std::cerr << "malformed KAS amount accepted: '" << bad << "'\n";
        return EXIT_FAILURE;
      }
    }
    if (ParseKasAmount("29000000001", &value, nullptr)) {
      std::cerr << "KAS amount above the supply bound accepted\n";
      return EXIT_FAILURE;
    }
  }

  {
    Amount value = 0;
    if (!ParseSompi("12500", &value, nullptr) || value != 12500) {
      std::cerr << "ParseSompi failed on a plain integer\n";
      return EXIT_FAILURE;
    }
    for (const char* bad : {"", "12.5", "+1", "-3", "0x10", "99999999999999999999999"}) {
      if (ParseSompi(bad, &value, nullptr)) {
        std::cerr << "ParseSompi accepted '" << bad << "'\n";
        return EXIT_FAILURE;
      }
    }
  }

  {
    Amount out = 0;
    if (CheckedAdd(kMaxSompi, 1, &out)) {
      std::cerr << "CheckedAdd must refuse to exceed kMaxSompi\n";
      return EXIT_FAILURE;
    }
    if (CheckedSub(5, 6, &out)) {
      std::cerr << "CheckedSub must refuse to go negative\n";
      return EXIT_FAILURE;
    }
    if (CheckedMul(kMaxSompi / 2 + 1, 2, &out)) {
      std::cerr << "CheckedMul overflow not detected\n";
      return EXIT_FAILURE;
    }
    if (SaturatingAdd(kMaxSompi - 10, 100) != kMaxSompi) {
      std::cerr << "SaturatingAdd should pin at kMaxSompi\n";
      return EXIT_FAILURE;
    }
  }

  {
    // 5 bps of 1 KAS: 1e8 * 5 / 1e4 = 50000 exactly.
    Amount out = 0;
    if (!CheckedMulDiv(100'000'000ULL, 5, 10000, &out, true) || out != 50000) {
      std::cerr << "CheckedMulDiv exact case wrong: " << out << "\n";
      return EXIT_FAILURE;
    }
    if (!CheckedMulDiv(1, 5, 10000, &out, true) || out != 1) {
      std::cerr << "CheckedMulDiv should round a fractional result up when asked\n";
      return EXIT_FAILURE;
    }
    if (!CheckedMulDiv(1, 5, 10000, &out, false) || out != 0) {
      std::cerr << "CheckedMulDiv should truncate by default\n";
      return EXIT_FAILURE;
    }
    // Large amounts must not overflow through the intermediate product.
    if (!CheckedMulDiv(kMaxSompi, 450, 1000, &out) || out != kMaxSompi / 1000 * 450) {
      std::cerr << "CheckedMulDiv overflowed on a large amount\n";
      return EXIT_FAILURE;
    }
    if (CheckedMulDiv(10, 1, 0, &out)) {
      std::cerr << "CheckedMulDiv accepted a zero denominator\n";
      return EXIT_FAILURE;
    }
  }

  if (FormatKas(150'000'000ULL) != "1.5" || FormatKas(1) != "0.00000001" ||
      FormatKas(0) != "0.0") {
    std::cerr << "FormatKas produced unexpected output\n";
    return EXIT_FAILURE;
  }

  {
    // value(8) + script version(2) + script length(8) + script.
    CTxOut out;
    out.value = 1000;
    out.script_public_key.script.assign(34, 0x00);
    if (serialize::SerializedOutputSize(out) != 8 + 2 + 8 + 34) {
      std::cerr << "SerializedOutputSize mismatch: " << serialize::SerializedOutputSize(out)
                << "\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
