#include "util/hex.hpp"

namespace txforge::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int Nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool DecodeInto(std::string_view hex, std::uint8_t* dest) {
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = Nibble(hex[i]);
    const int lo = Nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    dest[i / 2] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out(data.size() * 2, '0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    out[i * 2] = kHexDigits[data[i] >> 4];
    out[i * 2 + 1] = kHexDigits[data[i] & 0x0F];
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  std::vector<std::uint8_t> bytes(hex.size() / 2);
  if (!DecodeInto(hex, bytes.data())) {
    return false;
  }
  *out = std::move(bytes);
  return true;
}

bool HexDecode32(std::string_view hex, std::array<std::uint8_t, 32>* out) {
  if (hex.size() != 64) {
    return false;
  }
  std::array<std::uint8_t, 32> bytes{};
  if (!DecodeInto(hex, bytes.data())) {
    return false;
  }
  *out = bytes;
  return true;
}

}  // namespace txforge::util
