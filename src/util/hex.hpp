#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace txforge::util {

std::string HexEncode(std::span<const std::uint8_t> data);
// Accepts either case; rejects odd lengths and non-hex characters.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);
// Exactly 64 hex characters into a 32-byte array.
bool HexDecode32(std::string_view hex, std::array<std::uint8_t, 32>* out);

}  // namespace txforge::util
