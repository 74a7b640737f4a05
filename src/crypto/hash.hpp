#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace txforge::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

}  // namespace txforge::crypto
