#pragma once

#include <array>
#include <cstdint>

namespace txforge::primitives {

using Hash256 = std::array<std::uint8_t, 32>;

}  // namespace txforge::primitives
