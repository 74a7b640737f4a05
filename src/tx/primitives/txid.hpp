#pragma once

#include "primitives/transaction.hpp"

namespace txforge::primitives {

// SHA3-256 over the serialization with signature scripts blanked. Stable
// across signing, so callers can correlate a built transaction with the
// signed one the wallet later broadcasts.
Hash256 ComputeUnsignedDigest(const CTransaction& tx);

}  // namespace txforge::primitives
