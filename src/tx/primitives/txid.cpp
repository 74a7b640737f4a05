#include "primitives/txid.hpp"

#include <algorithm>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace txforge::primitives {

Hash256 ComputeUnsignedDigest(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_signature_scripts=*/false);
  const auto hash = crypto::Sha3_256(buffer);
  Hash256 result{};
  std::copy(hash.begin(), hash.end(), result.begin());
  return result;
}

}  // namespace txforge::primitives
