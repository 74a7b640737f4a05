#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "primitives/transaction.hpp"

namespace txforge::crypto {

enum class AddressVersion : std::uint8_t {
  kPubKey = 0,        // 32-byte Schnorr public key.
  kPubKeyEcdsa = 1,   // 33-byte compressed ECDSA public key.
  kScriptHash = 8,    // 32-byte BLAKE2b script hash.
};

struct KaspaAddress {
  std::string prefix;  // "kaspa", "kaspatest", ...
  AddressVersion version{AddressVersion::kPubKey};
  std::vector<std::uint8_t> payload;
};

// Encodes prefix:payload using the cashaddr base32 alphabet and the 40-bit
// BCH checksum Kaspa uses. Returns an empty string for an unknown version or
// a payload of the wrong length.
std::string EncodeAddress(const KaspaAddress& address);

// Decodes and verifies an address. The input is matched case-insensitively
// but must not mix cases. When expected_prefix is non-empty the address must
// carry exactly that prefix.
bool DecodeAddress(std::string_view text, std::string_view expected_prefix, KaspaAddress* out,
                   std::string* error);

// Standard locking script paying to the address.
primitives::ScriptPublicKey PayToAddressScript(const KaspaAddress& address);

}  // namespace txforge::crypto
