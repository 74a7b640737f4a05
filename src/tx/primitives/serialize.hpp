#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "nlohmann/json.hpp"

#include "primitives/transaction.hpp"

namespace txforge::primitives::serialize {

void WriteUint8(std::vector<std::uint8_t>* out, std::uint8_t value);
void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value);
void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
// Length-prefixed byte string; the length is a little-endian uint64.
void WriteVarBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes);

// Kaspa wire layout: every integer little-endian, every collection and
// byte string prefixed by a uint64 length. When include_signature_scripts
// is false the signature scripts are written as empty, which is the form
// hashed for the unsigned digest.
void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_signature_scripts = true);

std::size_t SerializedInputSize(const CTxIn& input);
std::size_t SerializedOutputSize(const CTxOut& output);

// JSON shape accepted by Kaspa wallet tooling (amounts as decimal strings,
// scripts as hex, scriptPublicKey as "<version hex4><script hex>").
nlohmann::json TransactionToJson(const CTransaction& tx);

}  // namespace txforge::primitives::serialize
