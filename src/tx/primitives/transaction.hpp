#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace txforge::primitives {

using SubnetworkId = std::array<std::uint8_t, 20>;

struct COutPoint {
  Hash256 txid{};
  std::uint32_t index{0};
  bool operator==(const COutPoint& other) const = default;
};

struct ScriptPublicKey {
  std::uint16_t version{0};
  std::vector<std::uint8_t> script{};
  bool operator==(const ScriptPublicKey& other) const = default;
};

// An unspent output as reported by the indexer for the funding address.
struct SpendableOutput {
  COutPoint outpoint{};
  Amount amount{0};
  ScriptPublicKey script_public_key{};
  std::uint64_t block_daa_score{0};
  bool is_coinbase{false};
};

struct CTxIn {
  COutPoint prevout{};
  std::vector<std::uint8_t> signature_script{};  // Empty until an external signer fills it.
  std::uint64_t sequence{0};
  std::uint8_t sig_op_count{1};
};

struct CTxOut {
  Amount value{0};  // In sompi.
  ScriptPublicKey script_public_key{};
};

struct CTransaction {
  std::uint16_t version{0};
  std::vector<CTxIn> vin{};
  std::vector<CTxOut> vout{};
  std::uint64_t lock_time{0};
  SubnetworkId subnetwork_id{};  // Native subnetwork (all zero).
  std::uint64_t gas{0};
  std::vector<std::uint8_t> payload{};
};

}  // namespace txforge::primitives
