#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace txforge::builder {

// Standard relay limit on transaction compute mass.
inline constexpr std::uint64_t kMaxStandardMass = 100'000;
// Minimum relay fee rate, sompi per gram of mass.
inline constexpr std::uint64_t kMinRelayFeePerGram = 1;

struct PaymentOutput {
  crypto::KaspaAddress address;
  primitives::Amount amount{0};
};

struct GeneratorRequest {
  std::vector<primitives::SpendableOutput> inputs;
  std::vector<PaymentOutput> outputs;
  crypto::KaspaAddress change_address;
  primitives::Amount fee{0};  // Network reserve plus priority fee.
};

struct ConstructedTransaction {
  primitives::CTransaction tx;
  std::vector<std::uint8_t> serialized;
  primitives::Hash256 txid{};
  primitives::Amount fee{0};  // Includes dust change folded into the fee.
  primitives::Amount change{0};
  std::uint64_t mass{0};
};

// Construction primitive. Implementations must not mutate shared state so
// the orchestrator can call them from any worker thread.
class TransactionGenerator {
 public:
  virtual ~TransactionGenerator() = default;
  virtual std::optional<ConstructedTransaction> Generate(const GeneratorRequest& request,
                                                         std::string* error) const = 0;
};

// Builds an unsigned transaction: inputs in the given order, payments in
// request order, then change to the change address unless it is dust.
class StandardTransactionGenerator final : public TransactionGenerator {
 public:
  std::optional<ConstructedTransaction> Generate(const GeneratorRequest& request,
                                                 std::string* error) const override;
};

// Compute mass with each input's signature script estimated at the size of
// one Schnorr signature push.
std::uint64_t EstimateMass(const primitives::CTransaction& tx);
bool IsDustOutput(const primitives::CTxOut& output);

}  // namespace txforge::builder
