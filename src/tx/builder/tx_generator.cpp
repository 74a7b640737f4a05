#include "builder/tx_generator.hpp"

#include <algorithm>

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"

namespace txforge::builder {

namespace {

using primitives::Amount;

// version, input and output counts, lock time, subnetwork id, gas, payload
// hash and payload length.
constexpr std::uint64_t kTxHeaderBytes = 2 + 8 + 8 + 8 + 20 + 8 + 32 + 8;
// Length prefix, push opcode, 64-byte signature and sighash type.
constexpr std::uint64_t kEstimatedSignatureScriptBytes = 66;
constexpr std::uint64_t kMassPerScriptPubKeyByte = 10;
constexpr std::uint64_t kMassPerSigOp = 1000;

bool SameOutpoint(const primitives::SpendableOutput& a, const primitives::SpendableOutput& b) {
  return a.outpoint == b.outpoint;
}

}  // namespace

std::uint64_t EstimateMass(const primitives::CTransaction& tx) {
  std::uint64_t size = kTxHeaderBytes;
  std::uint64_t script_bytes = 0;
  std::uint64_t sig_ops = 0;
  for (const auto& in : tx.vin) {
    primitives::CTxIn sized = in;
    if (sized.signature_script.empty()) {
      sized.signature_script.resize(kEstimatedSignatureScriptBytes);
    }
    size += primitives::serialize::SerializedInputSize(sized);
    sig_ops += in.sig_op_count;
  }
  for (const auto& out : tx.vout) {
    size += primitives::serialize::SerializedOutputSize(out);
    script_bytes += 2 + out.script_public_key.script.size();
  }
  size += tx.payload.size();
  return size + script_bytes * kMassPerScriptPubKeyByte + sig_ops * kMassPerSigOp;
}

bool IsDustOutput(const primitives::CTxOut& output) {
  // Relay rule: an output is dust when spending it would cost more than a
  // third of its value at the minimum relay fee (148 bytes to spend it).
  const std::uint64_t total_size = primitives::serialize::SerializedOutputSize(output) + 148;
  Amount scaled = 0;
  if (!primitives::CheckedMul(output.value, 1000, &scaled)) {
    return false;
  }
  return scaled / (3 * total_size) < 1000;
}

std::optional<ConstructedTransaction> StandardTransactionGenerator::Generate(
    const GeneratorRequest& request, std::string* error) const {
  if (request.inputs.empty()) {
    if (error) *error = "no inputs";
    return std::nullopt;
  }
  if (request.outputs.empty()) {
    if (error) *error = "no outputs";
    return std::nullopt;
  }
  if (crypto::EncodeAddress(request.change_address).empty()) {
    if (error) *error = "invalid change address";
    return std::nullopt;
  }

  Amount input_total = 0;
  for (std::size_t i = 0; i < request.inputs.size(); ++i) {
    const auto& coin = request.inputs[i];
    if (coin.amount == 0) {
      if (error) *error = "input with zero amount";
      return std::nullopt;
    }
    const auto first = std::find_if(request.inputs.begin(), request.inputs.end(),
                                    [&](const auto& other) { return SameOutpoint(coin, other); });
    if (static_cast<std::size_t>(first - request.inputs.begin()) != i) {
      if (error) *error = "duplicate input";
      return std::nullopt;
    }
    if (!primitives::CheckedAdd(input_total, coin.amount, &input_total)) {
      if (error) *error = "input total out of range";
      return std::nullopt;
    }
  }
  Amount output_total = 0;
  for (const auto& payment : request.outputs) {
    if (payment.amount == 0) {
      if (error) *error = "output with zero amount";
      return std::nullopt;
    }
    if (crypto::EncodeAddress(payment.address).empty()) {
      if (error) *error = "invalid output address";
      return std::nullopt;
    }
    if (!primitives::CheckedAdd(output_total, payment.amount, &output_total)) {
      if (error) *error = "output total out of range";
      return std::nullopt;
    }
  }
  Amount required = 0;
  if (!primitives::CheckedAdd(output_total, request.fee, &required)) {
    if (error) *error = "outputs plus fee out of range";
    return std::nullopt;
  }
  if (input_total < required) {
    if (error) {
      *error = "insufficient funds: inputs " + std::to_string(input_total) + " < required " +
               std::to_string(required);
    }
    return std::nullopt;
  }

  ConstructedTransaction built;
  auto& tx = built.tx;
  tx.vin.reserve(request.inputs.size());
  for (const auto& coin : request.inputs) {
    primitives::CTxIn in;
    in.prevout = coin.outpoint;
    tx.vin.push_back(std::move(in));
  }
  tx.vout.reserve(request.outputs.size() + 1);
  for (const auto& payment : request.outputs) {
    tx.vout.push_back({payment.amount, crypto::PayToAddressScript(payment.address)});
  }

  built.fee = request.fee;
  const Amount change = input_total - required;
  if (change > 0) {
    primitives::CTxOut change_out{change, crypto::PayToAddressScript(request.change_address)};
    if (IsDustOutput(change_out)) {
      built.fee += change;
    } else {
      built.change = change;
      tx.vout.push_back(std::move(change_out));
    }
  }

  built.mass = EstimateMass(tx);
  if (built.mass > kMaxStandardMass) {
    if (error) {
      *error = "transaction mass " + std::to_string(built.mass) + " exceeds standard limit " +
               std::to_string(kMaxStandardMass);
    }
    return std::nullopt;
  }
  if (built.fee < built.mass * kMinRelayFeePerGram) {
    if (error) {
      *error = "fee " + std::to_string(built.fee) + " below minimum relay fee " +
               std::to_string(built.mass * kMinRelayFeePerGram);
    }
    return std::nullopt;
  }

  primitives::serialize::SerializeTransaction(tx, &built.serialized);
  built.txid = primitives::ComputeUnsignedDigest(tx);
  return built;
}

}  // namespace txforge::builder
