#include "primitives/serialize.hpp"

#include <iomanip>
#include <sstream>

#include "util/hex.hpp"

namespace txforge::primitives::serialize {

namespace {

constexpr std::size_t kOutpointSize = 32 + 4;

void SerializeInputs(const CTransaction& tx, std::vector<std::uint8_t>* out,
                     bool include_signature_scripts) {
  WriteUint64(out, tx.vin.size());
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    WriteUint32(out, in.prevout.index);
    if (include_signature_scripts) {
      WriteVarBytes(out, in.signature_script);
    } else {
      WriteUint64(out, 0);
    }
    WriteUint64(out, in.sequence);
    WriteUint8(out, in.sig_op_count);
  }
}

void SerializeOutputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  WriteUint64(out, tx.vout.size());
  for (const auto& out_tx : tx.vout) {
    WriteUint64(out, out_tx.value);
    WriteUint16(out, out_tx.script_public_key.version);
    WriteVarBytes(out, out_tx.script_public_key.script);
  }
}

std::string ScriptPublicKeyHex(const ScriptPublicKey& spk) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(4) << spk.version;
  return oss.str() + util::HexEncode(spk.script);
}

}  // namespace

void WriteUint8(std::vector<std::uint8_t>* out, std::uint8_t value) { out->push_back(value); }

void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void WriteVarBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes) {
  WriteUint64(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_signature_scripts) {
  WriteUint16(out, tx.version);
  SerializeInputs(tx, out, include_signature_scripts);
  SerializeOutputs(tx, out);
  WriteUint64(out, tx.lock_time);
  out->insert(out->end(), tx.subnetwork_id.begin(), tx.subnetwork_id.end());
  WriteUint64(out, tx.gas);
  WriteVarBytes(out, tx.payload);
}

std::size_t SerializedInputSize(const CTxIn& input) {
  return kOutpointSize + 8 + input.signature_script.size() + 8 + 1;
}

std::size_t SerializedOutputSize(const CTxOut& output) {
  return 8 + 2 + 8 + output.script_public_key.script.size();
}

nlohmann::json TransactionToJson(const CTransaction& tx) {
  nlohmann::json inputs = nlohmann::json::array();
  for (const auto& in : tx.vin) {
    inputs.push_back({
        {"transactionId", util::HexEncode(in.prevout.txid)},
        {"index", in.prevout.index},
        {"signatureScript", util::HexEncode(in.signature_script)},
        {"sequence", std::to_string(in.sequence)},
        {"sigOpCount", in.sig_op_count},
    });
  }
  nlohmann::json outputs = nlohmann::json::array();
  for (const auto& out : tx.vout) {
    outputs.push_back({
        {"value", std::to_string(out.value)},
        {"scriptPublicKey", ScriptPublicKeyHex(out.script_public_key)},
    });
  }
  return {
      {"version", tx.version},
      {"inputs", std::move(inputs)},
      {"outputs", std::move(outputs)},
      {"lockTime", std::to_string(tx.lock_time)},
      {"subnetworkId", util::HexEncode(tx.subnetwork_id)},
      {"gas", std::to_string(tx.gas)},
      {"payload", util::HexEncode(tx.payload)},
  };
}

}  // namespace txforge::primitives::serialize
