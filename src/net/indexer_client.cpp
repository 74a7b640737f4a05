#include "net/indexer_client.hpp"

#include <cctype>
#include <cmath>

#include "net/http_client.hpp"
#include "util/hex.hpp"

namespace txforge::net {

namespace {

using primitives::Amount;

// Integers above 2^53 cannot be represented exactly by a JSON double.
constexpr double kMaxExactDouble = 9007199254740992.0;

const nlohmann::json* Find(const nlohmann::json& object, std::string_view key) {
  if (!object.is_object()) {
    return nullptr;
  }
  auto it = object.find(std::string(key));
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

const nlohmann::json* FindPath(const nlohmann::json& object, std::string_view a,
                               std::string_view b) {
  const auto* outer = Find(object, a);
  return outer ? Find(*outer, b) : nullptr;
}

std::optional<std::uint64_t> ReadUnsigned(const nlohmann::json* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->is_number_unsigned()) {
    return value->get<std::uint64_t>();
  }
  if (value->is_number_integer()) {
    const auto v = value->get<std::int64_t>();
    if (v < 0) return std::nullopt;
    return static_cast<std::uint64_t>(v);
  }
  if (value->is_number_float()) {
    const double v = value->get<double>();
    if (!std::isfinite(v) || v < 0 || v > kMaxExactDouble) return std::nullopt;
    return static_cast<std::uint64_t>(std::llround(v));
  }
  if (value->is_string()) {
    Amount parsed = 0;
    if (!primitives::ParseSompi(value->get<std::string>(), &parsed, nullptr)) {
      return std::nullopt;
    }
    return parsed;
  }
  return std::nullopt;
}

std::string LowerTrimmed(const nlohmann::json* value) {
  if (value == nullptr || !value->is_string()) {
    return {};
  }
  std::string out;
  for (char c : value->get<std::string>()) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

const nlohmann::json& EntryList(const nlohmann::json& payload) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  if (payload.is_array()) {
    return payload;
  }
  for (const char* key : {"utxos", "entries"}) {
    if (const auto* list = Find(payload, key); list && list->is_array()) {
      return *list;
    }
  }
  return kEmpty;
}

std::optional<primitives::SpendableOutput> NormalizeEntry(const nlohmann::json& row) {
  primitives::SpendableOutput out;
  const auto* outpoint = Find(row, "outpoint");
  if (outpoint == nullptr) {
    return std::nullopt;
  }
  std::string txid = LowerTrimmed(Find(*outpoint, "transactionId"));
  if (txid.empty()) {
    txid = LowerTrimmed(Find(*outpoint, "txid"));
  }
  if (!util::HexDecode32(txid, &out.outpoint.txid)) {
    return std::nullopt;
  }
  const auto index = ReadUnsigned(Find(*outpoint, "index"));
  if (!index || *index > UINT32_MAX) {
    return std::nullopt;
  }
  out.outpoint.index = static_cast<std::uint32_t>(*index);

  const auto* entry = Find(row, "utxoEntry");
  const nlohmann::json& source = entry ? *entry : row;
  const auto amount = ReadUnsigned(Find(source, "amount"));
  if (!amount || *amount == 0 || !primitives::MoneyRange(*amount)) {
    return std::nullopt;
  }
  out.amount = *amount;
  out.block_daa_score = ReadUnsigned(Find(source, "blockDaaScore")).value_or(0);
  if (const auto* coinbase = Find(source, "isCoinbase"); coinbase && coinbase->is_boolean()) {
    out.is_coinbase = coinbase->get<bool>();
  }

  const auto* spk = Find(source, "scriptPublicKey");
  if (spk == nullptr) {
    return std::nullopt;
  }
  std::string script_hex = LowerTrimmed(Find(*spk, "scriptPublicKey"));
  if (script_hex.empty()) {
    script_hex = LowerTrimmed(Find(*spk, "script"));
  }
  if (script_hex.empty() || !util::HexDecode(script_hex, &out.script_public_key.script)) {
    return std::nullopt;
  }
  const auto version = ReadUnsigned(Find(*spk, "version"));
  if (version && *version > UINT16_MAX) {
    return std::nullopt;
  }
  out.script_public_key.version = static_cast<std::uint16_t>(version.value_or(0));
  return out;
}

}  // namespace

std::vector<primitives::SpendableOutput> NormalizeUtxoEntries(const nlohmann::json& payload,
                                                             std::size_t* skipped) {
  std::vector<primitives::SpendableOutput> out;
  std::size_t dropped = 0;
  for (const auto& row : EntryList(payload)) {
    auto normalized = NormalizeEntry(row);
    if (!normalized) {
      ++dropped;
      continue;
    }
    out.push_back(std::move(*normalized));
  }
  if (skipped) {
    *skipped = dropped;
  }
  return out;
}

HttpIndexerClient::HttpIndexerClient(std::string mainnet_base, std::string testnet_base,
                                     int timeout_ms)
    : mainnet_base_(std::move(mainnet_base)),
      testnet_base_(std::move(testnet_base)),
      timeout_ms_(timeout_ms) {
  for (auto* base : {&mainnet_base_, &testnet_base_}) {
    while (!base->empty() && base->back() == '/') {
      base->pop_back();
    }
  }
}

const std::string& HttpIndexerClient::BaseFor(config::NetworkType network) const {
  return network == config::NetworkType::kMainnet ? mainnet_base_ : testnet_base_;
}

std::optional<std::vector<primitives::SpendableOutput>> HttpIndexerClient::FetchUtxos(
    config::NetworkType network, std::string_view address, std::string* error) {
  const std::string& base = BaseFor(network);
  if (base.empty()) {
    if (error) *error = "no indexer configured for " + std::string(config::NetworkName(network));
    return std::nullopt;
  }
  HttpRequestOptions options;
  options.timeout_ms = timeout_ms_;
  const std::string url = base + "/addresses/" + EncodePathSegment(address) + "/utxos";
  std::string fetch_error;
  auto payload = HttpGetJson(url, options, &fetch_error);
  if (!payload) {
    if (error) *error = "indexer request failed: " + fetch_error;
    return std::nullopt;
  }
  if (!payload->is_array() && !payload->is_object()) {
    if (error) *error = "indexer returned an unexpected JSON shape";
    return std::nullopt;
  }
  return NormalizeUtxoEntries(*payload);
}

}  // namespace txforge::net
