#include "crypto/address.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace txforge::crypto {

namespace {

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> CreateDecodeMap() {
  std::array<int, 128> map{};
  map.fill(-1);
  for (std::size_t i = 0; i < kCharset.size(); ++i) {
    map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
  }
  return map;
}

constexpr auto kDecodeMap = CreateDecodeMap();
constexpr std::size_t kChecksumGroups = 8;

// Script opcodes used by the standard pay-to-address templates.
constexpr std::uint8_t kOpData32 = 0x20;
constexpr std::uint8_t kOpData33 = 0x21;
constexpr std::uint8_t kOpEqual = 0x87;
constexpr std::uint8_t kOpBlake2b = 0xaa;
constexpr std::uint8_t kOpCheckSigEcdsa = 0xab;
constexpr std::uint8_t kOpCheckSig = 0xac;

std::uint64_t Polymod(const std::vector<std::uint8_t>& values) {
  std::uint64_t c = 1;
  for (std::uint8_t d : values) {
    const std::uint64_t c0 = c >> 35;
    c = ((c & 0x07ffffffffULL) << 5) ^ d;
    if (c0 & 0x01) c ^= 0x98f2bc8e61ULL;
    if (c0 & 0x02) c ^= 0x79b76d99e2ULL;
    if (c0 & 0x04) c ^= 0xf33e5fb3c4ULL;
    if (c0 & 0x08) c ^= 0xae2eabe2a8ULL;
    if (c0 & 0x10) c ^= 0x1e4f43e470ULL;
  }
  return c ^ 1;
}

std::uint64_t Checksum(std::string_view prefix, const std::vector<std::uint8_t>& payload5) {
  std::vector<std::uint8_t> values;
  values.reserve(prefix.size() + 1 + payload5.size() + kChecksumGroups);
  for (char c : prefix) {
    values.push_back(static_cast<std::uint8_t>(c & 0x1f));
  }
  values.push_back(0);
  values.insert(values.end(), payload5.begin(), payload5.end());
  values.insert(values.end(), kChecksumGroups, 0);
  return Polymod(values);
}

bool ConvertBits(std::vector<std::uint8_t>* out, int from_bits, int to_bits, bool pad,
                 std::span<const std::uint8_t> data) {
  std::uint32_t acc = 0;
  int bits = 0;
  const std::uint32_t maxv = (1u << to_bits) - 1;
  for (std::uint8_t value : data) {
    if (value >> from_bits) {
      return false;
    }
    acc = ((acc << from_bits) | value) & 0xFFFFF;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad) {
    if (bits) {
      out->push_back(static_cast<std::uint8_t>((acc << (to_bits - bits)) & maxv));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
    return false;
  }
  return true;
}

std::size_t ExpectedPayloadSize(AddressVersion version) {
  switch (version) {
    case AddressVersion::kPubKey:
    case AddressVersion::kScriptHash:
      return 32;
    case AddressVersion::kPubKeyEcdsa:
      return 33;
  }
  return 0;
}

bool VersionFromByte(std::uint8_t byte, AddressVersion* version) {
  switch (byte) {
    case 0:
      *version = AddressVersion::kPubKey;
      return true;
    case 1:
      *version = AddressVersion::kPubKeyEcdsa;
      return true;
    case 8:
      *version = AddressVersion::kScriptHash;
      return true;
    default:
      return false;
  }
}

}  // namespace

std::string EncodeAddress(const KaspaAddress& address) {
  if (address.prefix.empty() ||
      address.payload.size() != ExpectedPayloadSize(address.version)) {
    return {};
  }
  std::vector<std::uint8_t> raw;
  raw.reserve(address.payload.size() + 1);
  raw.push_back(static_cast<std::uint8_t>(address.version));
  raw.insert(raw.end(), address.payload.begin(), address.payload.end());
  std::vector<std::uint8_t> payload5;
  if (!ConvertBits(&payload5, 8, 5, true, raw)) {
    return {};
  }
  const std::uint64_t checksum = Checksum(address.prefix, payload5);
  std::string out = address.prefix + ":";
  out.reserve(out.size() + payload5.size() + kChecksumGroups);
  for (std::uint8_t v : payload5) {
    out.push_back(kCharset[v]);
  }
  for (std::size_t i = 0; i < kChecksumGroups; ++i) {
    out.push_back(kCharset[(checksum >> (5 * (kChecksumGroups - 1 - i))) & 0x1f]);
  }
  return out;
}

bool DecodeAddress(std::string_view text, std::string_view expected_prefix, KaspaAddress* out,
                   std::string* error) {
  bool lower = false;
  bool upper = false;
  for (char c : text) {
    if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    if (std::islower(static_cast<unsigned char>(c))) lower = true;
  }
  if (upper && lower) {
    if (error) *error = "address mixes upper and lower case";
    return false;
  }
  std::string normalized(text);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto colon = normalized.find(':');
  if (colon == std::string::npos || colon == 0) {
    if (error) *error = "address is missing its network prefix";
    return false;
  }
  const std::string prefix = normalized.substr(0, colon);
  if (!expected_prefix.empty() && prefix != expected_prefix) {
    if (error) *error = "address prefix does not match network";
    return false;
  }
  const std::string_view data_part = std::string_view(normalized).substr(colon + 1);
  if (data_part.size() <= kChecksumGroups) {
    if (error) *error = "address payload too short";
    return false;
  }
  std::vector<std::uint8_t> values;
  values.reserve(data_part.size());
  for (char c : data_part) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc > 127 || kDecodeMap[uc] == -1) {
      if (error) *error = "address contains invalid characters";
      return false;
    }
    values.push_back(static_cast<std::uint8_t>(kDecodeMap[uc]));
  }
  std::vector<std::uint8_t> payload5(values.begin(), values.end() - kChecksumGroups);
  std::uint64_t declared = 0;
  for (auto it = values.end() - kChecksumGroups; it != values.end(); ++it) {
    declared = (declared << 5) | *it;
  }
  if (Checksum(prefix, payload5) != declared) {
    if (error) *error = "address checksum mismatch";
    return false;
  }
  std::vector<std::uint8_t> raw;
  if (!ConvertBits(&raw, 5, 8, false, payload5) || raw.empty()) {
    if (error) *error = "address payload is malformed";
    return false;
  }
  AddressVersion version{};
  if (!VersionFromByte(raw.front(), &version)) {
    if (error) *error = "unknown address version";
    return false;
  }
  if (raw.size() - 1 != ExpectedPayloadSize(version)) {
    if (error) *error = "address payload has the wrong length";
    return false;
  }
  if (out) {
    out->prefix = prefix;
    out->version = version;
    out->payload.assign(raw.begin() + 1, raw.end());
  }
  return true;
}

primitives::ScriptPublicKey PayToAddressScript(const KaspaAddress& address) {
  primitives::ScriptPublicKey spk;
  auto& script = spk.script;
  switch (address.version) {
    case AddressVersion::kPubKey:
      script.push_back(kOpData32);
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpCheckSig);
      break;
    case AddressVersion::kPubKeyEcdsa:
      script.push_back(kOpData33);
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpCheckSigEcdsa);
      break;
    case AddressVersion::kScriptHash:
      script.push_back(kOpBlake2b);
      script.push_back(kOpData32);
      script.insert(script.end(), address.payload.begin(), address.payload.end());
      script.push_back(kOpEqual);
      break;
  }
  return spk;
}

}  // namespace txforge::crypto
