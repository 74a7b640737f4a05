#include "config/network.hpp"

namespace txforge::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string prefix,
                          std::string indexer_base) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.address_prefix = std::move(prefix);
  cfg.default_indexer_base = std::move(indexer_base);
  return cfg;
}

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", "kaspa", "http://127.0.0.1:8000");
  static const NetworkConfig testnet10 =
      BuildConfig(NetworkType::kTestnet10, "testnet-10", "kaspatest", "http://127.0.0.1:8001");
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet10:
      return testnet10;
  }
  return mainnet;
}

bool ParseNetworkId(std::string_view name, NetworkType* out) {
  NetworkType type;
  if (name == "mainnet") {
    type = NetworkType::kMainnet;
  } else if (name == "testnet-10") {
    type = NetworkType::kTestnet10;
  } else {
    return false;
  }
  if (out) {
    *out = type;
  }
  return true;
}

std::string_view NetworkName(NetworkType type) { return ConfigFor(type).network_id; }

}  // namespace txforge::config
