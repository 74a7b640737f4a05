#pragma once

#include <string>
#include <string_view>

namespace txforge::config {

enum class NetworkType {
  kMainnet,
  kTestnet10,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  // Human readable part of addresses ("kaspa:...").
  std::string address_prefix{"kaspa"};
  // Local indexer used when no base URL is configured.
  std::string default_indexer_base;
};

const NetworkConfig& ConfigFor(NetworkType type);
// Accepts the canonical ids only ("mainnet", "testnet-10").
bool ParseNetworkId(std::string_view name, NetworkType* out);
std::string_view NetworkName(NetworkType type);

}  // namespace txforge::config
