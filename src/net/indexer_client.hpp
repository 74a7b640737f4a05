#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

#include "config/network.hpp"
#include "primitives/transaction.hpp"

namespace txforge::net {

// Source of spendable outputs for a funding address.
class IndexerClient {
 public:
  virtual ~IndexerClient() = default;
  // nullopt when the indexer is unreachable or answers with a non-2xx
  // status or a non-JSON body; an empty vector is a valid answer.
  virtual std::optional<std::vector<primitives::SpendableOutput>> FetchUtxos(
      config::NetworkType network, std::string_view address, std::string* error) = 0;
};

// Talks to a kaspa REST indexer: GET {base}/addresses/{address}/utxos.
class HttpIndexerClient final : public IndexerClient {
 public:
  HttpIndexerClient(std::string mainnet_base, std::string testnet_base, int timeout_ms);

  std::optional<std::vector<primitives::SpendableOutput>> FetchUtxos(
      config::NetworkType network, std::string_view address, std::string* error) override;

  const std::string& BaseFor(config::NetworkType network) const;

 private:
  std::string mainnet_base_;
  std::string testnet_base_;
  int timeout_ms_;
};

// Accepts a bare array or an object with "utxos"/"entries". Entries with a
// malformed outpoint, a non-positive amount or an empty/non-hex script are
// skipped and counted in |skipped|.
std::vector<primitives::SpendableOutput> NormalizeUtxoEntries(const nlohmann::json& payload,
                                                             std::size_t* skipped = nullptr);

}  // namespace txforge::net
