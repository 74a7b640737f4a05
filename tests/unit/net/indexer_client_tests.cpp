#include <cstdlib>
#include <iostream>
#include <string>

#include "net/http_client.hpp"
#include "net/indexer_client.hpp"

using nlohmann::json;
using namespace txforge::net;

namespace {

const std::string kTxidA(64, 'a');
const std::string kTxidB(64, 'b');
const std::string kScript = "20" + std::string(64, '1') + "ac";

json ApiRow(const std::string& txid, std::uint32_t index, json amount) {
  return {
      {"address", "kaspa:ignored"},
      {"outpoint", {{"transactionId", txid}, {"index", index}}},
      {"utxoEntry",
       {{"amount", amount},
        {"scriptPublicKey", {{"scriptPublicKey", kScript}}},
        {"blockDaaScore", "123456"},
        {"isCoinbase", false}}},
  };
}

}  // namespace

int main() {
  {
    const json payload = json::array({ApiRow(kTxidA, 0, "100000000"), ApiRow(kTxidB, 3, 42)});
    std::size_t skipped = 99;
    const auto coins = NormalizeUtxoEntries(payload, &skipped);
    if (coins.size() != 2 || skipped != 0) {
      std::cerr << "expected two normalized entries\n";
      return EXIT_FAILURE;
    }
    if (coins[0].amount != 100000000 || coins[0].block_daa_score != 123456 ||
        coins[0].outpoint.index != 0 || coins[0].outpoint.txid[0] != 0xaa ||
        coins[0].script_public_key.script.size() != 34 || coins[0].script_public_key.version != 0) {
      std::cerr << "first entry normalized incorrectly\n";
      return EXIT_FAILURE;
    }
    if (coins[1].amount != 42 || coins[1].outpoint.index != 3) {
      std::cerr << "second entry normalized incorrectly\n";
      return EXIT_FAILURE;
    }
  }

  {
    // Flat rows under "entries", txid alias, script alias, upper-case hex.
    std::string upper_txid(64, 'C');
    const json payload = {
        {"entries",
         json::array({{{"outpoint", {{"txid", upper_txid}, {"index", "7"}}},
                       {"amount", 5000},
                       {"blockDaaScore", 9},
                       {"isCoinbase", true},
                       {"scriptPublicKey", {{"version", 0}, {"script", kScript}}}}})},
    };
    const auto coins = NormalizeUtxoEntries(payload);
    if (coins.size() != 1 || coins[0].outpoint.txid[31] != 0xcc || coins[0].outpoint.index != 7 ||
        !coins[0].is_coinbase || coins[0].block_daa_score != 9) {
      std::cerr << "flat entry shape not accepted\n";
      return EXIT_FAILURE;
    }
    const auto wrapped = NormalizeUtxoEntries(json{{"utxos", payload.at("entries")}});
    if (wrapped.size() != 1) {
      std::cerr << "\"utxos\" wrapper not accepted\n";
      return EXIT_FAILURE;
    }
  }

  {
    json missing_script = ApiRow(kTxidA, 1, 10);
    missing_script["utxoEntry"]["scriptPublicKey"]["scriptPublicKey"] = "";
    json odd_script = ApiRow(kTxidA, 2, 10);
    odd_script["utxoEntry"]["scriptPublicKey"]["scriptPublicKey"] = "abc";
    const json payload = json::array({
        ApiRow("deadbeef", 0, 10),
        ApiRow(kTxidA, 0, 0),
        ApiRow(kTxidA, 0, -4),
        ApiRow(kTxidA, 0, "1.5"),
        missing_script,
        odd_script,
        json{{"outpoint", nullptr}},
        "garbage",
        ApiRow(kTxidB, 0, 77),
    });
    std::size_t skipped = 0;
    const auto coins = NormalizeUtxoEntries(payload, &skipped);
    if (coins.size() != 1 || coins[0].amount != 77 || skipped != 8) {
      std::cerr << "malformed rows must be skipped and counted, skipped=" << skipped << "\n";
      return EXIT_FAILURE;
    }
    if (!NormalizeUtxoEntries(json{{"data", 1}}).empty()) {
      std::cerr << "unknown object shape should yield no entries\n";
      return EXIT_FAILURE;
    }
  }

  {
    HttpUrl url;
    std::string error;
    if (!ParseHttpUrl("http://indexer.local:8080/api/v1?x=1", &url, &error) ||
        url.host != "indexer.local" || url.port != 8080 || url.path != "/api/v1?x=1") {
      std::cerr << "host, port and path not parsed: " << error << "\n";
      return EXIT_FAILURE;
    }
    if (!ParseHttpUrl("http://[::1]", &url, &error) || url.host != "::1" || url.port != 80 ||
        url.path != "/") {
      std::cerr << "IPv6 literal not parsed\n";
      return EXIT_FAILURE;
    }
    for (const char* bad : {"https://example.com", "http://", "http://host:0/", "http://host:99999",
                            "http://host:8a/", "http://[::1/"}) {
      if (ParseHttpUrl(bad, nullptr, &error)) {
        std::cerr << "URL should be rejected: " << bad << "\n";
        return EXIT_FAILURE;
      }
    }
  }

  if (EncodePathSegment("kaspa:qq z/?") != "kaspa:qq%20z%2F%3F") {
    std::cerr << "path segment encoding wrong: " << EncodePathSegment("kaspa:qq z/?") << "\n";
    return EXIT_FAILURE;
  }

  {
    const std::string raw =
        "POST /v1/build-tx HTTP/1.1\r\ncontent-length: 12\r\nX-Tx-Builder-Token:  abc \r\n\r\nbody";
    const auto end = FindHeaderEnd(raw);
    if (!end || raw.substr(*end) != "body") {
      std::cerr << "header end not found\n";
      return EXIT_FAILURE;
    }
    const std::string_view headers(raw.data(), *end - 4);
    if (ParseContentLength(headers) != std::optional<std::size_t>(12) ||
        FindHeaderValue(headers, "x-tx-builder-token") != std::optional<std::string>("abc") ||
        FindHeaderValue(headers, "Authorization")) {
      std::cerr << "header lookup wrong\n";
      return EXIT_FAILURE;
    }
    if (ParseContentLength("Content-Length: -1") || ParseContentLength("Content-Length: 1e3")) {
      std::cerr << "malformed Content-Length must be rejected\n";
      return EXIT_FAILURE;
    }
  }

  {
    HttpIndexerClient client("http://127.0.0.1:1/", "", 500);
    if (client.BaseFor(txforge::config::NetworkType::kMainnet) != "http://127.0.0.1:1") {
      std::cerr << "trailing slash should be trimmed from the base URL\n";
      return EXIT_FAILURE;
    }
    std::string error;
    if (client.FetchUtxos(txforge::config::NetworkType::kTestnet10, "kaspatest:x", &error) ||
        error.find("no indexer configured") == std::string::npos) {
      std::cerr << "missing testnet base should fail: " << error << "\n";
      return EXIT_FAILURE;
    }
    error.clear();
    if (client.FetchUtxos(txforge::config::NetworkType::kMainnet, "kaspa:x", &error) ||
        error.find("indexer request failed") == std::string::npos) {
      std::cerr << "unreachable indexer should fail: " << error << "\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
