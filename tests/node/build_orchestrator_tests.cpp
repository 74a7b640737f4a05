#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "node/build_orchestrator.hpp"

using nlohmann::json;
using namespace txforge;
using node::BuildError;
using node::BuildErrorKind;
using node::BuildOrchestrator;

namespace {

const char* kFrom = "kaspa:qqg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zng5quzmq";
const char* kTo = "kaspa:qq3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zywrsf7452";

class FakeIndexer final : public net::IndexerClient {
 public:
  std::optional<std::vector<primitives::SpendableOutput>> FetchUtxos(
      config::NetworkType, std::string_view address, std::string* error) override {
    ++calls;
    last_address = std::string(address);
    if (!utxos) {
      if (error) *error = "indexer request failed: connection refused";
      return std::nullopt;
    }
    return utxos;
  }

  std::optional<std::vector<primitives::SpendableOutput>> utxos;
  int calls{0};
  std::string last_address;
};

// Rejects transactions with fewer than |min_inputs| inputs, otherwise
// defers to the standard generator.
class MinInputsGenerator final : public builder::TransactionGenerator {
 public:
  explicit MinInputsGenerator(std::size_t min_inputs) : min_inputs_(min_inputs) {}

  std::optional<builder::ConstructedTransaction> Generate(const builder::GeneratorRequest& request,
                                                          std::string* error) const override {
    if (request.inputs.size() < min_inputs_) {
      if (error) *error = "simulated rejection of " + std::to_string(request.inputs.size()) + " inputs";
      return std::nullopt;
    }
    return standard_.Generate(request, error);
  }

 private:
  std::size_t min_inputs_;
  builder::StandardTransactionGenerator standard_;
};

std::vector<primitives::SpendableOutput> Coins(std::vector<primitives::Amount> amounts) {
  std::vector<primitives::SpendableOutput> coins;
  std::uint8_t tag = 1;
  for (auto amount : amounts) {
    primitives::SpendableOutput coin;
    coin.outpoint.txid.fill(tag);
    coin.outpoint.index = tag;
    coin.amount = amount;
    coin.block_daa_score = 1000u + tag;
    coin.script_public_key.script = {0x20};
    coin.script_public_key.script.resize(33, tag);
    coin.script_public_key.script.push_back(0xac);
    coins.push_back(coin);
    ++tag;
  }
  return coins;
}

json Request(primitives::Amount amount) {
  return {
      {"networkId", "mainnet"},
      {"fromAddress", kFrom},
      {"outputs", json::array({{{"address", kTo}, {"amountSompi", amount}}})},
      {"requestedFeeInBaseUnit", 1000},
      {"purpose", "payout"},
  };
}

// Adaptive policy whose fee comes only from the components under test.
std::shared_ptr<policy::PolicyConfig> AdaptivePolicy() {
  auto config = std::make_shared<policy::PolicyConfig>();
  config->fee_mode = policy::PriorityFeeMode::kAdaptive;
  config->fixed_fee = 0;
  config->output_bps = 0;
  config->per_output_fee = 0;
  config->fee_max = 10'000'000;
  config->adaptive.per_input_cost = 0;
  return config;
}

}  // namespace

int main() {
  try {
    telemetry::TelemetryCache telemetry(nullptr, nullptr);
    const builder::StandardTransactionGenerator standard;
    auto policy = std::make_shared<const policy::PolicyConfig>();

    if (node::NetworkFeeReserve(*policy, 2) != 28000 || node::NetworkFeeReserve(*policy, 0) != 25000) {
      std::cerr << "network fee reserve formula wrong\n";
      return EXIT_FAILURE;
    }

    {
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000, 200'000'000, 100'000'000, 50'000'000});
      metrics::ServiceMetrics metrics;
      BuildOrchestrator orchestrator(policy, telemetry, indexer, standard, &metrics);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(400'000'000), &error);
      if (!result) {
        std::cerr << "build failed: " << error.message << "\n";
        return EXIT_FAILURE;
      }
      if (indexer.calls != 1 || indexer.last_address != kFrom) {
        std::cerr << "indexer queried incorrectly\n";
        return EXIT_FAILURE;
      }
      if (result->priority_fee != 1000 ||
          result->fee_paid != node::NetworkFeeReserve(*policy, result->inputs_used) + 1000 ||
          result->network_fee_reserve + result->priority_fee != result->fee_paid) {
        std::cerr << "fee paid must be network reserve plus priority fee\n";
        return EXIT_FAILURE;
      }
      if (result->selected_amount < result->required_target ||
          result->required_target != 400'000'000 + result->fee_paid) {
        std::cerr << "selection does not cover the required target\n";
        return EXIT_FAILURE;
      }
      if (result->inputs_used < 2 || result->inputs_used > policy->max_inputs ||
          result->total_inputs_available != 4 || result->truncated_by_cap || result->fallback_used ||
          result->attempt != node::Attempt::kOptimal) {
        std::cerr << "unexpected selection shape\n";
        return EXIT_FAILURE;
      }
      if (result->transaction_id.size() != 64 || result->serialized_transaction.empty() ||
          result->transaction_json.at("inputs").size() != result->inputs_used) {
        std::cerr << "transaction encoding missing\n";
        return EXIT_FAILURE;
      }
      const auto& trace = result->policy_trace;
      if (trace.at("attempt") != "optimal" || trace.at("purpose") != "payout" ||
          trace.at("telemetry").at("freshness") != "fresh" ||
          trace.contains("selectedBuildError")) {
        std::cerr << "policy trace incomplete: " << trace.dump() << "\n";
        return EXIT_FAILURE;
      }
      if (metrics.build_requests_total() != 1 || metrics.build_success_total() != 1 ||
          metrics.build_errors_total() != 0) {
        std::cerr << "success counters not recorded\n";
        return EXIT_FAILURE;
      }
    }

    {
      auto capped = std::make_shared<policy::PolicyConfig>();
      capped->max_inputs = 1;
      capped->coin_selection = policy::CoinSelectionMode::kLargestFirst;
      FakeIndexer indexer;
      indexer.utxos = Coins({500'000'000, 100'000'000});
      BuildOrchestrator orchestrator(capped, telemetry, indexer, standard);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(100'000'000), &error);
      if (!result || result->inputs_used != 1 || result->truncated_by_cap ||
          result->selected_amount != 500'000'000) {
        std::cerr << "largest-first should cover the payment with one coin\n";
        return EXIT_FAILURE;
      }
    }

    {
      auto zero_fee = std::make_shared<policy::PolicyConfig>();
      zero_fee->fee_mode = policy::PriorityFeeMode::kFixed;
      zero_fee->fixed_fee = 0;
      FakeIndexer indexer;
      indexer.utxos = std::vector<primitives::SpendableOutput>{};
      metrics::ServiceMetrics metrics;
      BuildOrchestrator orchestrator(zero_fee, telemetry, indexer, standard, &metrics);
      BuildError error;
      if (orchestrator.BuildFromJson(Request(1000), &error) ||
          error.kind != BuildErrorKind::kNoSpendableOutputs) {
        std::cerr << "empty UTXO set must be NoSpendableOutputs\n";
        return EXIT_FAILURE;
      }
      if (metrics.build_errors_total() != 1 || metrics.build_requests_total() != 1) {
        std::cerr << "error counters not recorded\n";
        return EXIT_FAILURE;
      }
    }

    {
      FakeIndexer indexer;
      BuildOrchestrator orchestrator(policy, telemetry, indexer, standard);
      BuildError error;
      if (orchestrator.BuildFromJson(Request(1000), &error) ||
          error.kind != BuildErrorKind::kBackendUnavailable ||
          error.message.find("connection refused") == std::string::npos) {
        std::cerr << "unreachable indexer must be BackendUnavailable\n";
        return EXIT_FAILURE;
      }
    }

    {
      FakeIndexer indexer;
      indexer.utxos = Coins({100});
      BuildOrchestrator orchestrator(policy, telemetry, indexer, standard);
      BuildError error;
      json body = Request(1000);
      body["networkId"] = "devnet";
      if (orchestrator.BuildFromJson(body, &error) ||
          error.kind != BuildErrorKind::kInvalidRequest || indexer.calls != 0) {
        std::cerr << "invalid request must fail before touching the indexer\n";
        return EXIT_FAILURE;
      }
    }

    {
      MinInputsGenerator needs_three(3);
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000, 300'000'000, 300'000'000, 300'000'000, 300'000'000});
      metrics::ServiceMetrics metrics;
      BuildOrchestrator orchestrator(policy, telemetry, indexer, needs_three, &metrics);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(400'000'000), &error);
      if (!result) {
        std::cerr << "all-inputs fallback should succeed: " << error.message << "\n";
        return EXIT_FAILURE;
      }
      if (!result->fallback_used || result->attempt != node::Attempt::kAllInputs ||
          result->inputs_used != 5 || result->selected_amount != 1'500'000'000 ||
          result->fee_paid != node::NetworkFeeReserve(*policy, 5) + result->priority_fee) {
        std::cerr << "fallback result wrong\n";
        return EXIT_FAILURE;
      }
      if (result->policy_trace.at("attempt") != "all_inputs" ||
          result->policy_trace.at("selectedBuildError").get<std::string>().find("simulated") ==
              std::string::npos) {
        std::cerr << "fallback not reflected in the trace\n";
        return EXIT_FAILURE;
      }
      if (metrics.fallback_all_inputs_total() != 1) {
        std::cerr << "fallback counter not recorded\n";
        return EXIT_FAILURE;
      }
    }

    {
      MinInputsGenerator never(1000);
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000, 300'000'000, 300'000'000});
      BuildOrchestrator orchestrator(policy, telemetry, indexer, never);
      BuildError error;
      if (orchestrator.BuildFromJson(Request(400'000'000), &error) ||
          error.kind != BuildErrorKind::kConstructionFailed ||
          error.message.find("optimal attempt: simulated rejection of 2") == std::string::npos ||
          error.message.find("all-inputs attempt: simulated rejection of 3") == std::string::npos) {
        std::cerr << "both attempts must be reported: " << error.message << "\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Every coin is already selected, so the retry has nothing to add.
      FakeIndexer indexer;
      indexer.utxos = Coins({100'000'000});
      BuildOrchestrator orchestrator(policy, telemetry, indexer, standard);
      BuildError error;
      if (orchestrator.BuildFromJson(Request(400'000'000), &error) ||
          error.kind != BuildErrorKind::kConstructionFailed ||
          error.message.find("insufficient funds") == std::string::npos ||
          error.message.find("all-inputs attempt") != std::string::npos) {
        std::cerr << "underfunded build should fail without a retry: " << error.message << "\n";
        return EXIT_FAILURE;
      }
    }

    {
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000});
      BuildOrchestrator orchestrator(policy, telemetry, indexer, standard);
      auto fixed = std::make_shared<policy::PolicyConfig>();
      fixed->fee_mode = policy::PriorityFeeMode::kFixed;
      fixed->fixed_fee = 7000;
      orchestrator.SetPolicy(fixed);
      orchestrator.SetPolicy(nullptr);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(100'000'000), &error);
      if (orchestrator.policy() != fixed || !result || result->priority_fee != 7000) {
        std::cerr << "swapped policy not applied\n";
        return EXIT_FAILURE;
      }
    }
    {
      // Two coins cover the provisional fee; the per-input cost charged in
      // the second pass needs a third.
      auto adaptive = AdaptivePolicy();
      adaptive->coin_selection = policy::CoinSelectionMode::kSmallestFirst;
      adaptive->adaptive.per_input_cost = 1'000'000;
      FakeIndexer indexer;
      indexer.utxos = Coins({100'000'000, 100'000'000, 100'000'000, 100'000'000});
      BuildOrchestrator orchestrator(adaptive, telemetry, indexer, standard);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(199'900'000), &error);
      if (!result) {
        std::cerr << "adaptive build failed: " << error.message << "\n";
        return EXIT_FAILURE;
      }
      const auto& trace = result->policy_trace;
      if (trace.at("provisionalPriorityFeeSompi") != "1000" ||
          trace.at("reselected") != true || result->inputs_used != 3 ||
          result->priority_fee != 2'000'000 || result->fallback_used) {
        std::cerr << "second fee pass should extend the selection once: " << trace.dump() << "\n";
        return EXIT_FAILURE;
      }
      if (result->selected_amount < result->required_target ||
          result->fee_paid != node::NetworkFeeReserve(*adaptive, 3) + 2'000'000 ||
          trace.at("fee").at("components").at("perInput") != "2000000") {
        std::cerr << "extended selection must cover the recomputed target\n";
        return EXIT_FAILURE;
      }
    }

    {
      auto now = std::make_shared<std::atomic<std::uint64_t>>(1000);
      auto healthy = std::make_shared<std::atomic<bool>>(true);
      telemetry::CacheWindows windows;
      windows.ttl_ms = 5000;
      auto source = std::make_unique<telemetry::SummarySource>(
          "callback",
          [healthy](std::string* fetch_error) -> std::optional<json> {
            if (!healthy->load()) {
              if (fetch_error) *fetch_error = "connection refused";
              return std::nullopt;
            }
            return json{{"receipts", {{"receiptLagMs", {{"p95", 50000}}}}}};
          },
          windows, [now] { return now->load(); });
      telemetry::TelemetryCache live(std::move(source), nullptr);

      auto adaptive = AdaptivePolicy();
      adaptive->adaptive.receipt_lag_bonus = 40'000;
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000});
      BuildOrchestrator orchestrator(adaptive, live, indexer, standard);

      const auto build = [&](const char* freshness, primitives::Amount expected_fee) {
        BuildError error;
        const auto result = orchestrator.BuildFromJson(Request(100'000'000), &error);
        if (!result) {
          std::cerr << "build with " << freshness << " telemetry failed: " << error.message << "\n";
          return false;
        }
        const auto& seen = result->policy_trace.at("telemetry");
        if (seen.at("freshness") != freshness || result->priority_fee != expected_fee) {
          std::cerr << "expected " << freshness << " telemetry and fee " << expected_fee
                    << ", got " << result->policy_trace.dump() << "\n";
          return false;
        }
        return true;
      };

      if (!build("fresh", 40'000)) return EXIT_FAILURE;
      healthy->store(false);
      now->fetch_add(10'000);
      // 450 permille of the receipt lag bonus.
      if (!build("stale_soft", 18'000)) return EXIT_FAILURE;
      now->fetch_add(100'000);
      // Telemetry weight drops to zero; the requested fee remains.
      if (!build("stale_hard", 1000)) return EXIT_FAILURE;
    }

    {
      auto source = std::make_unique<telemetry::SummarySource>(
          "scheduler",
          [](std::string*) -> std::optional<json> {
            throw std::runtime_error("summary endpoint reset the connection");
          },
          telemetry::CacheWindows{}, telemetry::SteadyClock());
      telemetry::TelemetryCache broken(nullptr, std::move(source));
      FakeIndexer indexer;
      indexer.utxos = Coins({300'000'000});
      BuildOrchestrator orchestrator(AdaptivePolicy(), broken, indexer, standard);
      BuildError error;
      const auto result = orchestrator.BuildFromJson(Request(100'000'000), &error);
      if (!result || result->policy_trace.at("telemetry").at("freshness") != "stale_hard" ||
          result->priority_fee != 1000) {
        std::cerr << "a failing summary source must not block the build\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
