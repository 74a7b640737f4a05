#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "builder/build_request.hpp"
#include "builder/tx_generator.hpp"
#include "config/network.hpp"
#include "metrics/service_metrics.hpp"
#include "net/indexer_client.hpp"
#include "policy/policy_config.hpp"
#include "primitives/amount.hpp"
#include "telemetry/summary_cache.hpp"

namespace txforge::node {

enum class BuildErrorKind {
  kInvalidRequest,
  kNoSpendableOutputs,
  kBackendUnavailable,
  kConstructionFailed,
};

const char* BuildErrorKindName(BuildErrorKind kind);

struct BuildError {
  BuildErrorKind kind{BuildErrorKind::kInvalidRequest};
  std::string message;
};

// Which construction attempt produced the transaction.
enum class Attempt {
  kOptimal,
  kAllInputs,
};

struct BuildResult {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string from_address;
  std::string serialized_transaction;  // Hex of the wire encoding.
  nlohmann::json transaction_json;
  std::string transaction_id;
  // Network reserve plus priority fee. Dust change the generator folds into
  // the fee shows up only as effectiveFeeSompi in the trace.
  primitives::Amount fee_paid{0};
  primitives::Amount priority_fee{0};
  primitives::Amount network_fee_reserve{0};
  primitives::Amount selected_amount{0};
  primitives::Amount required_target{0};
  std::size_t inputs_used{0};
  std::size_t total_inputs_available{0};
  bool truncated_by_cap{false};
  bool fallback_used{false};
  Attempt attempt{Attempt::kOptimal};
  nlohmann::json policy_trace;
};

// Drives one build: telemetry, UTXO fetch, selection and fee (two passes at
// most), construction and the all-inputs fallback. Holds no per-request
// state, so one instance serves every worker thread.
class BuildOrchestrator {
 public:
  BuildOrchestrator(std::shared_ptr<const policy::PolicyConfig> policy,
                    telemetry::TelemetryCache& telemetry, net::IndexerClient& indexer,
                    const builder::TransactionGenerator& generator,
                    metrics::ServiceMetrics* metrics = nullptr);

  std::optional<BuildResult> Build(const builder::BuildRequest& request, BuildError* error);
  // Validates |body| first; malformed requests fail with kInvalidRequest.
  std::optional<BuildResult> BuildFromJson(const nlohmann::json& body, BuildError* error);

  // Swaps the policy for subsequent builds; in-flight builds keep theirs.
  void SetPolicy(std::shared_ptr<const policy::PolicyConfig> policy);
  std::shared_ptr<const policy::PolicyConfig> policy() const;

 private:
  std::optional<BuildResult> Fail(BuildErrorKind kind, std::string message, BuildError* error);

  mutable std::mutex policy_mutex_;
  std::shared_ptr<const policy::PolicyConfig> policy_;
  telemetry::TelemetryCache& telemetry_;
  net::IndexerClient& indexer_;
  const builder::TransactionGenerator& generator_;
  metrics::ServiceMetrics* metrics_;
};

// estimated_network_fee + extra_safety_buffer + per_input_fee_buffer * n,
// saturating at kMaxSompi.
primitives::Amount NetworkFeeReserve(const policy::PolicyConfig& config, std::size_t input_count);

}  // namespace txforge::node
