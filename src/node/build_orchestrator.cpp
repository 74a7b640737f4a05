#include "node/build_orchestrator.hpp"

#include <algorithm>

#include "policy/coin_selection.hpp"
#include "policy/priority_fee.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"
#include "primitives/serialize.hpp"

namespace txforge::node {

namespace {

using primitives::Amount;
using primitives::SpendableOutput;

policy::SelectionTarget MakeTarget(const policy::PolicyConfig& config, Amount outputs_total,
                                   Amount priority_fee) {
  policy::SelectionTarget target;
  target.outputs_total = outputs_total;
  target.fixed_reserve = primitives::SaturatingAdd(
      primitives::SaturatingAdd(config.estimated_network_fee, config.extra_safety_buffer),
      priority_fee);
  target.per_input_reserve = config.per_input_fee_buffer;
  return target;
}

Amount SumAmounts(const std::vector<SpendableOutput>& coins) {
  Amount total = 0;
  for (const auto& coin : coins) {
    total = primitives::SaturatingAdd(total, coin.amount);
  }
  return total;
}

// Every candidate when they fit under the cap, else the largest ones.
std::vector<SpendableOutput> AllInputsSet(const std::vector<SpendableOutput>& candidates,
                                          std::size_t max_inputs) {
  if (candidates.size() <= max_inputs) {
    return candidates;
  }
  auto largest = policy::OrderCandidates(candidates, policy::CoinSelectionMode::kLargestFirst,
                                         /*prefer_consolidation=*/false);
  largest.resize(max_inputs);
  return largest;
}

nlohmann::json OptionalMs(const std::optional<std::uint64_t>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json DescribeTelemetry(const policy::TelemetrySnapshot& snapshot) {
  return {
      {"observedConfirmP95Ms", OptionalMs(snapshot.observed_confirm_p95_ms)},
      {"daaCongestionPct", snapshot.daa_congestion_pct ? nlohmann::json(*snapshot.daa_congestion_pct)
                                                       : nlohmann::json(nullptr)},
      {"receiptLagP95Ms", OptionalMs(snapshot.receipt_lag_p95_ms)},
      {"schedulerCallbackLatencyP95Ms", OptionalMs(snapshot.scheduler_callback_p95_ms)},
      {"freshness", policy::FreshnessName(snapshot.freshness)},
      {"freshnessMaxAgeMs", snapshot.freshness_max_age_ms},
  };
}

struct AttemptPlan {
  std::vector<SpendableOutput> inputs;
  policy::FeeDecision fee;
  Amount network_reserve{0};
  Amount fee_paid{0};
};

}  // namespace

const char* BuildErrorKindName(BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kInvalidRequest:
      return "invalid_request";
    case BuildErrorKind::kNoSpendableOutputs:
      return "no_spendable_outputs";
    case BuildErrorKind::kBackendUnavailable:
      return "backend_unavailable";
    case BuildErrorKind::kConstructionFailed:
      return "construction_failed";
  }
  return "unknown";
}

Amount NetworkFeeReserve(const policy::PolicyConfig& config, std::size_t input_count) {
  return MakeTarget(config, 0, 0).RequiredFor(input_count);
}

BuildOrchestrator::BuildOrchestrator(std::shared_ptr<const policy::PolicyConfig> policy,
                                     telemetry::TelemetryCache& telemetry,
                                     net::IndexerClient& indexer,
                                     const builder::TransactionGenerator& generator,
                                     metrics::ServiceMetrics* metrics)
    : policy_(policy ? std::move(policy) : std::make_shared<const policy::PolicyConfig>()),
      telemetry_(telemetry),
      indexer_(indexer),
      generator_(generator),
      metrics_(metrics) {}

void BuildOrchestrator::SetPolicy(std::shared_ptr<const policy::PolicyConfig> policy) {
  if (!policy) {
    return;
  }
  std::lock_guard<std::mutex> lock(policy_mutex_);
  policy_ = std::move(policy);
}

std::shared_ptr<const policy::PolicyConfig> BuildOrchestrator::policy() const {
  std::lock_guard<std::mutex> lock(policy_mutex_);
  return policy_;
}

std::optional<BuildResult> BuildOrchestrator::Fail(BuildErrorKind kind, std::string message,
                                                   BuildError* error) {
  if (metrics_) metrics_->RecordBuildError(BuildErrorKindName(kind));
  util::LogPrint(kind == BuildErrorKind::kInvalidRequest ? util::LogLevel::kDebug
                                                         : util::LogLevel::kWarn,
                 "build", std::string(BuildErrorKindName(kind)) + ": " + message);
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
  return std::nullopt;
}

std::optional<BuildResult> BuildOrchestrator::BuildFromJson(const nlohmann::json& body,
                                                            BuildError* error) {
  builder::BuildRequest request;
  std::string parse_error;
  if (!builder::ParseBuildRequest(body, &request, &parse_error)) {
    if (metrics_) metrics_->RecordBuildRequest();
    return Fail(BuildErrorKind::kInvalidRequest, parse_error, error);
  }
  return Build(request, error);
}

std::optional<BuildResult> BuildOrchestrator::Build(const builder::BuildRequest& request,
                                                    BuildError* error) {
  if (metrics_) metrics_->RecordBuildRequest();
  const auto config_ptr = policy();
  const policy::PolicyConfig& config = *config_ptr;

  const policy::TelemetrySnapshot telemetry = telemetry_.Resolve(request.telemetry);

  std::string fetch_error;
  auto candidates = indexer_.FetchUtxos(request.network, request.from_address, &fetch_error);
  if (!candidates) {
    if (metrics_) metrics_->RecordUtxoFetchError();
    return Fail(BuildErrorKind::kBackendUnavailable, fetch_error, error);
  }
  if (candidates->empty()) {
    return Fail(BuildErrorKind::kNoSpendableOutputs,
                "no spendable outputs for " + request.from_address, error);
  }

  const Amount outputs_total = request.OutputsTotal();
  policy::FeeRequest fee_request;
  fee_request.hint = request.requested_fee;
  fee_request.outputs_total = outputs_total;
  fee_request.output_count = request.outputs.size();
  fee_request.telemetry = telemetry;

  // Pass one: provisional fee without selection stats, then select.
  const policy::FeeDecision provisional = policy::ComputeFee(fee_request, config);
  policy::CoinSelector selector(*candidates, config.coin_selection, config.prefer_consolidation,
                                config.max_inputs);
  policy::SelectionPlan plan = selector.Select(MakeTarget(config, outputs_total, provisional.fee));

  // Pass two: fee from the plan's shape; extend once if the target grew.
  fee_request.selection = {plan.selected.size(), plan.truncated_by_cap};
  policy::FeeDecision decision = policy::ComputeFee(fee_request, config);
  const policy::SelectionTarget target = MakeTarget(config, outputs_total, decision.fee);
  if (plan.selected_amount < target.RequiredFor(plan.selected.size())) {
    selector.Extend(&plan, target);
  }
  plan.required_target = target.RequiredFor(plan.selected.size());

  AttemptPlan optimal;
  optimal.inputs = plan.selected;
  optimal.fee = decision;
  optimal.network_reserve = NetworkFeeReserve(config, optimal.inputs.size());
  optimal.fee_paid = primitives::SaturatingAdd(optimal.network_reserve, decision.fee);

  const auto construct = [&](const AttemptPlan& attempt, std::string* attempt_error) {
    builder::GeneratorRequest generator_request;
    generator_request.inputs = attempt.inputs;
    generator_request.outputs = request.outputs;
    generator_request.change_address = request.from;
    generator_request.fee = attempt.fee_paid;
    return generator_.Generate(generator_request, attempt_error);
  };

  Attempt used = Attempt::kOptimal;
  std::string optimal_error;
  std::string fallback_error;
  const AttemptPlan* chosen = &optimal;
  AttemptPlan fallback;
  auto built = construct(optimal, &optimal_error);
  if (!built) {
    fallback.inputs = AllInputsSet(*candidates, selector.max_inputs());
    if (SumAmounts(fallback.inputs) > plan.selected_amount) {
      util::LogPrint(util::LogLevel::kWarn, "build",
                     "optimal selection failed (" + optimal_error + "), retrying with " +
                         std::to_string(fallback.inputs.size()) + " inputs");
      fee_request.selection = {fallback.inputs.size(),
                               candidates->size() > selector.max_inputs()};
      fallback.fee = policy::ComputeFee(fee_request, config);
      fallback.network_reserve = NetworkFeeReserve(config, fallback.inputs.size());
      fallback.fee_paid = primitives::SaturatingAdd(fallback.network_reserve, fallback.fee.fee);
      built = construct(fallback, &fallback_error);
      used = Attempt::kAllInputs;
      chosen = &fallback;
    }
  }
  if (!built) {
    std::string message = "optimal attempt: " + optimal_error;
    if (used == Attempt::kAllInputs) {
      message += "; all-inputs attempt: " + fallback_error;
    }
    return Fail(BuildErrorKind::kConstructionFailed, message, error);
  }

  BuildResult result;
  result.network = request.network;
  result.from_address = request.from_address;
  result.serialized_transaction = util::HexEncode(built->serialized);
  result.transaction_json = primitives::serialize::TransactionToJson(built->tx);
  result.transaction_id = util::HexEncode(built->txid);
  result.priority_fee = chosen->fee.fee;
  result.network_fee_reserve = chosen->network_reserve;
  result.fee_paid = chosen->fee_paid;
  result.inputs_used = chosen->inputs.size();
  result.total_inputs_available = candidates->size();
  result.selected_amount = SumAmounts(chosen->inputs);
  result.required_target = primitives::SaturatingAdd(outputs_total, chosen->fee_paid);
  result.truncated_by_cap = used == Attempt::kOptimal
                                ? plan.truncated_by_cap
                                : candidates->size() > selector.max_inputs();
  result.fallback_used = used == Attempt::kAllInputs;
  result.attempt = used;

  nlohmann::json trace = {
      {"selectionMode", policy::CoinSelectionModeName(config.coin_selection)},
      {"preferConsolidation", config.prefer_consolidation},
      {"priorityFeeMode", policy::PriorityFeeModeName(config.fee_mode)},
      {"attempt", used == Attempt::kOptimal ? "optimal" : "all_inputs"},
      {"selectedInputs", result.inputs_used},
      {"totalInputs", result.total_inputs_available},
      {"truncatedByMaxInputs", result.truncated_by_cap},
      {"reselected", plan.extended},
      {"selectedAmountSompi", std::to_string(result.selected_amount)},
      {"outputsTotalSompi", std::to_string(outputs_total)},
      {"requiredTargetSompi", std::to_string(result.required_target)},
      {"networkFeeReserveSompi", std::to_string(result.network_fee_reserve)},
      {"provisionalPriorityFeeSompi", std::to_string(provisional.fee)},
      {"priorityFeeSompi", std::to_string(result.priority_fee)},
      {"feePaidSompi", std::to_string(result.fee_paid)},
      {"effectiveFeeSompi", std::to_string(built->fee)},
      {"changeSompi", std::to_string(built->change)},
      {"mass", built->mass},
      {"fee", chosen->fee.ToJson()},
      {"telemetry", DescribeTelemetry(telemetry)},
      {"fallbackUsedAllInputs", result.fallback_used},
      {"config", policy::DescribePolicyConfig(config)},
  };
  if (result.fallback_used) {
    trace["selectedBuildError"] = optimal_error.substr(0, 200);
  }
  if (!request.purpose.empty()) {
    trace["purpose"] = request.purpose;
  }
  result.policy_trace = std::move(trace);

  if (metrics_) {
    metrics::BuildSample sample;
    sample.selection_mode = policy::CoinSelectionModeName(config.coin_selection);
    sample.fee_mode = policy::PriorityFeeModeName(config.fee_mode);
    sample.selected_inputs = result.inputs_used;
    sample.total_candidates = result.total_inputs_available;
    sample.selected_amount = result.selected_amount;
    sample.required_target = result.required_target;
    sample.priority_fee = result.priority_fee;
    sample.truncated_by_cap = result.truncated_by_cap;
    sample.fallback_all_inputs = result.fallback_used;
    metrics_->RecordBuildSuccess(sample);
  }
  util::LogPrint(util::LogLevel::kInfo, "build",
                 "built " + result.transaction_id + " inputs=" +
                     std::to_string(result.inputs_used) + "/" +
                     std::to_string(result.total_inputs_available) +
                     " fee=" + std::to_string(result.fee_paid) +
                     (result.fallback_used ? " (all-inputs fallback)" : ""));
  return result;
}

}  // namespace txforge::node
