#include "policy/priority_fee.hpp"

#include <algorithm>
#include <string>

namespace txforge::policy {

namespace {

using primitives::Amount;
using primitives::kMaxSompi;

// Caps the latency pressure multiplier at 1.5x the configured uplift.
constexpr std::uint64_t kMaxLatencySeverityPermille = 1500;

Amount MulDivOrSaturate(Amount value, std::uint64_t numerator, std::uint64_t denominator,
                        bool round_up = false) {
  Amount out = 0;
  if (!primitives::CheckedMulDiv(value, numerator, denominator, &out, round_up)) {
    return kMaxSompi;
  }
  return out;
}

Amount Clamp(Amount fee, const PolicyConfig& config) {
  const Amount hi = std::max(config.fee_min, config.fee_max);
  return std::clamp(fee, config.fee_min, hi);
}

Amount OutputBpsFee(const FeeRequest& request, const PolicyConfig& config) {
  return MulDivOrSaturate(request.outputs_total, config.output_bps, 10000, /*round_up=*/true);
}

Amount PerOutputFee(const FeeRequest& request, const PolicyConfig& config) {
  Amount fee = 0;
  if (!primitives::CheckedMul(config.per_output_fee, request.output_count, &fee)) {
    return kMaxSompi;
  }
  return fee;
}

Amount LatencyPressure(std::optional<std::uint64_t> observed_p95_ms, Amount base,
                       const AdaptiveFeeTuning& tuning) {
  if (!observed_p95_ms || *observed_p95_ms <= tuning.high_confirm_ms) {
    return 0;
  }
  const std::uint64_t over = *observed_p95_ms - tuning.high_confirm_ms;
  std::uint64_t severity = kMaxLatencySeverityPermille;
  if (tuning.critical_confirm_ms > tuning.high_confirm_ms) {
    Amount ratio = 0;
    if (primitives::CheckedMulDiv(over, 1000,
                                  tuning.critical_confirm_ms - tuning.high_confirm_ms, &ratio)) {
      severity = std::min<std::uint64_t>(ratio, kMaxLatencySeverityPermille);
    }
  }
  return MulDivOrSaturate(base, tuning.latency_up_pct * severity, 100'000);
}

FeeComponents AdaptiveComponents(const FeeRequest& request, const PolicyConfig& config) {
  const auto& tuning = config.adaptive;
  const auto& telemetry = request.telemetry;
  FeeComponents c;
  c.base = std::max({config.fixed_fee, PerOutputFee(request, config),
                     OutputBpsFee(request, config)});
  if (!primitives::CheckedMul(tuning.per_input_cost, request.selection.selected_inputs,
                              &c.per_input)) {
    c.per_input = kMaxSompi;
  }
  if (request.selection.selected_inputs > tuning.fragmentation_threshold_inputs) {
    c.fragmentation = tuning.fragmentation_bonus;
  }
  if (request.selection.truncated_by_cap) {
    c.truncation = tuning.truncation_bonus;
  }

  c.freshness_permille = FreshnessPermille(telemetry.freshness, tuning);
  const auto weigh = [&](Amount raw) { return MulDivOrSaturate(raw, c.freshness_permille, 1000); };
  if (telemetry.daa_congestion_pct) {
    const std::uint32_t pct = std::min<std::uint32_t>(*telemetry.daa_congestion_pct, 100);
    c.congestion = weigh(MulDivOrSaturate(tuning.congestion_bonus, pct, 100));
  }
  c.receipt_lag = weigh(TieredBonus(telemetry.receipt_lag_p95_ms, tuning.receipt_lag_high_ms,
                                    tuning.receipt_lag_critical_ms, tuning.receipt_lag_bonus,
                                    tuning.tier_permille));
  c.scheduler_callback = weigh(TieredBonus(
      telemetry.scheduler_callback_p95_ms, tuning.scheduler_callback_high_ms,
      tuning.scheduler_callback_critical_ms, tuning.scheduler_callback_bonus,
      tuning.tier_permille));
  c.latency_pressure = weigh(LatencyPressure(telemetry.observed_confirm_p95_ms, c.base, tuning));

  for (Amount part : {c.base, c.per_input, c.fragmentation, c.truncation, c.congestion,
                      c.receipt_lag, c.scheduler_callback, c.latency_pressure}) {
    c.sum = primitives::SaturatingAdd(c.sum, part);
  }
  return c;
}

}  // namespace

std::uint32_t FreshnessPermille(Freshness freshness, const AdaptiveFeeTuning& tuning) {
  switch (freshness) {
    case Freshness::kFresh:
      return 1000;
    case Freshness::kStaleSoft:
      return std::min<std::uint32_t>(tuning.stale_soft_permille, 1000);
    case Freshness::kStaleHard:
      return std::min<std::uint32_t>(tuning.stale_hard_permille, 1000);
  }
  return 0;
}

Amount TieredBonus(std::optional<std::uint64_t> value, std::uint64_t high_ms,
                   std::uint64_t critical_ms, Amount bonus, std::uint32_t tier_permille) {
  if (!value || high_ms == 0 || *value < high_ms) {
    return 0;
  }
  if (critical_ms <= high_ms || *value >= critical_ms) {
    return bonus;
  }
  return MulDivOrSaturate(bonus, std::min<std::uint32_t>(tier_permille, 1000), 1000);
}

FeeDecision ComputeFee(const FeeRequest& request, const PolicyConfig& config) {
  FeeDecision decision;
  decision.mode = config.fee_mode;
  decision.hint = request.hint;
  decision.freshness = request.telemetry.freshness;
  switch (config.fee_mode) {
    case PriorityFeeMode::kFixed:
      decision.clamped = Clamp(config.fixed_fee, config);
      decision.fee = decision.clamped;
      break;
    case PriorityFeeMode::kOutputBps:
      decision.clamped = Clamp(OutputBpsFee(request, config), config);
      decision.fee = decision.clamped;
      break;
    case PriorityFeeMode::kPerOutput:
      decision.clamped = Clamp(PerOutputFee(request, config), config);
      decision.fee = decision.clamped;
      break;
    case PriorityFeeMode::kRequestOrFixed: {
      const Amount chosen =
          request.hint && *request.hint > 0 ? *request.hint : config.fixed_fee;
      decision.clamped = Clamp(chosen, config);
      decision.fee = decision.clamped;
      break;
    }
    case PriorityFeeMode::kAdaptive: {
      decision.components = AdaptiveComponents(request, config);
      decision.clamped = Clamp(decision.components->sum, config);
      decision.fee = std::max(request.hint.value_or(0), decision.clamped);
      break;
    }
  }
  return decision;
}

nlohmann::json FeeDecision::ToJson() const {
  // Amounts are decimal strings so they survive JSON readers limited to
  // 53-bit integers.
  nlohmann::json out = {
      {"mode", PriorityFeeModeName(mode)},
      {"priorityFeeSompi", std::to_string(fee)},
      {"clampedSompi", std::to_string(clamped)},
      {"freshness", FreshnessName(freshness)},
  };
  out["requestedFeeSompi"] = hint ? nlohmann::json(std::to_string(*hint)) : nlohmann::json(nullptr);
  if (components) {
    const auto& c = *components;
    out["components"] = {
        {"base", std::to_string(c.base)},
        {"perInput", std::to_string(c.per_input)},
        {"fragmentation", std::to_string(c.fragmentation)},
        {"truncation", std::to_string(c.truncation)},
        {"daaCongestion", std::to_string(c.congestion)},
        {"receiptLag", std::to_string(c.receipt_lag)},
        {"schedulerCallback", std::to_string(c.scheduler_callback)},
        {"latencyPressure", std::to_string(c.latency_pressure)},
        {"sum", std::to_string(c.sum)},
    };
    out["freshnessPermille"] = c.freshness_permille;
  }
  return out;
}

}  // namespace txforge::policy
