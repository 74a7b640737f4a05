#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "nlohmann/json.hpp"

#include "policy/policy_config.hpp"
#include "policy/telemetry_snapshot.hpp"
#include "primitives/amount.hpp"

namespace txforge::policy {

// Shape of the current selection as seen by the fee policy. A provisional
// fee is computed with default stats before any input is chosen.
struct SelectionStats {
  std::size_t selected_inputs{0};
  bool truncated_by_cap{false};
};

struct FeeRequest {
  std::optional<primitives::Amount> hint;  // Caller-requested priority fee.
  primitives::Amount outputs_total{0};
  std::size_t output_count{0};
  SelectionStats selection{};
  TelemetrySnapshot telemetry{};
};

// Per-component breakdown of an adaptive fee. Telemetry-derived parts
// (congestion, receipt lag, scheduler callback, latency pressure) are
// stored after the freshness weighting.
struct FeeComponents {
  primitives::Amount base{0};
  primitives::Amount per_input{0};
  primitives::Amount fragmentation{0};
  primitives::Amount truncation{0};
  primitives::Amount congestion{0};
  primitives::Amount receipt_lag{0};
  primitives::Amount scheduler_callback{0};
  primitives::Amount latency_pressure{0};
  std::uint32_t freshness_permille{1000};
  primitives::Amount sum{0};
};

struct FeeDecision {
  PriorityFeeMode mode{PriorityFeeMode::kRequestOrFixed};
  primitives::Amount fee{0};
  primitives::Amount clamped{0};  // Before the request hint floor.
  std::optional<primitives::Amount> hint;
  std::optional<FeeComponents> components;  // Adaptive mode only.
  Freshness freshness{Freshness::kFresh};

  nlohmann::json ToJson() const;
};

// Pure function of its inputs; never fails. Amounts saturate at kMaxSompi
// and the result is clamped to [fee_min, max(fee_min, fee_max)].
FeeDecision ComputeFee(const FeeRequest& request, const PolicyConfig& config);

// Share of a pressure bonus earned by |value| against a high/critical pair:
// nothing below high, tier_permille of the bonus up to critical, all of it
// from critical on. A zero high threshold disables the component.
primitives::Amount TieredBonus(std::optional<std::uint64_t> value, std::uint64_t high_ms,
                               std::uint64_t critical_ms, primitives::Amount bonus,
                               std::uint32_t tier_permille);

std::uint32_t FreshnessPermille(Freshness freshness, const AdaptiveFeeTuning& tuning);

}  // namespace txforge::policy
