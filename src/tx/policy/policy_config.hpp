#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

#include "primitives/amount.hpp"

namespace txforge::policy {

enum class CoinSelectionMode {
  kAuto,
  kLargestFirst,
  kSmallestFirst,
  kOldestFirst,
  kNewestFirst,
};

enum class PriorityFeeMode {
  kFixed,
  kOutputBps,
  kPerOutput,
  kRequestOrFixed,
  kAdaptive,
};

const char* CoinSelectionModeName(CoinSelectionMode mode);
const char* PriorityFeeModeName(PriorityFeeMode mode);
// Unknown names fall back to kAuto / kRequestOrFixed.
CoinSelectionMode ParseCoinSelectionMode(std::string_view value);
PriorityFeeMode ParsePriorityFeeMode(std::string_view value);

// Tuning table for PriorityFeeMode::kAdaptive. Amounts in sompi, ratios
// as integer percent or permille.
struct AdaptiveFeeTuning {
  std::uint64_t high_confirm_ms{20000};
  std::uint64_t critical_confirm_ms{45000};
  std::uint64_t latency_up_pct{120};
  primitives::Amount per_input_cost{500};
  std::size_t fragmentation_threshold_inputs{10};
  primitives::Amount fragmentation_bonus{4000};
  primitives::Amount truncation_bonus{8000};
  primitives::Amount congestion_bonus{6000};
  std::uint64_t receipt_lag_high_ms{12000};
  std::uint64_t receipt_lag_critical_ms{45000};
  primitives::Amount receipt_lag_bonus{4000};
  std::uint64_t scheduler_callback_high_ms{500};
  std::uint64_t scheduler_callback_critical_ms{2500};
  primitives::Amount scheduler_callback_bonus{2500};
  // Share of a pressure bonus paid between the high and critical thresholds.
  std::uint32_t tier_permille{500};
  // Weight of telemetry-derived components per freshness state.
  std::uint32_t stale_soft_permille{450};
  std::uint32_t stale_hard_permille{0};
};

struct PolicyConfig {
  CoinSelectionMode coin_selection{CoinSelectionMode::kAuto};
  std::size_t max_inputs{48};
  primitives::Amount estimated_network_fee{20000};
  primitives::Amount per_input_fee_buffer{1500};
  primitives::Amount extra_safety_buffer{5000};
  PriorityFeeMode fee_mode{PriorityFeeMode::kRequestOrFixed};
  primitives::Amount fixed_fee{0};
  std::uint64_t output_bps{5};
  primitives::Amount per_output_fee{2000};
  primitives::Amount fee_min{0};
  primitives::Amount fee_max{2'500'000};
  AdaptiveFeeTuning adaptive{};
  bool prefer_consolidation{true};
};

inline constexpr std::string_view kPolicyEnvPrefix = "TX_BUILDER_POLICY_";

// Looks up a variable by its full name; nullopt when unset or empty.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

EnvLookup ProcessEnvironment();

// Builds a config from TX_BUILDER_POLICY_* variables. Unparseable values
// keep their default and numeric values are raised to their minimum, so
// this never fails.
PolicyConfig ReadPolicyConfig(const EnvLookup& env);
PolicyConfig ReadPolicyConfig();

// Stable JSON description (camelCase keys) for /health and policy traces.
nlohmann::json DescribePolicyConfig(const PolicyConfig& config);

}  // namespace txforge::policy
