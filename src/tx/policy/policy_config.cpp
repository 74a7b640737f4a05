#include "policy/policy_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace txforge::policy {

namespace {

// Latency windows above one day are treated as misconfiguration and capped.
constexpr std::uint64_t kMaxWindowMs = 86'400'000;

std::string Lower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

class EnvReader {
 public:
  explicit EnvReader(const EnvLookup& env) : env_(env) {}

  std::optional<std::string> Raw(std::string_view suffix) const {
    if (!env_) {
      return std::nullopt;
    }
    return env_(std::string(kPolicyEnvPrefix) + std::string(suffix));
  }

  std::uint64_t Uint(std::string_view suffix, std::uint64_t fallback, std::uint64_t min,
                     std::uint64_t max = UINT64_MAX) const {
    auto raw = Raw(suffix);
    std::uint64_t value = fallback;
    if (raw) {
      const std::string text = Lower(*raw);
      char* end = nullptr;
      errno = 0;
      const unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
      if (!text.empty() && text.front() != '-' && end != nullptr && *end == '\0' &&
          errno == 0) {
        value = parsed;
      }
    }
    return std::clamp<std::uint64_t>(value, min, std::max(min, max));
  }

  primitives::Amount Sompi(std::string_view suffix, primitives::Amount fallback) const {
    return Uint(suffix, fallback, 0, primitives::kMaxSompi);
  }

  bool Bool(std::string_view suffix, bool fallback) const {
    auto raw = Raw(suffix);
    if (!raw) {
      return fallback;
    }
    const std::string text = Lower(*raw);
    return text == "1" || text == "true" || text == "yes";
  }

 private:
  const EnvLookup& env_;
};

}  // namespace

const char* CoinSelectionModeName(CoinSelectionMode mode) {
  switch (mode) {
    case CoinSelectionMode::kAuto:
      return "auto";
    case CoinSelectionMode::kLargestFirst:
      return "largest-first";
    case CoinSelectionMode::kSmallestFirst:
      return "smallest-first";
    case CoinSelectionMode::kOldestFirst:
      return "oldest-first";
    case CoinSelectionMode::kNewestFirst:
      return "newest-first";
  }
  return "auto";
}

const char* PriorityFeeModeName(PriorityFeeMode mode) {
  switch (mode) {
    case PriorityFeeMode::kFixed:
      return "fixed";
    case PriorityFeeMode::kOutputBps:
      return "output_bps";
    case PriorityFeeMode::kPerOutput:
      return "per_output";
    case PriorityFeeMode::kRequestOrFixed:
      return "request_or_fixed";
    case PriorityFeeMode::kAdaptive:
      return "adaptive";
  }
  return "request_or_fixed";
}

CoinSelectionMode ParseCoinSelectionMode(std::string_view value) {
  const std::string mode = Lower(value);
  if (mode == "largest-first") return CoinSelectionMode::kLargestFirst;
  if (mode == "smallest-first") return CoinSelectionMode::kSmallestFirst;
  if (mode == "oldest-first") return CoinSelectionMode::kOldestFirst;
  if (mode == "newest-first") return CoinSelectionMode::kNewestFirst;
  return CoinSelectionMode::kAuto;
}

PriorityFeeMode ParsePriorityFeeMode(std::string_view value) {
  const std::string mode = Lower(value);
  if (mode == "fixed") return PriorityFeeMode::kFixed;
  if (mode == "output_bps") return PriorityFeeMode::kOutputBps;
  if (mode == "per_output") return PriorityFeeMode::kPerOutput;
  if (mode == "adaptive") return PriorityFeeMode::kAdaptive;
  return PriorityFeeMode::kRequestOrFixed;
}

EnvLookup ProcessEnvironment() {
  return [](std::string_view name) -> std::optional<std::string> {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value || value[0] == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

PolicyConfig ReadPolicyConfig(const EnvLookup& env) {
  const EnvReader in(env);
  PolicyConfig cfg;
  if (auto mode = in.Raw("COIN_SELECTION")) {
    cfg.coin_selection = ParseCoinSelectionMode(*mode);
  }
  cfg.max_inputs = static_cast<std::size_t>(in.Uint("MAX_INPUTS", cfg.max_inputs, 1, 100000));
  cfg.estimated_network_fee = in.Sompi("ESTIMATED_NETWORK_FEE_SOMPI", cfg.estimated_network_fee);
  cfg.per_input_fee_buffer = in.Sompi("PER_INPUT_FEE_BUFFER_SOMPI", cfg.per_input_fee_buffer);
  cfg.extra_safety_buffer = in.Sompi("EXTRA_SAFETY_BUFFER_SOMPI", cfg.extra_safety_buffer);
  if (auto mode = in.Raw("PRIORITY_FEE_MODE")) {
    cfg.fee_mode = ParsePriorityFeeMode(*mode);
  }
  cfg.fixed_fee = in.Sompi("PRIORITY_FEE_SOMPI", cfg.fixed_fee);
  cfg.output_bps = in.Uint("PRIORITY_FEE_OUTPUT_BPS", cfg.output_bps, 0, 10000);
  cfg.per_output_fee = in.Sompi("PRIORITY_FEE_PER_OUTPUT_SOMPI", cfg.per_output_fee);
  cfg.fee_min = in.Sompi("PRIORITY_FEE_MIN_SOMPI", cfg.fee_min);
  cfg.fee_max = in.Sompi("PRIORITY_FEE_MAX_SOMPI", cfg.fee_max);

  auto& a = cfg.adaptive;
  a.high_confirm_ms = in.Uint("PRIORITY_FEE_ADAPTIVE_HIGH_CONFIRM_MS", a.high_confirm_ms, 100, kMaxWindowMs);
  a.critical_confirm_ms = in.Uint("PRIORITY_FEE_ADAPTIVE_CRITICAL_CONFIRM_MS",
                                  a.critical_confirm_ms, a.high_confirm_ms, kMaxWindowMs);
  a.latency_up_pct = in.Uint("PRIORITY_FEE_ADAPTIVE_LATENCY_UP_PCT", a.latency_up_pct, 0, 1000);
  a.per_input_cost = in.Sompi("PRIORITY_FEE_ADAPTIVE_PER_INPUT_SOMPI", a.per_input_cost);
  a.fragmentation_threshold_inputs = static_cast<std::size_t>(
      in.Uint("PRIORITY_FEE_ADAPTIVE_FRAGMENTATION_THRESHOLD_INPUTS",
              a.fragmentation_threshold_inputs, 1, 100000));
  a.fragmentation_bonus =
      in.Sompi("PRIORITY_FEE_ADAPTIVE_FRAGMENTATION_BUMP_SOMPI", a.fragmentation_bonus);
  a.truncation_bonus = in.Sompi("PRIORITY_FEE_ADAPTIVE_TRUNCATION_BUMP_SOMPI", a.truncation_bonus);
  a.congestion_bonus =
      in.Sompi("PRIORITY_FEE_ADAPTIVE_DAA_CONGESTION_BUMP_SOMPI", a.congestion_bonus);
  a.receipt_lag_high_ms =
      in.Uint("PRIORITY_FEE_ADAPTIVE_RECEIPT_LAG_HIGH_MS", a.receipt_lag_high_ms, 0, kMaxWindowMs);
  a.receipt_lag_critical_ms = in.Uint("PRIORITY_FEE_ADAPTIVE_RECEIPT_LAG_CRITICAL_MS",
                                      a.receipt_lag_critical_ms, a.receipt_lag_high_ms, kMaxWindowMs);
  a.receipt_lag_bonus =
      in.Sompi("PRIORITY_FEE_ADAPTIVE_RECEIPT_LAG_BUMP_SOMPI", a.receipt_lag_bonus);
  a.scheduler_callback_high_ms = in.Uint("PRIORITY_FEE_ADAPTIVE_SCHEDULER_CALLBACK_HIGH_MS",
                                         a.scheduler_callback_high_ms, 0, kMaxWindowMs);
  a.scheduler_callback_critical_ms =
      in.Uint("PRIORITY_FEE_ADAPTIVE_SCHEDULER_CALLBACK_CRITICAL_MS",
              a.scheduler_callback_critical_ms, a.scheduler_callback_high_ms, kMaxWindowMs);
  a.scheduler_callback_bonus =
      in.Sompi("PRIORITY_FEE_ADAPTIVE_SCHEDULER_CALLBACK_BUMP_SOMPI", a.scheduler_callback_bonus);
  a.tier_permille = static_cast<std::uint32_t>(
      in.Uint("PRIORITY_FEE_ADAPTIVE_TIER_PERMILLE", a.tier_permille, 0, 1000));
  a.stale_soft_permille = static_cast<std::uint32_t>(
      in.Uint("PRIORITY_FEE_ADAPTIVE_STALE_SOFT_PERMILLE", a.stale_soft_permille, 0, 1000));
  a.stale_hard_permille = static_cast<std::uint32_t>(in.Uint(
      "PRIORITY_FEE_ADAPTIVE_STALE_HARD_PERMILLE", a.stale_hard_permille, 0,
      a.stale_soft_permille));

  cfg.prefer_consolidation = in.Bool("PREFER_CONSOLIDATION", cfg.prefer_consolidation);
  return cfg;
}

PolicyConfig ReadPolicyConfig() { return ReadPolicyConfig(ProcessEnvironment()); }

nlohmann::json DescribePolicyConfig(const PolicyConfig& config) {
  const auto& a = config.adaptive;
  return {
      {"coinSelection", CoinSelectionModeName(config.coin_selection)},
      {"maxInputs", config.max_inputs},
      {"estimatedNetworkFeeSompi", config.estimated_network_fee},
      {"perInputFeeBufferSompi", config.per_input_fee_buffer},
      {"extraSafetyBufferSompi", config.extra_safety_buffer},
      {"priorityFeeMode", PriorityFeeModeName(config.fee_mode)},
      {"priorityFeeFixedSompi", config.fixed_fee},
      {"priorityFeeOutputBps", config.output_bps},
      {"priorityFeePerOutputSompi", config.per_output_fee},
      {"priorityFeeMinSompi", config.fee_min},
      {"priorityFeeMaxSompi", config.fee_max},
      {"adaptive",
       {
           {"highConfirmMs", a.high_confirm_ms},
           {"criticalConfirmMs", a.critical_confirm_ms},
           {"latencyUpPct", a.latency_up_pct},
           {"perInputSompi", a.per_input_cost},
           {"fragmentationThresholdInputs", a.fragmentation_threshold_inputs},
           {"fragmentationBumpSompi", a.fragmentation_bonus},
           {"truncationBumpSompi", a.truncation_bonus},
           {"daaCongestionBumpSompi", a.congestion_bonus},
           {"receiptLagHighMs", a.receipt_lag_high_ms},
           {"receiptLagCriticalMs", a.receipt_lag_critical_ms},
           {"receiptLagBumpSompi", a.receipt_lag_bonus},
           {"schedulerCallbackHighMs", a.scheduler_callback_high_ms},
           {"schedulerCallbackCriticalMs", a.scheduler_callback_critical_ms},
           {"schedulerCallbackBumpSompi", a.scheduler_callback_bonus},
           {"tierPermille", a.tier_permille},
           {"staleSoftPermille", a.stale_soft_permille},
           {"staleHardPermille", a.stale_hard_permille},
       }},
      {"preferConsolidation", config.prefer_consolidation},
  };
}

}  // namespace txforge::policy
