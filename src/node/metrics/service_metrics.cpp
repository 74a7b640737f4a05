#include "metrics/service_metrics.hpp"

#include <sstream>

namespace txforge::metrics {

namespace {

constexpr std::string_view kPrefix = "txforge_";

void Increment(std::map<std::string, std::uint64_t, std::less<>>& counters,
               std::string_view label) {
  auto it = counters.find(label);
  if (it == counters.end()) {
    counters.emplace(std::string(label), 1);
  } else {
    ++it->second;
  }
}

void EmitHeader(std::ostringstream& out, std::string_view name, std::string_view help,
                std::string_view type) {
  out << "# HELP " << kPrefix << name << ' ' << help << '\n';
  out << "# TYPE " << kPrefix << name << ' ' << type << '\n';
}

template <typename T>
void Emit(std::ostringstream& out, std::string_view name, std::string_view help,
          std::string_view type, T value) {
  EmitHeader(out, name, help, type);
  out << kPrefix << name << ' ' << value << '\n';
}

void EmitLabeled(std::ostringstream& out, std::string_view name, std::string_view help,
                 std::string_view label,
                 const std::map<std::string, std::uint64_t, std::less<>>& values) {
  EmitHeader(out, name, help, "counter");
  for (const auto& [key, count] : values) {
    out << kPrefix << name << '{' << label << "=\"" << key << "\"} " << count << '\n';
  }
}

}  // namespace

ServiceMetrics::ServiceMetrics() : started_(std::chrono::steady_clock::now()) {}

void ServiceMetrics::AddSaturating(std::atomic<std::uint64_t>& counter, std::uint64_t value) {
  std::uint64_t current = counter.load(std::memory_order_relaxed);
  std::uint64_t next;
  do {
    next = current > UINT64_MAX - value ? UINT64_MAX : current + value;
  } while (!counter.compare_exchange_weak(current, next, std::memory_order_relaxed));
}

void ServiceMetrics::RecordBuildSuccess(const BuildSample& sample) {
  build_success_total_.fetch_add(1, std::memory_order_relaxed);
  AddSaturating(selected_inputs_total_, sample.selected_inputs);
  AddSaturating(candidates_seen_total_, sample.total_candidates);
  AddSaturating(selected_amount_sompi_total_, sample.selected_amount);
  AddSaturating(required_target_sompi_total_, sample.required_target);
  if (sample.selected_amount > sample.required_target) {
    AddSaturating(overfund_sompi_total_, sample.selected_amount - sample.required_target);
  }
  AddSaturating(priority_fee_sompi_total_, sample.priority_fee);
  if (sample.truncated_by_cap) {
    truncated_selections_total_.fetch_add(1, std::memory_order_relaxed);
  }
  if (sample.fallback_all_inputs) {
    fallback_all_inputs_total_.fetch_add(1, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lock(labels_mutex_);
  Increment(selection_mode_total_, sample.selection_mode);
  Increment(fee_mode_total_, sample.fee_mode);
}

void ServiceMetrics::RecordBuildError(std::string_view kind) {
  build_errors_total_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(labels_mutex_);
  Increment(errors_by_kind_, kind);
}

void ServiceMetrics::RecordTelemetryFreshness(policy::Freshness freshness,
                                              std::uint64_t max_age_ms) {
  telemetry_freshness_code_.store(policy::FreshnessCode(freshness), std::memory_order_relaxed);
  telemetry_freshness_max_age_ms_.store(max_age_ms, std::memory_order_relaxed);
  if (freshness == policy::Freshness::kStaleSoft) {
    telemetry_stale_soft_total_.fetch_add(1, std::memory_order_relaxed);
  } else if (freshness == policy::Freshness::kStaleHard) {
    telemetry_stale_hard_total_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string ServiceMetrics::RenderPrometheus() const {
  std::ostringstream out;
  Emit(out, "http_requests_total", "HTTP requests received.", "counter",
       http_requests_total_.load());
  Emit(out, "auth_failures_total", "Requests rejected for missing or wrong token.", "counter",
       auth_failures_total_.load());
  Emit(out, "build_requests_total", "Build requests accepted for processing.", "counter",
       build_requests_total_.load());
  Emit(out, "build_success_total", "Transactions built.", "counter",
       build_success_total_.load());
  Emit(out, "build_errors_total", "Build requests that failed.", "counter",
       build_errors_total_.load());
  Emit(out, "utxo_fetch_errors_total", "Indexer UTXO fetch failures.", "counter",
       utxo_fetch_errors_total_.load());
  Emit(out, "policy_selected_inputs_total", "Inputs used by built transactions.", "counter",
       selected_inputs_total_.load());
  Emit(out, "policy_candidates_seen_total", "Spendable outputs considered.", "counter",
       candidates_seen_total_.load());
  Emit(out, "policy_selected_amount_sompi_total", "Sum of selected input amounts.", "counter",
       selected_amount_sompi_total_.load());
  Emit(out, "policy_required_target_sompi_total", "Sum of required targets.", "counter",
       required_target_sompi_total_.load());
  Emit(out, "policy_overfund_sompi_total", "Selected amount above the required target.",
       "counter", overfund_sompi_total_.load());
  Emit(out, "policy_priority_fee_sompi_total", "Priority fees charged.", "counter",
       priority_fee_sompi_total_.load());
  Emit(out, "policy_truncated_selections_total", "Selections stopped by the input cap.",
       "counter", truncated_selections_total_.load());
  Emit(out, "policy_fallback_all_inputs_total", "Builds that needed the all-inputs retry.",
       "counter", fallback_all_inputs_total_.load());
  Emit(out, "telemetry_summary_fetch_total", "Telemetry summary fetches.", "counter",
       telemetry_fetch_total_.load());
  Emit(out, "telemetry_summary_fetch_errors_total", "Failed telemetry summary fetches.",
       "counter", telemetry_fetch_errors_total_.load());
  Emit(out, "telemetry_summary_cache_hits_total", "Telemetry summaries served from cache.",
       "counter", telemetry_cache_hits_total_.load());
  Emit(out, "telemetry_summary_stale_soft_total", "Resolutions on soft-stale telemetry.",
       "counter", telemetry_stale_soft_total_.load());
  Emit(out, "telemetry_summary_stale_hard_total", "Resolutions on hard-stale telemetry.",
       "counter", telemetry_stale_hard_total_.load());
  Emit(out, "telemetry_summary_freshness_state", "1 fresh, 2 stale_soft, 3 stale_hard.",
       "gauge", telemetry_freshness_code_.load());
  Emit(out, "telemetry_summary_freshness_max_age_ms", "Oldest summary used last.", "gauge",
       telemetry_freshness_max_age_ms_.load());
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_)
                          .count();
  Emit(out, "uptime_seconds", "Seconds since start.", "gauge", uptime);
  {
    std::lock_guard<std::mutex> lock(labels_mutex_);
    EmitLabeled(out, "build_errors_by_kind_total", "Build failures by kind.", "kind",
                errors_by_kind_);
    EmitLabeled(out, "policy_selection_mode_total", "Builds by coin selection mode.", "mode",
                selection_mode_total_);
    EmitLabeled(out, "policy_fee_mode_total", "Builds by priority fee mode.", "mode",
                fee_mode_total_);
  }
  return out.str();
}

}  // namespace txforge::metrics
