#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "policy/telemetry_snapshot.hpp"
#include "primitives/amount.hpp"

namespace txforge::metrics {

// What a successful build contributes to the counters.
struct BuildSample {
  std::string_view selection_mode;
  std::string_view fee_mode;
  std::uint64_t selected_inputs{0};
  std::uint64_t total_candidates{0};
  primitives::Amount selected_amount{0};
  primitives::Amount required_target{0};
  primitives::Amount priority_fee{0};
  bool truncated_by_cap{false};
  bool fallback_all_inputs{false};
};

// Process-wide counters and gauges, rendered in the Prometheus text format.
// Every counter is monotonic; sums of amounts saturate instead of wrapping.
class ServiceMetrics {
 public:
  ServiceMetrics();

  void RecordHttpRequest() { http_requests_total_.fetch_add(1, std::memory_order_relaxed); }
  void RecordAuthFailure() { auth_failures_total_.fetch_add(1, std::memory_order_relaxed); }
  void RecordBuildRequest() { build_requests_total_.fetch_add(1, std::memory_order_relaxed); }
  void RecordUtxoFetchError() { utxo_fetch_errors_total_.fetch_add(1, std::memory_order_relaxed); }
  void RecordTelemetryFetch() { telemetry_fetch_total_.fetch_add(1, std::memory_order_relaxed); }
  void RecordTelemetryFetchError() {
    telemetry_fetch_errors_total_.fetch_add(1, std::memory_order_relaxed);
  }
  void RecordTelemetryCacheHit() {
    telemetry_cache_hits_total_.fetch_add(1, std::memory_order_relaxed);
  }

  void RecordBuildSuccess(const BuildSample& sample);
  void RecordBuildError(std::string_view kind);
  // Called once per resolution that consulted at least one summary source.
  void RecordTelemetryFreshness(policy::Freshness freshness, std::uint64_t max_age_ms);

  std::uint64_t build_requests_total() const { return build_requests_total_.load(); }
  std::uint64_t build_success_total() const { return build_success_total_.load(); }
  std::uint64_t build_errors_total() const { return build_errors_total_.load(); }
  std::uint64_t fallback_all_inputs_total() const { return fallback_all_inputs_total_.load(); }
  std::uint64_t telemetry_fetch_total() const { return telemetry_fetch_total_.load(); }
  std::uint64_t telemetry_cache_hits_total() const { return telemetry_cache_hits_total_.load(); }
  std::uint64_t auth_failures_total() const { return auth_failures_total_.load(); }

  std::string RenderPrometheus() const;

 private:
  static void AddSaturating(std::atomic<std::uint64_t>& counter, std::uint64_t value);

  const std::chrono::steady_clock::time_point started_;

  std::atomic<std::uint64_t> http_requests_total_{0};
  std::atomic<std::uint64_t> auth_failures_total_{0};
  std::atomic<std::uint64_t> build_requests_total_{0};
  std::atomic<std::uint64_t> build_success_total_{0};
  std::atomic<std::uint64_t> build_errors_total_{0};
  std::atomic<std::uint64_t> utxo_fetch_errors_total_{0};
  std::atomic<std::uint64_t> selected_inputs_total_{0};
  std::atomic<std::uint64_t> candidates_seen_total_{0};
  std::atomic<std::uint64_t> selected_amount_sompi_total_{0};
  std::atomic<std::uint64_t> required_target_sompi_total_{0};
  std::atomic<std::uint64_t> overfund_sompi_total_{0};
  std::atomic<std::uint64_t> priority_fee_sompi_total_{0};
  std::atomic<std::uint64_t> truncated_selections_total_{0};
  std::atomic<std::uint64_t> fallback_all_inputs_total_{0};
  std::atomic<std::uint64_t> telemetry_fetch_total_{0};
  std::atomic<std::uint64_t> telemetry_fetch_errors_total_{0};
  std::atomic<std::uint64_t> telemetry_cache_hits_total_{0};
  std::atomic<std::uint64_t> telemetry_stale_soft_total_{0};
  std::atomic<std::uint64_t> telemetry_stale_hard_total_{0};
  std::atomic<int> telemetry_freshness_code_{0};
  std::atomic<std::uint64_t> telemetry_freshness_max_age_ms_{0};

  mutable std::mutex labels_mutex_;
  std::map<std::string, std::uint64_t, std::less<>> errors_by_kind_;
  std::map<std::string, std::uint64_t, std::less<>> selection_mode_total_;
  std::map<std::string, std::uint64_t, std::less<>> fee_mode_total_;
};

}  // namespace txforge::metrics
