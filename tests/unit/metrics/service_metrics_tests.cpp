#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "metrics/service_metrics.hpp"

using txforge::metrics::BuildSample;
using txforge::metrics::ServiceMetrics;

namespace {

bool Contains(const std::string& text, const std::string& needle) {
  if (text.find(needle) == std::string::npos) {
    std::cerr << "missing metric line: " << needle << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  ServiceMetrics metrics;
  metrics.RecordHttpRequest();
  metrics.RecordHttpRequest();
  metrics.RecordBuildRequest();
  metrics.RecordBuildError("no_spendable_outputs");
  metrics.RecordBuildError("no_spendable_outputs");
  metrics.RecordBuildError("backend_unavailable");

  BuildSample sample;
  sample.selection_mode = "auto";
  sample.fee_mode = "adaptive";
  sample.selected_inputs = 3;
  sample.total_candidates = 7;
  sample.selected_amount = 1'000'000;
  sample.required_target = 900'000;
  sample.priority_fee = 5'000;
  sample.truncated_by_cap = true;
  metrics.RecordBuildSuccess(sample);

  BuildSample huge = sample;
  huge.selected_amount = UINT64_MAX - 10;
  huge.required_target = 0;
  metrics.RecordBuildSuccess(huge);

  metrics.RecordTelemetryFreshness(txforge::policy::Freshness::kStaleSoft, 12'000);

  const std::string text = metrics.RenderPrometheus();
  if (!Contains(text, "# TYPE txforge_http_requests_total counter\n") ||
      !Contains(text, "txforge_http_requests_total 2\n") ||
      !Contains(text, "txforge_build_success_total 2\n") ||
      !Contains(text, "txforge_build_errors_total 3\n") ||
      !Contains(text, "txforge_policy_selected_inputs_total 6\n") ||
      !Contains(text, "txforge_policy_truncated_selections_total 2\n") ||
      !Contains(text, "txforge_policy_selected_amount_sompi_total 18446744073709551615\n") ||
      !Contains(text, "txforge_build_errors_by_kind_total{kind=\"no_spendable_outputs\"} 2\n") ||
      !Contains(text, "txforge_build_errors_by_kind_total{kind=\"backend_unavailable\"} 1\n") ||
      !Contains(text, "txforge_policy_fee_mode_total{mode=\"adaptive\"} 2\n") ||
      !Contains(text, "txforge_telemetry_summary_freshness_state 2\n") ||
      !Contains(text, "txforge_telemetry_summary_freshness_max_age_ms 12000\n") ||
      !Contains(text, "txforge_telemetry_summary_stale_soft_total 1\n") ||
      !Contains(text, "# TYPE txforge_uptime_seconds gauge\n")) {
    return EXIT_FAILURE;
  }
  if (metrics.build_success_total() != 2 || metrics.fallback_all_inputs_total() != 0) {
    std::cerr << "accessors disagree with recorded events\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
