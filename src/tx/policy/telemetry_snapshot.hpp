#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace txforge::policy {

// How far the cached telemetry behind a snapshot can be trusted.
enum class Freshness {
  kFresh,
  kStaleSoft,
  kStaleHard,
};

inline const char* FreshnessName(Freshness freshness) {
  switch (freshness) {
    case Freshness::kFresh:
      return "fresh";
    case Freshness::kStaleSoft:
      return "stale_soft";
    case Freshness::kStaleHard:
      return "stale_hard";
  }
  return "unknown";
}

// Numeric code exported as a gauge (0 is reserved for "never evaluated").
inline int FreshnessCode(Freshness freshness) { return static_cast<int>(freshness) + 1; }

inline Freshness WorseFreshness(Freshness a, Freshness b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

// Congestion and latency signals used by the adaptive fee. Fields are unset
// when neither the caller nor a telemetry source provided them.
struct TelemetrySnapshot {
  std::optional<std::uint64_t> observed_confirm_p95_ms;
  std::optional<std::uint32_t> daa_congestion_pct;  // 0..100
  std::optional<std::uint64_t> receipt_lag_p95_ms;
  std::optional<std::uint64_t> scheduler_callback_p95_ms;
  Freshness freshness{Freshness::kFresh};
  std::uint64_t freshness_max_age_ms{0};
};

}  // namespace txforge::policy
