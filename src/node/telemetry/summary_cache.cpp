#include "telemetry/summary_cache.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <initializer_list>

#include "net/http_client.hpp"
#include "util/log.hpp"

namespace txforge::telemetry {

namespace {

constexpr std::uint64_t kMinWindowMs = 250;
constexpr std::uint64_t kMinStaleHardMs = 60000;
constexpr std::size_t kMaxErrorLength = 240;

// Positive numeric field, rounded; absent, zero and negative values are
// treated as "no signal".
std::optional<std::uint64_t> PositiveField(const nlohmann::json* object,
                                           std::initializer_list<const char*> path) {
  const nlohmann::json* node = object;
  for (const char* key : path) {
    if (node == nullptr || !node->is_object()) {
      return std::nullopt;
    }
    auto it = node->find(key);
    if (it == node->end()) {
      return std::nullopt;
    }
    node = &*it;
  }
  if (node == nullptr || !node->is_number()) {
    return std::nullopt;
  }
  const double value = node->get<double>();
  if (!std::isfinite(value) || value <= 0 || value > 1e15) {
    return std::nullopt;
  }
  const auto rounded = static_cast<std::uint64_t>(std::llround(value));
  if (rounded == 0) {
    return std::nullopt;
  }
  return rounded;
}

template <typename T>
std::optional<T> FirstOf(std::optional<T> a, std::optional<T> b) {
  return a ? a : b;
}

}  // namespace

Clock SteadyClock() {
  return [] {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now().time_since_epoch())
                                          .count());
  };
}

CacheWindows NormalizeWindows(CacheWindows windows) {
  windows.ttl_ms = std::max(windows.ttl_ms, kMinWindowMs);
  windows.timeout_ms = std::max(windows.timeout_ms, kMinWindowMs);
  if (windows.stale_hard_ms == 0) {
    windows.stale_hard_ms = std::max(kMinStaleHardMs, 12 * windows.ttl_ms);
  }
  windows.stale_hard_ms = std::max(windows.stale_hard_ms, windows.ttl_ms);
  return windows;
}

SummarySource::SummarySource(std::string name, SummaryFetcher fetcher, CacheWindows windows,
                             Clock clock, metrics::ServiceMetrics* metrics)
    : name_(std::move(name)),
      fetcher_(std::move(fetcher)),
      windows_(NormalizeWindows(windows)),
      clock_(clock ? std::move(clock) : SteadyClock()),
      metrics_(metrics) {}

Reading SummarySource::StaleReadingLocked(std::uint64_t now, std::string error) const {
  Reading reading;
  reading.error = std::move(error);
  if (!entry_) {
    reading.freshness = policy::Freshness::kStaleHard;
    return reading;
  }
  reading.value = entry_->value;
  reading.from_cache = true;
  reading.age_ms = now >= entry_->ts ? now - entry_->ts : 0;
  reading.freshness = reading.age_ms <= windows_.stale_hard_ms ? policy::Freshness::kStaleSoft
                                                              : policy::Freshness::kStaleHard;
  return reading;
}

Reading SummarySource::Get() {
  std::promise<Reading> promise;
  std::shared_future<Reading> waiter;
  bool leader = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t now = clock_();
    if (entry_ && now >= entry_->ts && now - entry_->ts < windows_.ttl_ms) {
      if (metrics_) metrics_->RecordTelemetryCacheHit();
      Reading hit;
      hit.value = entry_->value;
      hit.freshness = policy::Freshness::kFresh;
      hit.age_ms = now - entry_->ts;
      hit.from_cache = true;
      return hit;
    }
    if (inflight_) {
      waiter = *inflight_;
    } else {
      waiter = promise.get_future().share();
      inflight_ = waiter;
      leader = true;
    }
  }
  if (!leader) {
    return waiter.get();
  }

  if (metrics_) metrics_->RecordTelemetryFetch();
  std::string error;
  std::optional<nlohmann::json> value;
  try {
    value = fetcher_(&error);
  } catch (const std::exception& e) {
    error = e.what();
    value.reset();
  } catch (...) {
    error = "telemetry summary fetcher threw a non-standard exception";
    value.reset();
  }
  if (!value && error.empty()) {
    error = "telemetry summary fetch failed";
  }

  Reading reading;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t now = clock_();
    if (value) {
      entry_ = Entry{now, *value};
      last_error_.clear();
      reading.value = std::move(value);
      reading.freshness = policy::Freshness::kFresh;
    } else {
      last_error_ = error.substr(0, kMaxErrorLength);
      reading = StaleReadingLocked(now, last_error_);
    }
    inflight_.reset();
  }
  if (!reading.error.empty()) {
    if (metrics_) metrics_->RecordTelemetryFetchError();
    util::LogPrint(util::LogLevel::kWarn, "telemetry",
                   name_ + " summary unavailable (" + reading.error + "), serving " +
                       policy::FreshnessName(reading.freshness));
  }
  promise.set_value(reading);
  return reading;
}

nlohmann::json SummarySource::Describe() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json out = {
      {"configured", true},
      {"ttlMs", windows_.ttl_ms},
      {"timeoutMs", windows_.timeout_ms},
      {"staleHardMs", windows_.stale_hard_ms},
      {"hasValue", entry_.has_value()},
      {"lastError", last_error_},
  };
  if (entry_) {
    const std::uint64_t now = clock_();
    out["ageMs"] = now >= entry_->ts ? now - entry_->ts : 0;
  } else {
    out["ageMs"] = nullptr;
  }
  return out;
}

policy::TelemetrySnapshot MergeSummaries(const policy::TelemetrySnapshot& partial,
                                         const nlohmann::json* callback_summary,
                                         const nlohmann::json* scheduler_summary) {
  policy::TelemetrySnapshot merged = partial;
  const auto confirm_p95 =
      FirstOf(PositiveField(callback_summary, {"receipts", "confirmationLatencyMs", "p95"}),
              PositiveField(callback_summary, {"receipts", "confirmationLatencyMs", "p95Ms"}));
  const auto receipt_lag = PositiveField(callback_summary, {"receipts", "receiptLagMs", "p95"});
  const auto saturation =
      FirstOf(PositiveField(scheduler_summary, {"scheduler", "saturationProxyPct"}),
              PositiveField(scheduler_summary, {"scheduler", "saturation_pct"}));
  const auto callback_bucket =
      PositiveField(scheduler_summary, {"callbacks", "latencyP95BucketMs"});

  if (!merged.observed_confirm_p95_ms) {
    if (confirm_p95) {
      merged.observed_confirm_p95_ms = confirm_p95;
    } else if (receipt_lag) {
      merged.observed_confirm_p95_ms = std::max<std::uint64_t>(1000, (*receipt_lag * 3 + 2) / 4);
    } else if (callback_bucket) {
      merged.observed_confirm_p95_ms = std::max<std::uint64_t>(1000, *callback_bucket * 8);
    }
  }
  if (!merged.daa_congestion_pct) {
    if (saturation) {
      merged.daa_congestion_pct = static_cast<std::uint32_t>(std::min<std::uint64_t>(*saturation, 100));
    } else if (callback_bucket) {
      // round(bucket / 2500 * 100)
      merged.daa_congestion_pct =
          static_cast<std::uint32_t>(std::min<std::uint64_t>((*callback_bucket + 12) / 25, 100));
    }
  }
  if (!merged.receipt_lag_p95_ms && receipt_lag) {
    merged.receipt_lag_p95_ms = receipt_lag;
  }
  if (!merged.scheduler_callback_p95_ms && callback_bucket) {
    merged.scheduler_callback_p95_ms = callback_bucket;
  }
  return merged;
}

TelemetryCache::TelemetryCache(std::unique_ptr<SummarySource> callback,
                               std::unique_ptr<SummarySource> scheduler,
                               metrics::ServiceMetrics* metrics)
    : callback_(std::move(callback)), scheduler_(std::move(scheduler)), metrics_(metrics) {}

policy::TelemetrySnapshot TelemetryCache::Resolve(const policy::TelemetrySnapshot& partial) {
  policy::TelemetrySnapshot snapshot = partial;
  snapshot.freshness = policy::Freshness::kFresh;
  snapshot.freshness_max_age_ms = 0;
  const bool needs_callback = !partial.observed_confirm_p95_ms || !partial.receipt_lag_p95_ms;
  const bool needs_scheduler =
      !partial.daa_congestion_pct || !partial.scheduler_callback_p95_ms;
  if (!needs_callback && !needs_scheduler) {
    return snapshot;
  }

  std::optional<Reading> callback_reading;
  std::optional<Reading> scheduler_reading;
  if (needs_callback && callback_) {
    callback_reading = callback_->Get();
  }
  if (needs_scheduler && scheduler_) {
    scheduler_reading = scheduler_->Get();
  }
  if (!callback_reading && !scheduler_reading) {
    return snapshot;
  }

  auto merged = MergeSummaries(
      snapshot, callback_reading && callback_reading->value ? &*callback_reading->value : nullptr,
      scheduler_reading && scheduler_reading->value ? &*scheduler_reading->value : nullptr);
  merged.freshness = policy::Freshness::kFresh;
  for (const auto* reading : {callback_reading ? &*callback_reading : nullptr,
                              scheduler_reading ? &*scheduler_reading : nullptr}) {
    if (reading == nullptr) {
      continue;
    }
    merged.freshness = policy::WorseFreshness(merged.freshness, reading->freshness);
    merged.freshness_max_age_ms = std::max(merged.freshness_max_age_ms, reading->age_ms);
  }
  if (metrics_) {
    metrics_->RecordTelemetryFreshness(merged.freshness, merged.freshness_max_age_ms);
  }
  return merged;
}

nlohmann::json TelemetryCache::Describe() const {
  const nlohmann::json unconfigured = {{"configured", false}};
  return {
      {"callback", callback_ ? callback_->Describe() : unconfigured},
      {"scheduler", scheduler_ ? scheduler_->Describe() : unconfigured},
  };
}

SummaryFetcher HttpSummaryFetcher(std::string url, std::string bearer_token, int timeout_ms) {
  return [url = std::move(url), token = std::move(bearer_token),
          timeout_ms](std::string* error) -> std::optional<nlohmann::json> {
    net::HttpRequestOptions options;
    options.timeout_ms = timeout_ms;
    options.bearer_token = token;
    options.max_body_bytes = 1024 * 1024;
    return net::HttpGetJson(url, options, error);
  };
}

}  // namespace txforge::telemetry
