#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "metrics/service_metrics.hpp"
#include "policy/telemetry_snapshot.hpp"

namespace txforge::telemetry {

// Milliseconds on any monotonic scale.
using Clock = std::function<std::uint64_t()>;
// Returns the summary document or nullopt with |error| set.
using SummaryFetcher = std::function<std::optional<nlohmann::json>(std::string* error)>;

Clock SteadyClock();

struct CacheWindows {
  std::uint64_t ttl_ms{5000};
  std::uint64_t timeout_ms{3000};
  std::uint64_t stale_hard_ms{0};  // 0 derives max(60000, 12 * ttl_ms).
};

// Applies minimums and derives stale_hard_ms.
CacheWindows NormalizeWindows(CacheWindows windows);

struct Reading {
  std::optional<nlohmann::json> value;
  policy::Freshness freshness{policy::Freshness::kStaleHard};
  std::uint64_t age_ms{0};
  bool from_cache{false};
  std::string error;
};

// TTL cache over one remote summary. Concurrent misses share a single
// fetch: the first caller fetches and the others wait for its result.
class SummarySource {
 public:
  SummarySource(std::string name, SummaryFetcher fetcher, CacheWindows windows, Clock clock,
                metrics::ServiceMetrics* metrics = nullptr);

  Reading Get();
  nlohmann::json Describe() const;
  const std::string& name() const { return name_; }

 private:
  struct Entry {
    std::uint64_t ts{0};
    nlohmann::json value;
  };

  Reading StaleReadingLocked(std::uint64_t now, std::string error) const;

  const std::string name_;
  const SummaryFetcher fetcher_;
  const CacheWindows windows_;
  const Clock clock_;
  metrics::ServiceMetrics* metrics_;

  mutable std::mutex mutex_;
  std::optional<Entry> entry_;
  std::optional<std::shared_future<Reading>> inflight_;
  std::string last_error_;
};

// Combines the callback-consumer and scheduler summaries with caller
// supplied telemetry. Either source may be absent (unconfigured).
class TelemetryCache {
 public:
  TelemetryCache(std::unique_ptr<SummarySource> callback, std::unique_ptr<SummarySource> scheduler,
                 metrics::ServiceMetrics* metrics = nullptr);

  // Fills the gaps in |partial| from the summaries. Caller values always
  // win. A source is only consulted when one of the fields it feeds is
  // missing; a fully supplied snapshot comes back Fresh.
  policy::TelemetrySnapshot Resolve(const policy::TelemetrySnapshot& partial);

  nlohmann::json Describe() const;

 private:
  std::unique_ptr<SummarySource> callback_;
  std::unique_ptr<SummarySource> scheduler_;
  metrics::ServiceMetrics* metrics_;
};

// Merge rules, exposed for tests. Either summary may be null.
policy::TelemetrySnapshot MergeSummaries(const policy::TelemetrySnapshot& partial,
                                         const nlohmann::json* callback_summary,
                                         const nlohmann::json* scheduler_summary);

// Fetcher performing an authenticated GET of |url| bounded by |timeout_ms|.
SummaryFetcher HttpSummaryFetcher(std::string url, std::string bearer_token, int timeout_ms);

}  // namespace txforge::telemetry
