#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "metrics/service_metrics.hpp"
#include "telemetry/summary_cache.hpp"

using txforge::policy::Freshness;
using txforge::policy::TelemetrySnapshot;
using namespace txforge::telemetry;

namespace {

struct FakeClock {
  std::shared_ptr<std::atomic<std::uint64_t>> now = std::make_shared<std::atomic<std::uint64_t>>(1000);
  Clock AsClock() const {
    auto ptr = now;
    return [ptr] { return ptr->load(); };
  }
  void Advance(std::uint64_t ms) { now->fetch_add(ms); }
};

// Fetcher whose availability can be toggled; counts invocations.
struct ScriptedFetcher {
  std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
  std::shared_ptr<std::atomic<bool>> healthy = std::make_shared<std::atomic<bool>>(true);
  nlohmann::json value;

  SummaryFetcher AsFetcher() const {
    auto count = calls;
    auto ok = healthy;
    auto doc = value;
    return [count, ok, doc](std::string* error) -> std::optional<nlohmann::json> {
      count->fetch_add(1);
      if (!ok->load()) {
        if (error) *error = "connection refused";
        return std::nullopt;
      }
      return doc;
    };
  }
};

CacheWindows Windows() {
  CacheWindows windows;
  windows.ttl_ms = 5000;
  windows.timeout_ms = 3000;
  return windows;  // stale_hard derives to 60000
}

}  // namespace

int main() {
  {
    const auto windows = NormalizeWindows(CacheWindows{10, 10, 0});
    if (windows.ttl_ms != 250 || windows.timeout_ms != 250 || windows.stale_hard_ms != 60000) {
      std::cerr << "window minimums not applied\n";
      return EXIT_FAILURE;
    }
    if (NormalizeWindows(CacheWindows{10000, 3000, 0}).stale_hard_ms != 120000) {
      std::cerr << "stale_hard should derive to 12 x ttl\n";
      return EXIT_FAILURE;
    }
  }

  {
    FakeClock clock;
    ScriptedFetcher fetcher;
    fetcher.value = {{"receipts", {{"confirmationLatencyMs", {{"p95", 4200}}}}}};
    txforge::metrics::ServiceMetrics metrics;
    SummarySource source("callback", fetcher.AsFetcher(), Windows(), clock.AsClock(), &metrics);

    const Reading first = source.Get();
    if (!first.value || first.freshness != Freshness::kFresh || first.from_cache) {
      std::cerr << "first read should fetch a fresh value\n";
      return EXIT_FAILURE;
    }
    clock.Advance(4999);
    const Reading cached = source.Get();
    if (!cached.from_cache || cached.freshness != Freshness::kFresh || fetcher.calls->load() != 1 ||
        cached.age_ms != 4999) {
      std::cerr << "read inside the TTL should be served from cache\n";
      return EXIT_FAILURE;
    }
    if (metrics.telemetry_cache_hits_total() != 1 || metrics.telemetry_fetch_total() != 1) {
      std::cerr << "cache hit and fetch counters not recorded\n";
      return EXIT_FAILURE;
    }

    fetcher.healthy->store(false);
    clock.Advance(10000);
    const Reading soft = source.Get();
    if (!soft.value || soft.freshness != Freshness::kStaleSoft || soft.error.empty() ||
        soft.age_ms != 14999 || fetcher.calls->load() != 2) {
      std::cerr << "failed refresh should serve the cached value as stale_soft\n";
      return EXIT_FAILURE;
    }
    if (source.Describe().at("lastError") != "connection refused") {
      std::cerr << "last error not reported by Describe\n";
      return EXIT_FAILURE;
    }

    clock.Advance(60000);
    const Reading hard = source.Get();
    if (!hard.value || hard.freshness != Freshness::kStaleHard) {
      std::cerr << "value older than stale_hard should be stale_hard\n";
      return EXIT_FAILURE;
    }

    fetcher.healthy->store(true);
    const Reading recovered = source.Get();
    if (recovered.freshness != Freshness::kFresh || !recovered.error.empty() ||
        source.Describe().at("lastError") != "") {
      std::cerr << "successful refresh should clear the error\n";
      return EXIT_FAILURE;
    }
  }

  {
    FakeClock clock;
    SummarySource source(
        "scheduler",
        [](std::string*) -> std::optional<nlohmann::json> {
          throw std::runtime_error("boom");
        },
        Windows(), clock.AsClock());
    const Reading reading = source.Get();
    if (reading.value || reading.freshness != Freshness::kStaleHard ||
        reading.error.find("boom") == std::string::npos) {
      std::cerr << "throwing fetcher without a cached value should be stale_hard\n";
      return EXIT_FAILURE;
    }
  }

  {
    // Concurrent misses share one fetch.
    FakeClock clock;
    auto calls = std::make_shared<std::atomic<int>>(0);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    SummarySource source(
        "callback",
        [calls, gate](std::string*) -> std::optional<nlohmann::json> {
          calls->fetch_add(1);
          gate.wait();
          return nlohmann::json{{"ok", true}};
        },
        Windows(), clock.AsClock());

    std::vector<std::thread> threads;
    std::atomic<int> fresh{0};
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&] {
        if (source.Get().freshness == Freshness::kFresh) {
          fresh.fetch_add(1);
        }
      });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();
    for (auto& t : threads) {
      t.join();
    }
    if (calls->load() != 1 || fresh.load() != 8) {
      std::cerr << "single-flight violated: fetches=" << calls->load() << "\n";
      return EXIT_FAILURE;
    }
  }

  {
    const nlohmann::json callback = {
        {"receipts", {{"receiptLagMs", {{"p95", 8000}}}}},
    };
    const nlohmann::json scheduler = {
        {"callbacks", {{"latencyP95BucketMs", 1000}}},
    };
    const auto merged = MergeSummaries(TelemetrySnapshot{}, &callback, &scheduler);
    // Confirm latency derived from receipt lag (3/4), congestion from the
    // callback bucket (1000 / 2500 = 40%).
    if (merged.observed_confirm_p95_ms != 6000u || merged.daa_congestion_pct != 40u ||
        merged.receipt_lag_p95_ms != 8000u || merged.scheduler_callback_p95_ms != 1000u) {
      std::cerr << "summary merge rules produced unexpected values\n";
      return EXIT_FAILURE;
    }

    const nlohmann::json bucket_only = {{"callbacks", {{"latencyP95BucketMs", 50}}}};
    const auto from_bucket = MergeSummaries(TelemetrySnapshot{}, nullptr, &bucket_only);
    if (from_bucket.observed_confirm_p95_ms != 1000u || from_bucket.daa_congestion_pct != 2u) {
      std::cerr << "bucket-derived confirm latency should be floored at 1000 ms\n";
      return EXIT_FAILURE;
    }

    TelemetrySnapshot partial;
    partial.observed_confirm_p95_ms = 777;
    const nlohmann::json saturated = {{"scheduler", {{"saturationProxyPct", 250}}}};
    const auto caller_wins = MergeSummaries(partial, &callback, &saturated);
    if (caller_wins.observed_confirm_p95_ms != 777u || caller_wins.daa_congestion_pct != 100u) {
      std::cerr << "caller values must win and congestion must be clamped\n";
      return EXIT_FAILURE;
    }
  }

  {
    FakeClock clock;
    ScriptedFetcher callback_fetcher;
    callback_fetcher.value = {{"receipts", {{"confirmationLatencyMs", {{"p95Ms", 9000}}}}}};
    ScriptedFetcher scheduler_fetcher;
    scheduler_fetcher.healthy->store(false);
    TelemetryCache cache(
        std::make_unique<SummarySource>("callback", callback_fetcher.AsFetcher(), Windows(),
                                        clock.AsClock()),
        std::make_unique<SummarySource>("scheduler", scheduler_fetcher.AsFetcher(), Windows(),
                                        clock.AsClock()));

    TelemetrySnapshot complete;
    complete.observed_confirm_p95_ms = 100;
    complete.daa_congestion_pct = 5;
    complete.receipt_lag_p95_ms = 200;
    complete.scheduler_callback_p95_ms = 300;
    const auto untouched = cache.Resolve(complete);
    if (untouched.freshness != Freshness::kFresh || callback_fetcher.calls->load() != 0 ||
        scheduler_fetcher.calls->load() != 0) {
      std::cerr << "complete caller telemetry must skip the summaries\n";
      return EXIT_FAILURE;
    }

    TelemetrySnapshot needs_congestion;
    needs_congestion.observed_confirm_p95_ms = 100;
    needs_congestion.receipt_lag_p95_ms = 200;
    const auto degraded = cache.Resolve(needs_congestion);
    if (callback_fetcher.calls->load() != 0 || scheduler_fetcher.calls->load() != 1 ||
        degraded.freshness != Freshness::kStaleHard || degraded.daa_congestion_pct) {
      std::cerr << "only the scheduler should be consulted, and its failure reported\n";
      return EXIT_FAILURE;
    }

    const auto merged = cache.Resolve(TelemetrySnapshot{});
    if (merged.observed_confirm_p95_ms != 9000u || merged.freshness != Freshness::kStaleHard) {
      std::cerr << "freshness must be the worst of the consulted sources\n";
      return EXIT_FAILURE;
    }

    const auto description = cache.Describe();
    if (!description.at("callback").at("configured").get<bool>() ||
        description.at("scheduler").at("hasValue").get<bool>()) {
      std::cerr << "cache description is wrong: " << description.dump() << "\n";
      return EXIT_FAILURE;
    }
  }

  {
    FakeClock clock;
    ScriptedFetcher callback_fetcher;
    callback_fetcher.value = {{"receipts",
                               {{"confirmationLatencyMs", {{"p95", 4000}}},
                                {"receiptLagMs", {{"p95", 50000}}}}}};
    ScriptedFetcher scheduler_fetcher;
    scheduler_fetcher.value = {{"scheduler", {{"saturationProxyPct", 40}}},
                               {"callbacks", {{"latencyP95BucketMs", 1500}}}};
    TelemetryCache cache(
        std::make_unique<SummarySource>("callback", callback_fetcher.AsFetcher(), Windows(),
                                        clock.AsClock()),
        std::make_unique<SummarySource>("scheduler", scheduler_fetcher.AsFetcher(), Windows(),
                                        clock.AsClock()));

    TelemetrySnapshot headline_only;
    headline_only.observed_confirm_p95_ms = 10000;
    headline_only.daa_congestion_pct = 10;
    const auto filled = cache.Resolve(headline_only);
    if (filled.observed_confirm_p95_ms != 10000u || filled.daa_congestion_pct != 10u ||
        filled.receipt_lag_p95_ms != 50000u || filled.scheduler_callback_p95_ms != 1500u ||
        callback_fetcher.calls->load() != 1 || scheduler_fetcher.calls->load() != 1) {
      std::cerr << "receipt lag and scheduler callback latency must come from the summaries\n";
      return EXIT_FAILURE;
    }

    TelemetrySnapshot congestion_only;
    congestion_only.daa_congestion_pct = 10;
    const auto from_scheduler = cache.Resolve(congestion_only);
    if (from_scheduler.daa_congestion_pct != 10u ||
        from_scheduler.scheduler_callback_p95_ms != 1500u ||
        from_scheduler.observed_confirm_p95_ms != 4000u ||
        from_scheduler.freshness != Freshness::kFresh) {
      std::cerr << "caller congestion must not hide the scheduler callback latency\n";
      return EXIT_FAILURE;
    }
  }

  {
    FakeClock clock;
    std::atomic<int> calls{0};
    SummarySource source(
        "odd",
        [&calls](std::string*) -> std::optional<nlohmann::json> {
          if (calls.fetch_add(1) == 0) {
            throw 42;
          }
          return nlohmann::json{{"ok", true}};
        },
        Windows(), clock.AsClock());
    const auto failed = source.Get();
    if (failed.value || failed.error.empty()) {
      std::cerr << "a non-standard exception must still fail the fetch\n";
      return EXIT_FAILURE;
    }
    const auto recovered = source.Get();
    if (!recovered.value || calls.load() != 2) {
      std::cerr << "the source must fetch again after a non-standard exception\n";
      return EXIT_FAILURE;
    }
  }

  {
    TelemetryCache empty(nullptr, nullptr);
    const auto snapshot = empty.Resolve(TelemetrySnapshot{});
    if (snapshot.freshness != Freshness::kFresh || snapshot.observed_confirm_p95_ms ||
        empty.Describe().at("callback").at("configured").get<bool>()) {
      std::cerr << "unconfigured sources should leave the snapshot empty and fresh\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
