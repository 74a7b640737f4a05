#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "metrics/service_metrics.hpp"
#include "node/build_orchestrator.hpp"
#include "rpc/http_server.hpp"
#include "telemetry/summary_cache.hpp"

namespace txforge::rpc {

struct AuthOptions {
  // Empty disables authentication.
  std::vector<std::string> tokens;
  // Also require a token for GET routes other than /health.
  bool auth_reads{false};
};

struct CorsOptions {
  // "*" echoes any Origin; otherwise unknown origins get "null".
  std::vector<std::string> allowed_origins{"*"};
};

// Routes HTTP requests onto the build orchestrator:
//   GET  /health
//   GET  /metrics
//   POST /v1/build-tx (alias /v1/kastle/build-tx-json)
//   OPTIONS on any path answers the CORS preflight with 204.
class TxBuilderService {
 public:
  TxBuilderService(node::BuildOrchestrator& orchestrator, telemetry::TelemetryCache& telemetry,
                   metrics::ServiceMetrics& metrics, AuthOptions auth,
                   nlohmann::json backends = nlohmann::json::object(), CorsOptions cors = {});

  HttpResponse Handle(const HttpRequest& request);

 private:
  HttpResponse Route(const HttpRequest& request);
  std::string ResolveOrigin(const HttpRequest& request) const;
  bool RequiresAuth(const HttpRequest& request) const;
  bool Authorized(const HttpRequest& request) const;
  HttpResponse HandleHealth() const;
  HttpResponse HandleMetrics() const;
  HttpResponse HandleBuild(const HttpRequest& request);

  node::BuildOrchestrator& orchestrator_;
  telemetry::TelemetryCache& telemetry_;
  metrics::ServiceMetrics& metrics_;
  AuthOptions auth_;
  nlohmann::json backends_;
  CorsOptions cors_;
};

int StatusForBuildError(node::BuildErrorKind kind);
nlohmann::json BuildResponseBody(const node::BuildResult& result);

}  // namespace txforge::rpc
