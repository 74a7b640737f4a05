#include "rpc/service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include "config/network.hpp"
#include "policy/policy_config.hpp"

namespace txforge::rpc {

namespace {

constexpr char kServiceName[] = "txforge";
constexpr char kBuildPath[] = "/v1/build-tx";
constexpr char kKastleBuildPath[] = "/v1/kastle/build-tx-json";
constexpr char kCorsMethods[] = "GET,POST,OPTIONS";
constexpr char kCorsHeaders[] = "Content-Type,Authorization,X-Tx-Builder-Token";

bool IsRoute(std::string_view path) {
  return path == "/health" || path == "/metrics" || path == kBuildPath ||
         path == kKastleBuildPath;
}

std::string Trim(std::string_view value) {
  std::size_t first = 0;
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  std::size_t last = value.size();
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return std::string(value.substr(first, last - first));
}

std::string BearerToken(const HttpRequest& request) {
  if (auto header = request.Header("Authorization")) {
    const std::string value = Trim(*header);
    if (value.size() > 7) {
      std::string scheme = value.substr(0, 7);
      for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      if (scheme == "bearer ") {
        return Trim(std::string_view(value).substr(7));
      }
    }
  }
  if (auto header = request.Header("X-Tx-Builder-Token")) {
    return Trim(*header);
  }
  return {};
}

// Length leaks; contents do not.
bool TokenEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

std::uint64_t NowMs() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

}  // namespace

int StatusForBuildError(node::BuildErrorKind kind) {
  switch (kind) {
    case node::BuildErrorKind::kInvalidRequest:
      return 400;
    case node::BuildErrorKind::kNoSpendableOutputs:
      return 422;
    case node::BuildErrorKind::kBackendUnavailable:
      return 502;
    case node::BuildErrorKind::kConstructionFailed:
      return 500;
  }
  return 500;
}

nlohmann::json BuildResponseBody(const node::BuildResult& result) {
  nlohmann::json meta = {
      {"mode", "local"},
      {"attempt", result.attempt == node::Attempt::kOptimal ? "optimal" : "all_inputs"},
      {"networkId", std::string(config::NetworkName(result.network))},
      {"fromAddress", result.from_address},
      {"inputsUsed", result.inputs_used},
      {"totalInputsAvailable", result.total_inputs_available},
      {"feeInBaseUnit", std::to_string(result.fee_paid)},
      {"priorityFeeInBaseUnit", std::to_string(result.priority_fee)},
      {"truncatedByCap", result.truncated_by_cap},
      {"fallbackUsed", result.fallback_used},
      {"policyTrace", result.policy_trace},
  };
  return {
      {"serializedTransaction", result.serialized_transaction},
      {"txJson", result.transaction_json},
      {"txid", result.transaction_id},
      {"meta", std::move(meta)},
  };
}

TxBuilderService::TxBuilderService(node::BuildOrchestrator& orchestrator,
                                   telemetry::TelemetryCache& telemetry,
                                   metrics::ServiceMetrics& metrics, AuthOptions auth,
                                   nlohmann::json backends, CorsOptions cors)
    : orchestrator_(orchestrator),
      telemetry_(telemetry),
      metrics_(metrics),
      auth_(std::move(auth)),
      backends_(std::move(backends)),
      cors_(std::move(cors)) {}

bool TxBuilderService::RequiresAuth(const HttpRequest& request) const {
  if (auth_.tokens.empty()) {
    return false;
  }
  if (request.method == "GET") {
    if (request.path == "/health") {
      return false;
    }
    return auth_.auth_reads;
  }
  return true;
}

bool TxBuilderService::Authorized(const HttpRequest& request) const {
  const std::string token = BearerToken(request);
  if (token.empty()) {
    return false;
  }
  bool match = false;
  for (const auto& candidate : auth_.tokens) {
    match |= TokenEquals(token, candidate);
  }
  return match;
}

std::string TxBuilderService::ResolveOrigin(const HttpRequest& request) const {
  const auto header = request.Header("Origin");
  const std::string origin = header ? Trim(*header) : std::string();
  const auto& allowed = cors_.allowed_origins;
  if (std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
    return origin.empty() ? "*" : origin;
  }
  if (!origin.empty() && std::find(allowed.begin(), allowed.end(), origin) != allowed.end()) {
    return origin;
  }
  return "null";
}

HttpResponse TxBuilderService::Handle(const HttpRequest& request) {
  metrics_.RecordHttpRequest();
  HttpResponse response;
  if (request.method == "OPTIONS") {
    response.status = 204;
    response.content_type.clear();
  } else {
    response = Route(request);
  }
  const std::string origin = ResolveOrigin(request);
  response.headers.emplace_back("Access-Control-Allow-Origin", origin);
  response.headers.emplace_back("Access-Control-Allow-Methods", kCorsMethods);
  response.headers.emplace_back("Access-Control-Allow-Headers", kCorsHeaders);
  if (origin != "*") {
    response.headers.emplace_back("Vary", "Origin");
  }
  return response;
}

HttpResponse TxBuilderService::Route(const HttpRequest& request) {
  if (RequiresAuth(request) && !Authorized(request)) {
    metrics_.RecordAuthFailure();
    return JsonError(401, "unauthorized");
  }
  if (!IsRoute(request.path)) {
    return JsonError(404, "not_found");
  }
  if (request.path == "/health" || request.path == "/metrics") {
    if (request.method != "GET") {
      return JsonError(405, "method not allowed");
    }
    return request.path == "/health" ? HandleHealth() : HandleMetrics();
  }
  if (request.method != "POST") {
    return JsonError(405, "method not allowed");
  }
  return HandleBuild(request);
}

HttpResponse TxBuilderService::HandleHealth() const {
  const auto policy = orchestrator_.policy();
  nlohmann::json body = {
      {"ok", true},
      {"service", kServiceName},
      {"auth", {{"enabled", !auth_.tokens.empty()}, {"requireAuthForReads", auth_.auth_reads}}},
      {"backends", backends_},
      {"policy", policy::DescribePolicyConfig(*policy)},
      {"telemetrySummary", telemetry_.Describe()},
      {"ts", NowMs()},
  };
  HttpResponse response;
  response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

HttpResponse TxBuilderService::HandleMetrics() const {
  HttpResponse response;
  response.content_type = "text/plain; version=0.0.4";
  response.body = metrics_.RenderPrometheus();
  return response;
}

HttpResponse TxBuilderService::HandleBuild(const HttpRequest& request) {
  const auto body = nlohmann::json::parse(request.body, nullptr, false);
  if (body.is_discarded()) {
    metrics_.RecordBuildRequest();
    metrics_.RecordBuildError(node::BuildErrorKindName(node::BuildErrorKind::kInvalidRequest));
    return JsonError(400, "invalid JSON body");
  }
  node::BuildError error;
  auto result = orchestrator_.BuildFromJson(body, &error);
  if (!result) {
    return JsonError(StatusForBuildError(error.kind), error.message);
  }
  HttpResponse response;
  response.body =
      BuildResponseBody(*result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

}  // namespace txforge::rpc
