#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

#include "builder/tx_generator.hpp"
#include "config/network.hpp"
#include "metrics/service_metrics.hpp"
#include "net/indexer_client.hpp"
#include "node/build_orchestrator.hpp"
#include "policy/policy_config.hpp"
#include "rpc/http_server.hpp"
#include "rpc/service.hpp"
#include "telemetry/summary_cache.hpp"
#include "util/log.hpp"

namespace {

using txforge::util::LogLevel;
using txforge::util::LogPrint;

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

void HandleSignal(int signal) {
  // Keep signal handler minimal and async-signal-safe.
  if (signal == SIGHUP) {
    g_reload_requested.store(true);
  } else {
    g_shutdown_requested.store(true);
  }
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  std::signal(SIGHUP, HandleSignal);
  std::signal(SIGPIPE, SIG_IGN);
}

struct Options {
  std::string bind{"127.0.0.1"};
  std::uint16_t port{8795};
  std::size_t worker_threads{4};
  std::size_t max_body_bytes{1024 * 1024};
  int socket_timeout_ms{15000};
  std::vector<std::string> auth_tokens;
  bool auth_reads{false};
  std::vector<std::string> allowed_origins{"*"};
  std::string kas_api_mainnet;
  std::string kas_api_testnet;
  int kas_api_timeout_ms{12000};
  std::string callback_summary_url;
  std::string callback_summary_token;
  std::string scheduler_summary_url;
  std::string scheduler_summary_token;
  std::uint64_t telemetry_ttl_ms{5000};
  std::uint64_t telemetry_timeout_ms{3000};
  std::uint64_t telemetry_stale_hard_ms{0};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
};

void PrintUsage() {
  std::cout << "txforged options:\n"
            << "  --bind <addr>                  HTTP bind address (default: 127.0.0.1)\n"
            << "  --port <port>                  HTTP port (default: 8795)\n"
            << "  --worker-threads <n>           Request worker threads (default: 4)\n"
            << "  --max-body-bytes <n>           Largest accepted request body (default: 1048576)\n"
            << "  --auth-token <token>           Accepted bearer token (repeatable)\n"
            << "  --auth-reads                   Require a token for GET /metrics too\n"
            << "  --allowed-origins <list>       Comma separated CORS origins (default: *)\n"
            << "  --kas-api-mainnet <url>        Mainnet UTXO indexer base URL\n"
            << "  --kas-api-testnet <url>        testnet-10 UTXO indexer base URL\n"
            << "  --kas-api-timeout-ms <ms>      Indexer request timeout (min 1000, default: 12000)\n"
            << "  --callback-summary-url <url>   Callback-consumer telemetry summary URL\n"
            << "  --callback-summary-token <t>   Bearer token for the callback summary\n"
            << "  --scheduler-summary-url <url>  Scheduler telemetry summary URL\n"
            << "  --scheduler-summary-token <t>  Bearer token for the scheduler summary\n"
            << "  --telemetry-ttl-ms <ms>        Summary cache TTL (min 250, default: 5000)\n"
            << "  --telemetry-timeout-ms <ms>    Summary fetch timeout (min 250, default: 3000)\n"
            << "  --telemetry-stale-hard-ms <ms> Age at which a summary is unusable (default: max(60000, 12*ttl))\n"
            << "  --debug-log <path>             Append structured logs to the given file\n"
            << "  --log-level <lvl>              Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>         Rotate debug log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>            Number of rotated debug log files to keep (default: 0)\n"
            << "  --conf <path>                  Load options from txforge.conf (default: ./txforge.conf)\n"
            << "  --no-conf                      Disable config file loading\n"
            << "Policy tunables are read from TX_BUILDER_POLICY_* and re-read on SIGHUP.\n";
}

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::uint16_t ParsePort(const std::string& value) {
  const unsigned long parsed = std::stoul(value);
  if (parsed > 65535) {
    throw std::runtime_error("port out of range: " + value);
  }
  return static_cast<std::uint16_t>(parsed);
}

std::vector<std::string> SplitTokens(const std::string& value) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto comma = value.find(',', start);
    const auto end = comma == std::string::npos ? value.size() : comma;
    auto token = Trim(value.substr(start, end - start));
    if (!token.empty()) {
      out.push_back(std::move(token));
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return out;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void ApplyEnvironmentOverrides(Options* opts) {
  auto apply_string = [](std::string_view name, std::string* target) {
    if (auto value = GetEnvValue(name)) {
      *target = Trim(*value);
    }
  };
  auto apply_u64 = [](std::string_view name, std::uint64_t* target) {
    if (auto value = GetEnvValue(name)) {
      *target = std::stoull(*value);
    }
  };
  if (auto value = GetEnvValue("HOST")) {
    opts->bind = *value;
  }
  if (auto value = GetEnvValue("PORT")) {
    opts->port = ParsePort(*value);
  }
  if (auto value = GetEnvValue("TX_BUILDER_WORKER_THREADS")) {
    opts->worker_threads = static_cast<std::size_t>(std::stoul(*value));
  }
  if (auto value = GetEnvValue("TX_BUILDER_MAX_BODY_BYTES")) {
    opts->max_body_bytes = static_cast<std::size_t>(std::stoul(*value));
  }
  if (auto value = GetEnvValue("TX_BUILDER_AUTH_TOKENS")) {
    opts->auth_tokens = SplitTokens(*value);
  } else if (auto single = GetEnvValue("TX_BUILDER_AUTH_TOKEN")) {
    opts->auth_tokens = SplitTokens(*single);
  }
  if (auto value = GetEnvValue("TX_BUILDER_AUTH_READS")) {
    opts->auth_reads = ParseBool(*value);
  }
  if (auto value = GetEnvValue("TX_BUILDER_ALLOWED_ORIGINS")) {
    opts->allowed_origins = SplitTokens(*value);
  }
  if (auto value = GetEnvValue("TX_BUILDER_KAS_API_BASE")) {
    opts->kas_api_mainnet = Trim(*value);
    opts->kas_api_testnet = Trim(*value);
  }
  apply_string("TX_BUILDER_KAS_API_MAINNET", &opts->kas_api_mainnet);
  apply_string("TX_BUILDER_KAS_API_TESTNET", &opts->kas_api_testnet);
  if (auto value = GetEnvValue("TX_BUILDER_KAS_API_TIMEOUT_MS")) {
    opts->kas_api_timeout_ms = std::stoi(*value);
  }
  apply_string("TX_BUILDER_CALLBACK_CONSUMER_SUMMARY_URL", &opts->callback_summary_url);
  apply_string("TX_BUILDER_CALLBACK_CONSUMER_SUMMARY_TOKEN", &opts->callback_summary_token);
  apply_string("TX_BUILDER_SCHEDULER_SUMMARY_URL", &opts->scheduler_summary_url);
  apply_string("TX_BUILDER_SCHEDULER_SUMMARY_TOKEN", &opts->scheduler_summary_token);
  apply_u64("TX_BUILDER_TELEMETRY_SUMMARY_TTL_MS", &opts->telemetry_ttl_ms);
  apply_u64("TX_BUILDER_TELEMETRY_SUMMARY_TIMEOUT_MS", &opts->telemetry_timeout_ms);
  apply_u64("TX_BUILDER_TELEMETRY_SUMMARY_STALE_HARD_MS", &opts->telemetry_stale_hard_ms);
  apply_string("TXFORGE_DEBUG_LOG", &opts->debug_log_path);
}

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, Options* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "bind" || key == "host") {
    opts->bind = value;
  } else if (key == "port") {
    opts->port = ParsePort(value);
  } else if (key == "workerthreads") {
    opts->worker_threads = static_cast<std::size_t>(std::stoul(value));
  } else if (key == "maxbodybytes") {
    opts->max_body_bytes = static_cast<std::size_t>(std::stoul(value));
  } else if (key == "authtoken" || key == "authtokens") {
    for (auto& token : SplitTokens(value)) {
      opts->auth_tokens.push_back(std::move(token));
    }
  } else if (key == "authreads") {
    opts->auth_reads = ParseBool(value);
  } else if (key == "allowedorigins") {
    opts->allowed_origins = SplitTokens(value);
  } else if (key == "kasapimainnet") {
    opts->kas_api_mainnet = value;
  } else if (key == "kasapitestnet") {
    opts->kas_api_testnet = value;
  } else if (key == "kasapitimeoutms") {
    opts->kas_api_timeout_ms = std::stoi(value);
  } else if (key == "callbacksummaryurl") {
    opts->callback_summary_url = value;
  } else if (key == "callbacksummarytoken") {
    opts->callback_summary_token = value;
  } else if (key == "schedulersummaryurl") {
    opts->scheduler_summary_url = value;
  } else if (key == "schedulersummarytoken") {
    opts->scheduler_summary_token = value;
  } else if (key == "telemetryttlms") {
    opts->telemetry_ttl_ms = std::stoull(value);
  } else if (key == "telemetrytimeoutms") {
    opts->telemetry_timeout_ms = std::stoull(value);
  } else if (key == "telemetrystalehardms") {
    opts->telemetry_stale_hard_ms = std::stoull(value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(std::stoul(value));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(std::stoul(value));
  } else {
    std::cerr << "[txforged] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, Options* opts) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

Options ParseOptions(int argc, char** argv) {
  Options opts;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }

  if (!opts.disable_config_file) {
    const std::filesystem::path config_path =
        opts.config_path.empty() ? std::filesystem::path("txforge.conf")
                                 : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  std::vector<std::string> cli_tokens;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--bind") {
      opts.bind = ensure_value(i);
    } else if (arg == "--port") {
      opts.port = ParsePort(ensure_value(i));
    } else if (arg == "--worker-threads") {
      opts.worker_threads = static_cast<std::size_t>(std::stoul(ensure_value(i)));
    } else if (arg == "--max-body-bytes") {
      opts.max_body_bytes = static_cast<std::size_t>(std::stoul(ensure_value(i)));
    } else if (arg == "--auth-token") {
      cli_tokens.push_back(ensure_value(i));
    } else if (arg == "--auth-reads") {
      opts.auth_reads = true;
    } else if (arg == "--allowed-origins") {
      opts.allowed_origins = SplitTokens(ensure_value(i));
    } else if (arg == "--kas-api-mainnet") {
      opts.kas_api_mainnet = ensure_value(i);
    } else if (arg == "--kas-api-testnet") {
      opts.kas_api_testnet = ensure_value(i);
    } else if (arg == "--kas-api-timeout-ms") {
      opts.kas_api_timeout_ms = std::stoi(ensure_value(i));
    } else if (arg == "--callback-summary-url") {
      opts.callback_summary_url = ensure_value(i);
    } else if (arg == "--callback-summary-token") {
      opts.callback_summary_token = ensure_value(i);
    } else if (arg == "--scheduler-summary-url") {
      opts.scheduler_summary_url = ensure_value(i);
    } else if (arg == "--scheduler-summary-token") {
      opts.scheduler_summary_token = ensure_value(i);
    } else if (arg == "--telemetry-ttl-ms") {
      opts.telemetry_ttl_ms = std::stoull(ensure_value(i));
    } else if (arg == "--telemetry-timeout-ms") {
      opts.telemetry_timeout_ms = std::stoull(ensure_value(i));
    } else if (arg == "--telemetry-stale-hard-ms") {
      opts.telemetry_stale_hard_ms = std::stoull(ensure_value(i));
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--log-max-size-mb") {
      opts.log_max_size_mb = static_cast<std::size_t>(std::stoul(ensure_value(i)));
    } else if (arg == "--log-max-files") {
      opts.log_max_files = static_cast<std::size_t>(std::stoul(ensure_value(i)));
    } else if (arg == "--debug-log") {
      opts.debug_log_path = ensure_value(i);
    } else if (arg == "--conf") {
      ++i;  // already handled
    } else if (arg == "--no-conf") {
      continue;
    } else {
      throw std::runtime_error("unknown option: " + arg);
    }
  }
  if (!cli_tokens.empty()) {
    opts.auth_tokens = std::move(cli_tokens);
  }

  if (opts.kas_api_mainnet.empty()) {
    opts.kas_api_mainnet =
        txforge::config::ConfigFor(txforge::config::NetworkType::kMainnet).default_indexer_base;
  }
  if (opts.kas_api_testnet.empty()) {
    opts.kas_api_testnet =
        txforge::config::ConfigFor(txforge::config::NetworkType::kTestnet10).default_indexer_base;
  }
  if (opts.kas_api_timeout_ms < 1000) {
    opts.kas_api_timeout_ms = 1000;
  }
  return opts;
}

void ConfigureDebugLog(const Options& opts) {
  LogLevel level = LogLevel::kInfo;
  try {
    level = txforge::util::ParseLogLevelString(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[txforged] warn: " << ex.what() << " (falling back to info level)\n";
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  auto& logger = txforge::util::GetDebugLogger();
  logger.Configure(level, max_bytes, opts.log_max_files);
  logger.Enable(opts.debug_log_path);
  LogPrint(LogLevel::kInfo, "txforged", "debug log enabled at " + opts.debug_log_path);
}

std::unique_ptr<txforge::telemetry::SummarySource> MakeSummarySource(
    const std::string& name, const std::string& url, const std::string& token,
    const txforge::telemetry::CacheWindows& windows, txforge::metrics::ServiceMetrics* metrics) {
  if (url.empty()) {
    return nullptr;
  }
  return std::make_unique<txforge::telemetry::SummarySource>(
      name,
      txforge::telemetry::HttpSummaryFetcher(url, token, static_cast<int>(windows.timeout_ms)),
      windows, txforge::telemetry::SteadyClock(), metrics);
}

void ReloadPolicy(txforge::node::BuildOrchestrator& orchestrator) {
  auto policy = std::make_shared<const txforge::policy::PolicyConfig>(
      txforge::policy::ReadPolicyConfig());
  orchestrator.SetPolicy(policy);
  LogPrint(LogLevel::kInfo, "txforged",
           "policy reloaded: " + txforge::policy::DescribePolicyConfig(*policy).dump());
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    if (!opts.debug_log_path.empty()) {
      try {
        ConfigureDebugLog(opts);
      } catch (const std::exception& ex) {
        std::cerr << "[txforged] fatal: " << ex.what() << "\n";
        return 1;
      }
    }

    InstallSignalHandlers();

    txforge::metrics::ServiceMetrics metrics;

    txforge::telemetry::CacheWindows windows;
    windows.ttl_ms = opts.telemetry_ttl_ms;
    windows.timeout_ms = opts.telemetry_timeout_ms;
    windows.stale_hard_ms = opts.telemetry_stale_hard_ms;
    windows = txforge::telemetry::NormalizeWindows(windows);
    txforge::telemetry::TelemetryCache telemetry(
        MakeSummarySource("callback", opts.callback_summary_url, opts.callback_summary_token,
                          windows, &metrics),
        MakeSummarySource("scheduler", opts.scheduler_summary_url,
                          opts.scheduler_summary_token, windows, &metrics),
        &metrics);

    txforge::net::HttpIndexerClient indexer(opts.kas_api_mainnet, opts.kas_api_testnet,
                                            opts.kas_api_timeout_ms);
    txforge::builder::StandardTransactionGenerator generator;
    txforge::node::BuildOrchestrator orchestrator(
        std::make_shared<const txforge::policy::PolicyConfig>(
            txforge::policy::ReadPolicyConfig()),
        telemetry, indexer, generator, &metrics);

    txforge::rpc::AuthOptions auth;
    auth.tokens = opts.auth_tokens;
    auth.auth_reads = opts.auth_reads;
    const nlohmann::json backends = {
        {"kasApiMainnet", opts.kas_api_mainnet},
        {"kasApiTestnet", opts.kas_api_testnet},
        {"kasApiTimeoutMs", opts.kas_api_timeout_ms},
    };
    txforge::rpc::CorsOptions cors;
    if (!opts.allowed_origins.empty()) {
      cors.allowed_origins = opts.allowed_origins;
    }
    txforge::rpc::TxBuilderService service(orchestrator, telemetry, metrics, std::move(auth),
                                           backends, std::move(cors));

    txforge::rpc::HttpServer::Options server_options;
    server_options.bind_address = opts.bind;
    server_options.port = opts.port;
    server_options.worker_threads = opts.worker_threads;
    server_options.max_body_bytes = opts.max_body_bytes;
    server_options.socket_timeout_ms = opts.socket_timeout_ms;
    txforge::rpc::HttpServer server(
        server_options,
        [&service](const txforge::rpc::HttpRequest& request) { return service.Handle(request); });
    server.Start();

    std::cout << "[txforged] listening on " << opts.bind << ":" << server.port()
              << " auth=" << (opts.auth_tokens.empty() ? "off" : "on")
              << " workers=" << server_options.worker_threads << "\n";
    LogPrint(LogLevel::kInfo, "txforged",
             "policy: " + txforge::policy::DescribePolicyConfig(*orchestrator.policy()).dump());

    while (!g_shutdown_requested.load()) {
      if (g_reload_requested.exchange(false)) {
        ReloadPolicy(orchestrator);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LogPrint(LogLevel::kInfo, "txforged", "shutdown requested");
    server.Stop();
  } catch (const std::exception& ex) {
    LogPrint(LogLevel::kDebug, "txforged", std::string("fatal exception: ") + ex.what());
    std::cerr << "[txforged] fatal: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
