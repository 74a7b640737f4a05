#include "rpc/http_server.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "nlohmann/json.hpp"

#include "net/http_client.hpp"
#include "util/log.hpp"

namespace txforge::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kDefaultMaxBodySize = 1024 * 1024;
constexpr int kAcceptPollMs = 200;

}  // namespace

std::optional<std::string> HttpRequest::Header(std::string_view name) const {
  return net::FindHeaderValue(headers, name);
}

const char* ReasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 422:
      return "Unprocessable Entity";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    default:
      return "Error";
  }
}

HttpResponse JsonError(int status, std::string_view message) {
  nlohmann::json body = {{"error", {{"message", std::string(message)}}}};
  HttpResponse response;
  response.status = status;
  response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

HttpServer::HttpServer(Options options, Handler handler)
    : options_(std::move(options)), handler_(std::move(handler)) {
  if (options_.max_body_bytes == 0) {
    options_.max_body_bytes = kDefaultMaxBodySize;
  }
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen(options_.bind_address, options_.port)) {
    running_.store(false);
    throw std::runtime_error("failed to bind HTTP port " + std::to_string(options_.port) +
                             " on " + options_.bind_address);
  }
  bound_port_ = listener_.LocalPort();
  for (std::size_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
  acceptor_ = std::thread([this]() { AcceptLoop(); });
}

void HttpServer::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  if (acceptor_.joinable()) {
    acceptor_.join();
  }
  listener_.Close();
  queue_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  pending_.clear();
}

void HttpServer::AcceptLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(kAcceptPollMs);
    if (!client.IsValid()) {
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (pending_.size() >= options_.max_pending_connections) {
      lock.unlock();
      SendResponse(client, JsonError(503, "server busy"));
      continue;
    }
    pending_.push_back(std::move(client));
    lock.unlock();
    queue_cv_.notify_one();
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    net::TcpSocket client;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !running_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      client = std::move(pending_.front());
      pending_.pop_front();
    }
    HandleClient(std::move(client));
  }
}

void HttpServer::HandleClient(net::TcpSocket client) {
  HttpRequest request;
  int status = 200;
  if (!ReadRequest(client, &request, &status)) {
    SendResponse(client, JsonError(status, status == 413 ? "request too large" : "bad request"));
    return;
  }
  HttpResponse response;
  try {
    response = handler_(request);
  } catch (const std::exception& ex) {
    util::LogPrint(util::LogLevel::kError, "http",
                   request.method + " " + request.path + " failed: " + ex.what());
    response = JsonError(500, "internal error");
  }
  SendResponse(client, response);
}

bool HttpServer::ReadRequest(net::TcpSocket& client, HttpRequest* request, int* status) {
  std::string buffer;
  buffer.reserve(1024);
  std::array<std::uint8_t, 4096> chunk{};
  std::optional<std::size_t> body_offset;
  while (!body_offset) {
    if (buffer.size() > kMaxHeaderSize) {
      *status = 413;
      return false;
    }
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    body_offset = net::FindHeaderEnd(buffer);
  }
  const std::string_view head(buffer.data(), *body_offset - 4);
  const auto line_end = head.find("\r\n");
  const std::string_view request_line = head.substr(0, line_end);
  const auto first_space = request_line.find(' ');
  const auto second_space = request_line.find(' ', first_space + 1);
  if (first_space == std::string_view::npos || second_space == std::string_view::npos) {
    *status = 400;
    return false;
  }
  request->method = std::string(request_line.substr(0, first_space));
  std::string target(request_line.substr(first_space + 1, second_space - first_space - 1));
  const auto question = target.find('?');
  if (question != std::string::npos) {
    request->query = target.substr(question + 1);
    target.resize(question);
  }
  request->path = std::move(target);
  request->headers =
      line_end == std::string_view::npos ? std::string() : std::string(head.substr(line_end + 2));
  request->peer = client.PeerAddress();

  std::size_t content_length = 0;
  if (auto length = net::ParseContentLength(request->headers)) {
    content_length = *length;
  } else if (request->Header("Content-Length")) {
    *status = 400;
    return false;
  }
  if (content_length > options_.max_body_bytes) {
    *status = 413;
    return false;
  }
  std::string payload = buffer.substr(*body_offset);
  while (payload.size() < content_length) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
  }
  payload.resize(content_length);
  request->body = std::move(payload);
  return true;
}

void HttpServer::SendResponse(net::TcpSocket& client, const HttpResponse& response) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << response.status << ' ' << ReasonPhrase(response.status) << "\r\n";
  if (!response.content_type.empty()) {
    oss << "Content-Type: " << response.content_type << "\r\n";
  }
  oss << "Cache-Control: no-store\r\n";
  if (response.status == 401) {
    oss << "WWW-Authenticate: Bearer realm=\"txforge\"\r\n";
  }
  for (const auto& [name, value] : response.headers) {
    oss << name << ": " << value << "\r\n";
  }
  if (response.status != 204) {
    oss << "Content-Length: " << response.body.size() << "\r\n";
  }
  oss << "Connection: close\r\n\r\n";
  oss << response.body;
  (void)client.SendAll(oss.str());
  client.Close();
}

}  // namespace txforge::rpc
