#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "net/socket.hpp"

namespace txforge::rpc {

struct HttpRequest {
  std::string method;
  std::string path;  // Without the query string.
  std::string query;
  std::string headers;  // Raw header block, request line excluded.
  std::string body;
  std::string peer;

  std::optional<std::string> Header(std::string_view name) const;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};  // Omitted when empty.
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
};

// Minimal HTTP/1.1 server: one acceptor thread hands connections to a fixed
// pool of workers. Each connection carries exactly one request.
class HttpServer {
 public:
  struct Options {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};
    std::size_t worker_threads{4};
    std::size_t max_body_bytes{1024 * 1024};
    std::size_t max_pending_connections{256};
    int socket_timeout_ms{5000};
  };

  using Handler = std::function<HttpResponse(const HttpRequest&)>;

  HttpServer(Options options, Handler handler);
  ~HttpServer();

  // Binds and starts the threads; throws std::runtime_error if the port
  // cannot be bound.
  void Start();
  // Closes the listener, drains the workers and joins every thread. Safe
  // to call more than once.
  void Stop();
  // Actual port, useful when Options::port is 0.
  std::uint16_t port() const { return bound_port_; }

 private:
  void AcceptLoop();
  void WorkerLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, HttpRequest* request, int* status);
  static void SendResponse(net::TcpSocket& client, const HttpResponse& response);

  Options options_;
  Handler handler_;
  std::atomic<bool> running_{false};
  net::TcpSocket listener_;
  std::uint16_t bound_port_{0};
  std::thread acceptor_;
  std::vector<std::thread> workers_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<net::TcpSocket> pending_;
};

// {"error":{"message": ...}} with the given status.
HttpResponse JsonError(int status, std::string_view message);
const char* ReasonPhrase(int status);

}  // namespace txforge::rpc
