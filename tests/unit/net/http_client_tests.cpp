#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "net/http_client.hpp"
#include "net/socket.hpp"

using namespace txforge::net;

namespace {

// Accepts one connection, waits for the request headers and writes |reply|.
void ServeOnce(const TcpSocket& listener, const std::string& reply) {
  TcpSocket client = listener.AcceptWithTimeout(5000);
  if (!client.IsValid()) {
    return;
  }
  (void)client.SetTimeout(5000);
  std::string request;
  std::array<std::uint8_t, 1024> buffer{};
  while (!FindHeaderEnd(request)) {
    const auto bytes = client.Recv(buffer.data(), buffer.size());
    if (bytes <= 0) {
      return;
    }
    request.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(bytes));
  }
  (void)client.SendAll(reply);
}

std::string FetchFrom(const std::string& reply, bool* ok, std::string* error) {
  TcpSocket listener;
  if (!listener.BindAndListen("127.0.0.1", 0)) {
    *ok = false;
    *error = "could not bind loopback listener";
    return {};
  }
  const std::string url =
      "http://127.0.0.1:" + std::to_string(listener.LocalPort()) + "/v1/telemetry-summary";
  std::thread server([&listener, &reply] { ServeOnce(listener, reply); });
  HttpRequestOptions options;
  options.timeout_ms = 3000;
  options.max_body_bytes = 1024;
  auto body = HttpGetJson(url, options, error);
  server.join();
  *ok = body.has_value();
  return body ? body->dump() : std::string{};
}

}  // namespace

int main() {
  {
    std::string decoded;
    const auto status = DecodeChunkedBody("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n", 64,
                                          &decoded);
    if (status != ChunkedStatus::kComplete || decoded != "Wikipedia") {
      std::cerr << "chunked body not decoded: " << decoded << "\n";
      return EXIT_FAILURE;
    }
    if (DecodeChunkedBody("A\r\n0123456789\r\n0\r\nX-Trailer: 1\r\n\r\n", 64, &decoded) !=
            ChunkedStatus::kComplete ||
        decoded != "0123456789") {
      std::cerr << "trailers must be skipped\n";
      return EXIT_FAILURE;
    }
    if (DecodeChunkedBody("4\r\nWik", 64, &decoded) != ChunkedStatus::kIncomplete ||
        DecodeChunkedBody("4\r\nWiki\r\n0\r\n", 64, &decoded) != ChunkedStatus::kIncomplete) {
      std::cerr << "partial chunked bodies must report incomplete\n";
      return EXIT_FAILURE;
    }
    if (DecodeChunkedBody("zz\r\nWiki\r\n", 64, &decoded) != ChunkedStatus::kMalformed ||
        DecodeChunkedBody("4\r\nWikiX\r\n", 64, &decoded) != ChunkedStatus::kMalformed) {
      std::cerr << "bad chunk framing must be rejected\n";
      return EXIT_FAILURE;
    }
    if (DecodeChunkedBody("40\r\n", 16, &decoded) != ChunkedStatus::kTooLarge) {
      std::cerr << "chunks over the body limit must be rejected\n";
      return EXIT_FAILURE;
    }
  }

  {
    if (!IsChunkedTransfer("Content-Type: application/json\r\nTransfer-Encoding: Chunked") ||
        !IsChunkedTransfer("Transfer-Encoding: gzip, chunked") ||
        IsChunkedTransfer("Content-Length: 12")) {
      std::cerr << "Transfer-Encoding detection is wrong\n";
      return EXIT_FAILURE;
    }
  }

  {
    const std::string reply =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Connection: close\r\n\r\n"
        "13\r\n{\"receipts\":{\"recei\r\n"
        "18\r\nptLagMs\":{\"p95\":50000}}}\r\n"
        "0\r\n\r\n";
    bool ok = false;
    std::string error;
    const auto body = FetchFrom(reply, &ok, &error);
    if (!ok || body != "{\"receipts\":{\"receiptLagMs\":{\"p95\":50000}}}") {
      std::cerr << "chunked JSON reply not read: " << error << " " << body << "\n";
      return EXIT_FAILURE;
    }
  }

  {
    const std::string reply =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n\r\n"
        "13\r\n{\"receipts\":{\"recei\r\n";
    bool ok = true;
    std::string error;
    FetchFrom(reply, &ok, &error);
    if (ok || error != "truncated chunked HTTP response") {
      std::cerr << "a chunked reply cut short must fail, got: " << error << "\n";
      return EXIT_FAILURE;
    }
  }

  {
    const std::string reply =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 11\r\n\r\n"
        "{\"ok\":true}";
    bool ok = false;
    std::string error;
    const auto body = FetchFrom(reply, &ok, &error);
    if (!ok || body != "{\"ok\":true}") {
      std::cerr << "content-length reply not read: " << error << "\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
