#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace txforge::net {

struct HttpUrl {
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};  // Includes any query string.
};

// Only plain http:// URLs are accepted; TLS is expected to be terminated by
// a local proxy in front of remote services.
bool ParseHttpUrl(std::string_view url, HttpUrl* out, std::string* error);

struct HttpResponse {
  int status{0};
  std::string body;
};

struct HttpRequestOptions {
  int timeout_ms{3000};
  std::string bearer_token;  // Sent as "Authorization: Bearer" when set.
  std::size_t max_body_bytes{8 * 1024 * 1024};
};

// One-shot GET with "Connection: close". Transport failures and malformed
// responses return nullopt with |error| set; any HTTP status is a response.
std::optional<HttpResponse> HttpGet(const HttpUrl& url, const HttpRequestOptions& options,
                                    std::string* error);

// GET that requires a 2xx status and a JSON body. An empty body yields an
// empty object.
std::optional<nlohmann::json> HttpGetJson(std::string_view url,
                                          const HttpRequestOptions& options,
                                          std::string* error);

// Percent-encodes everything outside the RFC 3986 unreserved set except ':'.
std::string EncodePathSegment(std::string_view segment);

// Shared HTTP/1.1 header helpers (also used by the server side).
std::optional<std::size_t> FindHeaderEnd(std::string_view data);
std::optional<std::string> FindHeaderValue(std::string_view headers, std::string_view name);
std::optional<std::size_t> ParseContentLength(std::string_view headers);
// True when the last Transfer-Encoding coding is "chunked".
bool IsChunkedTransfer(std::string_view headers);

enum class ChunkedStatus {
  kComplete,
  kIncomplete,
  kMalformed,
  kTooLarge,
};

// Decodes a chunked body as received so far. |out| holds the payload
// decoded up to the first incomplete chunk; trailers are discarded.
ChunkedStatus DecodeChunkedBody(std::string_view data, std::size_t max_body_bytes,
                                std::string* out);

}  // namespace txforge::net
