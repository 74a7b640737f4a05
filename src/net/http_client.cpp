#include "net/http_client.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <sstream>

#include "net/socket.hpp"

namespace txforge::net {

namespace {

constexpr std::size_t kMaxResponseHeaderSize = 16 * 1024;
constexpr std::size_t kMaxChunkLineSize = 4096;
// Slack for chunk framing on top of the decoded body limit.
constexpr std::size_t kChunkFramingAllowance = 64 * 1024;

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

std::string BuildGetRequest(const HttpUrl& url, const HttpRequestOptions& options) {
  std::ostringstream oss;
  oss << "GET " << url.path << " HTTP/1.1\r\n";
  oss << "Host: " << url.host << ":" << url.port << "\r\n";
  oss << "Accept: application/json\r\n";
  if (!options.bearer_token.empty()) {
    oss << "Authorization: Bearer " << options.bearer_token << "\r\n";
  }
  oss << "Connection: close\r\n\r\n";
  return oss.str();
}

std::optional<int> ParseStatusLine(std::string_view response) {
  // "HTTP/1.1 200 OK"
  const auto space = response.find(' ');
  if (response.substr(0, 5) != "HTTP/" || space == std::string_view::npos ||
      response.size() < space + 4) {
    return std::nullopt;
  }
  int status = 0;
  for (std::size_t i = space + 1; i < space + 4; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(response[i]))) {
      return std::nullopt;
    }
    status = status * 10 + (response[i] - '0');
  }
  return status;
}

}  // namespace

bool ParseHttpUrl(std::string_view url, HttpUrl* out, std::string* error) {
  constexpr std::string_view kScheme = "http://";
  if (url.substr(0, kScheme.size()) != kScheme) {
    if (error) *error = "only http:// URLs are supported";
    return false;
  }
  std::string_view rest = url.substr(kScheme.size());
  const auto slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  HttpUrl parsed;
  parsed.path = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
  if (authority.empty()) {
    if (error) *error = "URL has no host";
    return false;
  }
  std::string_view host = authority;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      if (error) *error = "malformed IPv6 host";
      return false;
    }
    host = authority.substr(1, close - 1);
    authority.remove_prefix(close + 1);
    if (!authority.empty() && authority.front() != ':') {
      if (error) *error = "malformed URL authority";
      return false;
    }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    authority = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
  }
  if (!authority.empty()) {
    const std::string_view port_text = authority.substr(1);
    unsigned long port = 0;
    if (port_text.empty() || port_text.size() > 5) {
      if (error) *error = "malformed URL port";
      return false;
    }
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        if (error) *error = "malformed URL port";
        return false;
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) {
      if (error) *error = "URL port out of range";
      return false;
    }
    parsed.port = static_cast<std::uint16_t>(port);
  }
  if (host.empty()) {
    if (error) *error = "URL has no host";
    return false;
  }
  parsed.host = std::string(host);
  if (out) {
    *out = std::move(parsed);
  }
  return true;
}

std::optional<std::size_t> FindHeaderEnd(std::string_view data) {
  auto pos = data.find("\r\n\r\n");
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return pos + 4;
}

std::optional<std::string> FindHeaderValue(std::string_view headers, std::string_view name) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    auto line = headers.substr(offset, end - offset);
    auto colon = line.find(':');
    if (colon != std::string_view::npos && EqualsIgnoreCase(Trim(line.substr(0, colon)), name)) {
      return std::string(Trim(line.substr(colon + 1)));
    }
    if (end >= headers.size()) {
      break;
    }
    offset = end + 2;
  }
  return std::nullopt;
}

std::optional<std::size_t> ParseContentLength(std::string_view headers) {
  auto value = FindHeaderValue(headers, "Content-Length");
  if (!value || value->empty() || value->size() > 18) {
    return std::nullopt;
  }
  std::size_t length = 0;
  for (char c : *value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    length = length * 10 + static_cast<std::size_t>(c - '0');
  }
  return length;
}

bool IsChunkedTransfer(std::string_view headers) {
  const auto value = FindHeaderValue(headers, "Transfer-Encoding");
  if (!value) {
    return false;
  }
  std::string_view codings(*value);
  const auto comma = codings.rfind(',');
  if (comma != std::string_view::npos) {
    codings.remove_prefix(comma + 1);
  }
  return EqualsIgnoreCase(Trim(codings), "chunked");
}

ChunkedStatus DecodeChunkedBody(std::string_view data, std::size_t max_body_bytes,
                                std::string* out) {
  std::string decoded;
  std::size_t pos = 0;
  ChunkedStatus status = ChunkedStatus::kIncomplete;
  while (true) {
    const auto line_end = data.find("\r\n", pos);
    if (line_end == std::string_view::npos) {
      status = data.size() - pos > kMaxChunkLineSize ? ChunkedStatus::kMalformed
                                                     : ChunkedStatus::kIncomplete;
      break;
    }
    if (line_end - pos > kMaxChunkLineSize) {
      status = ChunkedStatus::kMalformed;
      break;
    }
    std::string_view size_text = data.substr(pos, line_end - pos);
    const auto extension = size_text.find(';');
    if (extension != std::string_view::npos) {
      size_text = size_text.substr(0, extension);
    }
    size_text = Trim(size_text);
    if (size_text.empty() || size_text.size() > 15) {
      status = ChunkedStatus::kMalformed;
      break;
    }
    std::size_t size = 0;
    bool valid = true;
    for (char c : size_text) {
      const auto byte = static_cast<unsigned char>(c);
      if (!std::isxdigit(byte)) {
        valid = false;
        break;
      }
      const int digit = std::isdigit(byte) ? c - '0' : std::tolower(byte) - 'a' + 10;
      size = size * 16 + static_cast<std::size_t>(digit);
    }
    if (!valid) {
      status = ChunkedStatus::kMalformed;
      break;
    }
    pos = line_end + 2;
    if (size == 0) {
      // Optional trailer fields, then the closing empty line.
      if (data.substr(pos, 2) == "\r\n" ||
          data.find("\r\n\r\n", pos) != std::string_view::npos) {
        status = ChunkedStatus::kComplete;
      }
      break;
    }
    if (size > max_body_bytes || decoded.size() > max_body_bytes - size) {
      status = ChunkedStatus::kTooLarge;
      break;
    }
    if (data.size() - pos < size + 2) {
      break;
    }
    if (data.substr(pos + size, 2) != "\r\n") {
      status = ChunkedStatus::kMalformed;
      break;
    }
    decoded.append(data.substr(pos, size));
    pos += size + 2;
  }
  if (out) {
    *out = std::move(decoded);
  }
  return status;
}

std::optional<HttpResponse> HttpGet(const HttpUrl& url, const HttpRequestOptions& options,
                                    std::string* error) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(options.timeout_ms);
  TcpSocket socket;
  std::string connect_error;
  if (!socket.Connect(url.host, url.port, options.timeout_ms, &connect_error)) {
    if (error) *error = url.host + ":" + std::to_string(url.port) + ": " + connect_error;
    return std::nullopt;
  }
  (void)socket.SetTimeout(options.timeout_ms);
  if (!socket.SendAll(BuildGetRequest(url, options))) {
    if (error) *error = "failed to send request";
    return std::nullopt;
  }

  std::string response;
  response.reserve(4096);
  std::array<std::uint8_t, 4096> chunk{};
  std::optional<std::size_t> body_offset;
  std::optional<std::size_t> content_length;
  bool chunked = false;
  std::string decoded;
  ChunkedStatus chunk_status = ChunkedStatus::kIncomplete;
  bool closed = false;
  while (true) {
    if (std::chrono::steady_clock::now() > deadline) {
      if (error) *error = "request timed out";
      return std::nullopt;
    }
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes < 0) {
      if (error) *error = "request timed out or connection reset";
      return std::nullopt;
    }
    if (bytes == 0) {
      closed = true;
      break;
    }
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      if (response.size() > kMaxResponseHeaderSize && !FindHeaderEnd(response)) {
        if (error) *error = "response headers too large";
        return std::nullopt;
      }
      body_offset = FindHeaderEnd(response);
      if (body_offset) {
        const std::string_view headers(response.data(), *body_offset - 4);
        chunked = IsChunkedTransfer(headers);
        if (!chunked) {
          content_length = ParseContentLength(headers);
        }
      }
    }
    if (body_offset && chunked) {
      const std::string_view raw = std::string_view(response).substr(*body_offset);
      chunk_status = DecodeChunkedBody(raw, options.max_body_bytes, &decoded);
      if (chunk_status == ChunkedStatus::kMalformed) {
        if (error) *error = "malformed chunked response body";
        return std::nullopt;
      }
      if (chunk_status == ChunkedStatus::kTooLarge ||
          raw.size() > options.max_body_bytes + kChunkFramingAllowance) {
        if (error) *error = "response body too large";
        return std::nullopt;
      }
      if (chunk_status == ChunkedStatus::kComplete) {
        break;
      }
    } else if (body_offset) {
      const std::size_t body_size = response.size() - *body_offset;
      if (body_size > options.max_body_bytes) {
        if (error) *error = "response body too large";
        return std::nullopt;
      }
      if (content_length && body_size >= *content_length) {
        break;
      }
    }
  }
  if (!body_offset) {
    if (error) *error = "malformed HTTP response";
    return std::nullopt;
  }
  const auto status = ParseStatusLine(response);
  if (!status) {
    if (error) *error = "malformed HTTP status line";
    return std::nullopt;
  }
  if (content_length && closed && response.size() - *body_offset < *content_length) {
    if (error) *error = "truncated HTTP response";
    return std::nullopt;
  }
  if (chunked && chunk_status != ChunkedStatus::kComplete) {
    if (error) *error = "truncated chunked HTTP response";
    return std::nullopt;
  }
  HttpResponse out;
  out.status = *status;
  if (chunked) {
    out.body = std::move(decoded);
    return out;
  }
  out.body = content_length ? response.substr(*body_offset, *content_length)
                            : response.substr(*body_offset);
  return out;
}

std::optional<nlohmann::json> HttpGetJson(std::string_view url,
                                          const HttpRequestOptions& options,
                                          std::string* error) {
  HttpUrl parsed;
  if (!ParseHttpUrl(url, &parsed, error)) {
    return std::nullopt;
  }
  auto response = HttpGet(parsed, options, error);
  if (!response) {
    return std::nullopt;
  }
  if (response->status < 200 || response->status >= 300) {
    if (error) {
      *error = "HTTP " + std::to_string(response->status) + ": " + response->body.substr(0, 200);
    }
    return std::nullopt;
  }
  if (response->body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed_body = nlohmann::json::parse(response->body, nullptr, /*allow_exceptions=*/false);
  if (parsed_body.is_discarded()) {
    if (error) *error = "response is not valid JSON";
    return std::nullopt;
  }
  return parsed_body;
}

std::string EncodePathSegment(std::string_view segment) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(segment.size());
  for (char c : segment) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~' || c == ':') {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0x0F]);
    }
  }
  return out;
}

}  // namespace txforge::net
