#include "net/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace txforge::net {

namespace {

constexpr int kInvalidSocket = -1;

bool ConnectWithTimeout(int socket_fd, const sockaddr* addr, socklen_t addr_len,
                        int timeout_ms, std::string* error) {
  const int original_flags = fcntl(socket_fd, F_GETFL, 0);
  if (original_flags >= 0) {
    (void)fcntl(socket_fd, F_SETFL, original_flags | O_NONBLOCK);
  }
  const auto restore = [&] {
    if (original_flags >= 0) {
      (void)fcntl(socket_fd, F_SETFL, original_flags);
    }
  };

  if (::connect(socket_fd, addr, addr_len) == 0) {
    restore();
    return true;
  }
  const int connect_err = errno;
  if (connect_err != EINPROGRESS) {
    restore();
    if (error) *error = std::string("connect failed: ") + std::strerror(connect_err);
    return false;
  }

  fd_set write_fds;
  FD_ZERO(&write_fds);
  FD_SET(socket_fd, &write_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  const int ready = ::select(socket_fd + 1, nullptr, &write_fds, nullptr, &tv);

  int so_error = 0;
  socklen_t so_error_len = sizeof(so_error);
  const int so_rc = ::getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_error, &so_error_len);
  restore();

  if (ready == 0) {
    if (error) *error = "connect timed out";
    return false;
  }
  if (ready < 0 || so_rc != 0 || so_error != 0) {
    if (error) {
      *error = std::string("connect failed: ") + std::strerror(so_error != 0 ? so_error : errno);
    }
    return false;
  }
  return true;
}

}  // namespace

TcpSocket::TcpSocket(int handle) : handle_(handle) {}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(std::exchange(other.handle_, -1)) {}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = std::exchange(other.handle_, -1);
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms,
                        std::string* error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (result) {
      freeaddrinfo(result);
    }
    if (error) *error = "cannot resolve " + host;
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const int sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == kInvalidSocket) {
      continue;
    }
    if (ConnectWithTimeout(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen),
                           timeout_ms, error)) {
      Close();
      handle_ = sock;
      freeaddrinfo(result);
      return true;
    }
    ::close(sock);
  }

  freeaddrinfo(result);
  return false;
}

bool TcpSocket::BindAndListen(const std::string& address, std::uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE;

  const bool wants_v4_any = address.empty() || address == "0.0.0.0";
  const bool wants_v6_any = address == "::";
  if (wants_v4_any) {
    hints.ai_family = AF_INET;
  } else if (wants_v6_any) {
    hints.ai_family = AF_INET6;
  } else {
    hints.ai_family = AF_UNSPEC;
  }

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  const char* node = (wants_v4_any || wants_v6_any) ? nullptr : address.c_str();
  if (getaddrinfo(node, port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const int sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == kInvalidSocket) {
      continue;
    }
    int opt = 1;
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (entry->ai_family == AF_INET6) {
      // Dual-stack so "::" also accepts IPv4-mapped peers.
      int v6only = 0;
      (void)setsockopt(sock, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    if (::bind(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen)) != 0 ||
        ::listen(sock, backlog) != 0) {
      ::close(sock);
      continue;
    }
    Close();
    handle_ = sock;
    freeaddrinfo(result);
    return true;
  }

  freeaddrinfo(result);
  return false;
}

TcpSocket TcpSocket::AcceptWithTimeout(int timeout_ms) const {
  if (!IsValid()) return TcpSocket();
  fd_set read_fds;
  FD_ZERO(&read_fds);
  FD_SET(handle_, &read_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  const int ready = ::select(handle_ + 1, &read_fds, nullptr, nullptr, &tv);
  if (ready <= 0) {
    return TcpSocket();
  }
  const int client = ::accept(handle_, nullptr, nullptr);
  if (client == kInvalidSocket) {
    return TcpSocket();
  }
  return TcpSocket(client);
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::send(handle_, data, length, MSG_NOSIGNAL);
}

bool TcpSocket::SendAll(std::string_view data) const {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = Send(reinterpret_cast<const std::uint8_t*>(data.data()) + sent,
                        data.size() - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::recv(handle_, data, length, 0);
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
  struct timeval tv {
    milliseconds / 1000, (milliseconds % 1000) * 1000
  };
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::uint16_t TcpSocket::LocalPort() const {
  if (!IsValid()) return 0;
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getsockname(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

std::string TcpSocket::PeerAddress() const {
  if (!IsValid()) return {};
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getpeername(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char hostbuf[NI_MAXHOST]{};
  if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, hostbuf, sizeof(hostbuf), nullptr, 0,
                  NI_NUMERICHOST) != 0) {
    return {};
  }
  return std::string(hostbuf);
}

void TcpSocket::Close() {
  if (handle_ != kInvalidSocket) {
    ::close(handle_);
    handle_ = kInvalidSocket;
  }
}

}  // namespace txforge::net
