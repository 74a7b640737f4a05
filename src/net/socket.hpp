#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace txforge::net {

// Blocking POSIX TCP socket owning its descriptor.
class TcpSocket {
 public:
  TcpSocket() = default;
  explicit TcpSocket(int handle);
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  // Tries every resolved address, each bounded by |timeout_ms|.
  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms = 5000,
               std::string* error = nullptr);
  // Port 0 binds an ephemeral port; see LocalPort().
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 64);
  TcpSocket AcceptWithTimeout(int timeout_ms) const;
  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  // Loops over partial writes; false on error or peer close.
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);
  std::uint16_t LocalPort() const;
  std::string PeerAddress() const;
  void Close();
  bool IsValid() const noexcept { return handle_ >= 0; }

 private:
  int handle_{-1};
};

}  // namespace txforge::net
