/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file net.hpp
 * @brief TCP listener and connection wrappers over sockpp.
 *
 * Move-only RAII types reporting failures through forge::expected.
 * Used by the status server and by components that own a listening port.
 */

#ifndef FORGE_NET_HPP_
#define FORGE_NET_HPP_

#include "forge/platform.hpp"
#include "forge/vocabulary.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/socket.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_connector.h>
#include <sockpp/tcp_socket.h>

#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <system_error>
#include <utility>

namespace forge {
namespace net {

enum class NetError : uint8_t {
  kConnectFailed = 0,
  kListenFailed,
  kAcceptFailed,
  kSendFailed,
  kRecvFailed,
  kTimeout,
  kClosed,
  kInvalidAddress,
};

inline const char* NetErrorName(NetError e) noexcept {
  switch (e) {
    case NetError::kConnectFailed:  return "connect failed";
    case NetError::kListenFailed:   return "listen failed";
    case NetError::kAcceptFailed:   return "accept failed";
    case NetError::kSendFailed:     return "send failed";
    case NetError::kRecvFailed:     return "recv failed";
    case NetError::kTimeout:        return "timeout";
    case NetError::kClosed:         return "closed";
    case NetError::kInvalidAddress: return "invalid address";
  }
  return "unknown";
}

namespace detail {

/// Ignores SIGPIPE process-wide; writes to a vanished peer fail with EPIPE.
inline void EnsureSocketsInitialized() noexcept {
  static const bool done = [] {
    sockpp::initialize();
    return true;
  }();
  (void)done;
}

}  // namespace detail

// ============================================================================
// TcpClient
// ============================================================================

class TcpClient {
 public:
  TcpClient() noexcept = default;

  /**
   * @brief Connect to a remote TCP endpoint.
   * @param timeout_ms Connection timeout in milliseconds (0 = blocking)
   */
  static expected<TcpClient, NetError> Connect(const char* host, uint16_t port,
                                               int32_t timeout_ms = 5000) noexcept {
    detail::EnsureSocketsInitialized();
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) {
      return expected<TcpClient, NetError>::error(NetError::kInvalidAddress);
    }

    sockpp::tcp_connector conn;
    sockpp::result<> res;
    if (timeout_ms > 0) {
      res = conn.connect(addr.value(), std::chrono::milliseconds(timeout_ms));
    } else {
      res = conn.connect(addr.value());
    }
    if (!res) {
      return expected<TcpClient, NetError>::error(NetError::kConnectFailed);
    }

    TcpClient client;
    client.sock_ = std::move(conn);
    return expected<TcpClient, NetError>::success(std::move(client));
  }

  /// Write the whole buffer.
  expected<size_t, NetError> SendAll(const void* data, size_t len) noexcept {
    if (!sock_.is_open()) {
      return expected<size_t, NetError>::error(NetError::kClosed);
    }
    auto res = sock_.write(data, len);
    if (!res || res.value() != len) {
      return expected<size_t, NetError>::error(NetError::kSendFailed);
    }
    return expected<size_t, NetError>::success(res.value());
  }

  /// Read at most @p len bytes; 0 means the peer closed the connection.
  expected<size_t, NetError> Recv(void* buf, size_t len) noexcept {
    if (!sock_.is_open()) {
      return expected<size_t, NetError>::error(NetError::kClosed);
    }
    auto res = sock_.read(buf, len);
    if (!res) {
      const std::error_code& ec = res.error();
      if (ec == std::errc::resource_unavailable_try_again ||
          ec == std::errc::operation_would_block) {
        return expected<size_t, NetError>::error(NetError::kTimeout);
      }
      return expected<size_t, NetError>::error(NetError::kRecvFailed);
    }
    return expected<size_t, NetError>::success(res.value());
  }

  /// Bound every subsequent Recv() to @p timeout_ms.
  bool SetRecvTimeout(uint32_t timeout_ms) noexcept {
    return static_cast<bool>(
        sock_.read_timeout(std::chrono::milliseconds(timeout_ms)));
  }

  int Fd() const noexcept { return sock_.handle(); }
  bool IsOpen() const noexcept { return sock_.is_open(); }
  void Close() noexcept { (void)sock_.close(); }

  TcpClient(TcpClient&& other) noexcept = default;
  TcpClient& operator=(TcpClient&& other) noexcept = default;
  TcpClient(const TcpClient&) = delete;
  TcpClient& operator=(const TcpClient&) = delete;

 private:
  friend class TcpServer;

  explicit TcpClient(sockpp::tcp_socket&& sock) noexcept
      : sock_(std::move(sock)) {}

  sockpp::tcp_socket sock_;
};

// ============================================================================
// TcpServer
// ============================================================================

class TcpServer {
 public:
  TcpServer() noexcept = default;

  /**
   * @brief Listen on @p host:@p port.
   * @param port 0 lets the OS pick a free port; see LocalPort().
   */
  static expected<TcpServer, NetError> Listen(const char* host, uint16_t port,
                                              int32_t backlog = 16) noexcept {
    detail::EnsureSocketsInitialized();
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) {
      return expected<TcpServer, NetError>::error(NetError::kInvalidAddress);
    }

    TcpServer server;
    auto res = server.acc_.open(addr.value(), backlog);
    if (!res) {
      return expected<TcpServer, NetError>::error(NetError::kListenFailed);
    }
    return expected<TcpServer, NetError>::success(std::move(server));
  }

  /// Block until a connection arrives or Shutdown() is called.
  expected<TcpClient, NetError> Accept() noexcept {
    if (!acc_.is_open()) {
      return expected<TcpClient, NetError>::error(NetError::kClosed);
    }
    auto res = acc_.accept();
    if (!res) {
      return expected<TcpClient, NetError>::error(NetError::kAcceptFailed);
    }
    return expected<TcpClient, NetError>::success(TcpClient(res.release()));
  }

  uint16_t LocalPort() const noexcept {
    if (!acc_.is_open()) return 0;
    sockpp::inet_address addr(acc_.address());
    return addr.port();
  }

  /// Wake a thread blocked in Accept(); the listener stays allocated.
  void Shutdown() noexcept { (void)acc_.shutdown(SHUT_RDWR); }

  int Fd() const noexcept { return acc_.handle(); }
  bool IsOpen() const noexcept { return acc_.is_open(); }
  void Close() noexcept { (void)acc_.close(); }

  TcpServer(TcpServer&& other) noexcept = default;
  TcpServer& operator=(TcpServer&& other) noexcept = default;
  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

 private:
  sockpp::tcp_acceptor acc_;
};

}  // namespace net
}  // namespace forge

#endif  // FORGE_NET_HPP_
