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
 * @file socket.hpp
 * @brief IPv4 stream sockets owned by RAII handles, with deadline support.
 *
 * SocketAddress resolves literals and host names; TcpSocket and TcpListener
 * share one descriptor-owning base. Every call reports failure through
 * SocketResult<V> / SocketStatus instead of errno. A timeout of 0 ms means
 * the call may block indefinitely.
 */

#ifndef LABXFER_SOCKET_HPP_
#define LABXFER_SOCKET_HPP_

#include "labxfer/platform.hpp"
#include "labxfer/vocabulary.hpp"

#if LABXFER_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace labxfer {

constexpr int32_t kDefaultBacklog = 16;

enum class SocketError : uint8_t {
  kInvalidFd = 0,   ///< Handle is closed, or poll() rejected the fd.
  kResolveFailed,   ///< Not an IPv4 literal and getaddrinfo found nothing.
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kConnectRefused,  ///< ECONNREFUSED: nobody listening on the peer port.
  kTimeout,         ///< Deadline expired while waiting for readiness.
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kWouldBlock       ///< EAGAIN on a non-blocking fd; retry after polling.
};

template <typename V>
using SocketResult = expected<V, SocketError>;
using SocketStatus = expected<void, SocketError>;

namespace detail {

inline SocketStatus SocketOk() noexcept { return SocketStatus::success(); }

inline SocketStatus SocketFail(SocketError err) noexcept {
  return SocketStatus::error(err);
}

/**
 * @brief Wait until fd reports one of events.
 *
 * EINTR restarts the wait with whatever time is left.
 */
inline SocketStatus PollFd(int32_t fd, int16_t events,
                           uint32_t timeout_ms) noexcept {
  const uint64_t deadline = SteadyNowMs() + timeout_ms;
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  for (;;) {
    int32_t remaining = -1;
    if (timeout_ms != 0U) {
      const uint64_t now = SteadyNowMs();
      const uint64_t left = (now < deadline) ? (deadline - now) : 0U;
      remaining = (left > 0x7FFFFFFFU) ? 0x7FFFFFFF : static_cast<int32_t>(left);
    }
    pfd.revents = 0;
    const int32_t rc = ::poll(&pfd, 1, remaining);
    if (rc > 0) return SocketOk();
    if (rc == 0) return SocketFail(SocketError::kTimeout);
    if (errno != EINTR) return SocketFail(SocketError::kInvalidFd);
  }
}

inline SocketStatus SetFdNonBlocking(int32_t fd, bool enable) noexcept {
  const int32_t flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return SocketFail(SocketError::kSetOptFailed);
  const int32_t wanted = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (wanted != flags && ::fcntl(fd, F_SETFL, wanted) < 0) {
    return SocketFail(SocketError::kSetOptFailed);
  }
  return SocketOk();
}

inline SocketStatus SetIntOption(int32_t fd, int32_t level, int32_t name,
                                 int32_t value) noexcept {
  if (::setsockopt(fd, level, name, &value,
                   static_cast<socklen_t>(sizeof(value))) != 0) {
    return SocketFail(SocketError::kSetOptFailed);
  }
  return SocketOk();
}

inline SocketResult<int32_t> OpenStreamFd() noexcept {
  const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return SocketResult<int32_t>::error(SocketError::kInvalidFd);
  return SocketResult<int32_t>::success(fd);
}

/// Sign of a send()/recv() return folded into the socket error space.
inline SocketResult<int32_t> TransferCount(ssize_t n,
                                           SocketError hard_err) noexcept {
  if (n >= 0) return SocketResult<int32_t>::success(static_cast<int32_t>(n));
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return SocketResult<int32_t>::error(SocketError::kWouldBlock);
  }
  return SocketResult<int32_t>::error(hard_err);
}

/**
 * @brief Move-only owner of one file descriptor, closed on destruction.
 */
class FdHandle {
 public:
  FdHandle(const FdHandle&) = delete;
  FdHandle& operator=(const FdHandle&) = delete;

  /** @brief Close the descriptor. Safe to call repeatedly. */
  void Close() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 protected:
  FdHandle() noexcept = default;
  explicit FdHandle(int32_t fd) noexcept : fd_(fd) {}
  ~FdHandle() { Close(); }

  FdHandle(FdHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  FdHandle& operator=(FdHandle&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  SocketStatus RequireOpen() const noexcept {
    return (fd_ >= 0) ? SocketOk() : SocketFail(SocketError::kInvalidFd);
  }

  int32_t fd_ = -1;
};

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 address and port (sockaddr_in). */
class SocketAddress {
 public:
  SocketAddress() noexcept {
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin_family = AF_INET;
  }

  /**
   * @brief Parse a dotted-decimal literal.
   * @return kResolveFailed for anything that is not an IPv4 literal.
   */
  static SocketResult<SocketAddress> FromIpv4(const char* ip,
                                              uint16_t port) noexcept {
    SocketAddress out;
    out.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &out.addr_.sin_addr) != 1) {
      return SocketResult<SocketAddress>::error(SocketError::kResolveFailed);
    }
    return SocketResult<SocketAddress>::success(out);
  }

  /**
   * @brief Literal first, then getaddrinfo(AF_INET) for names such as
   *        "localhost" or a DNS host. The first IPv4 answer is used.
   */
  static SocketResult<SocketAddress> Resolve(const char* host,
                                             uint16_t port) noexcept {
    if (host == nullptr || *host == '\0') {
      return SocketResult<SocketAddress>::error(SocketError::kResolveFailed);
    }
    auto literal = FromIpv4(host, port);
    if (literal.has_value()) return literal;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* found = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &found) != 0 || found == nullptr) {
      return SocketResult<SocketAddress>::error(SocketError::kResolveFailed);
    }
    SocketAddress out;
    std::memcpy(&out.addr_, found->ai_addr, sizeof(out.addr_));
    ::freeaddrinfo(found);
    out.addr_.sin_port = htons(port);
    return SocketResult<SocketAddress>::success(out);
  }

  /** @brief getsockname() of fd. */
  static SocketResult<SocketAddress> LocalOf(int32_t fd) noexcept {
    SocketAddress out;
    socklen_t len = out.Size();
    if (::getsockname(fd, out.RawMut(), &len) != 0) {
      return SocketResult<SocketAddress>::error(SocketError::kInvalidFd);
    }
    return SocketResult<SocketAddress>::success(out);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept { return sizeof(sockaddr_in); }

  /// Host byte order.
  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /** @brief Write the dotted-decimal address into buf and return buf. */
  const char* ToString(char* buf, socklen_t size) const noexcept {
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, size) == nullptr &&
        size > 0) {
      buf[0] = '\0';
    }
    return buf;
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief Connected (or connectable) TCP stream.
 *
 * Send/Recv restart on EINTR and report EAGAIN as kWouldBlock, so a caller
 * that switched the fd to non-blocking mode polls and retries.
 */
class TcpSocket : public detail::FdHandle {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static SocketResult<TcpSocket> Create() noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) return SocketResult<TcpSocket>::error(fd.get_error());
    return SocketResult<TcpSocket>::success(TcpSocket(fd.value()));
  }

  /**
   * @brief connect() with an optional deadline.
   *
   * With timeout_ms > 0 the connect runs non-blocking, waits for POLLOUT,
   * reads SO_ERROR and leaves the socket blocking again.
   */
  SocketStatus Connect(const SocketAddress& addr,
                       uint32_t timeout_ms = 0) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) return open;
    if (timeout_ms == 0U) {
      return (::connect(fd_, addr.Raw(), addr.Size()) == 0)
                 ? detail::SocketOk()
                 : detail::SocketFail(MapConnectErrno(errno));
    }

    auto nb = detail::SetFdNonBlocking(fd_, true);
    if (!nb.has_value()) return nb;
    SocketStatus outcome = AwaitConnect(addr, timeout_ms);
    auto restored = detail::SetFdNonBlocking(fd_, false);
    if (outcome.has_value() && !restored.has_value()) return restored;
    return outcome;
  }

  SocketResult<int32_t> Send(const void* data, size_t len) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) {
      return SocketResult<int32_t>::error(open.get_error());
    }
    ssize_t n;
    do {
      n = ::send(fd_, data, len, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);
    return detail::TransferCount(n, SocketError::kSendFailed);
  }

  /** @brief One recv(). Zero bytes means the peer shut down its side. */
  SocketResult<int32_t> Recv(void* buf, size_t len) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) {
      return SocketResult<int32_t>::error(open.get_error());
    }
    ssize_t n;
    do {
      n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    return detail::TransferCount(n, SocketError::kRecvFailed);
  }

  /** @brief Wait for data or EOF. */
  SocketStatus WaitReadable(uint32_t timeout_ms) const noexcept {
    auto open = RequireOpen();
    return open.has_value() ? detail::PollFd(fd_, POLLIN, timeout_ms) : open;
  }

  SocketStatus WaitWritable(uint32_t timeout_ms) const noexcept {
    auto open = RequireOpen();
    return open.has_value() ? detail::PollFd(fd_, POLLOUT, timeout_ms) : open;
  }

  SocketStatus SetNonBlocking(bool enable) noexcept {
    auto open = RequireOpen();
    return open.has_value() ? detail::SetFdNonBlocking(fd_, enable) : open;
  }

  SocketStatus SetNoDelay(bool enable) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) return open;
    return detail::SetIntOption(fd_, IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
  }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : FdHandle(fd) {}

  static SocketError MapConnectErrno(int32_t err) noexcept {
    if (err == ECONNREFUSED) return SocketError::kConnectRefused;
    if (err == ETIMEDOUT) return SocketError::kTimeout;
    return SocketError::kConnectFailed;
  }

  /// Non-blocking connect body; the caller restores blocking mode.
  SocketStatus AwaitConnect(const SocketAddress& addr,
                            uint32_t timeout_ms) noexcept {
    if (::connect(fd_, addr.Raw(), addr.Size()) == 0) return detail::SocketOk();
    if (errno != EINPROGRESS) {
      return detail::SocketFail(MapConnectErrno(errno));
    }
    auto ready = detail::PollFd(fd_, POLLOUT, timeout_ms);
    if (!ready.has_value()) return ready;

    int32_t pending = 0;
    socklen_t len = static_cast<socklen_t>(sizeof(pending));
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &pending, &len) != 0) {
      pending = errno;
    }
    return (pending == 0) ? detail::SocketOk()
                          : detail::SocketFail(MapConnectErrno(pending));
  }
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief Passive TCP socket: Create, Bind, Listen, then Accept peers.
 */
class TcpListener : public detail::FdHandle {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static SocketResult<TcpListener> Create() noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) {
      return SocketResult<TcpListener>::error(fd.get_error());
    }
    return SocketResult<TcpListener>::success(TcpListener(fd.value()));
  }

  SocketStatus SetReuseAddr(bool enable) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) return open;
    return detail::SetIntOption(fd_, SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  SocketStatus Bind(const SocketAddress& addr) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) return open;
    return (::bind(fd_, addr.Raw(), addr.Size()) == 0)
               ? detail::SocketOk()
               : detail::SocketFail(SocketError::kBindFailed);
  }

  SocketStatus Listen(int32_t backlog = kDefaultBacklog) noexcept {
    auto open = RequireOpen();
    if (!open.has_value()) return open;
    return (::listen(fd_, backlog) == 0)
               ? detail::SocketOk()
               : detail::SocketFail(SocketError::kListenFailed);
  }

  /**
   * @brief Take the next pending peer.
   * @param timeout_ms How long to wait for a peer; 0 blocks.
   * @param[out] peer  Remote address, when non-null.
   */
  SocketResult<TcpSocket> Accept(uint32_t timeout_ms = 0,
                                 SocketAddress* peer = nullptr) noexcept {
    auto open = RequireOpen();
    if (open.has_value() && timeout_ms != 0U) {
      open = detail::PollFd(fd_, POLLIN, timeout_ms);
    }
    if (!open.has_value()) {
      return SocketResult<TcpSocket>::error(open.get_error());
    }

    SocketAddress scratch;
    SocketAddress* from = (peer != nullptr) ? peer : &scratch;
    socklen_t len = from->Size();
    int32_t fd;
    do {
      fd = ::accept(fd_, from->RawMut(), &len);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) return SocketResult<TcpSocket>::error(SocketError::kAcceptFailed);
    return SocketResult<TcpSocket>::success(TcpSocket(fd));
  }

  /** @brief Bound port; after binding port 0 this is the kernel's pick. */
  uint16_t LocalPort() const noexcept {
    if (!IsValid()) return 0;
    auto local = SocketAddress::LocalOf(fd_);
    return local.has_value() ? local.value().Port() : 0;
  }

 private:
  explicit TcpListener(int32_t fd) noexcept : FdHandle(fd) {}
};

}  // namespace labxfer

#endif  // LABXFER_HAS_NETWORK

#endif  // LABXFER_SOCKET_HPP_
