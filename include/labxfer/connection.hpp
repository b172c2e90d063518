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
 * @file connection.hpp
 * @brief Connection manager: endpoints, exclusive byte-stream connections,
 *        and the listen / dial factories.
 *
 * A Connection carries exactly one file transfer and is owned by exactly
 * one session. It is move-only and closes its socket on destruction.
 * Close() is idempotent.
 *
 * No retry is performed at this layer; callers decide whether to dial again.
 */

#ifndef LABXFER_CONNECTION_HPP_
#define LABXFER_CONNECTION_HPP_

#include "labxfer/log.hpp"
#include "labxfer/platform.hpp"
#include "labxfer/socket.hpp"
#include "labxfer/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace labxfer {

// ============================================================================
// Endpoint
// ============================================================================

enum class EndpointRole : uint8_t { kListener = 0, kDialer };

inline const char* EndpointRoleName(EndpointRole role) noexcept {
  return (role == EndpointRole::kListener) ? "listener" : "dialer";
}

/**
 * @brief One side of a transfer: address plus whether it accepts or dials.
 *
 * A listener may use port 0 to let the kernel pick a free port.
 */
struct Endpoint {
  std::string host = "127.0.0.1";
  uint16_t port = 0;
  EndpointRole role = EndpointRole::kDialer;
};

/** @brief Map a socket-level failure onto the transfer error taxonomy. */
inline XferError ToXferError(SocketError err) noexcept {
  switch (err) {
    case SocketError::kResolveFailed:
      return XferError::kResolution;
    case SocketError::kConnectRefused:
      return XferError::kConnectionRefused;
    case SocketError::kBindFailed:
    case SocketError::kListenFailed:
      return XferError::kBind;
    case SocketError::kTimeout:
      return XferError::kTimeout;
    case SocketError::kInvalidFd:
      return XferError::kClosed;
    default:
      return XferError::kIo;
  }
}

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief Established bidirectional byte stream between two endpoints.
 *
 * Read and write calls block until the full request is satisfied, the peer
 * closes, or the per-operation I/O timeout expires (0 = no deadline).
 */
class Connection {
 public:
  Connection() noexcept : io_timeout_ms_(0) {}

  explicit Connection(TcpSocket&& sock, uint32_t io_timeout_ms = 0) noexcept
      : sock_(static_cast<TcpSocket&&>(sock)), io_timeout_ms_(0) {
    SetIoTimeout(io_timeout_ms);
  }

  Connection(Connection&&) noexcept = default;
  Connection& operator=(Connection&&) noexcept = default;
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  ~Connection() = default;

  /**
   * @brief Set the per-call read/write deadline.
   *
   * With a deadline the socket runs non-blocking and every recv/send is
   * preceded by poll(); without one it blocks in the kernel.
   */
  void SetIoTimeout(uint32_t timeout_ms) noexcept {
    io_timeout_ms_ = timeout_ms;
    if (sock_.IsValid()) {
      (void)sock_.SetNonBlocking(timeout_ms > 0U);
    }
  }

  uint32_t IoTimeout() const noexcept { return io_timeout_ms_; }

  /**
   * @brief Read up to max bytes; returns 0 when the peer has closed.
   */
  expected<size_t, XferError> ReadSome(void* buf, size_t max) noexcept {
    if (!sock_.IsValid()) {
      return expected<size_t, XferError>::error(XferError::kClosed);
    }
    for (;;) {
      if (io_timeout_ms_ > 0U) {
        auto ready = sock_.WaitReadable(io_timeout_ms_);
        if (!ready.has_value()) {
          return expected<size_t, XferError>::error(
              ToXferError(ready.get_error()));
        }
      }
      auto r = sock_.Recv(buf, max);
      if (r.has_value()) {
        return expected<size_t, XferError>::success(
            static_cast<size_t>(r.value()));
      }
      if (r.get_error() != SocketError::kWouldBlock) {
        return expected<size_t, XferError>::error(XferError::kIo);
      }
    }
  }

  /**
   * @brief Read exactly n bytes.
   * @param[out] got Bytes actually stored in buf, also on failure.
   * @return kIo if the peer closes before n bytes arrive, kTimeout on deadline.
   */
  expected<void, XferError> ReadExact(void* buf, size_t n,
                                      size_t* got = nullptr) noexcept {
    auto* p = static_cast<uint8_t*>(buf);
    size_t total = 0;
    while (total < n) {
      auto r = ReadSome(p + total, n - total);
      if (!r.has_value()) {
        if (got != nullptr) *got = total;
        return expected<void, XferError>::error(r.get_error());
      }
      if (r.value() == 0U) {
        if (got != nullptr) *got = total;
        return expected<void, XferError>::error(XferError::kIo);
      }
      total += r.value();
    }
    if (got != nullptr) *got = total;
    return expected<void, XferError>::success();
  }

  /** @brief Read exactly n bytes into a new buffer. */
  expected<std::vector<uint8_t>, XferError> Read(size_t n) {
    std::vector<uint8_t> out(n);
    auto r = ReadExact(out.data(), n);
    if (!r.has_value()) {
      return expected<std::vector<uint8_t>, XferError>::error(r.get_error());
    }
    return expected<std::vector<uint8_t>, XferError>::success(
        static_cast<std::vector<uint8_t>&&>(out));
  }

  /**
   * @brief Write all len bytes.
   * @return len on success; kIo if the peer goes away, kTimeout on deadline.
   */
  expected<size_t, XferError> WriteAll(const void* data, size_t len) noexcept {
    if (!sock_.IsValid()) {
      return expected<size_t, XferError>::error(XferError::kClosed);
    }
    const auto* p = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < len) {
      if (io_timeout_ms_ > 0U) {
        auto ready = sock_.WaitWritable(io_timeout_ms_);
        if (!ready.has_value()) {
          return expected<size_t, XferError>::error(
              ToXferError(ready.get_error()));
        }
      }
      auto r = sock_.Send(p + sent, len - sent);
      if (!r.has_value()) {
        if (r.get_error() == SocketError::kWouldBlock) continue;
        return expected<size_t, XferError>::error(XferError::kIo);
      }
      sent += static_cast<size_t>(r.value());
    }
    return expected<size_t, XferError>::success(sent);
  }

  /** @brief Close the connection. Idempotent - safe to call multiple times. */
  void Close() noexcept { sock_.Close(); }

  bool IsOpen() const noexcept { return sock_.IsValid(); }
  int32_t Fd() const noexcept { return sock_.Fd(); }

 private:
  TcpSocket sock_;
  uint32_t io_timeout_ms_;
};

// ============================================================================
// Listener
// ============================================================================

/**
 * @brief Long-lived listening socket that hands out one Connection per peer.
 *
 * The only resource that may outlive a session. Close it on shutdown.
 */
class Listener {
 public:
  Listener() noexcept = default;

  Listener(Listener&&) noexcept = default;
  Listener& operator=(Listener&&) noexcept = default;
  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  /**
   * @brief Bind and listen on endpoint.host:endpoint.port.
   * @return kResolution for an unusable host, kBind if the address is taken.
   */
  static expected<Listener, XferError> Open(
      const Endpoint& ep, int32_t backlog = kDefaultBacklog) noexcept {
    auto addr = SocketAddress::Resolve(ep.host.c_str(), ep.port);
    if (!addr.has_value()) {
      LABXFER_LOG_ERROR("CONN", "cannot resolve listen host '%s'",
                        ep.host.c_str());
      return expected<Listener, XferError>::error(XferError::kResolution);
    }
    auto created = TcpListener::Create();
    if (!created.has_value()) {
      return expected<Listener, XferError>::error(XferError::kBind);
    }
    Listener l;
    l.sock_ = static_cast<TcpListener&&>(created.value());
    (void)l.sock_.SetReuseAddr(true);

    auto bound = l.sock_.Bind(addr.value());
    if (!bound.has_value()) {
      LABXFER_LOG_ERROR("CONN", "bind %s:%u failed: %s", ep.host.c_str(),
                        ep.port, std::strerror(errno));
      return expected<Listener, XferError>::error(XferError::kBind);
    }
    auto listening = l.sock_.Listen(backlog);
    if (!listening.has_value()) {
      return expected<Listener, XferError>::error(XferError::kBind);
    }
    LABXFER_LOG_INFO("CONN", "listening on %s:%u", ep.host.c_str(),
                     l.sock_.LocalPort());
    return expected<Listener, XferError>::success(static_cast<Listener&&>(l));
  }

  /**
   * @brief Wait up to timeout_ms for one peer (0 = forever).
   * @param io_timeout_ms Read/write deadline applied to the new Connection.
   */
  expected<Connection, XferError> Accept(uint32_t timeout_ms,
                                         uint32_t io_timeout_ms = 0) noexcept {
    if (!sock_.IsValid()) {
      return expected<Connection, XferError>::error(XferError::kClosed);
    }
    SocketAddress peer;
    auto accepted = sock_.Accept(timeout_ms, &peer);
    if (!accepted.has_value()) {
      return expected<Connection, XferError>::error(
          ToXferError(accepted.get_error()));
    }
    char ip[INET_ADDRSTRLEN];
    LABXFER_LOG_INFO("CONN", "accepted peer %s:%u",
                     peer.ToString(ip, sizeof(ip)), peer.Port());
    return expected<Connection, XferError>::success(
        Connection(static_cast<TcpSocket&&>(accepted.value()), io_timeout_ms));
  }

  /** @brief Bound port (resolves port 0 to the kernel's choice). */
  uint16_t Port() const noexcept { return sock_.LocalPort(); }

  void Close() noexcept { sock_.Close(); }
  bool IsOpen() const noexcept { return sock_.IsValid(); }
  int32_t Fd() const noexcept { return sock_.Fd(); }

 private:
  TcpListener sock_;
};

// ============================================================================
// Factories
// ============================================================================

/**
 * @brief Bind, accept exactly one peer, release the listening socket.
 * @return kTimeout if nobody connects within accept_timeout_ms.
 */
inline expected<Connection, XferError> Listen(const Endpoint& ep,
                                              uint32_t accept_timeout_ms,
                                              uint32_t io_timeout_ms = 0) {
  auto listener = Listener::Open(ep, 1);
  if (!listener.has_value()) {
    return expected<Connection, XferError>::error(listener.get_error());
  }
  auto conn = listener.value().Accept(accept_timeout_ms, io_timeout_ms);
  if (!conn.has_value() && conn.get_error() == XferError::kTimeout) {
    LABXFER_LOG_WARN("CONN", "no peer connected to port %u within %u ms",
                     listener.value().Port(), accept_timeout_ms);
  }
  return conn;
}

/**
 * @brief Resolve ep.host and connect within connect_timeout_ms.
 * @return kResolution, kConnectionRefused, or kTimeout on failure.
 */
inline expected<Connection, XferError> Dial(const Endpoint& ep,
                                            uint32_t connect_timeout_ms,
                                            uint32_t io_timeout_ms = 0) {
  if (ep.port == 0U) {
    LABXFER_LOG_ERROR("CONN", "cannot dial port 0");
    return expected<Connection, XferError>::error(XferError::kResolution);
  }
  auto addr = SocketAddress::Resolve(ep.host.c_str(), ep.port);
  if (!addr.has_value()) {
    LABXFER_LOG_ERROR("CONN", "cannot resolve host '%s'", ep.host.c_str());
    return expected<Connection, XferError>::error(XferError::kResolution);
  }
  auto created = TcpSocket::Create();
  if (!created.has_value()) {
    return expected<Connection, XferError>::error(XferError::kIo);
  }
  TcpSocket sock = static_cast<TcpSocket&&>(created.value());
  auto connected = sock.Connect(addr.value(), connect_timeout_ms);
  if (!connected.has_value()) {
    const XferError err = ToXferError(connected.get_error());
    LABXFER_LOG_WARN("CONN", "connect %s:%u failed: %s", ep.host.c_str(),
                     ep.port, XferErrorString(err));
    return expected<Connection, XferError>::error(err);
  }
  (void)sock.SetNoDelay(true);
  LABXFER_LOG_INFO("CONN", "connected to %s:%u", ep.host.c_str(), ep.port);
  return expected<Connection, XferError>::success(
      Connection(static_cast<TcpSocket&&>(sock), io_timeout_ms));
}

/**
 * @brief Listen or dial depending on ep.role.
 * @param timeout_ms accept deadline for listeners, connect deadline for dialers.
 */
inline expected<Connection, XferError> Connect(const Endpoint& ep,
                                               uint32_t timeout_ms,
                                               uint32_t io_timeout_ms = 0) {
  return (ep.role == EndpointRole::kListener)
             ? Listen(ep, timeout_ms, io_timeout_ms)
             : Dial(ep, timeout_ms, io_timeout_ms);
}

}  // namespace labxfer

#endif  // LABXFER_CONNECTION_HPP_
