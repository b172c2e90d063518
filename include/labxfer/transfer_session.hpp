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
 * @file transfer_session.hpp
 * @brief One-file-per-connection transfer state machine.
 *
 *   kIdle -> kConnecting -> kAwaitingName -> kAwaitingSize
 *         -> kAwaitingContent -> kCompleted
 *   (any state) -> kFailed
 *
 * On the sending side the state names the frame currently being written.
 * Both terminal states close the connection before the result is returned.
 *
 * Receive() streams CONTENT into a temporary "<dest_dir>/.<name>.XXXXXX.part"
 * private to the session and renames it to "<dest_dir>/<name>" only after
 * exactly SIZE bytes arrived; on failure the partial file is removed.
 */

#ifndef LABXFER_TRANSFER_SESSION_HPP_
#define LABXFER_TRANSFER_SESSION_HPP_

#include "labxfer/connection.hpp"
#include "labxfer/frame_codec.hpp"
#include "labxfer/log.hpp"
#include "labxfer/vocabulary.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace labxfer {

// ============================================================================
// Types
// ============================================================================

enum class SessionState : uint8_t {
  kIdle = 0,
  kConnecting,
  kAwaitingName,
  kAwaitingSize,
  kAwaitingContent,
  kCompleted,
  kFailed,
};

inline const char* SessionStateName(SessionState state) noexcept {
  switch (state) {
    case SessionState::kIdle:
      return "IDLE";
    case SessionState::kConnecting:
      return "CONNECTING";
    case SessionState::kAwaitingName:
      return "AWAITING_NAME";
    case SessionState::kAwaitingSize:
      return "AWAITING_SIZE";
    case SessionState::kAwaitingContent:
      return "AWAITING_CONTENT";
    case SessionState::kCompleted:
      return "COMPLETED";
    case SessionState::kFailed:
      return "FAILED";
  }
  return "?";
}

enum class TransferStatus : uint8_t { kCompleted = 0, kFailed };

/**
 * @brief Outcome of one session. Built once, at the terminal state.
 */
struct TransferResult {
  TransferStatus status = TransferStatus::kFailed;
  uint64_t bytes_transferred = 0;
  optional<XferError> error;
  /// State the session was in when it failed (kCompleted on success).
  SessionState failed_stage = SessionState::kIdle;
  std::string file_name;

  bool ok() const noexcept { return status == TransferStatus::kCompleted; }
};

struct TransferOptions {
  uint32_t connect_timeout_ms = 10000U;
  uint32_t accept_timeout_ms = 10000U;
  /// Applied to every connection handed to a session (0 = no deadline).
  uint32_t io_timeout_ms = 10000U;
  uint32_t chunk_bytes = kDefaultChunkBytes;
  FrameLimits limits;
};

namespace detail {

inline std::string PathBasename(const std::string& path) {
  if (path.empty()) return path;
  size_t end = path.size();
  while (end > 1U && path[end - 1U] == '/') --end;
  const size_t slash = path.rfind('/', end - 1U);
  if (slash == std::string::npos) return path.substr(0, end);
  return path.substr(slash + 1U, end - slash - 1U);
}

inline std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

/// Name component kept in temporary file names, so the template stays
/// within NAME_MAX for any accepted file name.
static constexpr size_t kPartNameKeep = 64U;

/**
 * @brief Create and open a unique "<dir>/.<name>.XXXXXX.part" for writing.
 *
 * Concurrent sessions receiving the same name never share a temporary
 * file. On success *path holds the created file's path.
 */
inline FILE* OpenPartFile(const std::string& dir, const std::string& name,
                          std::string* path) {
  std::string tmpl = JoinPath(dir, "." + name.substr(0, kPartNameKeep) +
                                       ".XXXXXX.part");
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  const int fd = ::mkstemps(buf.data(), 5);
  if (fd < 0) return nullptr;
  *path = buf.data();
  (void)::fchmod(fd, 0644);
  FILE* fp = ::fdopen(fd, "wb");
  if (fp == nullptr) {
    const int saved = errno;
    (void)::close(fd);
    (void)::unlink(path->c_str());
    errno = saved;
  }
  return fp;
}

}  // namespace detail

// ============================================================================
// TransferSession
// ============================================================================

/**
 * @brief Drives the codec through one NAME / SIZE / CONTENT exchange.
 *
 * Every entry point takes ownership of the connection and returns a
 * TransferResult; none of them report a partial transfer as completed.
 * A session object may be reused, each call starts again at kIdle.
 * Not thread-safe: use one session per thread.
 */
class TransferSession {
 public:
  explicit TransferSession(const TransferOptions& opts = TransferOptions{})
      : opts_(opts) {}

  SessionState State() const noexcept { return state_; }
  const TransferOptions& Options() const noexcept { return opts_; }

  // --------------------------------------------------------------------------
  // Sending
  // --------------------------------------------------------------------------

  /** @brief Send an in-memory buffer under the given file name. */
  TransferResult Send(Connection&& conn, const std::string& name,
                      const void* data, size_t len) {
    Connection c(static_cast<Connection&&>(conn));
    Begin(c, name);

    auto head = SendHeader(c, name, len);
    if (!head.has_value()) return Fail(c, head.get_error());

    auto w = c.WriteAll(data, len);
    if (!w.has_value()) return Fail(c, w.get_error());
    result_.bytes_transferred = len;
    return Complete(c);
  }

  /**
   * @brief Stream a local file. The NAME frame carries basename(path).
   * @return kFileAccess when the file cannot be opened or read.
   */
  TransferResult SendFile(Connection&& conn, const std::string& path) {
    Connection c(static_cast<Connection&&>(conn));
    const std::string name = detail::PathBasename(path);
    Begin(c, name);

    FILE* fp = std::fopen(path.c_str(), "rb");
    if (fp == nullptr) {
      LABXFER_LOG_ERROR("XFER", "cannot open %s: %s", path.c_str(),
                        std::strerror(errno));
      return Fail(c, XferError::kFileAccess);
    }
    LABXFER_SCOPE_EXIT((void)std::fclose(fp));

    struct stat st;
    if (::fstat(::fileno(fp), &st) != 0 || !S_ISREG(st.st_mode)) {
      LABXFER_LOG_ERROR("XFER", "%s is not a regular file", path.c_str());
      return Fail(c, XferError::kFileAccess);
    }
    const uint64_t size = static_cast<uint64_t>(st.st_size);

    auto head = SendHeader(c, name, size);
    if (!head.has_value()) return Fail(c, head.get_error());

    std::vector<uint8_t> chunk(ChunkBytes());
    uint64_t sent = 0;
    while (sent < size) {
      const size_t want = static_cast<size_t>(
          std::min<uint64_t>(chunk.size(), size - sent));
      const size_t n = std::fread(chunk.data(), 1, want, fp);
      if (n == 0U) {
        LABXFER_LOG_ERROR("XFER", "%s shrank while sending (%llu of %llu)",
                          path.c_str(), static_cast<unsigned long long>(sent),
                          static_cast<unsigned long long>(size));
        return Fail(c, XferError::kFileAccess);
      }
      auto w = c.WriteAll(chunk.data(), n);
      if (!w.has_value()) return Fail(c, w.get_error());
      sent += n;
      result_.bytes_transferred = sent;
    }
    return Complete(c);
  }

  /** @brief Dial or listen on ep, then SendFile(). */
  TransferResult SendTo(const Endpoint& ep, const std::string& path) {
    auto conn = Open(ep, detail::PathBasename(path));
    if (!conn.has_value()) return FailUnconnected(conn.get_error());
    return SendFile(static_cast<Connection&&>(conn.value()), path);
  }

  // --------------------------------------------------------------------------
  // Receiving
  // --------------------------------------------------------------------------

  /**
   * @brief Receive one file into dest_dir.
   * @return kFileAccess when the destination cannot be created or renamed.
   */
  TransferResult Receive(Connection&& conn, const std::string& dest_dir) {
    Connection c(static_cast<Connection&&>(conn));
    Begin(c, std::string());

    uint64_t size = 0;
    auto head = ReceiveHeader(c, &size);
    if (!head.has_value()) return Fail(c, head.get_error());

    const std::string final_path = detail::JoinPath(dest_dir, result_.file_name);
    std::string part_path;
    FILE* fp = detail::OpenPartFile(dest_dir, result_.file_name, &part_path);
    if (fp == nullptr) {
      LABXFER_LOG_ERROR("XFER", "cannot create temporary file for %s: %s",
                        final_path.c_str(), std::strerror(errno));
      return Fail(c, XferError::kFileAccess);
    }
    auto cleanup = MakeScopeGuard([&fp, &part_path]() {
      if (fp != nullptr) (void)std::fclose(fp);
      (void)std::remove(part_path.c_str());
    });

    uint64_t received = 0;
    auto body = ReadContent(
        c, size, opts_.limits, ChunkBytes(),
        [fp](const uint8_t* data, size_t n) {
          return std::fwrite(data, 1, n, fp) == n;
        },
        &received);
    result_.bytes_transferred = received;
    if (!body.has_value()) return Fail(c, body.get_error());

    const bool flushed = (std::fflush(fp) == 0);
    const bool closed = (std::fclose(fp) == 0);
    fp = nullptr;
    if (!flushed || !closed ||
        std::rename(part_path.c_str(), final_path.c_str()) != 0) {
      LABXFER_LOG_ERROR("XFER", "cannot finalize %s: %s", final_path.c_str(),
                        std::strerror(errno));
      return Fail(c, XferError::kFileAccess);
    }
    cleanup.release();
    LABXFER_LOG_INFO("XFER", "stored %s", final_path.c_str());
    return Complete(c);
  }

  /** @brief Receive one file into out without touching the filesystem. */
  TransferResult ReceiveToMemory(Connection&& conn, std::vector<uint8_t>& out) {
    Connection c(static_cast<Connection&&>(conn));
    Begin(c, std::string());
    out.clear();

    uint64_t size = 0;
    auto head = ReceiveHeader(c, &size);
    if (!head.has_value()) return Fail(c, head.get_error());

    out.reserve(static_cast<size_t>(size));
    uint64_t received = 0;
    auto body = ReadContent(
        c, size, opts_.limits, ChunkBytes(),
        [&out](const uint8_t* data, size_t n) {
          out.insert(out.end(), data, data + n);
          return true;
        },
        &received);
    result_.bytes_transferred = received;
    if (!body.has_value()) {
      out.clear();
      return Fail(c, body.get_error());
    }
    return Complete(c);
  }

  /** @brief Dial or listen on ep, then Receive(). */
  TransferResult ReceiveFrom(const Endpoint& ep, const std::string& dest_dir) {
    auto conn = Open(ep, std::string());
    if (!conn.has_value()) return FailUnconnected(conn.get_error());
    return Receive(static_cast<Connection&&>(conn.value()), dest_dir);
  }

 private:
  uint32_t ChunkBytes() const noexcept {
    return (opts_.chunk_bytes == 0U) ? kDefaultChunkBytes : opts_.chunk_bytes;
  }

  void Transition(SessionState next) noexcept {
    LABXFER_LOG_DEBUG("XFER", "%s -> %s", SessionStateName(state_),
                      SessionStateName(next));
    state_ = next;
  }

  void Reset(const std::string& name) {
    state_ = SessionState::kIdle;
    result_ = TransferResult{};
    result_.file_name = name;
  }

  void Begin(Connection& c, const std::string& name) {
    if (state_ != SessionState::kConnecting) Reset(name);
    c.SetIoTimeout(opts_.io_timeout_ms);
    Transition(SessionState::kAwaitingName);
  }

  expected<Connection, XferError> Open(const Endpoint& ep,
                                       const std::string& name) {
    Reset(name);
    Transition(SessionState::kConnecting);
    const uint32_t timeout = (ep.role == EndpointRole::kListener)
                                 ? opts_.accept_timeout_ms
                                 : opts_.connect_timeout_ms;
    return Connect(ep, timeout, opts_.io_timeout_ms);
  }

  expected<void, XferError> SendHeader(Connection& c, const std::string& name,
                                       uint64_t size) {
    auto n = WriteName(c, name, opts_.limits);
    if (!n.has_value()) return n;
    Transition(SessionState::kAwaitingSize);
    auto s = WriteSize(c, size, opts_.limits);
    if (!s.has_value()) return s;
    Transition(SessionState::kAwaitingContent);
    return WriteFrameHeader(c, FrameKind::kContent, size, opts_.limits);
  }

  expected<void, XferError> ReceiveHeader(Connection& c, uint64_t* size) {
    auto name = ReadName(c, opts_.limits);
    if (!name.has_value()) {
      return expected<void, XferError>::error(name.get_error());
    }
    result_.file_name = name.value();
    Transition(SessionState::kAwaitingSize);
    auto s = ReadSize(c, opts_.limits);
    if (!s.has_value()) {
      return expected<void, XferError>::error(s.get_error());
    }
    *size = s.value();
    LABXFER_LOG_INFO("XFER", "incoming %s (%llu bytes)",
                     result_.file_name.c_str(),
                     static_cast<unsigned long long>(*size));
    Transition(SessionState::kAwaitingContent);
    return expected<void, XferError>::success();
  }

  TransferResult Complete(Connection& c) {
    c.Close();
    Transition(SessionState::kCompleted);
    result_.status = TransferStatus::kCompleted;
    result_.failed_stage = SessionState::kCompleted;
    LABXFER_LOG_INFO("XFER", "completed %s (%llu bytes)",
                     result_.file_name.c_str(),
                     static_cast<unsigned long long>(result_.bytes_transferred));
    return result_;
  }

  TransferResult Fail(Connection& c, XferError err) {
    c.Close();
    return FailUnconnected(err);
  }

  TransferResult FailUnconnected(XferError err) {
    result_.status = TransferStatus::kFailed;
    result_.error = err;
    result_.failed_stage = state_;
    Transition(SessionState::kFailed);
    LABXFER_LOG_ERROR("XFER", "transfer of '%s' failed in %s: %s",
                      result_.file_name.c_str(),
                      SessionStateName(result_.failed_stage),
                      XferErrorString(err));
    return result_;
  }

  TransferOptions opts_;
  SessionState state_ = SessionState::kIdle;
  TransferResult result_;
};

// ============================================================================
// Driver helpers
// ============================================================================

inline TransferResult SendTo(const Endpoint& ep, const TransferOptions& opts,
                             const std::string& path) {
  TransferSession session(opts);
  return session.SendTo(ep, path);
}

inline TransferResult ReceiveFrom(const Endpoint& ep,
                                  const TransferOptions& opts,
                                  const std::string& dest_dir) {
  TransferSession session(opts);
  return session.ReceiveFrom(ep, dest_dir);
}

}  // namespace labxfer

#endif  // LABXFER_TRANSFER_SESSION_HPP_
