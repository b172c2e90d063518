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
 * @file transfer_server.hpp
 * @brief Receiving service: one listening socket, one session per peer.
 *
 *   Mode::kSerial               accept -> Receive() inline -> accept ...
 *   Mode::kThreadPerConnection  accept -> std::thread(Receive()) -> accept ...
 *
 * Sessions share nothing but the completion callback, whose invocations are
 * serialized by a mutex. The accept loop polls with a short timeout so Stop() is
 * observed promptly.
 */

#ifndef LABXFER_TRANSFER_SERVER_HPP_
#define LABXFER_TRANSFER_SERVER_HPP_

#include "labxfer/connection.hpp"
#include "labxfer/log.hpp"
#include "labxfer/transfer_session.hpp"
#include "labxfer/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace labxfer {

struct ServerConfig {
  enum class Mode : uint8_t { kSerial = 0, kThreadPerConnection };

  Endpoint endpoint{"0.0.0.0", 5001U, EndpointRole::kListener};
  Mode mode = Mode::kSerial;
  TransferOptions options;
  std::string dest_dir = ".";
  /// Upper bound on concurrent sessions in kThreadPerConnection mode.
  /// 0 removes the bound.
  uint32_t max_sessions = 16U;
  /// Accept poll interval; bounds how long Stop() waits for the loop.
  uint32_t poll_ms = 100U;
};

class TransferServer {
 public:
  using Mode = ServerConfig::Mode;
  using CompletionFn = std::function<void(const TransferResult&)>;

  explicit TransferServer(const ServerConfig& cfg) : cfg_(cfg) {}

  ~TransferServer() { Stop(); }

  TransferServer(const TransferServer&) = delete;
  TransferServer& operator=(const TransferServer&) = delete;

  /**
   * @brief Called once per finished session, from the session's thread.
   *
   * Invocations never overlap. The callback may call Stop() or replace
   * itself; a replacement takes effect from the next session.
   */
  void SetCompletionCallback(CompletionFn fn) {
    std::lock_guard<std::mutex> lock(callback_mtx_);
    on_complete_ = static_cast<CompletionFn&&>(fn);
  }

  /** @brief Bind and listen. Port() is valid afterwards. */
  expected<void, XferError> Start() {
    auto l = Listener::Open(cfg_.endpoint);
    if (!l.has_value()) {
      return expected<void, XferError>::error(l.get_error());
    }
    listener_ = static_cast<Listener&&>(l.value());
    running_.store(true);
    LABXFER_LOG_INFO("SERVER", "receiving into %s (%s mode)",
                     cfg_.dest_dir.c_str(),
                     cfg_.mode == Mode::kSerial ? "serial" : "threaded");
    return expected<void, XferError>::success();
  }

  uint16_t Port() const noexcept { return listener_.Port(); }
  bool IsRunning() const noexcept { return running_.load(); }

  /**
   * @brief Accept exactly one peer and run its session inline.
   * @return kTimeout if nobody connected within timeout_ms.
   */
  expected<TransferResult, XferError> ServeOne(uint32_t timeout_ms) {
    auto conn = listener_.Accept(timeout_ms, cfg_.options.io_timeout_ms);
    if (!conn.has_value()) {
      return expected<TransferResult, XferError>::error(conn.get_error());
    }
    TransferResult r = RunSession(static_cast<Connection&&>(conn.value()));
    return expected<TransferResult, XferError>::success(
        static_cast<TransferResult&&>(r));
  }

  /**
   * @brief Accept loop. Returns after Stop(), once every session finished.
   */
  void Run() {
    {
      std::lock_guard<std::mutex> lock(run_mtx_);
      run_active_ = true;
      run_thread_ = std::this_thread::get_id();
    }
    while (running_.load()) {
      ReapSessions(false);
      if (AtSessionCap()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_ms));
        continue;
      }
      auto conn = listener_.Accept(cfg_.poll_ms, cfg_.options.io_timeout_ms);
      if (!conn.has_value()) {
        if (conn.get_error() == XferError::kTimeout) continue;
        if (!running_.load() || conn.get_error() == XferError::kClosed) break;
        LABXFER_LOG_WARN("SERVER", "accept failed: %s, retrying in %u ms",
                         XferErrorString(conn.get_error()), cfg_.poll_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_ms));
        continue;
      }
      if (cfg_.mode == Mode::kSerial) {
        (void)RunSession(static_cast<Connection&&>(conn.value()));
      } else {
        Spawn(static_cast<Connection&&>(conn.value()));
      }
    }
    ReapSessions(true);
    listener_.Close();
    {
      std::lock_guard<std::mutex> lock(run_mtx_);
      run_active_ = false;
    }
    run_cv_.notify_all();
    LABXFER_LOG_INFO("SERVER", "stopped: %u completed, %u failed",
                     completed_.load(), failed_.load());
  }

  /**
   * @brief Stop accepting, close the listening socket, join sessions.
   *
   * Safe from any thread. From inside a completion callback it only
   * requests the stop; Run() finishes the rest.
   */
  void Stop() {
    running_.store(false);
    if (InCallback()) return;
    std::unique_lock<std::mutex> lock(run_mtx_);
    if (run_active_ && run_thread_ == std::this_thread::get_id()) return;
    run_cv_.wait(lock, [this]() { return !run_active_; });
    lock.unlock();
    ReapSessions(true);
    listener_.Close();
  }

  uint32_t CompletedCount() const noexcept { return completed_.load(); }
  uint32_t FailedCount() const noexcept { return failed_.load(); }
  uint32_t ActiveSessions() const noexcept { return active_.load(); }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  bool AtSessionCap() const noexcept {
    return cfg_.mode == Mode::kThreadPerConnection && cfg_.max_sessions != 0U &&
           active_.load() >= cfg_.max_sessions;
  }

  TransferResult RunSession(Connection&& conn) {
    TransferSession session(cfg_.options);
    TransferResult r =
        session.Receive(static_cast<Connection&&>(conn), cfg_.dest_dir);
    Report(r);
    return r;
  }

  void Spawn(Connection&& conn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    active_.fetch_add(1U);
    Worker w;
    w.done = done;
    w.thread = std::thread(
        [this, done, c = static_cast<Connection&&>(conn)]() mutable {
          (void)RunSession(static_cast<Connection&&>(c));
          active_.fetch_sub(1U);
          done->store(true);
        });
    std::lock_guard<std::mutex> lock(workers_mtx_);
    workers_.push_back(static_cast<Worker&&>(w));
  }

  /// Join finished workers, or all of them when wait_all is set.
  void ReapSessions(bool wait_all) {
    std::lock_guard<std::mutex> lock(workers_mtx_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (wait_all || it->done->load()) {
        if (it->thread.joinable()) it->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void Report(const TransferResult& r) {
    if (r.ok()) {
      completed_.fetch_add(1U);
    } else {
      failed_.fetch_add(1U);
    }
    std::lock_guard<std::mutex> lock(report_mtx_);
    CompletionFn fn;
    {
      std::lock_guard<std::mutex> fn_lock(callback_mtx_);
      fn = on_complete_;
    }
    if (!fn) return;
    InCallback() = true;
    LABXFER_SCOPE_EXIT(InCallback() = false);
    fn(r);
  }

  static bool& InCallback() noexcept {
    static thread_local bool in_callback = false;
    return in_callback;
  }

  ServerConfig cfg_;
  Listener listener_;
  std::atomic<bool> running_{false};
  std::atomic<uint32_t> active_{0};
  std::atomic<uint32_t> completed_{0};
  std::atomic<uint32_t> failed_{0};

  std::mutex run_mtx_;
  std::condition_variable run_cv_;
  bool run_active_ = false;
  std::thread::id run_thread_;

  std::mutex workers_mtx_;
  std::vector<Worker> workers_;

  std::mutex report_mtx_;
  std::mutex callback_mtx_;
  CompletionFn on_complete_;
};

}  // namespace labxfer

#endif  // LABXFER_TRANSFER_SERVER_HPP_
