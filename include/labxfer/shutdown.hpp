/**
 * @file shutdown.hpp
 * @brief SIGINT / SIGTERM handling for long-running receivers.
 *
 * The signal handler only flips an atomic flag and writes one byte to a
 * self-pipe; cleanup callbacks run later, LIFO, on the thread that calls
 * WaitForShutdown().
 */

#ifndef LABXFER_SHUTDOWN_HPP_
#define LABXFER_SHUTDOWN_HPP_

#include "labxfer/log.hpp"
#include "labxfer/platform.hpp"
#include "labxfer/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>

#include <unistd.h>

namespace labxfer {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

/// Cleanup callback. signo is 0 for Quit(); ctx is the pointer given to
/// Register().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

inline ShutdownManager*& ActiveShutdownManager() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown coordinator. At most one is active.
 *
 * @code
 *   labxfer::ShutdownManager mgr;
 *   mgr.Register([](int, void* s) { static_cast<TransferServer*>(s)->Stop(); },
 *                &server);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8;

  ShutdownManager() noexcept {
    if (detail::ActiveShutdownManager() != nullptr) return;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ActiveShutdownManager() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) (void)::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) (void)::close(pipe_fd_[1]);
    if (detail::ActiveShutdownManager() == this) {
      detail::ActiveShutdownManager() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// False for a second instance or when pipe(2) failed.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    slots_[count_].fn = fn;
    slots_[count_].ctx = ctx;
    ++count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Request shutdown from code; the first request wins. */
  void Quit(int signo = 0) noexcept {
    bool was = false;
    if (requested_.compare_exchange_strong(was, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Block until a signal or Quit(), then run callbacks LIFO.
   */
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0) {
      uint8_t byte = 0;
      while (!requested_.load()) {
        if (::read(pipe_fd_[0], &byte, 1) == 1) break;
      }
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    LABXFER_LOG_INFO("SHUTDOWN", "shutting down (signal %d), %u callbacks",
                     signo, count_);
    for (uint32_t i = count_; i > 0U; --i) {
      slots_[i - 1U].fn(signo, slots_[i - 1U].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept { return requested_.load(); }

 private:
  struct Slot {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  // async-signal-safe: atomics and write(2) only
  static void OnSignal(int signo) {
    ShutdownManager* self = detail::ActiveShutdownManager();
    if (self == nullptr) return;
    self->requested_.store(true);
    self->signo_.store(signo, std::memory_order_relaxed);
    self->Wake();
  }

  Slot slots_[kMaxCallbacks];
  uint32_t count_ = 0;
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  bool valid_ = false;
};

}  // namespace labxfer

#endif  // LABXFER_SHUTDOWN_HPP_
