/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every labxfer module.
 *
 * Provides:
 *   - expected<V, E>  -- value-or-error return type (no exceptions)
 *   - optional<T>     -- nullable value without heap allocation
 *   - and_then / or_else helpers for expected
 *   - ScopeGuard + LABXFER_SCOPE_EXIT for RAII cleanup
 *   - Module error enums (XferError, ConfigError)
 *   - Monotonic clock helpers
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LABXFER_VOCABULARY_HPP_
#define LABXFER_VOCABULARY_HPP_

#include "labxfer/platform.hpp"

#include <chrono>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace labxfer {

// ============================================================================
// Error Enums
// ============================================================================

/// Failure kinds of the file-transfer stack (connection, codec, session).
enum class XferError : uint8_t {
  kResolution = 0,     ///< Host name could not be resolved to IPv4.
  kConnectionRefused,  ///< Peer is not listening.
  kBind,               ///< Local address unavailable.
  kTimeout,            ///< accept / connect / read / write deadline expired.
  kIo,                 ///< Short read/write or peer closed mid-frame.
  kFrameTooLarge,      ///< Declared length exceeds the configured ceiling.
  kInvalidName,        ///< File name empty or contains a path separator.
  kSizeMismatch,       ///< CONTENT bytes differ from the SIZE declaration.
  kMalformedFrame,     ///< SIZE frame payload is not 8 bytes.
  kFileAccess,         ///< Local file could not be opened/written/renamed.
  kClosed,             ///< Operation on a closed connection.
};

inline const char* XferErrorString(XferError err) noexcept {
  switch (err) {
    case XferError::kResolution:
      return "ResolutionError";
    case XferError::kConnectionRefused:
      return "ConnectionRefused";
    case XferError::kBind:
      return "BindError";
    case XferError::kTimeout:
      return "TimeoutError";
    case XferError::kIo:
      return "IOError";
    case XferError::kFrameTooLarge:
      return "FrameTooLarge";
    case XferError::kInvalidName:
      return "InvalidName";
    case XferError::kSizeMismatch:
      return "SizeMismatch";
    case XferError::kMalformedFrame:
      return "MalformedFrame";
    case XferError::kFileAccess:
      return "FileAccessError";
    case XferError::kClosed:
      return "ConnectionClosed";
  }
  return "UnknownError";
}

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the success() / error() factories so the
 * intent is visible at every return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected r(E{});
    ::new (static_cast<void*>(r.storage_)) V(val);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& val) {
    expected r(E{});
    ::new (static_cast<void*>(r.storage_)) V(static_cast<V&&>(val));
    r.has_value_ = true;
    return r;
  }

  static expected error(E err) noexcept { return expected(err); }

  expected(const expected& other) : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) V(other.Ref());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : err_(other.err_), has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) V(static_cast<V&&>(other.Ref()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) V(other.Ref());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) V(static_cast<V&&>(other.Ref()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    LABXFER_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const& {
    LABXFER_ASSERT(has_value_);
    return Ref();
  }

  V&& value() && {
    LABXFER_ASSERT(has_value_);
    return static_cast<V&&>(Ref());
  }

  E get_error() const noexcept { return err_; }

  template <typename U>
  V value_or(U&& fallback) const& {
    return has_value_ ? Ref() : static_cast<V>(static_cast<U&&>(fallback));
  }

 private:
  explicit expected(E err) noexcept : err_(err), has_value_(false) {}

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(storage_)); }
  const V& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  alignas(V) unsigned char storage_[sizeof(V)];
  E err_;
  bool has_value_;
};

/** @brief Specialization for operations that return no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(E{}, true); }
  static expected error(E err) noexcept { return expected(err, false); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept { return err_; }

 private:
  expected(E err, bool ok) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(storage_)) T(val);
  }

  optional(T&& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(storage_)) T(static_cast<T&&>(val));
  }

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) T(other.Ref());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) T(static_cast<T&&>(other.Ref()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(other.Ref());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(static_cast<T&&>(other.Ref()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    LABXFER_ASSERT(has_value_);
    return Ref();
  }

  const T& value() const {
    LABXFER_ASSERT(has_value_);
    return Ref();
  }

  template <typename U>
  T value_or(U&& fallback) const {
    return has_value_ ? Ref() : static_cast<T>(static_cast<U&&>(fallback));
  }

  void reset() noexcept {
    if (has_value_) {
      Ref().~T();
      has_value_ = false;
    }
  }

 private:
  T& Ref() noexcept { return *std::launder(reinterpret_cast<T*>(storage_)); }
  const T& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const T*>(storage_));
  }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/**
 * @brief Chain a fallible step onto a successful expected.
 *
 * F must return expected<U, E>. On error the original error is forwarded.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Ret = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Ret::error(r.get_error());
  }
  return fn(r.value());
}

/** @brief Invoke fn(error) when r holds an error; no-op on success. */
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable when the enclosing scope exits.
 *
 * release() disarms the guard. Move transfers ownership of the cleanup.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(static_cast<F&&>(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(static_cast<F&&>(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) {
  return ScopeGuard<F>(static_cast<F&&>(fn));
}

#define LABXFER_SCOPE_EXIT(...)                              \
  auto LABXFER_CONCAT(labxfer_scope_exit_, __LINE__) =       \
      ::labxfer::MakeScopeGuard([&]() { __VA_ARGS__; })

// ============================================================================
// Monotonic Clock Helpers
// ============================================================================

inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace labxfer

#endif  // LABXFER_VOCABULARY_HPP_
