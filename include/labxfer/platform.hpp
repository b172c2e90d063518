/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef LABXFER_PLATFORM_HPP_
#define LABXFER_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace labxfer {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define LABXFER_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define LABXFER_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define LABXFER_PLATFORM_WINDOWS 1
#endif

/// BSD sockets are available (Linux and macOS only).
#if defined(LABXFER_PLATFORM_LINUX) || defined(LABXFER_PLATFORM_MACOS)
#define LABXFER_HAS_NETWORK 1
#else
#define LABXFER_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

/// printf-style format checking for the logging entry points.
#if defined(__GNUC__) || defined(__clang__)
#define LABXFER_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define LABXFER_PRINTF_FMT(fmt_idx, arg_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "LABXFER_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define LABXFER_ASSERT(cond) ((void)0)
#else
#define LABXFER_ASSERT(cond) \
  ((cond) ? ((void)0)        \
          : ::labxfer::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define LABXFER_CONCAT_IMPL(a, b) a##b
#define LABXFER_CONCAT(a, b) LABXFER_CONCAT_IMPL(a, b)

}  // namespace labxfer

#endif  // LABXFER_PLATFORM_HPP_
