/**
 * @file log.hpp
 * @brief Leveled printf-style logging with an optional per-run log file.
 *
 * Every line goes to stderr. After Init() with a LogConfig whose dir is set,
 * lines are also appended to
 *   <dir>/<hostname>_<user>_<name>_<YYYY-mm-dd_HH-MM-SS>.log
 * so a lab PC keeps one log per run next to the data it moved.
 *
 * Usage:
 * @code
 *   labxfer::log::LogConfig cfg;
 *   cfg.dir = "/var/log/labxfer";
 *   cfg.name = "receiver";
 *   labxfer::log::Init(cfg);
 *   LABXFER_LOG_INFO("XFER", "received %s (%lu bytes)", name, size);
 *   labxfer::log::Shutdown();
 * @endcode
 *
 * Compile-time floor: LABXFER_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL). Calls
 * below the floor compile to nothing.
 */

#ifndef LABXFER_LOG_HPP_
#define LABXFER_LOG_HPP_

#include "labxfer/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

#include <pwd.h>
#include <strings.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

#ifndef LABXFER_LOG_MIN_LEVEL
#ifdef NDEBUG
#define LABXFER_LOG_MIN_LEVEL 1
#else
#define LABXFER_LOG_MIN_LEVEL 0
#endif
#endif

namespace labxfer {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/// Parameters for Init(). An empty dir disables the file sink.
struct LogConfig {
  std::string dir;
  std::string name = "labxfer";
#ifdef NDEBUG
  Level level = Level::kInfo;
#else
  Level level = Level::kDebug;
#endif
};

namespace detail {

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

struct LogState {
  std::mutex mtx;
  FILE* file = nullptr;
  std::string file_path;
  bool initialized = false;
};

inline LogState& State() {
  static LogState state;
  return state;
}

/// Written by Init()/SetLevel(), read by every logging thread.
inline std::atomic<Level>& LogLevelRef() {
  static std::atomic<Level> level{kDefaultLevel};
  return level;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

/// "YYYY-mm-dd HH:MM:SS.mmm" in local time.
inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  ::localtime_r(&tv.tv_sec, &tm_buf);
  char date[32];
  (void)std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf, size, "%s.%03ld", date,
                      static_cast<long>(tv.tv_usec / 1000));
}

inline std::string CurrentUser() {
  struct passwd* pw = ::getpwuid(::geteuid());
  if (pw != nullptr && pw->pw_name != nullptr) return pw->pw_name;
  const char* env = std::getenv("USER");
  return (env != nullptr) ? env : "unknown";
}

inline std::string BuildLogFileName(const std::string& name) {
  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) != 0) {
    std::strncpy(host, "localhost", sizeof(host) - 1);
  }
  std::time_t now = std::time(nullptr);
  struct tm tm_buf;
  ::localtime_r(&now, &tm_buf);
  char stamp[32];
  (void)std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &tm_buf);
  return std::string(host) + "_" + CurrentUser() + "_" + name + "_" + stamp +
         ".log";
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}
inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse "debug" / "INFO" / "warn" / "error" / "fatal" / "off".
 * @return fallback when the string is not recognised.
 */
inline Level ParseLevel(const char* str, Level fallback) noexcept {
  if (str == nullptr) return fallback;
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"warning", Level::kWarn},
                {"error", Level::kError}, {"fatal", Level::kFatal},
                {"off", Level::kOff}};
  for (const auto& entry : kNames) {
    if (::strcasecmp(str, entry.name) == 0) return entry.level;
  }
  return fallback;
}

inline bool IsInitialized() noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  return st.initialized;
}

/** @brief Path of the active log file, or empty when only stderr is used. */
inline std::string FilePath() {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  return st.file_path;
}

/**
 * @brief Initialise logging.
 *
 * Creates cfg.dir when missing. If the file cannot be opened, logging
 * continues on stderr only and Init() returns false.
 */
inline bool Init(const LogConfig& cfg) {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  detail::LogLevelRef().store(cfg.level, std::memory_order_relaxed);
  st.initialized = true;
  if (cfg.dir.empty()) return true;

  (void)::mkdir(cfg.dir.c_str(), 0755);
  std::string path = cfg.dir + "/" + detail::BuildLogFileName(cfg.name);
  FILE* f = std::fopen(path.c_str(), "a");
  if (f == nullptr) {
    (void)std::fprintf(stderr, "[labxfer] cannot open log file %s\n",
                       path.c_str());
    return false;
  }
  if (st.file != nullptr) std::fclose(st.file);
  st.file = f;
  st.file_path = path;
  return true;
}

inline bool Init() { return Init(LogConfig{}); }

inline void Shutdown() noexcept {
  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
  if (st.file != nullptr) {
    std::fclose(st.file);
    st.file = nullptr;
  }
  st.file_path.clear();
  st.initialized = false;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  const Level threshold = detail::LogLevelRef().load(std::memory_order_relaxed);
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(threshold)) {
    return;
  }

  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));
  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  auto& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mtx);
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (st.file != nullptr) {
    (void)std::fprintf(st.file, "[%s] [%s] [%s] %s\n", ts,
                       detail::LevelTag(level), category, msg);
    (void)std::fflush(st.file);
  }
}

LABXFER_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace labxfer

// ============================================================================
// Macros
// ============================================================================

#define LABXFER_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (LABXFER_LOG_MIN_LEVEL <= 0) {                                      \
      ::labxfer::log::LogWrite(::labxfer::log::Level::kDebug, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LABXFER_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (LABXFER_LOG_MIN_LEVEL <= 1) {                                      \
      ::labxfer::log::LogWrite(::labxfer::log::Level::kInfo, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LABXFER_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (LABXFER_LOG_MIN_LEVEL <= 2) {                                      \
      ::labxfer::log::LogWrite(::labxfer::log::Level::kWarn, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LABXFER_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                     \
    if (LABXFER_LOG_MIN_LEVEL <= 3) {                                      \
      ::labxfer::log::LogWrite(::labxfer::log::Level::kError, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define LABXFER_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                     \
    ::labxfer::log::LogWrite(::labxfer::log::Level::kFatal, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    std::abort();                                                          \
  } while (0)

#endif  // LABXFER_LOG_HPP_
