/**
 * @file config.hpp
 * @brief Transfer settings from INI / JSON / YAML files.
 *
 * Every format is flattened into "section + key = value" entries held in a
 * fixed-size ConfigStore. Config<Backends...> composes the parsers that
 * were enabled at build time:
 *
 *   - IniBackend  : inih           (LABXFER_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (LABXFER_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (LABXFER_CONFIG_YAML_ENABLED)
 *
 * LoadTransferConfig() then maps the store onto a validated TransferConfig:
 *
 * @code
 *   labxfer::MultiConfig cfg;
 *   if (cfg.LoadFile("lab_pc.ini").has_value()) {
 *     auto tc = labxfer::LoadTransferConfig(cfg);
 *   }
 * @endcode
 */

#ifndef LABXFER_CONFIG_HPP_
#define LABXFER_CONFIG_HPP_

#include "labxfer/connection.hpp"
#include "labxfer/log.hpp"
#include "labxfer/platform.hpp"
#include "labxfer/transfer_session.hpp"
#include "labxfer/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#include <strings.h>

#ifdef LABXFER_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef LABXFER_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef LABXFER_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace labxfer {

enum class ConfigFormat : uint8_t { kAuto = 0, kIni, kJson, kYaml };

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return ::strcasecmp(ext, "ini") == 0 || ::strcasecmp(ext, "cfg") == 0 ||
           ::strcasecmp(ext, "conf") == 0;
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return ::strcasecmp(ext, "json") == 0;
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return ::strcasecmp(ext, "yaml") == 0 || ::strcasecmp(ext, "yml") == 0;
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef LABXFER_CONFIG_MAX_FILE_SIZE
#define LABXFER_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Flat, allocation-free section/key/value table.
 *
 * Section and key lookups are case-insensitive. A later Set() of the same
 * section/key replaces the earlier value.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 256;

  /** @return false when the table is full. */
  bool Set(const char* section, const char* key, const char* value) {
    Entry* e = Find(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      CopyTrunc(e->section, section, kMaxKeyLen);
      CopyTrunc(e->key, key, kMaxKeyLen);
    }
    CopyTrunc(e->value, value, kMaxValueLen);
    return true;
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return default_val;
    return ::strcasecmp(e->value, "true") == 0 ||
           ::strcasecmp(e->value, "yes") == 0 ||
           ::strcasecmp(e->value, "on") == 0 || std::strcmp(e->value, "1") == 0;
  }

  /**
   * @brief Unsigned integer lookup bounded by max_val.
   * @return default_val when absent; kInvalidValue when not a plain decimal
   *         number or above max_val.
   */
  expected<uint64_t, ConfigError> GetUint64(const char* section,
                                            const char* key,
                                            uint64_t default_val,
                                            uint64_t max_val = UINT64_MAX) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return expected<uint64_t, ConfigError>::success(default_val);
    const char* s = e->value;
    if (*s < '0' || *s > '9') {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno == ERANGE || *end != '\0' || v > max_val) {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint64_t, ConfigError>::success(static_cast<uint64_t>(v));
  }

  expected<uint32_t, ConfigError> GetUint32(const char* section,
                                            const char* key,
                                            uint32_t default_val,
                                            uint32_t max_val = UINT32_MAX) const {
    auto r = GetUint64(section, key, default_val, max_val);
    if (!r.has_value()) {
      return expected<uint32_t, ConfigError>::error(r.get_error());
    }
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(r.value()));
  }

  bool HasSection(const char* section) const {
    LABXFER_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (::strcasecmp(entries_[i].section, section) == 0) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  /// Whole file into buf, NUL-terminated. kBufferFull if it does not fit.
  static expected<uint32_t, ConfigError> Slurp(const char* path, char* buf,
                                               uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t n = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static void CopyTrunc(char* dst, const char* src, uint32_t cap) noexcept {
    if (src == nullptr) src = "";
    (void)std::snprintf(dst, cap, "%s", src);
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

 private:
  const Entry* Find(const char* section, const char* key) const {
    LABXFER_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (::strcasecmp(entries_[i].section, section) == 0 &&
          ::strcasecmp(entries_[i].key, key) == 0) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* Find(const char* section, const char* key) {
    return const_cast<Entry*>(
        static_cast<const ConfigStore*>(this)->Find(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend compiled out: every call reports kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef LABXFER_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc != 0) {
      LABXFER_LOG_WARN("CONF", "%s: syntax error on line %d", path, rc);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

#ifdef LABXFER_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[LABXFER_CONFIG_MAX_FILE_SIZE];
    auto n = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!n.has_value()) return expected<void, ConfigError>::error(n.get_error());
    return ParseBuffer(store, buf, n.value());
  }

  /// Objects become sections; top-level scalars land in section "".
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (!it->is_object()) {
        if (!Put(store, "", it.key(), *it)) return Full();
        continue;
      }
      for (auto kit = it->begin(); kit != it->end(); ++kit) {
        if (!Put(store, it.key().c_str(), kit.key(), *kit)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Put(ConfigStore& store, const char* section,
                  const std::string& key, const nlohmann::json& n) {
    std::string text;
    if (n.is_string()) {
      text = n.get<std::string>();
    } else if (n.is_boolean()) {
      text = n.get<bool>() ? "true" : "false";
    } else {
      text = n.dump();
    }
    return store.Set(section, key.c_str(), text.c_str());
  }
};
#endif

#ifdef LABXFER_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[LABXFER_CONFIG_MAX_FILE_SIZE];
    auto n = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!n.has_value()) return expected<void, ConfigError>::error(n.get_error());
    return ParseBuffer(store, buf, n.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (!node.is_mapping()) {
        if (!Put(store, "", section, node)) return Full();
        continue;
      }
      for (auto kit = node.begin(); kit != node.end(); ++kit) {
        const auto key = kit.key().get_value<std::string>();
        if (!Put(store, section.c_str(), key, *kit)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Put(ConfigStore& store, const char* section,
                  const std::string& key, const fkyaml::node& n) {
    char text[ConfigStore::kMaxValueLen] = {};
    if (n.is_string()) {
      (void)std::snprintf(text, sizeof(text), "%s",
                          n.get_value<std::string>().c_str());
    } else if (n.is_boolean()) {
      (void)std::snprintf(text, sizeof(text), "%s",
                          n.get_value<bool>() ? "true" : "false");
    } else if (n.is_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(text, sizeof(text), "%g", n.get_value<double>());
    }
    return store.Set(section, key.c_str(), text);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  /** @brief Parse path; kAuto picks the backend by file extension. */
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    LABXFER_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = Detect(path);
    auto r = LoadFileAs<Backends...>(path, format);
    if (r.has_value()) {
      LABXFER_LOG_INFO("CONF", "loaded %s (%u entries)", path, EntryCount());
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    LABXFER_ASSERT(data != nullptr);
    return LoadBufferAs<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadFileAs(const char* path,
                                         ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return LoadFileAs<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadBufferAs(const char* data, uint32_t size,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return LoadBufferAs<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  static ConfigFormat DetectIn(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectIn<Rest...>(ext);
    return Head::kFormat;
  }

  static ConfigFormat Detect(const char* path) noexcept {
    const char* ext = Extension(path);
    return (ext == nullptr) ? Head::kFormat : DetectIn<Backends...>(ext);
  }
};

#ifdef LABXFER_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef LABXFER_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef LABXFER_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

#if defined(LABXFER_CONFIG_INI_ENABLED) || \
    defined(LABXFER_CONFIG_JSON_ENABLED) || defined(LABXFER_CONFIG_YAML_ENABLED)
using MultiConfig = Config<
#ifdef LABXFER_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(LABXFER_CONFIG_INI_ENABLED) && \
    (defined(LABXFER_CONFIG_JSON_ENABLED) || defined(LABXFER_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef LABXFER_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(LABXFER_CONFIG_JSON_ENABLED) && defined(LABXFER_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef LABXFER_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#define LABXFER_HAS_MULTI_CONFIG 1
#endif

// ============================================================================
// TransferConfig
// ============================================================================

static constexpr uint16_t kDefaultPort = 5001U;
static constexpr uint32_t kMaxChunkBytes = 16U * 1024U * 1024U;
static constexpr uint32_t kMaxRetryAttempts = 100U;

/**
 * @brief Everything a send / recv / serve run needs.
 *
 * Defaults match a lab PC pushing to the collection server on port 5001.
 */
struct TransferConfig {
  Endpoint endpoint{"127.0.0.1", kDefaultPort, EndpointRole::kDialer};
  TransferOptions options;
  std::string dest_dir = ".";
  uint32_t retry_attempts = 1U;
  uint32_t retry_delay_ms = 1000U;
  log::LogConfig log;
};

namespace detail {

inline bool ParseRole(const char* s, EndpointRole* out) noexcept {
  if (::strcasecmp(s, "listener") == 0 || ::strcasecmp(s, "listen") == 0 ||
      ::strcasecmp(s, "server") == 0) {
    *out = EndpointRole::kListener;
    return true;
  }
  if (::strcasecmp(s, "dialer") == 0 || ::strcasecmp(s, "dial") == 0 ||
      ::strcasecmp(s, "client") == 0) {
    *out = EndpointRole::kDialer;
    return true;
  }
  return false;
}

inline void LogBadValue(const ConfigStore& store, const char* sec,
                        const char* key) {
  LABXFER_LOG_ERROR("CONF", "invalid value for [%s] %s: '%s'", sec, key,
                    store.GetString(sec, key));
}

/**
 * @brief Read an optional bounded integer into *dst.
 *
 * *dst is the default and is left untouched when the key is absent.
 */
inline expected<void, ConfigError> ReadKey(const ConfigStore& store,
                                           const char* sec, const char* key,
                                           uint32_t max_val, uint32_t* dst) {
  auto r = store.GetUint32(sec, key, *dst, max_val);
  if (!r.has_value()) {
    LogBadValue(store, sec, key);
    return expected<void, ConfigError>::error(r.get_error());
  }
  *dst = r.value();
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ReadKey(const ConfigStore& store,
                                           const char* sec, const char* key,
                                           uint64_t max_val, uint64_t* dst) {
  auto r = store.GetUint64(sec, key, *dst, max_val);
  if (!r.has_value()) {
    LogBadValue(store, sec, key);
    return expected<void, ConfigError>::error(r.get_error());
  }
  *dst = r.value();
  return expected<void, ConfigError>::success();
}

}  // namespace detail

/**
 * @brief Map [transfer] / [retry] / [log] onto a TransferConfig.
 *
 * Missing keys keep their defaults. Any present but unusable value yields
 * kInvalidValue; the offending key is logged.
 */
inline expected<TransferConfig, ConfigError> LoadTransferConfig(
    const ConfigStore& store) {
  using Result = expected<TransferConfig, ConfigError>;
  TransferConfig tc;

  tc.endpoint.host = store.GetString("transfer", "host", "127.0.0.1");
  if (tc.endpoint.host.empty()) {
    LABXFER_LOG_ERROR("CONF", "[transfer] host is empty");
    return Result::error(ConfigError::kInvalidValue);
  }

  if (store.HasKey("transfer", "role") &&
      !detail::ParseRole(store.GetString("transfer", "role"),
                         &tc.endpoint.role)) {
    LABXFER_LOG_ERROR("CONF", "invalid value for [transfer] role: '%s'",
                      store.GetString("transfer", "role"));
    return Result::error(ConfigError::kInvalidValue);
  }

  uint32_t port = tc.endpoint.port;
  auto rd = detail::ReadKey(store, "transfer", "port", 65535U, &port);
  if (!rd.has_value()) return Result::error(rd.get_error());
  if (port == 0U && tc.endpoint.role == EndpointRole::kDialer) {
    LABXFER_LOG_ERROR("CONF", "[transfer] port 0 is only valid for listeners");
    return Result::error(ConfigError::kInvalidValue);
  }
  tc.endpoint.port = static_cast<uint16_t>(port);

  TransferOptions& o = tc.options;
  rd = detail::ReadKey(store, "transfer", "connect_timeout_ms", UINT32_MAX,
                       &o.connect_timeout_ms);
  if (rd.has_value()) {
    rd = detail::ReadKey(store, "transfer", "accept_timeout_ms", UINT32_MAX,
                         &o.accept_timeout_ms);
  }
  if (rd.has_value()) {
    rd = detail::ReadKey(store, "transfer", "io_timeout_ms", UINT32_MAX,
                         &o.io_timeout_ms);
  }
  if (rd.has_value()) {
    rd = detail::ReadKey(store, "transfer", "chunk_bytes", kMaxChunkBytes,
                         &o.chunk_bytes);
  }
  if (rd.has_value()) {
    rd = detail::ReadKey(store, "transfer", "max_content_bytes",
                         kMaxContentFrameBytes, &o.limits.max_content_bytes);
  }
  if (!rd.has_value()) return Result::error(rd.get_error());
  if (o.chunk_bytes == 0U || o.limits.max_content_bytes == 0U) {
    LABXFER_LOG_ERROR("CONF", "chunk_bytes and max_content_bytes must be > 0");
    return Result::error(ConfigError::kInvalidValue);
  }
  tc.dest_dir = store.GetString("transfer", "dest_dir", ".");

  rd = detail::ReadKey(store, "retry", "attempts", kMaxRetryAttempts,
                       &tc.retry_attempts);
  if (rd.has_value()) {
    rd = detail::ReadKey(store, "retry", "delay_ms", UINT32_MAX,
                         &tc.retry_delay_ms);
  }
  if (!rd.has_value()) return Result::error(rd.get_error());
  if (tc.retry_attempts == 0U) tc.retry_attempts = 1U;

  if (store.HasKey("log", "level")) {
    const char* lv = store.GetString("log", "level");
    const log::Level parsed = log::ParseLevel(lv, log::Level::kOff);
    if (parsed == log::Level::kOff && ::strcasecmp(lv, "off") != 0) {
      LABXFER_LOG_ERROR("CONF", "invalid value for [log] level: '%s'", lv);
      return Result::error(ConfigError::kInvalidValue);
    }
    tc.log.level = parsed;
  }
  tc.log.dir = store.GetString("log", "dir", "");
  tc.log.name = store.GetString("log", "name", "labxfer");

  return Result::success(static_cast<TransferConfig&&>(tc));
}

}  // namespace labxfer

#endif  // LABXFER_CONFIG_HPP_
