/**
 * @file test_config.cpp
 * @brief Tests for config.hpp: ConfigStore, backends, LoadTransferConfig.
 */

#include "labxfer/config.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

namespace {

bool WriteText(const std::string& path, const char* text) {
  FILE* f = std::fopen(path.c_str(), "w");
  if (f == nullptr) return false;
  (void)std::fputs(text, f);
  return std::fclose(f) == 0;
}

}  // namespace

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("config - ConfigStore Set and lookups", "[config][store]") {
  labxfer::ConfigStore store;
  REQUIRE(store.Set("transfer", "host", "10.1.2.3"));
  REQUIRE(store.Set("Transfer", "HOST", "10.1.2.4"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(std::strcmp(store.GetString("transfer", "host"), "10.1.2.4") == 0);
  REQUIRE(std::strcmp(store.GetString("transfer", "missing", "dflt"), "dflt") ==
          0);
  REQUIRE(store.HasSection("TRANSFER"));
  REQUIRE(!store.HasSection("retry"));
}

TEST_CASE("config - ConfigStore GetBool", "[config][store]") {
  labxfer::ConfigStore store;
  store.Set("f", "a", "true");
  store.Set("f", "b", "On");
  store.Set("f", "c", "0");
  REQUIRE(store.GetBool("f", "a"));
  REQUIRE(store.GetBool("f", "b"));
  REQUIRE(!store.GetBool("f", "c", true));
  REQUIRE(store.GetBool("f", "missing", true));
}

TEST_CASE("config - ConfigStore unsigned getters", "[config][store]") {
  labxfer::ConfigStore store;
  store.Set("t", "ok", "65535");
  store.Set("t", "big", "70000");
  store.Set("t", "neg", "-1");
  store.Set("t", "junk", "12ms");
  store.Set("t", "huge", "99999999999999999999999");

  REQUIRE(store.GetUint32("t", "ok", 0, 65535U).value() == 65535U);
  REQUIRE(store.GetUint32("t", "absent", 7U).value() == 7U);
  REQUIRE(store.GetUint32("t", "big", 0, 65535U).get_error() ==
          labxfer::ConfigError::kInvalidValue);
  REQUIRE(!store.GetUint32("t", "neg", 0).has_value());
  REQUIRE(!store.GetUint32("t", "junk", 0).has_value());
  REQUIRE(!store.GetUint64("t", "huge", 0).has_value());
}

TEST_CASE("config - ConfigStore fills up", "[config][store]") {
  labxfer::ConfigStore store;
  char key[16];
  for (uint32_t i = 0; i < labxfer::ConfigStore::kMaxEntries; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE(!store.Set("s", "one_more", "v"));
  REQUIRE(store.Set("s", "k0", "replaced"));
}

// ============================================================================
// LoadTransferConfig
// ============================================================================

TEST_CASE("config - LoadTransferConfig defaults", "[config][transfer]") {
  labxfer::ConfigStore empty;
  auto r = labxfer::LoadTransferConfig(empty);
  REQUIRE(r.has_value());
  const labxfer::TransferConfig& tc = r.value();
  REQUIRE(tc.endpoint.host == "127.0.0.1");
  REQUIRE(tc.endpoint.port == 5001U);
  REQUIRE(tc.endpoint.role == labxfer::EndpointRole::kDialer);
  REQUIRE(tc.options.connect_timeout_ms == 10000U);
  REQUIRE(tc.options.accept_timeout_ms == 10000U);
  REQUIRE(tc.options.io_timeout_ms == 10000U);
  REQUIRE(tc.options.chunk_bytes == 65536U);
  REQUIRE(tc.options.limits.max_content_bytes == (1ULL << 30));
  REQUIRE(tc.retry_attempts == 1U);
  REQUIRE(tc.dest_dir == ".");
  REQUIRE(tc.log.dir.empty());
}

TEST_CASE("config - LoadTransferConfig reads every key", "[config][transfer]") {
  labxfer::ConfigStore s;
  s.Set("transfer", "host", "lab-server.local");
  s.Set("transfer", "port", "6000");
  s.Set("transfer", "role", "listener");
  s.Set("transfer", "connect_timeout_ms", "2500");
  s.Set("transfer", "accept_timeout_ms", "0");
  s.Set("transfer", "io_timeout_ms", "750");
  s.Set("transfer", "chunk_bytes", "4096");
  s.Set("transfer", "max_content_bytes", "1048576");
  s.Set("transfer", "dest_dir", "/data/incoming");
  s.Set("retry", "attempts", "5");
  s.Set("retry", "delay_ms", "200");
  s.Set("log", "level", "warn");
  s.Set("log", "dir", "/var/log/labxfer");
  s.Set("log", "name", "pc07");

  auto r = labxfer::LoadTransferConfig(s);
  REQUIRE(r.has_value());
  const labxfer::TransferConfig& tc = r.value();
  REQUIRE(tc.endpoint.host == "lab-server.local");
  REQUIRE(tc.endpoint.port == 6000U);
  REQUIRE(tc.endpoint.role == labxfer::EndpointRole::kListener);
  REQUIRE(tc.options.connect_timeout_ms == 2500U);
  REQUIRE(tc.options.accept_timeout_ms == 0U);
  REQUIRE(tc.options.io_timeout_ms == 750U);
  REQUIRE(tc.options.chunk_bytes == 4096U);
  REQUIRE(tc.options.limits.max_content_bytes == 1048576U);
  REQUIRE(tc.dest_dir == "/data/incoming");
  REQUIRE(tc.retry_attempts == 5U);
  REQUIRE(tc.retry_delay_ms == 200U);
  REQUIRE(tc.log.level == labxfer::log::Level::kWarn);
  REQUIRE(tc.log.dir == "/var/log/labxfer");
  REQUIRE(tc.log.name == "pc07");
}

TEST_CASE("config - LoadTransferConfig rejects bad values", "[config][transfer]") {
  labxfer::ConfigStore s;
  SECTION("port out of range") { s.Set("transfer", "port", "65536"); }
  SECTION("unknown role") { s.Set("transfer", "role", "both"); }
  SECTION("dialer on port 0") { s.Set("transfer", "port", "0"); }
  SECTION("zero chunk") { s.Set("transfer", "chunk_bytes", "0"); }
  SECTION("chunk above limit") { s.Set("transfer", "chunk_bytes", "999999999"); }
  SECTION("content above u32") {
    s.Set("transfer", "max_content_bytes", "4294967296");
  }
  SECTION("timeout not a number") { s.Set("transfer", "io_timeout_ms", "soon"); }
  SECTION("negative accept timeout") {
    s.Set("transfer", "accept_timeout_ms", "-1");
  }
  SECTION("too many retries") { s.Set("retry", "attempts", "101"); }
  SECTION("retry delay not a number") { s.Set("retry", "delay_ms", "1s"); }
  SECTION("unknown log level") { s.Set("log", "level", "chatty"); }
  SECTION("empty host") { s.Set("transfer", "host", ""); }

  auto r = labxfer::LoadTransferConfig(s);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::ConfigError::kInvalidValue);
}

TEST_CASE("config - ReadKey keeps the default for a missing key",
          "[config][transfer]") {
  labxfer::ConfigStore s;
  s.Set("retry", "delay_ms", "250");
  uint32_t delay = 1000U;
  uint32_t attempts = 3U;
  REQUIRE(labxfer::detail::ReadKey(s, "retry", "delay_ms", UINT32_MAX, &delay)
              .has_value());
  REQUIRE(labxfer::detail::ReadKey(s, "retry", "attempts", 10U, &attempts)
              .has_value());
  REQUIRE(delay == 250U);
  REQUIRE(attempts == 3U);

  uint64_t limit = 7U;
  auto r = labxfer::detail::ReadKey(s, "retry", "delay_ms", uint64_t{100},
                                    &limit);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::ConfigError::kInvalidValue);
  REQUIRE(limit == 7U);
}

TEST_CASE("config - listener may bind port 0", "[config][transfer]") {
  labxfer::ConfigStore s;
  s.Set("transfer", "role", "server");
  s.Set("transfer", "port", "0");
  auto r = labxfer::LoadTransferConfig(s);
  REQUIRE(r.has_value());
  REQUIRE(r.value().endpoint.port == 0U);
}

// ============================================================================
// Backends
// ============================================================================

TEST_CASE("config - backend extension tags", "[config][tag]") {
  REQUIRE(labxfer::IniBackend::MatchesExtension("ini"));
  REQUIRE(labxfer::IniBackend::MatchesExtension("CONF"));
  REQUIRE(labxfer::JsonBackend::MatchesExtension("json"));
  REQUIRE(labxfer::YamlBackend::MatchesExtension("yml"));
  REQUIRE(!labxfer::YamlBackend::MatchesExtension("ini"));
}

#ifdef LABXFER_CONFIG_INI_ENABLED

TEST_CASE("config - INI buffer to TransferConfig", "[config][ini]") {
  const char* ini =
      "; lab PC 7\n"
      "[transfer]\n"
      "host = 192.168.10.2\n"
      "port = 5001\n"
      "chunk_bytes = 8192\n"
      "[retry]\n"
      "attempts = 3\n";
  labxfer::IniConfig cfg;
  auto loaded = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)),
                               labxfer::ConfigFormat::kIni);
  REQUIRE(loaded.has_value());
  auto tc = labxfer::LoadTransferConfig(cfg);
  REQUIRE(tc.has_value());
  REQUIRE(tc.value().endpoint.host == "192.168.10.2");
  REQUIRE(tc.value().options.chunk_bytes == 8192U);
  REQUIRE(tc.value().retry_attempts == 3U);
}

TEST_CASE("config - INI file on disk, auto-detected", "[config][ini]") {
  labxfer_test::TempDir dir;
  const std::string path = dir.File("receiver.ini");
  REQUIRE(WriteText(path, "[transfer]\nrole = listener\ndest_dir = /tmp\n"));
  labxfer::IniConfig cfg;
  REQUIRE(cfg.LoadFile(path.c_str()).has_value());
  REQUIRE(std::strcmp(cfg.GetString("transfer", "role"), "listener") == 0);
}

TEST_CASE("config - INI errors", "[config][ini]") {
  labxfer::IniConfig cfg;
  auto missing = cfg.LoadFile("/nonexistent/labxfer.ini");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == labxfer::ConfigError::kFileNotFound);

  const char* bad = "[transfer\nhost\n";
  auto parsed = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                               labxfer::ConfigFormat::kIni);
  REQUIRE(!parsed.has_value());
  REQUIRE(parsed.get_error() == labxfer::ConfigError::kParseError);

  auto wrong = cfg.LoadBuffer("{}", 2, labxfer::ConfigFormat::kJson);
  REQUIRE(!wrong.has_value());
  REQUIRE(wrong.get_error() == labxfer::ConfigError::kFormatNotSupported);
}

#endif  // LABXFER_CONFIG_INI_ENABLED

#ifdef LABXFER_CONFIG_JSON_ENABLED

TEST_CASE("config - JSON buffer", "[config][json]") {
  const char* json =
      R"({"transfer": {"host": "10.0.0.9", "port": 7000, "role": "dialer"},)"
      R"( "retry": {"attempts": 2}, "log": {"level": "error"}})";
  labxfer::JsonConfig cfg;
  auto loaded = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                               labxfer::ConfigFormat::kJson);
  REQUIRE(loaded.has_value());
  auto tc = labxfer::LoadTransferConfig(cfg);
  REQUIRE(tc.has_value());
  REQUIRE(tc.value().endpoint.host == "10.0.0.9");
  REQUIRE(tc.value().endpoint.port == 7000U);
  REQUIRE(tc.value().retry_attempts == 2U);
  REQUIRE(tc.value().log.level == labxfer::log::Level::kError);
}

TEST_CASE("config - JSON parse error", "[config][json]") {
  const char* json = "{\"transfer\": ";
  labxfer::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                          labxfer::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::ConfigError::kParseError);
}

#endif  // LABXFER_CONFIG_JSON_ENABLED

#ifdef LABXFER_CONFIG_YAML_ENABLED

TEST_CASE("config - YAML file", "[config][yaml]") {
  labxfer_test::TempDir dir;
  const std::string path = dir.File("lab.yaml");
  REQUIRE(WriteText(path,
                    "transfer:\n"
                    "  host: 172.16.0.4\n"
                    "  port: 5002\n"
                    "  io_timeout_ms: 1500\n"
                    "log:\n"
                    "  level: info\n"));
  labxfer::YamlConfig cfg;
  REQUIRE(cfg.LoadFile(path.c_str()).has_value());
  auto tc = labxfer::LoadTransferConfig(cfg);
  REQUIRE(tc.has_value());
  REQUIRE(tc.value().endpoint.host == "172.16.0.4");
  REQUIRE(tc.value().endpoint.port == 5002U);
  REQUIRE(tc.value().options.io_timeout_ms == 1500U);
}

#endif  // LABXFER_CONFIG_YAML_ENABLED

#ifdef LABXFER_HAS_MULTI_CONFIG

TEST_CASE("config - MultiConfig picks the backend by extension", "[config][multi]") {
  labxfer_test::TempDir dir;
  const std::string path = dir.File("missing.ini");
  labxfer::MultiConfig cfg;
  auto r = cfg.LoadFile(path.c_str());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::ConfigError::kFileNotFound);
}

#endif
