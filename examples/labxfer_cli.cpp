// Copyright (c) 2024 liudegui. MIT License.
//
// labxfer_cli.cpp -- Command-line front end: send, recv, serve.
//
//   labxfer send  <file>     [--listen] [--retries N]
//   labxfer recv  <dest_dir> [--dial]
//   labxfer serve <dest_dir> [--threads]
//
// Common options: --config F --host H --port P --chunk BYTES
//                 --io-timeout MS --log-dir DIR --log-level LEVEL
//
// Exit codes: 0 transfer completed, 1 transfer failed, 2 usage error.

#include "labxfer/config.hpp"
#include "labxfer/log.hpp"
#include "labxfer/shutdown.hpp"
#include "labxfer/transfer_server.hpp"
#include "labxfer/transfer_session.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include <sys/stat.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* prog) {
  (void)std::fprintf(
      stderr,
      "usage: %s send  <file>     [options] [--listen] [--retries N]\n"
      "       %s recv  <dest_dir> [options] [--dial]\n"
      "       %s serve <dest_dir> [options] [--threads]\n"
      "options: --config F --host H --port P --chunk BYTES\n"
      "         --io-timeout MS --log-dir DIR --log-level LEVEL\n",
      prog, prog, prog);
}

bool ParseU32(const char* s, uint32_t max_val, uint32_t* out) {
  if (s == nullptr || *s < '0' || *s > '9') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || *end != '\0' || v > max_val) return false;
  *out = static_cast<uint32_t>(v);
  return true;
}

struct CliArgs {
  const char* command = nullptr;
  const char* target = nullptr;
  const char* config_path = nullptr;
  const char* host = nullptr;
  const char* log_dir = nullptr;
  const char* log_level = nullptr;
  int32_t port = -1;
  int64_t chunk = -1;
  int64_t io_timeout = -1;
  int64_t retries = -1;
  bool listen = false;
  bool dial = false;
  bool threads = false;
};

/// Returns false on any malformed or unknown argument.
bool ParseArgs(int argc, char* argv[], CliArgs* a) {
  if (argc < 3) return false;
  a->command = argv[1];
  a->target = argv[2];
  for (int i = 3; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_val = (i + 1 < argc);
    uint32_t n = 0;
    if (std::strcmp(arg, "--config") == 0 && has_val) {
      a->config_path = argv[++i];
    } else if (std::strcmp(arg, "--host") == 0 && has_val) {
      a->host = argv[++i];
    } else if (std::strcmp(arg, "--port") == 0 && has_val) {
      if (!ParseU32(argv[++i], 65535U, &n)) return false;
      a->port = static_cast<int32_t>(n);
    } else if (std::strcmp(arg, "--chunk") == 0 && has_val) {
      if (!ParseU32(argv[++i], labxfer::kMaxChunkBytes, &n) || n == 0U) {
        return false;
      }
      a->chunk = n;
    } else if (std::strcmp(arg, "--io-timeout") == 0 && has_val) {
      if (!ParseU32(argv[++i], UINT32_MAX, &n)) return false;
      a->io_timeout = n;
    } else if (std::strcmp(arg, "--retries") == 0 && has_val) {
      if (!ParseU32(argv[++i], labxfer::kMaxRetryAttempts, &n)) return false;
      a->retries = n;
    } else if (std::strcmp(arg, "--log-dir") == 0 && has_val) {
      a->log_dir = argv[++i];
    } else if (std::strcmp(arg, "--log-level") == 0 && has_val) {
      a->log_level = argv[++i];
    } else if (std::strcmp(arg, "--listen") == 0) {
      a->listen = true;
    } else if (std::strcmp(arg, "--dial") == 0) {
      a->dial = true;
    } else if (std::strcmp(arg, "--threads") == 0) {
      a->threads = true;
    } else {
      (void)std::fprintf(stderr, "unknown or incomplete option: %s\n", arg);
      return false;
    }
  }
  return !(a->listen && a->dial);
}

/// Config file (if any) first, then command-line overrides.
bool BuildConfig(const CliArgs& a, labxfer::TransferConfig* tc) {
  bool role_from_file = false;
  if (a.config_path != nullptr) {
#ifdef LABXFER_HAS_MULTI_CONFIG
    labxfer::MultiConfig file;
    auto loaded = file.LoadFile(a.config_path);
    if (!loaded.has_value()) {
      (void)std::fprintf(stderr, "cannot load %s (error %u)\n", a.config_path,
                         static_cast<unsigned>(loaded.get_error()));
      return false;
    }
    auto parsed = labxfer::LoadTransferConfig(file);
    if (!parsed.has_value()) return false;
    *tc = parsed.value();
    role_from_file = file.HasKey("transfer", "role");
#else
    (void)std::fprintf(stderr, "built without configuration file support\n");
    return false;
#endif
  }

  const bool receiving = (std::strcmp(a.command, "send") != 0);
  if (!role_from_file) {
    tc->endpoint.role = receiving ? labxfer::EndpointRole::kListener
                                  : labxfer::EndpointRole::kDialer;
  }
  if (a.listen) tc->endpoint.role = labxfer::EndpointRole::kListener;
  if (a.dial) tc->endpoint.role = labxfer::EndpointRole::kDialer;
  if (std::strcmp(a.command, "serve") == 0) {
    tc->endpoint.role = labxfer::EndpointRole::kListener;
  }

  if (a.host != nullptr) tc->endpoint.host = a.host;
  if (a.port >= 0) tc->endpoint.port = static_cast<uint16_t>(a.port);
  if (a.chunk > 0) tc->options.chunk_bytes = static_cast<uint32_t>(a.chunk);
  if (a.io_timeout >= 0) {
    tc->options.io_timeout_ms = static_cast<uint32_t>(a.io_timeout);
  }
  if (a.retries >= 0) {
    tc->retry_attempts = (a.retries == 0) ? 1U : static_cast<uint32_t>(a.retries);
  }
  if (a.log_dir != nullptr) tc->log.dir = a.log_dir;
  if (a.log_level != nullptr) {
    tc->log.level = labxfer::log::ParseLevel(a.log_level, tc->log.level);
  }
  if (receiving) tc->dest_dir = a.target;

  if (tc->endpoint.role == labxfer::EndpointRole::kDialer &&
      tc->endpoint.port == 0U) {
    (void)std::fprintf(stderr, "a dialer needs a non-zero --port\n");
    return false;
  }
  return true;
}

bool EnsureDir(const std::string& dir) {
  struct stat st;
  if (::stat(dir.c_str(), &st) == 0) return S_ISDIR(st.st_mode);
  if (::mkdir(dir.c_str(), 0755) != 0) {
    LABXFER_LOG_ERROR("CLI", "cannot create %s: %s", dir.c_str(),
                      std::strerror(errno));
    return false;
  }
  return true;
}

void PrintResult(const labxfer::TransferResult& r) {
  if (r.ok()) {
    (void)std::printf("completed %s %llu bytes\n", r.file_name.c_str(),
                      static_cast<unsigned long long>(r.bytes_transferred));
  } else {
    (void)std::printf("failed %s at %s: %s\n", r.file_name.c_str(),
                      labxfer::SessionStateName(r.failed_stage),
                      labxfer::XferErrorString(r.error.value()));
  }
}

int CmdSend(const labxfer::TransferConfig& tc, const char* path) {
  labxfer::TransferResult r;
  for (uint32_t attempt = 1; attempt <= tc.retry_attempts; ++attempt) {
    labxfer::TransferSession session(tc.options);
    r = session.SendTo(tc.endpoint, path);
    if (r.ok()) break;
    // A missing local file will not appear by retrying.
    if (r.error.value() == labxfer::XferError::kFileAccess ||
        r.error.value() == labxfer::XferError::kInvalidName) {
      break;
    }
    if (attempt < tc.retry_attempts) {
      LABXFER_LOG_WARN("CLI", "attempt %u/%u failed (%s), retrying in %u ms",
                       attempt, tc.retry_attempts,
                       labxfer::XferErrorString(r.error.value()),
                       tc.retry_delay_ms);
      std::this_thread::sleep_for(std::chrono::milliseconds(tc.retry_delay_ms));
    }
  }
  PrintResult(r);
  return r.ok() ? kExitOk : kExitFailed;
}

int CmdRecv(const labxfer::TransferConfig& tc) {
  if (!EnsureDir(tc.dest_dir)) return kExitFailed;
  labxfer::TransferResult r =
      labxfer::ReceiveFrom(tc.endpoint, tc.options, tc.dest_dir);
  PrintResult(r);
  return r.ok() ? kExitOk : kExitFailed;
}

int CmdServe(const labxfer::TransferConfig& tc, bool threads) {
  if (!EnsureDir(tc.dest_dir)) return kExitFailed;

  labxfer::ServerConfig sc;
  sc.endpoint = tc.endpoint;
  sc.options = tc.options;
  sc.dest_dir = tc.dest_dir;
  sc.mode = threads ? labxfer::ServerConfig::Mode::kThreadPerConnection
                    : labxfer::ServerConfig::Mode::kSerial;

  labxfer::TransferServer server(sc);
  server.SetCompletionCallback(
      [](const labxfer::TransferResult& r) { PrintResult(r); });
  auto started = server.Start();
  if (!started.has_value()) {
    LABXFER_LOG_ERROR("CLI", "cannot listen on %s:%u: %s",
                      tc.endpoint.host.c_str(), tc.endpoint.port,
                      labxfer::XferErrorString(started.get_error()));
    return kExitFailed;
  }

  labxfer::ShutdownManager shutdown;
  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<labxfer::TransferServer*>(ctx)->Stop(); },
      &server);
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    LABXFER_LOG_WARN("CLI", "signal handlers not installed; stop with kill -9");
  }

  std::thread loop([&server]() { server.Run(); });
  shutdown.WaitForShutdown();
  loop.join();
  return (server.FailedCount() == 0U) ? kExitOk : kExitFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args;
  if (!ParseArgs(argc, argv, &args)) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }
  const bool known = std::strcmp(args.command, "send") == 0 ||
                     std::strcmp(args.command, "recv") == 0 ||
                     std::strcmp(args.command, "serve") == 0;
  if (!known) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  labxfer::TransferConfig tc;
  if (!BuildConfig(args, &tc)) return kExitUsage;

  if (tc.log.name == "labxfer") tc.log.name = args.command;
  (void)labxfer::log::Init(tc.log);

  int rc = kExitUsage;
  if (std::strcmp(args.command, "send") == 0) {
    rc = CmdSend(tc, args.target);
  } else if (std::strcmp(args.command, "recv") == 0) {
    rc = CmdRecv(tc);
  } else {
    rc = CmdServe(tc, args.threads);
  }
  labxfer::log::Shutdown();
  return rc;
}
