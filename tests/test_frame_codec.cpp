/**
 * @file test_frame_codec.cpp
 * @brief Tests for frame_codec.hpp: integer encoding, name rules, frame I/O.
 */

#include "labxfer/frame_codec.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <thread>
#include <vector>

namespace {

/// Raw bytes as the peer would put them on the wire.
void PutRaw(labxfer::Connection& c, const std::vector<uint8_t>& bytes) {
  REQUIRE(c.WriteAll(bytes.data(), bytes.size()).has_value());
}

std::vector<uint8_t> Prefix(uint32_t len) {
  std::vector<uint8_t> out(4);
  labxfer::EncodeU32(len, out.data());
  return out;
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("frame_codec - integers are big-endian", "[frame_codec][encoding]") {
  uint8_t b4[4];
  labxfer::EncodeU32(0x01020304U, b4);
  REQUIRE(b4[0] == 0x01);
  REQUIRE(b4[3] == 0x04);
  REQUIRE(labxfer::DecodeU32(b4) == 0x01020304U);

  uint8_t b8[8];
  labxfer::EncodeU64(1024U, b8);
  const uint8_t expect[8] = {0, 0, 0, 0, 0, 0, 0x04, 0x00};
  REQUIRE(std::memcmp(b8, expect, 8) == 0);
  REQUIRE(labxfer::DecodeU64(b8) == 1024U);

  labxfer::EncodeU64(0xFFFFFFFFFFFFFFFFULL, b8);
  REQUIRE(labxfer::DecodeU64(b8) == 0xFFFFFFFFFFFFFFFFULL);
}

TEST_CASE("frame_codec - FrameLimits ceilings", "[frame_codec][limits]") {
  labxfer::FrameLimits limits;
  REQUIRE(limits.CeilingFor(labxfer::FrameKind::kName) == 255U);
  REQUIRE(limits.CeilingFor(labxfer::FrameKind::kSize) == 8U);
  REQUIRE(limits.CeilingFor(labxfer::FrameKind::kContent) == (1ULL << 30));

  limits.max_content_bytes = 1ULL << 40;
  REQUIRE(limits.CeilingFor(labxfer::FrameKind::kContent) == 0xFFFFFFFFULL);
}

// ============================================================================
// Name validation
// ============================================================================

TEST_CASE("frame_codec - ValidateName", "[frame_codec][name]") {
  using labxfer::ValidateName;
  using labxfer::XferError;

  REQUIRE(ValidateName("run1.csv").has_value());
  REQUIRE(ValidateName("Messung \xC3\xA4 2024.dat").has_value());
  REQUIRE(ValidateName(std::string(255, 'a')).has_value());

  REQUIRE(ValidateName("").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName(".").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName("..").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName("../etc/passwd").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName("dir/run1.csv").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName("C:\\data\\run1.csv").get_error() ==
          XferError::kInvalidName);
  REQUIRE(ValidateName(std::string("a\0b", 3)).get_error() ==
          XferError::kInvalidName);
  REQUIRE(ValidateName("bad\xFF").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName("\xC0\xAF").get_error() == XferError::kInvalidName);
  REQUIRE(ValidateName(std::string(256, 'a')).get_error() ==
          XferError::kFrameTooLarge);
}

// ============================================================================
// Frame I/O
// ============================================================================

TEST_CASE("frame_codec - NAME and SIZE frames round trip", "[frame_codec][io]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);

  REQUIRE(labxfer::WriteName(pair.client, "run1.csv").has_value());
  REQUIRE(labxfer::WriteSize(pair.client, 1024U).has_value());

  auto name = labxfer::ReadName(pair.server);
  REQUIRE(name.has_value());
  REQUIRE(name.value() == "run1.csv");
  auto size = labxfer::ReadSize(pair.server);
  REQUIRE(size.has_value());
  REQUIRE(size.value() == 1024U);
}

TEST_CASE("frame_codec - NAME frame wire layout", "[frame_codec][io]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  REQUIRE(labxfer::WriteName(pair.client, "a.txt").has_value());

  auto raw = pair.server.Read(9);
  REQUIRE(raw.has_value());
  const std::vector<uint8_t> expect = {0, 0, 0, 5, 'a', '.', 't', 'x', 't'};
  REQUIRE(raw.value() == expect);
}

TEST_CASE("frame_codec - WriteName refuses a path", "[frame_codec][name]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto r = labxfer::WriteName(pair.client, "sub/run1.csv");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::XferError::kInvalidName);
}

TEST_CASE("frame_codec - WriteFrame enforces the ceiling", "[frame_codec][limits]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  labxfer::FrameLimits limits;
  limits.max_content_bytes = 16U;
  std::vector<uint8_t> big(17, 0);
  auto r = labxfer::WriteFrame(pair.client, labxfer::FrameKind::kContent,
                               big.data(), big.size(), limits);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::XferError::kFrameTooLarge);

  auto s = labxfer::WriteSize(pair.client, 17U, limits);
  REQUIRE(!s.has_value());
  REQUIRE(s.get_error() == labxfer::XferError::kFrameTooLarge);
}

TEST_CASE("frame_codec - oversized NAME rejected before its payload is read",
          "[frame_codec][limits]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto bytes = Prefix(300U);
  bytes.insert(bytes.end(), {'A', 'B', 'C', 'D'});
  PutRaw(pair.client, bytes);

  auto name = labxfer::ReadName(pair.server);
  REQUIRE(!name.has_value());
  REQUIRE(name.get_error() == labxfer::XferError::kFrameTooLarge);

  // The payload is still unread on the stream.
  auto rest = pair.server.Read(4);
  REQUIRE(rest.has_value());
  const std::vector<uint8_t> expect = {'A', 'B', 'C', 'D'};
  REQUIRE(rest.value() == expect);
}

TEST_CASE("frame_codec - NAME with separator is InvalidName", "[frame_codec][name]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto bytes = Prefix(6U);
  bytes.insert(bytes.end(), {'.', '.', '/', 'x', 'y', 'z'});
  PutRaw(pair.client, bytes);

  auto name = labxfer::ReadName(pair.server);
  REQUIRE(!name.has_value());
  REQUIRE(name.get_error() == labxfer::XferError::kInvalidName);
}

TEST_CASE("frame_codec - SIZE frame must carry 8 bytes", "[frame_codec][size]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto bytes = Prefix(4U);
  bytes.insert(bytes.end(), {0, 0, 4, 0});
  PutRaw(pair.client, bytes);

  auto size = labxfer::ReadSize(pair.server);
  REQUIRE(!size.has_value());
  REQUIRE(size.get_error() == labxfer::XferError::kMalformedFrame);
}

TEST_CASE("frame_codec - SIZE above the content ceiling", "[frame_codec][size]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  REQUIRE(labxfer::WriteSize(pair.client, 4096U).has_value());

  labxfer::FrameLimits limits;
  limits.max_content_bytes = 1024U;
  auto size = labxfer::ReadSize(pair.server, limits);
  REQUIRE(!size.has_value());
  REQUIRE(size.get_error() == labxfer::XferError::kFrameTooLarge);
}

// ============================================================================
// CONTENT streaming
// ============================================================================

TEST_CASE("frame_codec - ReadContent streams in chunks", "[frame_codec][content]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  const auto payload = labxfer_test::PatternBytes(10000);

  bool write_ok = false;
  std::thread writer([&]() {
    write_ok = labxfer::WriteFrame(pair.client, labxfer::FrameKind::kContent,
                                   payload.data(), payload.size())
                   .has_value();
  });

  std::vector<uint8_t> sink;
  size_t max_chunk = 0;
  uint64_t received = 0;
  auto r = labxfer::ReadContent(
      pair.server, payload.size(), labxfer::FrameLimits{}, 333U,
      [&](const uint8_t* d, size_t n) {
        if (n > max_chunk) max_chunk = n;
        sink.insert(sink.end(), d, d + n);
        return true;
      },
      &received);
  writer.join();

  REQUIRE(write_ok);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == payload.size());
  REQUIRE(received == payload.size());
  REQUIRE(max_chunk <= 333U);
  REQUIRE(sink == payload);
}

TEST_CASE("frame_codec - CONTENT length differing from SIZE", "[frame_codec][content]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto bytes = Prefix(10U);
  bytes.resize(bytes.size() + 10U, 0x55);
  PutRaw(pair.client, bytes);

  auto r = labxfer::ReadContent(pair.server, 20U, labxfer::FrameLimits{}, 64U,
                                [](const uint8_t*, size_t) { return true; });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::XferError::kSizeMismatch);
}

TEST_CASE("frame_codec - CONTENT shortfall", "[frame_codec][content]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);

  SECTION("some bytes then close is SizeMismatch") {
    auto bytes = Prefix(100U);
    bytes.resize(bytes.size() + 40U, 0x11);
    PutRaw(pair.client, bytes);
    pair.client.Close();

    uint64_t received = 0;
    auto r = labxfer::ReadContent(pair.server, 100U, labxfer::FrameLimits{}, 64U,
                                  [](const uint8_t*, size_t) { return true; },
                                  &received);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == labxfer::XferError::kSizeMismatch);
    REQUIRE(received == 40U);
  }

  SECTION("close before any content byte is IOError") {
    PutRaw(pair.client, Prefix(100U));
    pair.client.Close();
    auto r = labxfer::ReadContent(pair.server, 100U, labxfer::FrameLimits{}, 64U,
                                  [](const uint8_t*, size_t) { return true; });
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == labxfer::XferError::kIo);
  }

  SECTION("close before the CONTENT prefix is IOError") {
    pair.client.Close();
    auto r = labxfer::ReadContent(pair.server, 100U, labxfer::FrameLimits{}, 64U,
                                  [](const uint8_t*, size_t) { return true; });
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == labxfer::XferError::kIo);
  }
}

TEST_CASE("frame_codec - failing sink aborts with FileAccessError",
          "[frame_codec][content]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  auto bytes = Prefix(8U);
  bytes.resize(bytes.size() + 8U, 0x22);
  PutRaw(pair.client, bytes);

  auto r = labxfer::ReadContent(pair.server, 8U, labxfer::FrameLimits{}, 64U,
                                [](const uint8_t*, size_t) { return false; });
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == labxfer::XferError::kFileAccess);
}

TEST_CASE("frame_codec - empty CONTENT frame", "[frame_codec][content]") {
  auto pair = labxfer_test::MakeConnPair();
  REQUIRE(pair.ok);
  REQUIRE(labxfer::WriteFrame(pair.client, labxfer::FrameKind::kContent, nullptr, 0)
              .has_value());
  int calls = 0;
  auto r = labxfer::ReadContent(pair.server, 0U, labxfer::FrameLimits{}, 64U,
                                [&calls](const uint8_t*, size_t) {
                                  ++calls;
                                  return true;
                                });
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
  REQUIRE(calls == 0);
}
