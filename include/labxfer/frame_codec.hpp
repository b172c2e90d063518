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
 * @file frame_codec.hpp
 * @brief Length-prefixed NAME / SIZE / CONTENT frames over a Connection.
 *
 * Wire format (all integers big-endian):
 *
 *   Frame    := Length(u32) || Payload(Length bytes)
 *   Transfer := Frame(NAME) Frame(SIZE) Frame(CONTENT)
 *
 *   NAME     UTF-8 file name, 1..255 bytes, no '/', '\\' or NUL
 *   SIZE     u64, exact byte count of the CONTENT payload
 *   CONTENT  raw bytes, Length == SIZE value
 *
 * Every length is checked against FrameLimits before any payload byte is
 * read, so a hostile or corrupt prefix cannot force a large allocation.
 * CONTENT is streamed in chunks so memory use does not grow with file size.
 */

#ifndef LABXFER_FRAME_CODEC_HPP_
#define LABXFER_FRAME_CODEC_HPP_

#include "labxfer/connection.hpp"
#include "labxfer/log.hpp"
#include "labxfer/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace labxfer {

// ============================================================================
// Constants
// ============================================================================

enum class FrameKind : uint8_t { kName = 0, kSize, kContent };

inline const char* FrameKindName(FrameKind kind) noexcept {
  switch (kind) {
    case FrameKind::kName:
      return "NAME";
    case FrameKind::kSize:
      return "SIZE";
    case FrameKind::kContent:
      return "CONTENT";
  }
  return "?";
}

static constexpr uint32_t kLengthPrefixBytes = 4U;
static constexpr uint32_t kSizePayloadBytes = 8U;
static constexpr uint32_t kMaxNameBytes = 255U;
/// Largest CONTENT payload a u32 prefix can describe.
static constexpr uint64_t kMaxContentFrameBytes = 0xFFFFFFFFULL;
static constexpr uint64_t kDefaultMaxContentBytes = 1ULL << 30;  // 1 GiB
static constexpr uint32_t kDefaultChunkBytes = 64U * 1024U;

/**
 * @brief Per-kind length ceilings enforced on both send and receive.
 */
struct FrameLimits {
  uint32_t max_name_bytes = kMaxNameBytes;
  uint64_t max_content_bytes = kDefaultMaxContentBytes;

  uint64_t CeilingFor(FrameKind kind) const noexcept {
    switch (kind) {
      case FrameKind::kName:
        return std::min<uint64_t>(max_name_bytes, kMaxNameBytes);
      case FrameKind::kSize:
        return kSizePayloadBytes;
      case FrameKind::kContent:
        return std::min<uint64_t>(max_content_bytes, kMaxContentFrameBytes);
    }
    return 0;
  }
};

// ============================================================================
// Integer encoding
// ============================================================================

inline void EncodeU32(uint32_t v, uint8_t out[4]) noexcept {
  out[0] = static_cast<uint8_t>(v >> 24);
  out[1] = static_cast<uint8_t>(v >> 16);
  out[2] = static_cast<uint8_t>(v >> 8);
  out[3] = static_cast<uint8_t>(v);
}

inline uint32_t DecodeU32(const uint8_t in[4]) noexcept {
  return (static_cast<uint32_t>(in[0]) << 24) |
         (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

inline void EncodeU64(uint64_t v, uint8_t out[8]) noexcept {
  for (int32_t i = 7; i >= 0; --i) {
    out[i] = static_cast<uint8_t>(v & 0xFFU);
    v >>= 8;
  }
}

inline uint64_t DecodeU64(const uint8_t in[8]) noexcept {
  uint64_t v = 0;
  for (uint32_t i = 0; i < 8U; ++i) {
    v = (v << 8) | in[i];
  }
  return v;
}

// ============================================================================
// Name validation
// ============================================================================

namespace detail {

/// Strict UTF-8 check: no overlongs, no surrogates, max U+10FFFF.
inline bool IsValidUtf8(const uint8_t* s, size_t len) noexcept {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = s[i];
    if (c < 0x80U) {
      ++i;
      continue;
    }
    size_t extra;
    uint32_t cp;
    if ((c & 0xE0U) == 0xC0U) {
      extra = 1;
      cp = c & 0x1FU;
    } else if ((c & 0xF0U) == 0xE0U) {
      extra = 2;
      cp = c & 0x0FU;
    } else if ((c & 0xF8U) == 0xF0U) {
      extra = 3;
      cp = c & 0x07U;
    } else {
      return false;
    }
    if (i + extra >= len) return false;
    for (size_t k = 1; k <= extra; ++k) {
      if ((s[i + k] & 0xC0U) != 0x80U) return false;
      cp = (cp << 6) | (s[i + k] & 0x3FU);
    }
    static constexpr uint32_t kMinForLength[4] = {0, 0x80U, 0x800U, 0x10000U};
    if (cp < kMinForLength[extra] || cp > 0x10FFFFU ||
        (cp >= 0xD800U && cp <= 0xDFFFU)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

}  // namespace detail

/**
 * @brief Check that name is safe to use as a single local file name.
 *
 * @return kFrameTooLarge above max_bytes; kInvalidName when empty, not
 *         UTF-8, "." / "..", or containing '/', '\\' or NUL.
 */
inline expected<void, XferError> ValidateName(
    const std::string& name, uint32_t max_bytes = kMaxNameBytes) noexcept {
  if (name.size() > max_bytes) {
    return expected<void, XferError>::error(XferError::kFrameTooLarge);
  }
  if (name.empty() || name == "." || name == "..") {
    return expected<void, XferError>::error(XferError::kInvalidName);
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return expected<void, XferError>::error(XferError::kInvalidName);
    }
  }
  if (!detail::IsValidUtf8(reinterpret_cast<const uint8_t*>(name.data()),
                           name.size())) {
    return expected<void, XferError>::error(XferError::kInvalidName);
  }
  return expected<void, XferError>::success();
}

// ============================================================================
// Frame I/O
// ============================================================================

/**
 * @brief Write only the length prefix of a frame whose payload follows.
 *
 * Used to stream CONTENT from a file after announcing its length.
 */
inline expected<void, XferError> WriteFrameHeader(
    Connection& conn, FrameKind kind, uint64_t len,
    const FrameLimits& limits = FrameLimits{}) noexcept {
  if (len > limits.CeilingFor(kind)) {
    LABXFER_LOG_ERROR("CODEC", "%s frame of %llu bytes exceeds ceiling %llu",
                      FrameKindName(kind), static_cast<unsigned long long>(len),
                      static_cast<unsigned long long>(limits.CeilingFor(kind)));
    return expected<void, XferError>::error(XferError::kFrameTooLarge);
  }
  uint8_t prefix[kLengthPrefixBytes];
  EncodeU32(static_cast<uint32_t>(len), prefix);
  auto w = conn.WriteAll(prefix, sizeof(prefix));
  if (!w.has_value()) {
    return expected<void, XferError>::error(w.get_error());
  }
  return expected<void, XferError>::success();
}

/**
 * @brief Write one complete frame (prefix then payload).
 *
 * Small frames are coalesced into a single send.
 */
inline expected<void, XferError> WriteFrame(
    Connection& conn, FrameKind kind, const void* payload, size_t len,
    const FrameLimits& limits = FrameLimits{}) {
  if (kind == FrameKind::kSize && len != kSizePayloadBytes) {
    return expected<void, XferError>::error(XferError::kMalformedFrame);
  }
  if (len > limits.CeilingFor(kind)) {
    LABXFER_LOG_ERROR("CODEC", "%s frame of %zu bytes exceeds ceiling",
                      FrameKindName(kind), len);
    return expected<void, XferError>::error(XferError::kFrameTooLarge);
  }

  static constexpr size_t kCoalesceBytes = 512U;
  if (len <= kCoalesceBytes) {
    uint8_t buf[kLengthPrefixBytes + kCoalesceBytes];
    EncodeU32(static_cast<uint32_t>(len), buf);
    if (len > 0U) std::memcpy(buf + kLengthPrefixBytes, payload, len);
    auto w = conn.WriteAll(buf, kLengthPrefixBytes + len);
    if (!w.has_value()) {
      return expected<void, XferError>::error(w.get_error());
    }
    return expected<void, XferError>::success();
  }

  auto hdr = WriteFrameHeader(conn, kind, len, limits);
  if (!hdr.has_value()) return hdr;
  auto w = conn.WriteAll(payload, len);
  if (!w.has_value()) {
    return expected<void, XferError>::error(w.get_error());
  }
  return expected<void, XferError>::success();
}

/**
 * @brief Read a frame's length prefix and check it against the ceiling.
 *
 * kFrameTooLarge is returned before any payload byte is consumed.
 */
inline expected<uint32_t, XferError> ReadFrameLength(
    Connection& conn, FrameKind kind,
    const FrameLimits& limits = FrameLimits{}) noexcept {
  uint8_t prefix[kLengthPrefixBytes];
  auto r = conn.ReadExact(prefix, sizeof(prefix));
  if (!r.has_value()) {
    return expected<uint32_t, XferError>::error(r.get_error());
  }
  const uint32_t len = DecodeU32(prefix);
  if (kind == FrameKind::kSize && len != kSizePayloadBytes) {
    if (len > kSizePayloadBytes) {
      return expected<uint32_t, XferError>::error(XferError::kFrameTooLarge);
    }
    return expected<uint32_t, XferError>::error(XferError::kMalformedFrame);
  }
  if (len > limits.CeilingFor(kind)) {
    LABXFER_LOG_WARN("CODEC", "declared %s length %u exceeds ceiling %llu",
                     FrameKindName(kind), len,
                     static_cast<unsigned long long>(limits.CeilingFor(kind)));
    return expected<uint32_t, XferError>::error(XferError::kFrameTooLarge);
  }
  return expected<uint32_t, XferError>::success(len);
}

/** @brief Read one whole frame into memory. */
inline expected<std::vector<uint8_t>, XferError> ReadFrame(
    Connection& conn, FrameKind kind,
    const FrameLimits& limits = FrameLimits{}) {
  auto len = ReadFrameLength(conn, kind, limits);
  if (!len.has_value()) {
    return expected<std::vector<uint8_t>, XferError>::error(len.get_error());
  }
  return conn.Read(len.value());
}

// ============================================================================
// Typed helpers
// ============================================================================

inline expected<void, XferError> WriteName(
    Connection& conn, const std::string& name,
    const FrameLimits& limits = FrameLimits{}) {
  auto valid = ValidateName(name, limits.max_name_bytes);
  if (!valid.has_value()) return valid;
  return WriteFrame(conn, FrameKind::kName, name.data(), name.size(), limits);
}

inline expected<void, XferError> WriteSize(
    Connection& conn, uint64_t size,
    const FrameLimits& limits = FrameLimits{}) {
  if (size > limits.CeilingFor(FrameKind::kContent)) {
    return expected<void, XferError>::error(XferError::kFrameTooLarge);
  }
  uint8_t payload[kSizePayloadBytes];
  EncodeU64(size, payload);
  return WriteFrame(conn, FrameKind::kSize, payload, sizeof(payload), limits);
}

/** @brief Read a NAME frame and validate it as a local file name. */
inline expected<std::string, XferError> ReadName(
    Connection& conn, const FrameLimits& limits = FrameLimits{}) {
  auto payload = ReadFrame(conn, FrameKind::kName, limits);
  if (!payload.has_value()) {
    return expected<std::string, XferError>::error(payload.get_error());
  }
  std::string name(payload.value().begin(), payload.value().end());
  auto valid = ValidateName(name, limits.max_name_bytes);
  if (!valid.has_value()) {
    return expected<std::string, XferError>::error(valid.get_error());
  }
  return expected<std::string, XferError>::success(
      static_cast<std::string&&>(name));
}

/**
 * @brief Read a SIZE frame.
 * @return kFrameTooLarge when the announced content exceeds the ceiling.
 */
inline expected<uint64_t, XferError> ReadSize(
    Connection& conn, const FrameLimits& limits = FrameLimits{}) {
  auto len = ReadFrameLength(conn, FrameKind::kSize, limits);
  if (!len.has_value()) {
    return expected<uint64_t, XferError>::error(len.get_error());
  }
  uint8_t payload[kSizePayloadBytes];
  auto r = conn.ReadExact(payload, sizeof(payload));
  if (!r.has_value()) {
    return expected<uint64_t, XferError>::error(r.get_error());
  }
  const uint64_t size = DecodeU64(payload);
  if (size > limits.CeilingFor(FrameKind::kContent)) {
    LABXFER_LOG_WARN("CODEC", "announced size %llu exceeds ceiling %llu",
                     static_cast<unsigned long long>(size),
                     static_cast<unsigned long long>(
                         limits.CeilingFor(FrameKind::kContent)));
    return expected<uint64_t, XferError>::error(XferError::kFrameTooLarge);
  }
  return expected<uint64_t, XferError>::success(size);
}

/**
 * @brief Stream a CONTENT frame into sink in chunks of at most chunk_bytes.
 *
 * Sink is callable as bool(const uint8_t* data, size_t len); returning false
 * aborts with kFileAccess.
 *
 * Failure kinds:
 *   - kIo           peer closed before any CONTENT byte arrived
 *   - kSizeMismatch CONTENT prefix differs from declared_size, or the peer
 *                   closed after delivering only part of the content
 *   - kTimeout      a read deadline expired
 *
 * @param[out] received Bytes handed to sink, also on failure.
 */
template <typename Sink>
expected<uint64_t, XferError> ReadContent(Connection& conn,
                                          uint64_t declared_size,
                                          const FrameLimits& limits,
                                          uint32_t chunk_bytes, Sink&& sink,
                                          uint64_t* received = nullptr) {
  if (received != nullptr) *received = 0;
  auto len = ReadFrameLength(conn, FrameKind::kContent, limits);
  if (!len.has_value()) {
    return expected<uint64_t, XferError>::error(len.get_error());
  }
  if (static_cast<uint64_t>(len.value()) != declared_size) {
    LABXFER_LOG_WARN("CODEC", "CONTENT length %u != declared SIZE %llu",
                     len.value(),
                     static_cast<unsigned long long>(declared_size));
    return expected<uint64_t, XferError>::error(XferError::kSizeMismatch);
  }

  std::vector<uint8_t> chunk(std::max<uint32_t>(chunk_bytes, 1U));
  uint64_t total = 0;
  while (total < declared_size) {
    const size_t want = static_cast<size_t>(
        std::min<uint64_t>(chunk.size(), declared_size - total));
    auto got = conn.ReadSome(chunk.data(), want);
    if (!got.has_value()) {
      return expected<uint64_t, XferError>::error(got.get_error());
    }
    if (got.value() == 0U) {
      LABXFER_LOG_WARN("CODEC", "peer closed after %llu of %llu content bytes",
                       static_cast<unsigned long long>(total),
                       static_cast<unsigned long long>(declared_size));
      return expected<uint64_t, XferError>::error(
          (total == 0U) ? XferError::kIo : XferError::kSizeMismatch);
    }
    if (!sink(chunk.data(), got.value())) {
      return expected<uint64_t, XferError>::error(XferError::kFileAccess);
    }
    total += got.value();
    if (received != nullptr) *received = total;
  }
  return expected<uint64_t, XferError>::success(total);
}

}  // namespace labxfer

#endif  // LABXFER_FRAME_CODEC_HPP_
