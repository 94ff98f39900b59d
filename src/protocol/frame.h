/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_FRAME_H
#define SHELFSYNC_FRAME_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/expected.h"
#include "etl/span.h"

#include "cobs.h"
#include "crc.h"

namespace shelfsync {
namespace protocol {

// --- Endianness-safe helpers for Big Endian (Network Byte Order) ---

inline uint16_t read_u16_be(const uint8_t* buffer) {
  return static_cast<uint16_t>((static_cast<uint16_t>(buffer[0]) << 8) |
                               static_cast<uint16_t>(buffer[1]));
}

inline void write_u16_be(uint8_t* buffer, uint16_t value) {
  buffer[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buffer[1] = static_cast<uint8_t>(value & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t* buffer) {
  return (static_cast<uint32_t>(buffer[0]) << 24) |
         (static_cast<uint32_t>(buffer[1]) << 16) |
         (static_cast<uint32_t>(buffer[2]) << 8) |
         static_cast<uint32_t>(buffer[3]);
}

inline void write_u32_be(uint8_t* buffer, uint32_t value) {
  buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
  buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
  buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

constexpr uint8_t PROTOCOL_VERSION = 0x01;
constexpr size_t MAX_PAYLOAD_SIZE = 384;
constexpr size_t CRC_TRAILER_SIZE = 4;
constexpr uint8_t FRAME_DELIMITER = 0x00;

// The packed layout is the wire layout: 1 + 2 + 2 bytes, no padding.
struct FrameHeader {
  uint8_t version;
  uint16_t payload_length;
  uint16_t message_id;
} __attribute__((packed));

static_assert(sizeof(FrameHeader) == 5, "FrameHeader must be exactly 5 bytes");

// Header + payload + CRC.
constexpr size_t MAX_RAW_FRAME_SIZE =
    sizeof(FrameHeader) + MAX_PAYLOAD_SIZE + CRC_TRAILER_SIZE;

// COBS adds one code byte per 254-byte block plus the leading code byte.
constexpr size_t COBS_BUFFER_SIZE = cobs::max_encoded_length(MAX_RAW_FRAME_SIZE);

// Encoded frame including its trailing delimiter.
constexpr size_t MAX_WIRE_FRAME_SIZE = COBS_BUFFER_SIZE + 1;

struct Frame {
  FrameHeader header;
  uint8_t payload[MAX_PAYLOAD_SIZE];
};

enum class FrameError : uint8_t {
  NONE = 0,
  MALFORMED,
  CRC_MISMATCH,
  OVERFLOW,
  UNKNOWN_MESSAGE
};

const char* toString(FrameError error);

class FrameParser {
 public:
  // Validates a raw (already COBS-decoded) frame: header, length and CRC.
  static etl::expected<Frame, FrameError> parse(etl::span<const uint8_t> raw);
};

class FrameBuilder {
 public:
  // Builds a raw frame into a buffer. Returns the length of the raw frame,
  // 0 if the payload or the buffer is too large/small.
  static size_t build(uint8_t* buffer, size_t buffer_size, uint16_t message_id,
                      const uint8_t* payload, size_t payload_len);
};

// Byte-at-a-time accumulator for a delimited COBS stream.
class FrameStream {
 public:
  enum class Result : uint8_t {
    NEED_MORE = 0,
    FRAME_READY,
    ERROR
  };

  FrameStream();

  // Feeds one byte. FRAME_READY populates out_frame; ERROR sets lastError().
  // Bytes after an overflow are discarded until the next delimiter.
  Result consume(uint8_t byte, Frame& out_frame);

  void reset();
  FrameError lastError() const { return _last_error; }
  bool overflowed() const { return _overflow_detected; }

 private:
  uint8_t _rx_buffer[COBS_BUFFER_SIZE];
  size_t _rx_buffer_ptr;
  bool _overflow_detected;
  FrameError _last_error;
};

// Builds, COBS-encodes and delimits a frame. Returns the number of bytes to
// put on the wire, 0 on failure.
size_t encodeFrame(uint16_t message_id, const uint8_t* payload,
                   size_t payload_len, etl::span<uint8_t> out);

// Decodes one complete wire frame, with or without its trailing delimiter.
etl::expected<Frame, FrameError> decodeFrame(etl::span<const uint8_t> wire);

}  // namespace protocol
}  // namespace shelfsync

#endif  // SHELFSYNC_FRAME_H
