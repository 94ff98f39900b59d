/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "frame.h"

#include <string.h>

namespace shelfsync {
namespace protocol {

namespace {

// Walks the COBS code bytes and computes the decoded length without writing,
// so that a hostile block length can never push the in-place decoder past
// MAX_RAW_FRAME_SIZE.
bool is_cobs_decoded_length_valid(const uint8_t* encoded, size_t encoded_len,
                                  size_t& decoded_len) {
  decoded_len = 0;
  size_t index = 0;

  while (index < encoded_len) {
    const uint8_t code = encoded[index++];
    if (code == 0) {
      return false;
    }

    if (decoded_len + static_cast<size_t>(code) - 1 > MAX_RAW_FRAME_SIZE) {
      return false;
    }
    decoded_len += static_cast<size_t>(code) - 1;

    if (index + static_cast<size_t>(code) - 1 > encoded_len) {
      return false;  // Not enough encoded bytes for the claimed data segment.
    }
    index += static_cast<size_t>(code) - 1;

    const bool has_more = index < encoded_len;
    if (code < 0xFF && has_more) {
      if (decoded_len >= MAX_RAW_FRAME_SIZE) {
        return false;
      }
      decoded_len += 1;  // account for inserted zero byte
    }
  }

  return decoded_len <= MAX_RAW_FRAME_SIZE;
}

etl::expected<Frame, FrameError> decode_in_place(uint8_t* buffer,
                                                 size_t encoded_len) {
  size_t decoded_len = 0;
  if (!is_cobs_decoded_length_valid(buffer, encoded_len, decoded_len)) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }

  const size_t actual_written = cobs::decode(buffer, encoded_len, buffer);
  if (actual_written != decoded_len) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }

  return FrameParser::parse(etl::span<const uint8_t>(buffer, decoded_len));
}

}  // namespace

const char* toString(FrameError error) {
  switch (error) {
    case FrameError::NONE:            return "none";
    case FrameError::MALFORMED:       return "malformed";
    case FrameError::CRC_MISMATCH:    return "crc_mismatch";
    case FrameError::OVERFLOW:        return "overflow";
    case FrameError::UNKNOWN_MESSAGE: return "unknown_message";
  }
  return "?";
}

// --- FrameParser ---

etl::expected<Frame, FrameError> FrameParser::parse(
    etl::span<const uint8_t> raw) {
  const size_t raw_len = raw.size();
  if (raw_len > MAX_RAW_FRAME_SIZE) {
    return etl::unexpected<FrameError>(FrameError::OVERFLOW);
  }
  if (raw_len < sizeof(FrameHeader) + CRC_TRAILER_SIZE) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }

  const size_t crc_start = raw_len - CRC_TRAILER_SIZE;
  const uint32_t received_crc = read_u32_be(raw.data() + crc_start);
  const uint32_t calculated_crc = crc32_ieee(raw.data(), crc_start);
  if (received_crc != calculated_crc) {
    return etl::unexpected<FrameError>(FrameError::CRC_MISMATCH);
  }

  Frame frame;
  const uint8_t* p = raw.data();
  frame.header.version = *p++;
  frame.header.payload_length = read_u16_be(p);
  p += 2;
  frame.header.message_id = read_u16_be(p);
  p += 2;

  if (frame.header.version != PROTOCOL_VERSION) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }
  if (frame.header.payload_length > MAX_PAYLOAD_SIZE) {
    return etl::unexpected<FrameError>(FrameError::OVERFLOW);
  }
  if (sizeof(FrameHeader) + frame.header.payload_length != crc_start) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }

  if (frame.header.payload_length > 0) {
    memcpy(frame.payload, p, frame.header.payload_length);
  }
  return frame;
}

// --- FrameBuilder ---

size_t FrameBuilder::build(uint8_t* buffer, size_t buffer_size,
                           uint16_t message_id, const uint8_t* payload,
                           size_t payload_len) {
  if (!buffer || payload_len > MAX_PAYLOAD_SIZE) {
    return 0;
  }

  const size_t data_len = sizeof(FrameHeader) + payload_len;
  const size_t total_len = data_len + CRC_TRAILER_SIZE;
  if (total_len > buffer_size) {
    return 0;
  }

  uint8_t* p = buffer;
  *p++ = PROTOCOL_VERSION;
  write_u16_be(p, static_cast<uint16_t>(payload_len));
  p += 2;
  write_u16_be(p, message_id);
  p += 2;

  if (payload && payload_len > 0) {
    memcpy(p, payload, payload_len);
  }

  write_u32_be(buffer + data_len, crc32_ieee(buffer, data_len));
  return total_len;
}

// --- FrameStream ---

FrameStream::FrameStream() : _last_error(FrameError::NONE) { reset(); }

void FrameStream::reset() {
  _rx_buffer_ptr = 0;
  _overflow_detected = false;
  memset(_rx_buffer, 0, sizeof(_rx_buffer));
}

FrameStream::Result FrameStream::consume(uint8_t byte, Frame& out_frame) {
  if (byte != FRAME_DELIMITER) {
    if (_rx_buffer_ptr < COBS_BUFFER_SIZE) {
      _rx_buffer[_rx_buffer_ptr++] = byte;
    } else {
      _overflow_detected = true;
    }
    return Result::NEED_MORE;
  }

  if (_overflow_detected) {
    reset();
    _last_error = FrameError::OVERFLOW;
    return Result::ERROR;
  }
  if (_rx_buffer_ptr == 0) {
    return Result::NEED_MORE;  // Empty packet (back-to-back delimiters).
  }

  etl::expected<Frame, FrameError> parsed =
      decode_in_place(_rx_buffer, _rx_buffer_ptr);
  reset();

  if (!parsed.has_value()) {
    _last_error = parsed.error();
    return Result::ERROR;
  }
  out_frame = parsed.value();
  _last_error = FrameError::NONE;
  return Result::FRAME_READY;
}

// --- Whole-frame helpers ---

size_t encodeFrame(uint16_t message_id, const uint8_t* payload,
                   size_t payload_len, etl::span<uint8_t> out) {
  uint8_t raw[MAX_RAW_FRAME_SIZE];
  const size_t raw_len =
      FrameBuilder::build(raw, sizeof(raw), message_id, payload, payload_len);
  if (raw_len == 0) {
    return 0;
  }
  if (out.size() < cobs::max_encoded_length(raw_len) + 1) {
    return 0;
  }
  const size_t encoded_len = cobs::encode(raw, raw_len, out.data());
  out[encoded_len] = FRAME_DELIMITER;
  return encoded_len + 1;
}

etl::expected<Frame, FrameError> decodeFrame(etl::span<const uint8_t> wire) {
  size_t len = wire.size();
  if (len > 0 && wire[len - 1] == FRAME_DELIMITER) {
    --len;
  }
  if (len == 0) {
    return etl::unexpected<FrameError>(FrameError::MALFORMED);
  }
  if (len > COBS_BUFFER_SIZE) {
    return etl::unexpected<FrameError>(FrameError::OVERFLOW);
  }
  for (size_t i = 0; i < len; ++i) {
    if (wire[i] == FRAME_DELIMITER) {
      return etl::unexpected<FrameError>(FrameError::MALFORMED);
    }
  }
  uint8_t buffer[COBS_BUFFER_SIZE];
  memcpy(buffer, wire.data(), len);
  return decode_in_place(buffer, len);
}

}  // namespace protocol
}  // namespace shelfsync
