/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_COBS_H
#define SHELFSYNC_COBS_H

#include <stddef.h>
#include <stdint.h>

// PacketSerial ships its encoders as header-only classes.
#include <Encoding/COBS.h>

namespace shelfsync {
namespace cobs {

/**
 * @brief COBS encodes a source buffer into a destination buffer.
 *
 * The destination must hold at least max_encoded_length(src_len) bytes.
 * @return Number of bytes written, NOT including the trailing zero.
 */
inline size_t encode(const uint8_t* src_buf, size_t src_len, uint8_t* dst_buf) {
  if (!src_buf || !dst_buf) {
    return 0;
  }
  return ::COBS::encode(src_buf, src_len, dst_buf);
}

// Decoding in place (src_buf == dst_buf) is supported.
inline size_t decode(const uint8_t* src_buf, size_t src_len, uint8_t* dst_buf) {
  if (!src_buf || !dst_buf) {
    return 0;
  }
  return ::COBS::decode(src_buf, src_len, dst_buf);
}

constexpr size_t max_encoded_length(size_t len) {
  return len + (len / 254) + 1;
}

}  // namespace cobs
}  // namespace shelfsync

#endif  // SHELFSYNC_COBS_H
