/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_CRC_H
#define SHELFSYNC_CRC_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/crc32.h"

namespace shelfsync {
namespace protocol {

// Computes a CRC32 (IEEE 802.3 polynomial) over the provided buffer.
uint32_t crc32_ieee(const uint8_t* data, size_t len);

// Incremental form for data that is not contiguous (storage records).
class Crc32 {
 public:
  void add(const uint8_t* data, size_t len) {
    if (data && len > 0) {
      _crc.add(data, data + len);
    }
  }
  uint32_t value() const { return _crc.value(); }

 private:
  etl::crc32 _crc;
};

}  // namespace protocol
}  // namespace shelfsync

#endif  // SHELFSYNC_CRC_H
