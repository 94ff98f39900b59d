/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "crc.h"

namespace shelfsync {
namespace protocol {

uint32_t crc32_ieee(const uint8_t* data, size_t len) {
  Crc32 crc;
  crc.add(data, len);
  return crc.value();
}

}  // namespace protocol
}  // namespace shelfsync
