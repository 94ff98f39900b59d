/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_PACKET_BUILDER_H
#define SHELFSYNC_PACKET_BUILDER_H

#include "etl_profile.h"
#include "etl/algorithm.h"
#include "etl/string_view.h"
#include "etl/vector.h"

#include "frame.h"

namespace shelfsync {
namespace protocol {

/**
 * @brief Fluent interface for building frame payloads.
 *
 * Writes past the capacity are dropped and latch ok() to false, so a
 * sequence of add() calls needs a single check at the end.
 */
class PacketBuilder {
 public:
  explicit PacketBuilder(etl::ivector<uint8_t>& payload)
      : _payload(payload), _ok(true) {
    _payload.clear();
  }

  PacketBuilder& add(uint8_t byte) {
    if (_payload.full()) {
      _ok = false;
    } else {
      _payload.push_back(byte);
    }
    return *this;
  }

  PacketBuilder& add(const uint8_t* data, size_t len) {
    const size_t available = _payload.capacity() - _payload.size();
    if (len > available) {
      _ok = false;
      return *this;
    }
    if (len > 0) {
      _payload.insert(_payload.end(), data, data + len);
    }
    return *this;
  }

  PacketBuilder& add_u16(uint16_t value) {
    uint8_t buf[2];
    write_u16_be(buf, value);
    return add(buf, 2);
  }

  PacketBuilder& add_u32(uint32_t value) {
    uint8_t buf[4];
    write_u32_be(buf, value);
    return add(buf, 4);
  }

  PacketBuilder& add_pascal_string(etl::string_view str) {
    const uint8_t len = static_cast<uint8_t>(etl::min<size_t>(str.length(), 255));
    add(len);
    if (len > 0) {
      add(reinterpret_cast<const uint8_t*>(str.data()), len);
    }
    return *this;
  }

  bool ok() const { return _ok; }
  size_t size() const { return _payload.size(); }
  const uint8_t* data() const { return _payload.data(); }

 private:
  etl::ivector<uint8_t>& _payload;
  bool _ok;
};

/**
 * @brief Bounds-checked cursor over a received payload.
 *
 * Reads past the end return zero and latch ok() to false.
 */
class PacketReader {
 public:
  PacketReader(const uint8_t* data, size_t len)
      : _data(data), _len(len), _pos(0), _ok(true) {}

  uint8_t read_u8() {
    if (!require(1)) return 0;
    return _data[_pos++];
  }

  uint16_t read_u16() {
    if (!require(2)) return 0;
    const uint16_t value = read_u16_be(_data + _pos);
    _pos += 2;
    return value;
  }

  uint32_t read_u32() {
    if (!require(4)) return 0;
    const uint32_t value = read_u32_be(_data + _pos);
    _pos += 4;
    return value;
  }

  bool read_bytes(uint8_t* out, size_t len) {
    if (!require(len)) return false;
    etl::copy_n(_data + _pos, len, out);
    _pos += len;
    return true;
  }

  // Returns a view into the payload; empty and !ok() if truncated.
  etl::string_view read_pascal_string() {
    const uint8_t len = read_u8();
    if (!require(len)) return etl::string_view();
    const etl::string_view view(reinterpret_cast<const char*>(_data + _pos), len);
    _pos += len;
    return view;
  }

  const uint8_t* cursor() const { return _data + _pos; }
  void skip(size_t len) {
    if (require(len)) _pos += len;
  }

  size_t remaining() const { return _len - _pos; }
  bool ok() const { return _ok; }

 private:
  bool require(size_t len) {
    if (!_ok || len > _len - _pos) {
      _ok = false;
      return false;
    }
    return true;
  }

  const uint8_t* _data;
  size_t _len;
  size_t _pos;
  bool _ok;
};

}  // namespace protocol
}  // namespace shelfsync

#endif  // SHELFSYNC_PACKET_BUILDER_H
