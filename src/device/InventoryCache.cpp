/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "InventoryCache.h"

#include <string.h>

#include "device/PendingQueue.h"
#include "protocol/crc.h"
#include "protocol/frame.h"
#include "protocol/messages.h"
#include "util/Log.h"

namespace shelfsync {
namespace device {

namespace {

constexpr uint32_t kRecordMagic = 0x53534353UL;  // "SSCS"
constexpr size_t kHeaderSize = 4 + 2;
constexpr size_t kRecordCapacity = kHeaderSize + protocol::MAX_PAYLOAD_SIZE + 4;
const char kTag[] = "cache";

}  // namespace

InventoryCache::InventoryCache(Storage& storage)
    : _storage(storage), _snapshot() {
  _counts.fill(0);
}

bool InventoryCache::load() {
  _snapshot = model::ConfigSnapshot();
  resetCounts();

  uint8_t buffer[kRecordCapacity];
  const size_t len = _storage.read(RecordId::SNAPSHOT, buffer, sizeof(buffer));
  if (len == 0) {
    return false;
  }
  if (len < kHeaderSize + 4 || protocol::read_u32_be(buffer) != kRecordMagic) {
    return discard("bad header");
  }

  const uint16_t payload_len = protocol::read_u16_be(buffer + 4);
  if (payload_len > protocol::MAX_PAYLOAD_SIZE ||
      len != kHeaderSize + payload_len + 4) {
    return discard("bad length");
  }
  const size_t crc_start = kHeaderSize + payload_len;
  if (protocol::read_u32_be(buffer + crc_start) !=
      protocol::crc32_ieee(buffer, crc_start)) {
    return discard("bad crc");
  }

  protocol::Frame frame;
  frame.header.version = protocol::PROTOCOL_VERSION;
  frame.header.message_id = static_cast<uint16_t>(protocol::MessageId::CONFIG_PUSH);
  frame.header.payload_length = payload_len;
  memcpy(frame.payload, buffer + kHeaderSize, payload_len);

  protocol::ConfigPush push;
  if (protocol::message::decodeInto(frame, push) != protocol::FrameError::NONE ||
      !push.snapshot.valid()) {
    return discard("undecodable payload");
  }

  _snapshot = push.snapshot;
  resetCounts();
  return true;
}

// The panel starts blank and waits for the next ConfigPush.
bool InventoryCache::discard(const char* problem) {
  SHELFSYNC_LOG_WARN(kTag, "discarding snapshot record: %s", problem);
  if (!_storage.erase(RecordId::SNAPSHOT)) {
    SHELFSYNC_LOG_WARN(kTag, "cannot erase snapshot record");
  }
  return false;
}

bool InventoryCache::apply(const model::ConfigSnapshot& snapshot) {
  if (!snapshot.valid()) {
    SHELFSYNC_LOG_WARN(kTag, "rejecting snapshot outside footprint R%u",
                       static_cast<unsigned>(snapshot.footprint.row));
    return false;
  }
  _snapshot = snapshot;
  for (model::Item& item : _snapshot.items) {
    if (item.stock > model::kMaxCount) {
      item.stock = model::kMaxCount;
    }
  }
  resetCounts();
  if (!persist()) {
    SHELFSYNC_LOG_WARN(kTag, "snapshot applied but not persisted");
  }
  return true;
}

void InventoryCache::overlay(const PendingQueue& queue) {
  for (size_t i = 0; i < queue.size(); ++i) {
    const model::StockChange& change = queue.at(i);
    const size_t index = indexOf(change.slot);
    if (change.row == _snapshot.footprint.row && index < itemCount() &&
        _snapshot.items[index].id == change.item_id) {
      _snapshot.items[index].stock = change.count;
      _counts[index] = change.count;
    }
  }
}

size_t InventoryCache::indexOf(const model::Slot& slot) const {
  for (size_t i = 0; i < _snapshot.items.size(); ++i) {
    if (_snapshot.items[i].slot == slot) {
      return i;
    }
  }
  return _snapshot.items.size();
}

bool InventoryCache::adjust(const model::Slot& slot, int8_t step,
                            uint16_t& new_count) {
  const size_t index = indexOf(slot);
  if (index >= itemCount()) {
    return false;
  }
  _counts[index] = model::applyStep(_counts[index], step);
  new_count = _counts[index];
  return true;
}

bool InventoryCache::hasDirty() const {
  for (size_t i = 0; i < itemCount(); ++i) {
    if (isDirty(i)) {
      return true;
    }
  }
  return false;
}

void InventoryCache::commit(size_t index) {
  _snapshot.items[index].stock = _counts[index];
  if (!persist()) {
    // The pending queue holds the change; overlay() restores it after a reboot.
    SHELFSYNC_LOG_WARN(kTag, "snapshot counts not persisted");
  }
}

void InventoryCache::resetCounts() {
  _counts.fill(0);
  for (size_t i = 0; i < _snapshot.items.size(); ++i) {
    _counts[i] = _snapshot.items[i].stock;
  }
}

bool InventoryCache::persist() {
  protocol::ConfigPush push;
  push.snapshot = _snapshot;
  protocol::Payload payload;
  if (!protocol::message::encode(push, payload)) {
    return false;
  }

  uint8_t buffer[kRecordCapacity];
  protocol::write_u32_be(buffer, kRecordMagic);
  protocol::write_u16_be(buffer + 4, static_cast<uint16_t>(payload.size()));
  memcpy(buffer + kHeaderSize, payload.data(), payload.size());
  const size_t crc_start = kHeaderSize + payload.size();
  protocol::write_u32_be(buffer + crc_start, protocol::crc32_ieee(buffer, crc_start));
  return _storage.write(RecordId::SNAPSHOT, buffer, crc_start + 4);
}

}  // namespace device
}  // namespace shelfsync
