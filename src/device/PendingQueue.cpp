/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "PendingQueue.h"

#include "protocol/crc.h"
#include "protocol/frame.h"
#include "util/Log.h"

namespace shelfsync {
namespace device {

namespace {

constexpr uint32_t kRecordMagic = 0x53535051UL;  // "SSPQ"
constexpr uint32_t kFirstSequence = 1;
constexpr uint32_t kLastSequence = 0xFFFFFFFFUL;
// magic, next sequence, flags, entry count
constexpr size_t kHeaderSize = 4 + 4 + 1 + 1;
constexpr uint8_t kFlagUnconfirmed = 0x01;
const char kTag[] = "queue";

using protocol::read_u16_be;
using protocol::read_u32_be;
using protocol::write_u16_be;
using protocol::write_u32_be;

}  // namespace

const char* toString(StorageError error) {
  switch (error) {
    case StorageError::QUEUE_FULL:   return "queue_full";
    case StorageError::WRITE_FAILED: return "write_failed";
    case StorageError::SEQUENCE_EXHAUSTED: return "sequence_exhausted";
  }
  return "?";
}

PendingQueue::PendingQueue(Storage& storage)
    : _storage(storage),
      _entries(),
      _next_sequence(kFirstSequence),
      _sequence_confirmed(true) {}

bool PendingQueue::load() {
  _entries.clear();
  _next_sequence = kFirstSequence;
  _sequence_confirmed = true;

  uint8_t buffer[RECORD_SIZE];
  const size_t len = _storage.read(RecordId::PENDING_QUEUE, buffer, sizeof(buffer));
  if (len == 0) {
    return true;
  }

  const char* problem = nullptr;
  const uint8_t count = len >= kHeaderSize ? buffer[9] : 0;
  if (len < kHeaderSize + 4 || read_u32_be(buffer) != kRecordMagic) {
    problem = "bad header";
  } else if (count > CAPACITY ||
             len != kHeaderSize + static_cast<size_t>(count) * ENTRY_SIZE + 4) {
    problem = "bad length";
  } else if (read_u32_be(buffer + len - 4) != protocol::crc32_ieee(buffer, len - 4)) {
    problem = "bad crc";
  }
  if (problem != nullptr) {
    SHELFSYNC_LOG_WARN(kTag, "discarding record with %s (%u bytes)", problem,
                       static_cast<unsigned>(len));
    // The counter is gone with it; hold the numbering until the backend
    // reports its floor. The flag has to survive a reboot before that.
    _sequence_confirmed = false;
    if (!persist()) {
      SHELFSYNC_LOG_WARN(kTag, "unconfirmed counter not persisted");
    }
    return false;
  }

  _next_sequence = read_u32_be(buffer + 4);
  _sequence_confirmed = (buffer[8] & kFlagUnconfirmed) == 0;
  const uint8_t* p = buffer + kHeaderSize;
  for (uint8_t i = 0; i < count; ++i) {
    model::StockChange change;
    change.row = p[0];
    change.slot.level = p[1];
    change.slot.column = p[2];
    change.item_id = read_u32_be(p + 3);
    change.count = read_u16_be(p + 7);
    change.sequence = read_u32_be(p + 9);
    change.timestamp = read_u32_be(p + 13);
    _entries.push_back(change);
    p += ENTRY_SIZE;
  }

  SHELFSYNC_LOG_INFO(kTag, "restored %u pending, next seq %lu%s",
                     static_cast<unsigned>(_entries.size()),
                     static_cast<unsigned long>(_next_sequence),
                     _sequence_confirmed ? "" : " (unconfirmed)");
  return true;
}

etl::expected<model::StockChange, StorageError> PendingQueue::append(
    uint8_t row, const model::Item& item, uint16_t count, uint32_t timestamp) {
  if (_entries.full()) {
    return etl::unexpected<StorageError>(StorageError::QUEUE_FULL);
  }
  if (_next_sequence == kLastSequence) {
    return etl::unexpected<StorageError>(StorageError::SEQUENCE_EXHAUSTED);
  }

  model::StockChange change;
  change.row = row;
  change.slot = item.slot;
  change.item_id = item.id;
  change.count = count;
  change.sequence = _next_sequence;
  change.timestamp = timestamp;

  _entries.push_back(change);
  ++_next_sequence;

  if (!persist()) {
    _entries.pop_back();
    --_next_sequence;
    return etl::unexpected<StorageError>(StorageError::WRITE_FAILED);
  }
  return change;
}

bool PendingQueue::acknowledge(uint32_t sequence) {
  if (_entries.empty() || _entries.front().sequence != sequence) {
    return false;
  }
  _entries.erase(_entries.begin());
  if (!persist()) {
    // The stale record only causes a resend, which the backend deduplicates.
    SHELFSYNC_LOG_WARN(kTag, "ack of seq %lu not persisted",
                       static_cast<unsigned long>(sequence));
  }
  return true;
}

bool PendingQueue::advanceSequence(uint32_t last_applied) {
  if (last_applied > MAX_SEQUENCE_FLOOR) {
    SHELFSYNC_LOG_ERROR(kTag, "sequence floor %lu out of range",
                        static_cast<unsigned long>(last_applied));
    return false;
  }
  const uint32_t floor = last_applied + 1;
  bool changed = false;

  if (!_sequence_confirmed) {
    // Entries numbered after the counter was lost have never been sent.
    if (!_entries.empty() && _entries.front().sequence < floor) {
      uint32_t sequence = floor;
      for (model::StockChange& change : _entries) {
        change.sequence = sequence++;
      }
      _next_sequence = sequence;
      SHELFSYNC_LOG_WARN(kTag, "renumbered %u pending from seq %lu",
                         static_cast<unsigned>(_entries.size()),
                         static_cast<unsigned long>(floor));
    }
    _sequence_confirmed = true;
    changed = true;
  }
  if (_next_sequence < floor) {
    _next_sequence = floor;
    changed = true;
  }

  if (changed && !persist()) {
    SHELFSYNC_LOG_WARN(kTag, "sequence floor %lu not persisted",
                       static_cast<unsigned long>(_next_sequence));
  }
  return true;
}

size_t PendingQueue::purgeUnmapped(const model::ConfigSnapshot& snapshot) {
  size_t removed = 0;
  auto it = _entries.begin();
  while (it != _entries.end()) {
    const model::Item* item = snapshot.itemAt(it->slot);
    if (it->row == snapshot.footprint.row && item != nullptr &&
        item->id == it->item_id) {
      ++it;
    } else {
      SHELFSYNC_LOG_WARN(kTag, "dropping seq %lu for item %lu at %s",
                         static_cast<unsigned long>(it->sequence),
                         static_cast<unsigned long>(it->item_id),
                         model::locationCode(it->row, it->slot).c_str());
      it = _entries.erase(it);
      ++removed;
    }
  }
  if (removed > 0 && !persist()) {
    SHELFSYNC_LOG_WARN(kTag, "purge not persisted");
  }
  return removed;
}

size_t PendingQueue::serialize(uint8_t* buffer) const {
  write_u32_be(buffer, kRecordMagic);
  write_u32_be(buffer + 4, _next_sequence);
  buffer[8] = _sequence_confirmed ? 0 : kFlagUnconfirmed;
  buffer[9] = static_cast<uint8_t>(_entries.size());

  uint8_t* p = buffer + kHeaderSize;
  for (const model::StockChange& change : _entries) {
    p[0] = change.row;
    p[1] = change.slot.level;
    p[2] = change.slot.column;
    write_u32_be(p + 3, change.item_id);
    write_u16_be(p + 7, change.count);
    write_u32_be(p + 9, change.sequence);
    write_u32_be(p + 13, change.timestamp);
    p += ENTRY_SIZE;
  }

  const size_t crc_start = static_cast<size_t>(p - buffer);
  write_u32_be(p, protocol::crc32_ieee(buffer, crc_start));
  return crc_start + 4;
}

bool PendingQueue::persist() {
  uint8_t buffer[RECORD_SIZE];
  const size_t len = serialize(buffer);
  return _storage.write(RecordId::PENDING_QUEUE, buffer, len);
}

}  // namespace device
}  // namespace shelfsync
