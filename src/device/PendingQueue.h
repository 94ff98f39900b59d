/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_PENDING_QUEUE_H
#define SHELFSYNC_PENDING_QUEUE_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/expected.h"
#include "etl/vector.h"

#include "config/shelfsync_config.h"
#include "device/DeviceHal.h"
#include "model/inventory.h"

namespace shelfsync {
namespace device {

enum class StorageError : uint8_t {
  QUEUE_FULL = 1,
  WRITE_FAILED = 2,
  SEQUENCE_EXHAUSTED = 3
};

const char* toString(StorageError error);

/**
 * @brief FIFO of stock changes not yet acknowledged by the bridge.
 *
 * The queue and the sequence counter live in one storage record that is
 * rewritten on every mutation. An entry is only visible after its record
 * write succeeded, so whatever is transmitted has survived a power loss.
 *
 * Losing a corrupt record also loses the counter. Until the backend reports
 * its highest applied sequence the numbering is unconfirmed: entries must
 * not be sent, and advanceSequence() renumbers them above that floor.
 */
class PendingQueue {
 public:
  static constexpr size_t CAPACITY = SHELFSYNC_PENDING_QUEUE_CAPACITY;
  static constexpr size_t ENTRY_SIZE = 1 + 1 + 1 + 4 + 2 + 4 + 4;
  static constexpr size_t RECORD_SIZE = 4 + 4 + 1 + 1 + CAPACITY * ENTRY_SIZE + 4;
  // Highest floor accepted from the backend; leaves room to renumber a full
  // queue without wrapping.
  static constexpr uint32_t MAX_SEQUENCE_FLOOR = 0xFFFFFFFFUL - CAPACITY - 1;

  explicit PendingQueue(Storage& storage);

  // Restores the persisted queue. An absent record is a fresh device; a
  // corrupt one is replaced by an empty, unconfirmed queue and reported as
  // false.
  bool load();

  // Records the new count of an item at row/item.slot. Assigns the next
  // sequence number and persists the entry. On error the queue and the
  // counter are unchanged.
  etl::expected<model::StockChange, StorageError> append(
      uint8_t row, const model::Item& item, uint16_t count, uint32_t timestamp);

  // Drops the front entry if it carries this sequence number.
  bool acknowledge(uint32_t sequence);

  // Raises the counter so the next sequence is greater than last_applied
  // and confirms the numbering. False if last_applied is out of range.
  bool advanceSequence(uint32_t last_applied);

  // Drops entries whose item is no longer at that position in the snapshot
  // (other row, slot emptied or holding another item). Returns the count.
  size_t purgeUnmapped(const model::ConfigSnapshot& snapshot);

  bool empty() const { return _entries.empty(); }
  bool full() const { return _entries.full(); }
  size_t size() const { return _entries.size(); }
  const model::StockChange& front() const { return _entries.front(); }
  const model::StockChange& at(size_t index) const { return _entries[index]; }
  uint32_t nextSequence() const { return _next_sequence; }
  bool sequenceConfirmed() const { return _sequence_confirmed; }

 private:
  bool persist();
  size_t serialize(uint8_t* buffer) const;

  Storage& _storage;
  etl::vector<model::StockChange, CAPACITY> _entries;
  uint32_t _next_sequence;
  bool _sequence_confirmed;
};

}  // namespace device
}  // namespace shelfsync

#endif  // SHELFSYNC_PENDING_QUEUE_H
