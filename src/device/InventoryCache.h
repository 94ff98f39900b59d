/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_INVENTORY_CACHE_H
#define SHELFSYNC_INVENTORY_CACHE_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/array.h"

#include "device/DeviceHal.h"
#include "model/inventory.h"

namespace shelfsync {
namespace device {

class PendingQueue;

/**
 * @brief Local copy of the device's slice of the inventory.
 *
 * Two counts are kept per item: the live count shown on the panel and the
 * recorded count, i.e. the value last written to the pending queue or
 * received from the backend. An item is dirty while they differ. Only
 * recorded counts are persisted, so a change that never reached the queue
 * is never mistaken for a durable one.
 */
class InventoryCache {
 public:
  explicit InventoryCache(Storage& storage);

  // Restores the persisted snapshot; false if absent or corrupt. A corrupt
  // record is erased.
  bool load();

  // Replaces the snapshot. Rejects one that is not valid() as a whole.
  bool apply(const model::ConfigSnapshot& snapshot);

  // Replays unacknowledged changes over the snapshot counts. A change only
  // applies to the item it was recorded for.
  void overlay(const PendingQueue& queue);

  bool hasSnapshot() const { return _snapshot.footprint.valid(); }
  const model::ConfigSnapshot& snapshot() const { return _snapshot; }
  const model::Footprint& footprint() const { return _snapshot.footprint; }

  size_t itemCount() const { return _snapshot.items.size(); }
  const model::Item& item(size_t index) const { return _snapshot.items[index]; }
  uint16_t count(size_t index) const { return _counts[index]; }

  // Item index for a slot, or itemCount() if the slot is empty.
  size_t indexOf(const model::Slot& slot) const;

  // Applies a +1/-1 tap. False if the slot holds no item.
  bool adjust(const model::Slot& slot, int8_t step, uint16_t& new_count);

  bool isDirty(size_t index) const { return _counts[index] != _snapshot.items[index].stock; }
  bool hasDirty() const;

  // The live count of this item is now durably queued.
  void commit(size_t index);

 private:
  bool persist();
  bool discard(const char* problem);
  void resetCounts();

  Storage& _storage;
  model::ConfigSnapshot _snapshot;
  etl::array<uint16_t, model::kMaxSlots> _counts;
};

}  // namespace device
}  // namespace shelfsync

#endif  // SHELFSYNC_INVENTORY_CACHE_H
