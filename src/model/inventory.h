/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_INVENTORY_H
#define SHELFSYNC_INVENTORY_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/array.h"
#include "etl/string.h"
#include "etl/vector.h"

#include "config/shelfsync_config.h"

namespace shelfsync {
namespace model {

// Shelf geometry.
constexpr uint8_t kMaxRow = 6;
constexpr uint8_t kMaxLevel = 4;
constexpr uint8_t kMaxColumn = 6;

// Largest allowed footprint is 2 x 4.
constexpr size_t kMaxSlots = 8;
constexpr size_t kMaxNameLength = 20;
constexpr size_t kMaxDeviceIdLength = 31;
constexpr size_t kDigestSize = 32;
constexpr uint16_t kMaxCount = SHELFSYNC_MAX_STOCK_COUNT;

typedef etl::string<kMaxDeviceIdLength> DeviceId;
typedef etl::string<kMaxNameLength> ItemName;
typedef etl::string<16> LocationCode;
typedef etl::array<uint8_t, kDigestSize> Digest;

// A cell of the shelf in absolute coordinates (the row is implied by the
// owning footprint).
struct Slot {
  uint8_t level;
  uint8_t column;
};

inline bool operator==(const Slot& a, const Slot& b) {
  return a.level == b.level && a.column == b.column;
}

inline bool operator!=(const Slot& a, const Slot& b) { return !(a == b); }

struct Footprint {
  uint8_t row;
  uint8_t bottom_level;
  uint8_t left_column;
  uint8_t height;
  uint8_t width;

  // Row/level/column ranges and one of the allowed layouts
  // (1x1, 2x2, 2x3, 2x4 as height x width).
  bool valid() const;

  bool contains(const Slot& slot) const;

  size_t slotCount() const { return static_cast<size_t>(height) * width; }

  // Row-major from the bottom-left cell. Only meaningful if valid().
  Slot slotAt(size_t index) const;

  // Returns kMaxSlots if the slot is outside the footprint.
  size_t indexOf(const Slot& slot) const;
};

bool operator==(const Footprint& a, const Footprint& b);
inline bool operator!=(const Footprint& a, const Footprint& b) {
  return !(a == b);
}

struct Item {
  uint32_t id;
  Slot slot;
  uint16_t min_stock;
  uint16_t stock;
  ItemName name;

  bool belowMinimum() const { return stock < min_stock; }
};

struct FirmwareInfo {
  uint16_t version;
  uint32_t image_size;
  Digest digest;
};

struct ConfigSnapshot {
  Footprint footprint;
  FirmwareInfo firmware;
  // Highest sequence number the backend has applied for this device.
  uint32_t last_sequence;
  etl::vector<Item, kMaxSlots> items;

  ConfigSnapshot();

  // Footprint valid, every item inside it, no two items on one slot.
  bool valid() const;

  const Item* itemAt(const Slot& slot) const;
  Item* itemAt(const Slot& slot);
};

// Battery level of a device that does not measure it.
constexpr uint8_t kBatteryUnknown = 0xFF;

// Device-side view of one stock change. Row, slot and item id identify the
// counted item as the device saw it when the change was recorded.
struct StockChange {
  uint8_t row;
  Slot slot;
  uint32_t item_id;
  uint16_t count;
  uint32_t sequence;
  uint32_t timestamp;
};

// Position inside the shelf, a non-zero item id and a count in range.
bool wellFormed(const StockChange& change);

// Bridge-side view: the change plus the device it came from.
struct StockDelta {
  DeviceId device;
  uint8_t row;
  Slot slot;
  uint32_t item_id;
  uint16_t count;
  uint32_t sequence;
  uint32_t timestamp;
  // 0..100, kBatteryUnknown if the device does not report it.
  uint8_t battery;
};

// Applies a +/- step and keeps the result inside 0..kMaxCount.
uint16_t applyStep(uint16_t count, int8_t step);

// R{row}-E{level}-K{column}
LocationCode locationCode(uint8_t row, const Slot& slot);

}  // namespace model
}  // namespace shelfsync

#endif  // SHELFSYNC_INVENTORY_H
