/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "inventory.h"

#include <stdio.h>

namespace shelfsync {
namespace model {

namespace {

struct Layout {
  uint8_t height;
  uint8_t width;
};

const Layout kAllowedLayouts[] = {{1, 1}, {2, 2}, {2, 3}, {2, 4}};

}  // namespace

bool Footprint::valid() const {
  if (row < 1 || row > kMaxRow) return false;
  if (bottom_level < 1 || left_column < 1) return false;

  bool layout_ok = false;
  for (const Layout& layout : kAllowedLayouts) {
    if (layout.height == height && layout.width == width) {
      layout_ok = true;
      break;
    }
  }
  if (!layout_ok) return false;

  if (bottom_level + height - 1 > kMaxLevel) return false;
  if (left_column + width - 1 > kMaxColumn) return false;
  return true;
}

bool Footprint::contains(const Slot& slot) const {
  return slot.level >= bottom_level && slot.level < bottom_level + height &&
         slot.column >= left_column && slot.column < left_column + width;
}

Slot Footprint::slotAt(size_t index) const {
  Slot slot;
  slot.level = static_cast<uint8_t>(bottom_level + index / width);
  slot.column = static_cast<uint8_t>(left_column + index % width);
  return slot;
}

size_t Footprint::indexOf(const Slot& slot) const {
  if (!contains(slot)) {
    return kMaxSlots;
  }
  return static_cast<size_t>(slot.level - bottom_level) * width +
         (slot.column - left_column);
}

bool operator==(const Footprint& a, const Footprint& b) {
  return a.row == b.row && a.bottom_level == b.bottom_level &&
         a.left_column == b.left_column && a.height == b.height &&
         a.width == b.width;
}

ConfigSnapshot::ConfigSnapshot() : footprint(), firmware(), last_sequence(0) {
  firmware.digest.fill(0);
}

bool ConfigSnapshot::valid() const {
  if (!footprint.valid()) {
    return false;
  }
  for (size_t i = 0; i < items.size(); ++i) {
    if (!footprint.contains(items[i].slot)) {
      return false;
    }
    for (size_t j = i + 1; j < items.size(); ++j) {
      if (items[i].slot == items[j].slot) {
        return false;
      }
    }
  }
  return true;
}

const Item* ConfigSnapshot::itemAt(const Slot& slot) const {
  for (const Item& item : items) {
    if (item.slot == slot) {
      return &item;
    }
  }
  return nullptr;
}

Item* ConfigSnapshot::itemAt(const Slot& slot) {
  for (Item& item : items) {
    if (item.slot == slot) {
      return &item;
    }
  }
  return nullptr;
}

uint16_t applyStep(uint16_t count, int8_t step) {
  const int32_t next = static_cast<int32_t>(count) + step;
  if (next < 0) {
    return 0;
  }
  if (next > kMaxCount) {
    return kMaxCount;
  }
  return static_cast<uint16_t>(next);
}

bool wellFormed(const StockChange& change) {
  return change.row >= 1 && change.row <= kMaxRow && change.slot.level >= 1 &&
         change.slot.level <= kMaxLevel && change.slot.column >= 1 &&
         change.slot.column <= kMaxColumn && change.item_id != 0 &&
         change.count <= kMaxCount;
}

LocationCode locationCode(uint8_t row, const Slot& slot) {
  char buffer[LocationCode::MAX_SIZE + 1];
  snprintf(buffer, sizeof(buffer), "R%u-E%u-K%u", static_cast<unsigned>(row),
           static_cast<unsigned>(slot.level),
           static_cast<unsigned>(slot.column));
  return LocationCode(buffer);
}

}  // namespace model
}  // namespace shelfsync
