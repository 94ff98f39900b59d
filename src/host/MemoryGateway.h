/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_MEMORY_GATEWAY_H
#define SHELFSYNC_MEMORY_GATEWAY_H

#include <stdint.h>
#include <stdio.h>

#include <map>
#include <string>

#include "host/BackendGateway.h"
#include "model/inventory.h"

namespace shelfsync {
namespace host {

// Absolute shelf cell.
struct Position {
  uint8_t row;
  uint8_t level;
  uint8_t column;
};

bool operator<(const Position& a, const Position& b);

struct StockItem {
  uint32_t id;
  std::string name;
  uint16_t stock;
  uint16_t min_stock;
};

/**
 * @brief In-process backend.
 *
 * Items live at absolute shelf positions; a device sees the items inside
 * its footprint. A stock update names the row and item it was counted
 * against and is rejected once either has changed. Stock updates are deduplicated on (device, sequence) by
 * keeping the highest applied sequence per device, which is sufficient
 * because a device delivers its deltas in order.
 *
 * With a journal open, every accepted delta is appended and flushed to
 * disk before ACCEPTED is returned; the journal is replayed on open.
 */
class MemoryGateway : public BackendGateway {
 public:
  MemoryGateway();
  ~MemoryGateway() override;

  // Seed format:
  //   { "firmware_version": 3,
  //     "devices": [ { "address": "ShelfSync-A1", "row": 1, "bottom_level": 1,
  //                    "left_column": 1, "height": 2, "width": 2 } ],
  //     "items": [ { "id": 7, "name": "M8 bolts", "row": 1, "level": 1,
  //                  "column": 1, "stock": 40, "min_stock": 10 } ] }
  bool loadInventory(const std::string& json, std::string& error);
  bool loadInventoryFile(const std::string& path, std::string& error);

  bool openJournal(const std::string& path, std::string& error);
  void closeJournal();

  // Rejects invalid footprints and footprints overlapping another device.
  bool addDevice(const std::string& device, const model::Footprint& footprint);
  bool setFootprint(const std::string& device, const model::Footprint& footprint);
  bool swapFootprints(const std::string& a, const std::string& b);

  bool placeItem(const Position& position, const StockItem& item);
  bool removeItem(const Position& position);

  void setFirmware(const model::FirmwareInfo& firmware) { _firmware = firmware; }
  const model::FirmwareInfo& firmware() const { return _firmware; }

  // Simulates an outage: every call fails with UNAVAILABLE.
  void setAvailable(bool available) { _available = available; }

  // Stock at a position, -1 if no item is placed there.
  int stockAt(const Position& position) const;
  uint32_t lastSequence(const std::string& device) const;
  // Last level reported with a stock update, model::kBatteryUnknown if none.
  uint8_t batteryPercent(const std::string& device) const;
  bool knows(const std::string& device) const;
  uint32_t appliedCount() const { return _applied; }

  // BackendGateway
  SubmitResult submitStockUpdate(const model::StockDelta& delta) override;
  etl::expected<model::ConfigSnapshot, UpstreamError> fetchConfig(
      const std::string& device) override;
  bool registerDevice(const std::string& device) override;

 private:
  struct DeviceEntry {
    DeviceEntry()
        : footprint(), assigned(false), last_sequence(0),
          battery(model::kBatteryUnknown) {}

    model::Footprint footprint;
    bool assigned;
    uint32_t last_sequence;
    uint8_t battery;
  };

  MemoryGateway(const MemoryGateway&) = delete;
  MemoryGateway& operator=(const MemoryGateway&) = delete;

  bool overlapsOther(const std::string& device,
                     const model::Footprint& footprint) const;
  void apply(const std::string& device, uint32_t sequence,
             const Position& position, uint32_t item_id, uint16_t count);
  bool appendJournal(const model::StockDelta& delta);

  std::map<std::string, DeviceEntry> _devices;
  std::map<Position, StockItem> _items;
  model::FirmwareInfo _firmware;
  bool _available;
  uint32_t _applied;
  FILE* _journal;
  std::string _journal_path;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_MEMORY_GATEWAY_H
