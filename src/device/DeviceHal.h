/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_DEVICE_HAL_H
#define SHELFSYNC_DEVICE_HAL_H

#include <stddef.h>
#include <stdint.h>

#include "model/inventory.h"

namespace shelfsync {
namespace device {

class InventoryCache;

// Non-volatile records. Each write replaces the whole record atomically
// (write-new-then-swap on flash, a single commit on EEPROM emulation).
enum class RecordId : uint8_t {
  PENDING_QUEUE = 0,
  SNAPSHOT = 1
};

class Storage {
 public:
  virtual ~Storage() {}
  virtual bool write(RecordId id, const uint8_t* data, size_t len) = 0;
  // Returns the record length, 0 if absent. Fails (0) if it does not fit.
  virtual size_t read(RecordId id, uint8_t* data, size_t capacity) = 0;
  virtual bool erase(RecordId id) = 0;
};

// Serial-like byte stream to the bridge over the wireless link.
class RadioLink {
 public:
  virtual ~RadioLink() {}
  virtual void startAdvertising() = 0;
  virtual void stopAdvertising() = 0;
  virtual bool connected() = 0;
  virtual int available() = 0;
  virtual int read() = 0;
  virtual size_t write(const uint8_t* data, size_t len) = 0;
};

class Display {
 public:
  virtual ~Display() {}
  // Full redraw of the shelf grid (names, counts, minimum thresholds).
  virtual void renderGrid(const InventoryCache& cache) = 0;
  // Partial refresh of a single count.
  virtual void renderCount(const model::Slot& slot, uint16_t count,
                           bool below_minimum) = 0;
  // The panel keeps its image without power.
  virtual void sleep() = 0;
};

// Staging area for a downloaded image. The running image is never touched.
class FirmwareStore {
 public:
  virtual ~FirmwareStore() {}
  virtual uint16_t runningVersion() = 0;
  // Version marked for activation on next boot, 0 if none.
  virtual uint16_t pendingVersion() = 0;
  virtual bool eraseStaging(uint32_t image_size) = 0;
  virtual bool writeStaging(uint32_t offset, const uint8_t* data, size_t len) = 0;
  virtual size_t readStaging(uint32_t offset, uint8_t* data, size_t len) = 0;
  virtual bool markForActivation(uint16_t version) = 0;
};

class Platform {
 public:
  virtual ~Platform() {}
  virtual uint32_t millis() = 0;
  // Wall-clock seconds when known, otherwise seconds since boot.
  virtual uint32_t epochSeconds() = 0;
  // 0..100, model::kBatteryUnknown on mains-powered boards.
  virtual uint8_t batteryPercent() = 0;
  // Arms the touch wake source and powers down. On hardware this may not
  // return (wake is a reboot); the host build returns immediately.
  virtual void deepSleep() = 0;
};

}  // namespace device
}  // namespace shelfsync

#endif  // SHELFSYNC_DEVICE_HAL_H
