/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_FIRMWARE_UPDATER_H
#define SHELFSYNC_FIRMWARE_UPDATER_H

#include <stddef.h>
#include <stdint.h>

#include "device/DeviceHal.h"
#include "model/inventory.h"
#include "protocol/messages.h"

namespace shelfsync {
namespace device {

enum class FirmwareError : uint8_t {
  NONE = 0,
  STORAGE,      // staging area could not be erased or written
  INTEGRITY,    // length or digest mismatch, image discarded
  SELF_TEST     // SHA-256 known answer test failed
};

const char* toString(FirmwareError error);

/**
 * @brief Downloads a firmware image into the staging area and verifies it.
 *
 * Chunks must arrive in order; a chunk for another offset or version is
 * ignored and the current request is simply repeated. The digest is taken
 * over what was read back from staging, not over what was received, so a
 * flash write error is caught as well.
 */
class FirmwareUpdater {
 public:
  enum class Progress : uint8_t {
    IGNORED = 0,
    IN_PROGRESS,
    COMPLETE,
    FAILED
  };

  explicit FirmwareUpdater(FirmwareStore& store);

  // True if info describes an image newer than the running one that has
  // not already been staged.
  bool isUpdate(const model::FirmwareInfo& info);

  bool start(const model::FirmwareInfo& info);
  void abort();

  bool active() const { return _active; }
  uint32_t received() const { return _offset; }
  const model::FirmwareInfo& target() const { return _target; }
  FirmwareError lastError() const { return _last_error; }

  protocol::FirmwareRequest nextRequest() const;
  Progress onChunk(const protocol::FirmwareChunk& chunk);

 private:
  Progress fail(FirmwareError error);
  bool verify();

  FirmwareStore& _store;
  model::FirmwareInfo _target;
  uint32_t _offset;
  bool _active;
  bool _self_test_passed;
  FirmwareError _last_error;
};

}  // namespace device
}  // namespace shelfsync

#endif  // SHELFSYNC_FIRMWARE_UPDATER_H
