/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_FIRMWARE_SOURCE_H
#define SHELFSYNC_FIRMWARE_SOURCE_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "model/inventory.h"

namespace shelfsync {
namespace host {

// A firmware image the bridge can serve in chunks.
class FirmwareImage {
 public:
  virtual ~FirmwareImage() {}
  virtual const model::FirmwareInfo& info() const = 0;
  // Copies up to len bytes from offset; returns the count (0 past the end).
  virtual size_t read(uint32_t offset, uint8_t* data, size_t len) const = 0;
};

// Image loaded whole from a file; the digest is computed on load.
class FileFirmwareImage : public FirmwareImage {
 public:
  FileFirmwareImage();

  bool load(const std::string& path, uint16_t version, std::string& error);
  // Same, from memory.
  bool assign(const uint8_t* data, size_t len, uint16_t version);

  const model::FirmwareInfo& info() const override { return _info; }
  size_t read(uint32_t offset, uint8_t* data, size_t len) const override;

 private:
  std::vector<uint8_t> _image;
  model::FirmwareInfo _info;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_FIRMWARE_SOURCE_H
