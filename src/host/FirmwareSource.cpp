/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "FirmwareSource.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "security/security.h"
#include "util/Log.h"

namespace shelfsync {
namespace host {

namespace {
const char kTag[] = "firmware";
// Offsets travel as u32; keep well inside what a device can stage.
constexpr size_t kMaxImageSize = 4UL * 1024UL * 1024UL;
}  // namespace

FileFirmwareImage::FileFirmwareImage() : _image(), _info() {}

bool FileFirmwareImage::load(const std::string& path, uint16_t version,
                             std::string& error) {
  FILE* file = fopen(path.c_str(), "rb");
  if (file == nullptr) {
    error = path + ": " + strerror(errno);
    return false;
  }
  std::vector<uint8_t> image;
  uint8_t buffer[1024];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
    image.insert(image.end(), buffer, buffer + n);
    if (image.size() > kMaxImageSize) {
      break;
    }
  }
  const bool read_error = ferror(file) != 0;
  fclose(file);
  if (read_error) {
    error = path + ": read error";
    return false;
  }
  if (image.empty() || image.size() > kMaxImageSize) {
    error = path + ": image empty or too large";
    return false;
  }
  if (!assign(image.data(), image.size(), version)) {
    error = path + ": bad version";
    return false;
  }
  SHELFSYNC_LOG_INFO(kTag, "serving v%u from %s (%lu bytes)",
                     static_cast<unsigned>(version), path.c_str(),
                     static_cast<unsigned long>(_info.image_size));
  return true;
}

bool FileFirmwareImage::assign(const uint8_t* data, size_t len, uint16_t version) {
  if (version == 0 || len == 0 || len > kMaxImageSize) {
    return false;
  }
  _image.assign(data, data + len);
  _info.version = version;
  _info.image_size = static_cast<uint32_t>(len);
  security::sha256(_image.data(), _image.size(), _info.digest.data());
  return true;
}

size_t FileFirmwareImage::read(uint32_t offset, uint8_t* data, size_t len) const {
  if (offset >= _image.size()) {
    return 0;
  }
  const size_t available = _image.size() - offset;
  const size_t n = len < available ? len : available;
  memcpy(data, _image.data() + offset, n);
  return n;
}

}  // namespace host
}  // namespace shelfsync
