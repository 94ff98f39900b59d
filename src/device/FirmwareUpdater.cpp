/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "FirmwareUpdater.h"

#include <SHA256.h>

#include "security/security.h"
#include "util/Log.h"

namespace shelfsync {
namespace device {

namespace {
const char kTag[] = "fwupd";
constexpr size_t kVerifyBlock = 64;
}  // namespace

const char* toString(FirmwareError error) {
  switch (error) {
    case FirmwareError::NONE:      return "none";
    case FirmwareError::STORAGE:   return "storage";
    case FirmwareError::INTEGRITY: return "integrity";
    case FirmwareError::SELF_TEST: return "self_test";
  }
  return "?";
}

FirmwareUpdater::FirmwareUpdater(FirmwareStore& store)
    : _store(store),
      _target(),
      _offset(0),
      _active(false),
      _self_test_passed(false),
      _last_error(FirmwareError::NONE) {}

bool FirmwareUpdater::isUpdate(const model::FirmwareInfo& info) {
  if (info.image_size == 0) {
    return false;
  }
  if (info.version <= _store.runningVersion()) {
    return false;
  }
  return info.version != _store.pendingVersion();
}

bool FirmwareUpdater::start(const model::FirmwareInfo& info) {
  if (!_self_test_passed) {
    _self_test_passed = security::run_sha256_self_test();
    if (!_self_test_passed) {
      _last_error = FirmwareError::SELF_TEST;
      SHELFSYNC_LOG_ERROR(kTag, "sha256 self test failed");
      return false;
    }
  }
  if (!_store.eraseStaging(info.image_size)) {
    _last_error = FirmwareError::STORAGE;
    SHELFSYNC_LOG_WARN(kTag, "cannot erase staging for %lu bytes",
                       static_cast<unsigned long>(info.image_size));
    return false;
  }
  _target = info;
  _offset = 0;
  _active = true;
  _last_error = FirmwareError::NONE;
  SHELFSYNC_LOG_INFO(kTag, "downloading v%u (%lu bytes)",
                     static_cast<unsigned>(info.version),
                     static_cast<unsigned long>(info.image_size));
  return true;
}

void FirmwareUpdater::abort() {
  if (!_active) {
    return;
  }
  _active = false;
  // A partial image is worthless: start from scratch next time.
  if (!_store.eraseStaging(0)) {
    SHELFSYNC_LOG_WARN(kTag, "staging not erased after abort");
  }
}

protocol::FirmwareRequest FirmwareUpdater::nextRequest() const {
  protocol::FirmwareRequest request;
  request.version = _target.version;
  request.offset = _offset;
  const uint32_t remaining = _target.image_size - _offset;
  request.length = static_cast<uint16_t>(
      remaining < protocol::kFirmwareChunkSize ? remaining
                                               : protocol::kFirmwareChunkSize);
  return request;
}

FirmwareUpdater::Progress FirmwareUpdater::onChunk(
    const protocol::FirmwareChunk& chunk) {
  if (!_active || chunk.version != _target.version || chunk.offset != _offset) {
    return Progress::IGNORED;
  }
  if (chunk.data.empty() ||
      chunk.data.size() > _target.image_size - _offset) {
    SHELFSYNC_LOG_WARN(kTag, "chunk at %lu overruns image",
                       static_cast<unsigned long>(chunk.offset));
    return fail(FirmwareError::INTEGRITY);
  }
  if (!_store.writeStaging(_offset, chunk.data.data(), chunk.data.size())) {
    return fail(FirmwareError::STORAGE);
  }
  _offset += static_cast<uint32_t>(chunk.data.size());

  if (_offset < _target.image_size) {
    return Progress::IN_PROGRESS;
  }

  if (!verify()) {
    SHELFSYNC_LOG_WARN(kTag, "v%u digest mismatch, staging discarded",
                       static_cast<unsigned>(_target.version));
    return fail(FirmwareError::INTEGRITY);
  }
  if (!_store.markForActivation(_target.version)) {
    return fail(FirmwareError::STORAGE);
  }
  _active = false;
  SHELFSYNC_LOG_INFO(kTag, "v%u staged for next boot",
                     static_cast<unsigned>(_target.version));
  return Progress::COMPLETE;
}

bool FirmwareUpdater::verify() {
  SHA256 hash;
  hash.reset();
  uint8_t block[kVerifyBlock];
  uint32_t offset = 0;
  while (offset < _target.image_size) {
    const uint32_t remaining = _target.image_size - offset;
    const size_t want = remaining < kVerifyBlock ? remaining : kVerifyBlock;
    const size_t got = _store.readStaging(offset, block, want);
    if (got != want) {
      return false;
    }
    hash.update(block, got);
    offset += static_cast<uint32_t>(got);
  }

  uint8_t digest[security::SHA256_DIGEST_SIZE];
  hash.finalize(digest, sizeof(digest));
  const bool match = security::timing_safe_equal(
      digest, _target.digest.data(), security::SHA256_DIGEST_SIZE);
  security::secure_zero(block, sizeof(block));
  return match;
}

FirmwareUpdater::Progress FirmwareUpdater::fail(FirmwareError error) {
  _last_error = error;
  abort();
  return Progress::FAILED;
}

}  // namespace device
}  // namespace shelfsync
