/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_MESSAGES_H
#define SHELFSYNC_MESSAGES_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/expected.h"
#include "etl/span.h"
#include "etl/vector.h"

#include "frame.h"
#include "model/inventory.h"

namespace shelfsync {
namespace protocol {

enum class MessageId : uint16_t {
  HEARTBEAT = 0x01,
  STOCK_UPDATE = 0x10,
  CONFIG_PUSH = 0x20,
  CONFIG_REQUEST = 0x21,
  ACK = 0x30,
  NACK = 0x31,
  FIRMWARE_REQUEST = 0x40,
  FIRMWARE_CHUNK = 0x41
};

enum class NackReason : uint8_t {
  UPSTREAM_UNAVAILABLE = 1,
  SLOT_OUTSIDE_FOOTPRINT = 2,
  MALFORMED = 3
};

constexpr size_t kFirmwareChunkSize = 256;

typedef etl::vector<uint8_t, MAX_PAYLOAD_SIZE> Payload;

struct Heartbeat {
  static constexpr MessageId ID = MessageId::HEARTBEAT;
  uint16_t firmware_version;
  // Sender's battery level, model::kBatteryUnknown from the bridge.
  uint8_t battery;
};

struct StockUpdate {
  static constexpr MessageId ID = MessageId::STOCK_UPDATE;
  model::StockChange change;
  uint8_t battery;
};

struct ConfigPush {
  static constexpr MessageId ID = MessageId::CONFIG_PUSH;
  model::ConfigSnapshot snapshot;
};

struct ConfigRequest {
  static constexpr MessageId ID = MessageId::CONFIG_REQUEST;
};

struct Ack {
  static constexpr MessageId ID = MessageId::ACK;
  uint32_t sequence;
};

struct Nack {
  static constexpr MessageId ID = MessageId::NACK;
  uint32_t sequence;
  NackReason reason;
};

struct FirmwareRequest {
  static constexpr MessageId ID = MessageId::FIRMWARE_REQUEST;
  uint16_t version;
  uint32_t offset;
  uint16_t length;
};

struct FirmwareChunk {
  static constexpr MessageId ID = MessageId::FIRMWARE_CHUNK;
  uint16_t version;
  uint32_t offset;
  etl::vector<uint8_t, kFirmwareChunkSize> data;
};

namespace message {

bool isKnown(uint16_t message_id);
const char* name(uint16_t message_id);
const char* toString(NackReason reason);

// Payload encoders. Return false if the message does not fit.
bool encode(const Heartbeat& msg, etl::ivector<uint8_t>& payload);
bool encode(const StockUpdate& msg, etl::ivector<uint8_t>& payload);
bool encode(const ConfigPush& msg, etl::ivector<uint8_t>& payload);
bool encode(const ConfigRequest& msg, etl::ivector<uint8_t>& payload);
bool encode(const Ack& msg, etl::ivector<uint8_t>& payload);
bool encode(const Nack& msg, etl::ivector<uint8_t>& payload);
bool encode(const FirmwareRequest& msg, etl::ivector<uint8_t>& payload);
bool encode(const FirmwareChunk& msg, etl::ivector<uint8_t>& payload);

// Payload decoders. The frame's message id must match the target type and
// the payload must be consumed exactly.
FrameError decodeInto(const Frame& frame, Heartbeat& out);
FrameError decodeInto(const Frame& frame, StockUpdate& out);
FrameError decodeInto(const Frame& frame, ConfigPush& out);
FrameError decodeInto(const Frame& frame, ConfigRequest& out);
FrameError decodeInto(const Frame& frame, Ack& out);
FrameError decodeInto(const Frame& frame, Nack& out);
FrameError decodeInto(const Frame& frame, FirmwareRequest& out);
FrameError decodeInto(const Frame& frame, FirmwareChunk& out);

template <typename TMessage>
etl::expected<TMessage, FrameError> decode(const Frame& frame) {
  TMessage out;
  const FrameError error = decodeInto(frame, out);
  if (error != FrameError::NONE) {
    return etl::unexpected<FrameError>(error);
  }
  return out;
}

// Full pipeline: payload, frame header, CRC, COBS, delimiter.
// Returns the number of wire bytes written to out, 0 on failure.
template <typename TMessage>
size_t encodeFrame(const TMessage& msg, etl::span<uint8_t> out) {
  Payload payload;
  if (!encode(msg, payload)) {
    return 0;
  }
  return protocol::encodeFrame(static_cast<uint16_t>(TMessage::ID),
                               payload.data(), payload.size(), out);
}

// CRC32 of the encoded ConfigPush payload. Two snapshots with the same
// digest render and behave identically on the device.
uint32_t configDigest(const model::ConfigSnapshot& snapshot);

}  // namespace message
}  // namespace protocol
}  // namespace shelfsync

#endif  // SHELFSYNC_MESSAGES_H
