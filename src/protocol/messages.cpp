/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "messages.h"

#include "PacketBuilder.h"

namespace shelfsync {
namespace protocol {
namespace message {

namespace {

constexpr size_t kStockUpdateSize = 1 + 1 + 1 + 4 + 2 + 4 + 4 + 1;
constexpr size_t kAckSize = 4;
constexpr size_t kNackSize = 4 + 1;
constexpr size_t kHeartbeatSize = 2 + 1;
constexpr size_t kFirmwareRequestSize = 2 + 4 + 2;
constexpr size_t kFirmwareChunkHeaderSize = 2 + 4;

// Checks id and, when exact_size is non-zero, the payload length.
FrameError checkFrame(const Frame& frame, MessageId expected, size_t exact_size) {
  if (frame.header.message_id != static_cast<uint16_t>(expected)) {
    return FrameError::UNKNOWN_MESSAGE;
  }
  if (exact_size != 0 && frame.header.payload_length != exact_size) {
    return FrameError::MALFORMED;
  }
  return FrameError::NONE;
}

bool validNackReason(uint8_t raw) {
  return raw >= static_cast<uint8_t>(NackReason::UPSTREAM_UNAVAILABLE) &&
         raw <= static_cast<uint8_t>(NackReason::MALFORMED);
}

}  // namespace

bool isKnown(uint16_t message_id) {
  switch (static_cast<MessageId>(message_id)) {
    case MessageId::HEARTBEAT:
    case MessageId::STOCK_UPDATE:
    case MessageId::CONFIG_PUSH:
    case MessageId::CONFIG_REQUEST:
    case MessageId::ACK:
    case MessageId::NACK:
    case MessageId::FIRMWARE_REQUEST:
    case MessageId::FIRMWARE_CHUNK:
      return true;
  }
  return false;
}

const char* name(uint16_t message_id) {
  switch (static_cast<MessageId>(message_id)) {
    case MessageId::HEARTBEAT:        return "Heartbeat";
    case MessageId::STOCK_UPDATE:     return "StockUpdate";
    case MessageId::CONFIG_PUSH:      return "ConfigPush";
    case MessageId::CONFIG_REQUEST:   return "ConfigRequest";
    case MessageId::ACK:              return "Ack";
    case MessageId::NACK:             return "Nack";
    case MessageId::FIRMWARE_REQUEST: return "FirmwareRequest";
    case MessageId::FIRMWARE_CHUNK:   return "FirmwareChunk";
  }
  return "Unknown";
}

const char* toString(NackReason reason) {
  switch (reason) {
    case NackReason::UPSTREAM_UNAVAILABLE:   return "upstream_unavailable";
    case NackReason::SLOT_OUTSIDE_FOOTPRINT: return "slot_outside_footprint";
    case NackReason::MALFORMED:              return "malformed";
  }
  return "?";
}

// --- Encoders ---

bool encode(const Heartbeat& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add_u16(msg.firmware_version).add(msg.battery);
  return builder.ok();
}

bool encode(const StockUpdate& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add(msg.change.row)
      .add(msg.change.slot.level)
      .add(msg.change.slot.column)
      .add_u32(msg.change.item_id)
      .add_u16(msg.change.count)
      .add_u32(msg.change.sequence)
      .add_u32(msg.change.timestamp)
      .add(msg.battery);
  return builder.ok();
}

bool encode(const ConfigPush& msg, etl::ivector<uint8_t>& payload) {
  const model::ConfigSnapshot& s = msg.snapshot;
  PacketBuilder builder(payload);
  builder.add(s.footprint.row)
      .add(s.footprint.bottom_level)
      .add(s.footprint.left_column)
      .add(s.footprint.height)
      .add(s.footprint.width)
      .add_u16(s.firmware.version)
      .add_u32(s.firmware.image_size)
      .add(s.firmware.digest.data(), s.firmware.digest.size())
      .add_u32(s.last_sequence)
      .add(static_cast<uint8_t>(s.items.size()));
  for (const model::Item& item : s.items) {
    builder.add(item.slot.level)
        .add(item.slot.column)
        .add_u32(item.id)
        .add_u16(item.min_stock)
        .add_u16(item.stock)
        .add_pascal_string(etl::string_view(item.name.data(), item.name.size()));
  }
  return builder.ok();
}

bool encode(const ConfigRequest&, etl::ivector<uint8_t>& payload) {
  payload.clear();
  return true;
}

bool encode(const Ack& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add_u32(msg.sequence);
  return builder.ok();
}

bool encode(const Nack& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add_u32(msg.sequence).add(static_cast<uint8_t>(msg.reason));
  return builder.ok();
}

bool encode(const FirmwareRequest& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add_u16(msg.version).add_u32(msg.offset).add_u16(msg.length);
  return builder.ok();
}

bool encode(const FirmwareChunk& msg, etl::ivector<uint8_t>& payload) {
  PacketBuilder builder(payload);
  builder.add_u16(msg.version)
      .add_u32(msg.offset)
      .add(msg.data.data(), msg.data.size());
  return builder.ok();
}

// --- Decoders ---

FrameError decodeInto(const Frame& frame, Heartbeat& out) {
  const FrameError error = checkFrame(frame, Heartbeat::ID, kHeartbeatSize);
  if (error != FrameError::NONE) return error;
  out.firmware_version = read_u16_be(frame.payload);
  out.battery = frame.payload[2];
  return FrameError::NONE;
}

FrameError decodeInto(const Frame& frame, StockUpdate& out) {
  const FrameError error = checkFrame(frame, StockUpdate::ID, kStockUpdateSize);
  if (error != FrameError::NONE) return error;
  PacketReader reader(frame.payload, frame.header.payload_length);
  out.change.row = reader.read_u8();
  out.change.slot.level = reader.read_u8();
  out.change.slot.column = reader.read_u8();
  out.change.item_id = reader.read_u32();
  out.change.count = reader.read_u16();
  out.change.sequence = reader.read_u32();
  out.change.timestamp = reader.read_u32();
  out.battery = reader.read_u8();
  return reader.ok() ? FrameError::NONE : FrameError::MALFORMED;
}

FrameError decodeInto(const Frame& frame, ConfigPush& out) {
  const FrameError error = checkFrame(frame, ConfigPush::ID, 0);
  if (error != FrameError::NONE) return error;

  model::ConfigSnapshot& s = out.snapshot;
  PacketReader reader(frame.payload, frame.header.payload_length);
  s.footprint.row = reader.read_u8();
  s.footprint.bottom_level = reader.read_u8();
  s.footprint.left_column = reader.read_u8();
  s.footprint.height = reader.read_u8();
  s.footprint.width = reader.read_u8();
  s.firmware.version = reader.read_u16();
  s.firmware.image_size = reader.read_u32();
  reader.read_bytes(s.firmware.digest.data(), s.firmware.digest.size());
  s.last_sequence = reader.read_u32();

  const uint8_t item_count = reader.read_u8();
  if (!reader.ok() || item_count > model::kMaxSlots) {
    return FrameError::MALFORMED;
  }

  s.items.clear();
  for (uint8_t i = 0; i < item_count; ++i) {
    model::Item item;
    item.slot.level = reader.read_u8();
    item.slot.column = reader.read_u8();
    item.id = reader.read_u32();
    item.min_stock = reader.read_u16();
    item.stock = reader.read_u16();
    const etl::string_view name = reader.read_pascal_string();
    if (!reader.ok() || name.size() > model::kMaxNameLength) {
      return FrameError::MALFORMED;
    }
    item.name.assign(name.data(), name.size());
    s.items.push_back(item);
  }

  if (reader.remaining() != 0) {
    return FrameError::MALFORMED;
  }
  return FrameError::NONE;
}

FrameError decodeInto(const Frame& frame, ConfigRequest&) {
  const FrameError error = checkFrame(frame, ConfigRequest::ID, 0);
  if (error != FrameError::NONE) return error;
  return frame.header.payload_length == 0 ? FrameError::NONE
                                          : FrameError::MALFORMED;
}

FrameError decodeInto(const Frame& frame, Ack& out) {
  const FrameError error = checkFrame(frame, Ack::ID, kAckSize);
  if (error != FrameError::NONE) return error;
  out.sequence = read_u32_be(frame.payload);
  return FrameError::NONE;
}

FrameError decodeInto(const Frame& frame, Nack& out) {
  const FrameError error = checkFrame(frame, Nack::ID, kNackSize);
  if (error != FrameError::NONE) return error;
  out.sequence = read_u32_be(frame.payload);
  const uint8_t reason = frame.payload[4];
  if (!validNackReason(reason)) {
    return FrameError::MALFORMED;
  }
  out.reason = static_cast<NackReason>(reason);
  return FrameError::NONE;
}

FrameError decodeInto(const Frame& frame, FirmwareRequest& out) {
  const FrameError error =
      checkFrame(frame, FirmwareRequest::ID, kFirmwareRequestSize);
  if (error != FrameError::NONE) return error;
  PacketReader reader(frame.payload, frame.header.payload_length);
  out.version = reader.read_u16();
  out.offset = reader.read_u32();
  out.length = reader.read_u16();
  return reader.ok() ? FrameError::NONE : FrameError::MALFORMED;
}

FrameError decodeInto(const Frame& frame, FirmwareChunk& out) {
  const FrameError error = checkFrame(frame, FirmwareChunk::ID, 0);
  if (error != FrameError::NONE) return error;
  if (frame.header.payload_length < kFirmwareChunkHeaderSize ||
      frame.header.payload_length - kFirmwareChunkHeaderSize > kFirmwareChunkSize) {
    return FrameError::MALFORMED;
  }
  PacketReader reader(frame.payload, frame.header.payload_length);
  out.version = reader.read_u16();
  out.offset = reader.read_u32();
  const size_t data_len = reader.remaining();
  out.data.assign(reader.cursor(), reader.cursor() + data_len);
  return FrameError::NONE;
}

uint32_t configDigest(const model::ConfigSnapshot& snapshot) {
  ConfigPush push;
  push.snapshot = snapshot;
  Payload payload;
  if (!encode(push, payload)) {
    return 0;
  }
  return crc32_ieee(payload.data(), payload.size());
}

}  // namespace message
}  // namespace protocol
}  // namespace shelfsync
