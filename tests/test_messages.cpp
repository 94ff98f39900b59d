/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include <stdint.h>
#include <string.h>

#include "protocol/frame.h"
#include "protocol/messages.h"
#include "router/message_router.h"
#include "test_doubles.h"
#include "test_support.h"

using namespace shelfsync;
using namespace shelfsync::protocol;
using shelfsync::test::slot;

// Frame as it arrives on the other end.
template <typename TMessage>
static Frame toFrame(const TMessage& msg) {
  const std::vector<uint8_t> bytes = test::wireBytes(msg);
  TEST_ASSERT(!bytes.empty());
  etl::expected<Frame, FrameError> frame =
      decodeFrame(etl::span<const uint8_t>(bytes.data(), bytes.size()));
  TEST_ASSERT(frame.has_value());
  return frame.value();
}

static Frame rawFrame(MessageId id, const uint8_t* payload, size_t len) {
  Frame frame;
  frame.header.version = PROTOCOL_VERSION;
  frame.header.message_id = static_cast<uint16_t>(id);
  frame.header.payload_length = static_cast<uint16_t>(len);
  if (len > 0) {
    memcpy(frame.payload, payload, len);
  }
  return frame;
}

static void test_stock_update_wire_format() {
  StockUpdate update;
  update.change.row = 3;
  update.change.slot = slot(1, 2);
  update.change.item_id = 0x00A0B0C0UL;
  update.change.count = 7;
  update.change.sequence = 42;
  update.change.timestamp = 0x01020304UL;
  update.battery = 64;

  Payload payload;
  TEST_ASSERT(message::encode(update, payload));
  TEST_ASSERT_EQ_UINT(payload.size(), 18);
  TEST_ASSERT_EQ_UINT(payload[0], 3);
  TEST_ASSERT_EQ_UINT(payload[1], 1);
  TEST_ASSERT_EQ_UINT(payload[2], 2);
  TEST_ASSERT_EQ_UINT(read_u32_be(&payload[3]), 0x00A0B0C0UL);
  TEST_ASSERT_EQ_UINT(read_u16_be(&payload[7]), 7);
  TEST_ASSERT_EQ_UINT(read_u32_be(&payload[9]), 42);
  TEST_ASSERT_EQ_UINT(read_u32_be(&payload[13]), 0x01020304UL);
  TEST_ASSERT_EQ_UINT(payload[17], 64);

  etl::expected<StockUpdate, FrameError> decoded =
      message::decode<StockUpdate>(toFrame(update));
  TEST_ASSERT(decoded.has_value());
  TEST_ASSERT_EQ_UINT(decoded.value().change.row, 3);
  TEST_ASSERT(decoded.value().change.slot == slot(1, 2));
  TEST_ASSERT_EQ_UINT(decoded.value().change.item_id, 0x00A0B0C0UL);
  TEST_ASSERT_EQ_UINT(decoded.value().change.count, 7);
  TEST_ASSERT_EQ_UINT(decoded.value().change.sequence, 42);
  TEST_ASSERT_EQ_UINT(decoded.value().battery, 64);
}

static void test_heartbeat_carries_battery() {
  Heartbeat heartbeat;
  heartbeat.firmware_version = 0x0203;
  heartbeat.battery = model::kBatteryUnknown;

  Payload payload;
  TEST_ASSERT(message::encode(heartbeat, payload));
  TEST_ASSERT_EQ_UINT(payload.size(), 3);
  TEST_ASSERT_EQ_UINT(read_u16_be(&payload[0]), 0x0203);
  TEST_ASSERT_EQ_UINT(payload[2], 0xFF);

  // The two-byte heartbeat of older firmware is refused.
  Heartbeat out;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::HEARTBEAT, payload.data(), 2),
                                  out) == FrameError::MALFORMED);
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::HEARTBEAT, payload.data(),
                                           payload.size()), out) == FrameError::NONE);
  TEST_ASSERT_EQ_UINT(out.battery, model::kBatteryUnknown);
}

static void test_stock_change_well_formed() {
  model::StockChange change;
  change.row = 1;
  change.slot = slot(2, 2);
  change.item_id = 101;
  change.count = model::kMaxCount;
  change.sequence = 1;
  change.timestamp = 0;
  TEST_ASSERT(model::wellFormed(change));

  model::StockChange bad = change;
  bad.item_id = 0;
  TEST_ASSERT(!model::wellFormed(bad));
  bad = change;
  bad.count = model::kMaxCount + 1;
  TEST_ASSERT(!model::wellFormed(bad));
  bad = change;
  bad.row = 0;
  TEST_ASSERT(!model::wellFormed(bad));
  bad = change;
  bad.slot.column = model::kMaxColumn + 1;
  TEST_ASSERT(!model::wellFormed(bad));
}

static void test_config_push_carries_snapshot() {
  ConfigPush push;
  push.snapshot = test::twoItemSnapshot();
  push.snapshot.firmware.version = 4;
  push.snapshot.firmware.image_size = 1000;
  push.snapshot.firmware.digest.fill(0x5A);
  push.snapshot.last_sequence = 41;

  etl::expected<ConfigPush, FrameError> decoded =
      message::decode<ConfigPush>(toFrame(push));
  TEST_ASSERT(decoded.has_value());
  const model::ConfigSnapshot& s = decoded.value().snapshot;
  TEST_ASSERT(s.footprint == push.snapshot.footprint);
  TEST_ASSERT_EQ_UINT(s.firmware.version, 4);
  TEST_ASSERT_EQ_UINT(s.firmware.image_size, 1000);
  TEST_ASSERT_EQ_UINT(s.firmware.digest[31], 0x5A);
  TEST_ASSERT_EQ_UINT(s.last_sequence, 41);
  TEST_ASSERT_EQ_UINT(s.items.size(), 2);
  TEST_ASSERT(s.items[1].name == "M8 nuts");
  TEST_ASSERT_EQ_UINT(s.items[1].stock, 12);
  TEST_ASSERT_EQ_UINT(s.items[1].min_stock, 4);
  TEST_ASSERT_EQ_UINT(message::configDigest(s), message::configDigest(push.snapshot));
}

static void test_full_config_fits_a_frame() {
  ConfigPush push;
  push.snapshot.footprint = test::footprint(6, 3, 3, 2, 4);
  for (size_t i = 0; i < push.snapshot.footprint.slotCount(); ++i) {
    push.snapshot.items.push_back(test::item(
        static_cast<uint32_t>(i), push.snapshot.footprint.slotAt(i), 999, 999,
        "ABCDEFGHIJKLMNOPQRST"));
  }
  TEST_ASSERT(push.snapshot.valid());
  etl::expected<ConfigPush, FrameError> decoded =
      message::decode<ConfigPush>(toFrame(push));
  TEST_ASSERT(decoded.has_value());
  TEST_ASSERT_EQ_UINT(decoded.value().snapshot.items.size(), model::kMaxSlots);
}

static void test_config_digest_tracks_changes() {
  model::ConfigSnapshot a = test::twoItemSnapshot();
  model::ConfigSnapshot b = test::twoItemSnapshot();
  TEST_ASSERT_EQ_UINT(message::configDigest(a), message::configDigest(b));
  b.footprint.row = 2;
  TEST_ASSERT(message::configDigest(a) != message::configDigest(b));
  b = a;
  b.items[0].min_stock = 3;
  TEST_ASSERT(message::configDigest(a) != message::configDigest(b));
}

static void test_truncated_payloads_are_malformed() {
  const uint8_t short_update[] = {1, 1, 0, 7, 0, 0};
  StockUpdate update;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::STOCK_UPDATE, short_update,
                                           sizeof(short_update)), update) ==
              FrameError::MALFORMED);

  const uint8_t short_ack[] = {0, 0, 42};
  Ack ack;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::ACK, short_ack, sizeof(short_ack)),
                                  ack) == FrameError::MALFORMED);

  // Item count promises more than the payload holds.
  Payload payload;
  ConfigPush push;
  push.snapshot = test::twoItemSnapshot();
  TEST_ASSERT(message::encode(push, payload));
  ConfigPush out;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::CONFIG_PUSH, payload.data(),
                                           payload.size() - 3), out) ==
              FrameError::MALFORMED);
  // Trailing garbage.
  payload.push_back(0xEE);
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::CONFIG_PUSH, payload.data(),
                                           payload.size()), out) ==
              FrameError::MALFORMED);
}

static void test_bad_nack_reason_is_malformed() {
  const uint8_t payload[] = {0, 0, 0, 42, 9};
  Nack nack;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::NACK, payload, sizeof(payload)),
                                  nack) == FrameError::MALFORMED);
}

static void test_id_mismatch() {
  Ack ack;
  ack.sequence = 1;
  Nack nack;
  TEST_ASSERT(message::decodeInto(toFrame(ack), nack) == FrameError::UNKNOWN_MESSAGE);
  TEST_ASSERT(message::isKnown(0x10));
  TEST_ASSERT(!message::isKnown(0x99));
  TEST_ASSERT(strcmp(message::name(0x30), "Ack") == 0);
}

static void test_firmware_chunk_bounds() {
  FirmwareChunk chunk;
  chunk.version = 5;
  chunk.offset = 512;
  for (size_t i = 0; i < kFirmwareChunkSize; ++i) {
    chunk.data.push_back(static_cast<uint8_t>(i));
  }
  etl::expected<FirmwareChunk, FrameError> decoded =
      message::decode<FirmwareChunk>(toFrame(chunk));
  TEST_ASSERT(decoded.has_value());
  TEST_ASSERT_EQ_UINT(decoded.value().offset, 512);
  TEST_ASSERT_EQ_UINT(decoded.value().data.size(), kFirmwareChunkSize);
  TEST_ASSERT_EQ_UINT(decoded.value().data[255], 255);

  uint8_t oversized[6 + kFirmwareChunkSize + 1] = {0};
  FirmwareChunk out;
  TEST_ASSERT(message::decodeInto(rawFrame(MessageId::FIRMWARE_CHUNK, oversized,
                                           sizeof(oversized)), out) ==
              FrameError::MALFORMED);
}

class RecordingHandler : public router::IMessageHandler {
 public:
  RecordingHandler() : acks(0), updates(0), unexpected(0), malformed(0), last_sequence(0) {}

  void onAck(const Ack& msg) override {
    ++acks;
    last_sequence = msg.sequence;
  }
  void onStockUpdate(const StockUpdate& msg) override {
    ++updates;
    last_sequence = msg.change.sequence;
  }
  void onUnexpected(MessageId) override { ++unexpected; }
  void onMalformed(uint16_t, FrameError) override { ++malformed; }

  unsigned acks;
  unsigned updates;
  unsigned unexpected;
  unsigned malformed;
  uint32_t last_sequence;
};

static void test_router_dispatch() {
  RecordingHandler handler;
  router::MessageRouter router;
  router.setHandler(&handler);

  Ack ack;
  ack.sequence = 42;
  TEST_ASSERT(router.route(toFrame(ack)) == FrameError::NONE);
  TEST_ASSERT_EQ_UINT(handler.acks, 1);
  TEST_ASSERT_EQ_UINT(handler.last_sequence, 42);

  StockUpdate update;
  update.change.row = 1;
  update.change.slot = slot(2, 1);
  update.change.item_id = 101;
  update.change.count = 3;
  update.change.sequence = 43;
  update.change.timestamp = 0;
  update.battery = 50;
  TEST_ASSERT(router.route(toFrame(update)) == FrameError::NONE);
  TEST_ASSERT_EQ_UINT(handler.updates, 1);

  // Known but not handled on this side.
  ConfigRequest request;
  TEST_ASSERT(router.route(toFrame(request)) == FrameError::NONE);
  TEST_ASSERT_EQ_UINT(handler.unexpected, 1);

  const uint8_t junk[] = {1};
  TEST_ASSERT(router.route(rawFrame(MessageId::ACK, junk, sizeof(junk))) ==
              FrameError::MALFORMED);
  TEST_ASSERT_EQ_UINT(handler.malformed, 1);
  TEST_ASSERT_EQ_UINT(handler.acks, 1);

  Frame unknown = rawFrame(MessageId::ACK, junk, sizeof(junk));
  unknown.header.message_id = 0x7777;
  TEST_ASSERT(router.route(unknown) == FrameError::UNKNOWN_MESSAGE);
  TEST_ASSERT_EQ_UINT(handler.malformed, 2);
}

int main() {
  RUN_TEST(test_stock_update_wire_format);
  RUN_TEST(test_heartbeat_carries_battery);
  RUN_TEST(test_stock_change_well_formed);
  RUN_TEST(test_config_push_carries_snapshot);
  RUN_TEST(test_full_config_fits_a_frame);
  RUN_TEST(test_config_digest_tracks_changes);
  RUN_TEST(test_truncated_payloads_are_malformed);
  RUN_TEST(test_bad_nack_reason_is_malformed);
  RUN_TEST(test_id_mismatch);
  RUN_TEST(test_firmware_chunk_bounds);
  RUN_TEST(test_router_dispatch);
  printf("  -> messages: OK\n");
  return 0;
}
