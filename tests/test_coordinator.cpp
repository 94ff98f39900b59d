/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include <string>
#include <vector>

#include "host/BridgeCoordinator.h"
#include "host/FirmwareSource.h"
#include "host/MemoryGateway.h"
#include "test_doubles.h"
#include "test_support.h"

using namespace shelfsync;
using shelfsync::host::BridgeCoordinator;
using shelfsync::host::MemoryGateway;
using shelfsync::test::FakeLink;
using shelfsync::test::footprint;
using shelfsync::test::slot;

namespace {

const char kSeed[] =
    "{ \"firmware_version\": 4,"
    "  \"devices\": ["
    "    { \"address\": \"ShelfSync-A1\", \"row\": 1, \"bottom_level\": 1,"
    "      \"left_column\": 1, \"height\": 2, \"width\": 2 } ],"
    "  \"items\": ["
    "    { \"id\": 100, \"name\": \"M8 bolts\", \"row\": 1, \"level\": 1,"
    "      \"column\": 1, \"stock\": 5, \"min_stock\": 2 },"
    "    { \"id\": 101, \"name\": \"M8 nuts\", \"row\": 1, \"level\": 1,"
    "      \"column\": 2, \"stock\": 12, \"min_stock\": 4 } ] }";

struct BridgeFixture {
  MemoryGateway backend;
  test::FakeScanner scanner;
  test::FakeLinkFactory links;
  BridgeCoordinator bridge;
  uint32_t now;

  BridgeFixture() : backend(), scanner(), links(), bridge(scanner, links, backend), now(0) {
    std::string error;
    TEST_ASSERT(backend.loadInventory(kSeed, error));
  }

  void start() {
    bridge.begin(now);
    bridge.poll(now);
  }

  void run(uint32_t ms, uint32_t step = 100) {
    while (ms > 0) {
      const uint32_t d = ms < step ? ms : step;
      now += d;
      bridge.poll(now);
      ms -= d;
    }
  }

  FakeLink* link(const char* address) { return links.links[address]; }
};

host::Position at(uint8_t row, uint8_t level, uint8_t column) {
  host::Position p;
  p.row = row;
  p.level = level;
  p.column = column;
  return p;
}

}  // namespace

static void test_scan_filters_service_name() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.scanner.show("Printer-77");
  f.start();
  TEST_ASSERT_EQ_UINT(f.scanner.scans, 1);
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
  TEST_ASSERT(f.bridge.session("Printer-77") == nullptr);
  TEST_ASSERT(f.bridge.session(TEST_DEVICE_A) != nullptr);
  TEST_ASSERT_EQ_UINT(f.bridge.connectedCount(), 1);

  protocol::ConfigPush push;
  TEST_ASSERT(test::lastMessage(f.link(TEST_DEVICE_A)->takeFrames(), push));
  TEST_ASSERT_EQ_UINT(push.snapshot.items.size(), 2);

  f.run(5000);
  TEST_ASSERT_EQ_UINT(f.scanner.scans, 2);
  // Still one session for the same device.
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
  TEST_ASSERT_EQ_UINT(f.links.links.size(), 1);
}

static void test_new_device_is_registered() {
  BridgeFixture f;
  f.start();
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 0);

  f.scanner.show(TEST_DEVICE_B);
  f.run(5000);
  TEST_ASSERT(f.backend.knows(TEST_DEVICE_B));
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
  host::SessionManager* session = f.bridge.session(TEST_DEVICE_B);
  TEST_ASSERT(session != nullptr);
  TEST_ASSERT(session->connected());
  // No footprint yet, so nothing to push.
  TEST_ASSERT_EQ_UINT(session->configPushes(), 0);

  TEST_ASSERT(f.backend.setFootprint(TEST_DEVICE_B, footprint(2, 1, 1, 1, 1)));
  f.run(30000, 1000);
  TEST_ASSERT_EQ_UINT(session->configPushes(), 1);
  protocol::ConfigPush push;
  TEST_ASSERT(test::lastMessage(f.link(TEST_DEVICE_B)->takeFrames(), push));
  TEST_ASSERT_EQ_UINT(push.snapshot.footprint.row, 2);
}

static void test_registration_retried_after_outage() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_B);
  f.backend.setAvailable(false);
  f.start();
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 0);

  f.backend.setAvailable(true);
  f.run(5000);
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
}

static void test_stale_devices_are_forgotten() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.start();
  FakeLink* link = f.link(TEST_DEVICE_A);
  TEST_ASSERT(link->isOpen());

  // Connected sessions are kept even when the device stops advertising.
  f.scanner.hide(TEST_DEVICE_A);
  protocol::Heartbeat hb;
  hb.firmware_version = TEST_RUNNING_FIRMWARE;
  hb.battery = model::kBatteryUnknown;
  for (uint32_t elapsed = 0; elapsed <= SHELFSYNC_STALE_DEVICE_MS; elapsed += 10000) {
    link->inject(hb);
    f.run(10000, 1000);
  }
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
  TEST_ASSERT(f.bridge.session(TEST_DEVICE_A)->connected());

  // Once the link is gone for good the record goes too.
  link->open_ok = false;
  link->read_error = true;
  f.run(10000, 1000);
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 0);
}

static void test_visible_device_is_not_forgotten() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.start();
  f.link(TEST_DEVICE_A)->open_ok = false;
  f.link(TEST_DEVICE_A)->read_error = true;
  f.run(SHELFSYNC_STALE_DEVICE_MS + 10000, 1000);
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 1);
  TEST_ASSERT(!f.bridge.session(TEST_DEVICE_A)->connected());
}

static void test_stock_update_reaches_backend() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.start();
  FakeLink* link = f.link(TEST_DEVICE_A);
  link->takeFrames();

  protocol::StockUpdate update;
  update.change.row = 1;
  update.change.slot = slot(1, 2);
  update.change.item_id = 101;
  update.change.count = 9;
  update.change.sequence = 1;
  update.change.timestamp = TEST_EPOCH;
  update.battery = 70;
  link->inject(update);
  f.run(100);

  protocol::Ack ack;
  TEST_ASSERT(test::lastMessage(link->takeFrames(), ack));
  TEST_ASSERT_EQ_UINT(ack.sequence, 1);
  TEST_ASSERT_EQ_UINT(f.backend.stockAt(at(1, 1, 2)), 9);
  TEST_ASSERT_EQ_UINT(f.backend.batteryPercent(TEST_DEVICE_A), 70);
  TEST_ASSERT_EQ_UINT(f.bridge.session(TEST_DEVICE_A)->batteryPercent(), 70);

  // A slot outside the footprint is refused.
  update.change.slot = slot(3, 3);
  update.change.sequence = 2;
  link->inject(update);
  f.run(100);
  protocol::Nack nack;
  TEST_ASSERT(test::lastMessage(link->takeFrames(), nack));
  TEST_ASSERT(nack.reason == protocol::NackReason::SLOT_OUTSIDE_FOOTPRINT);
}

static void test_config_changes_are_pushed() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.start();
  FakeLink* link = f.link(TEST_DEVICE_A);
  link->takeFrames();

  TEST_ASSERT(!f.bridge.notifyConfigChanged(TEST_DEVICE_A));
  TEST_ASSERT(!f.bridge.notifyConfigChanged("ShelfSync-Z9"));

  host::StockItem item;
  item.id = 102;
  item.name = "washers";
  item.stock = 30;
  item.min_stock = 10;
  TEST_ASSERT(f.backend.placeItem(at(1, 2, 1), item));
  TEST_ASSERT(f.bridge.notifyConfigChanged(TEST_DEVICE_A));
  protocol::ConfigPush push;
  TEST_ASSERT(test::lastMessage(link->takeFrames(), push));
  TEST_ASSERT_EQ_UINT(push.snapshot.items.size(), 3);
}

static void test_firmware_image_completes_config() {
  std::vector<uint8_t> bytes(1000, 0xA5);
  host::FileFirmwareImage image;
  TEST_ASSERT(image.assign(bytes.data(), bytes.size(), 4));

  BridgeFixture f;
  f.bridge.setFirmwareImage(&image);
  f.scanner.show(TEST_DEVICE_A);
  f.start();

  protocol::ConfigPush push;
  TEST_ASSERT(test::lastMessage(f.link(TEST_DEVICE_A)->takeFrames(), push));
  TEST_ASSERT_EQ_UINT(push.snapshot.firmware.version, 4);
  TEST_ASSERT_EQ_UINT(push.snapshot.firmware.image_size, 1000);
  TEST_ASSERT(push.snapshot.firmware.digest == image.info().digest);

  // A backend naming another version gets no image.
  model::FirmwareInfo other;
  other.version = 5;
  other.image_size = 0;
  other.digest.fill(0);
  f.backend.setFirmware(other);
  etl::expected<model::ConfigSnapshot, host::UpstreamError> config =
      f.bridge.configFor(TEST_DEVICE_A);
  TEST_ASSERT(config.has_value());
  TEST_ASSERT_EQ_UINT(config.value().firmware.image_size, 0);
}

static void test_shutdown_closes_sessions() {
  BridgeFixture f;
  f.scanner.show(TEST_DEVICE_A);
  f.start();
  TEST_ASSERT(f.bridge.running());
  f.bridge.shutdown();
  TEST_ASSERT(!f.bridge.running());
  TEST_ASSERT_EQ_UINT(f.bridge.deviceCount(), 0);

  const unsigned scans = f.scanner.scans;
  f.run(10000, 1000);
  TEST_ASSERT_EQ_UINT(f.scanner.scans, scans);
}

int main() {
  RUN_TEST(test_scan_filters_service_name);
  RUN_TEST(test_new_device_is_registered);
  RUN_TEST(test_registration_retried_after_outage);
  RUN_TEST(test_stale_devices_are_forgotten);
  RUN_TEST(test_visible_device_is_not_forgotten);
  RUN_TEST(test_stock_update_reaches_backend);
  RUN_TEST(test_config_changes_are_pushed);
  RUN_TEST(test_firmware_image_completes_config);
  RUN_TEST(test_shutdown_closes_sessions);
  printf("  -> coordinator: OK\n");
  return 0;
}
