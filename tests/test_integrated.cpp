/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include <memory>
#include <string>

#include "device/DeviceController.h"
#include "host/BridgeCoordinator.h"
#include "host/MemoryGateway.h"
#include "test_doubles.h"
#include "test_support.h"

using namespace shelfsync;
using shelfsync::device::DeviceController;
using shelfsync::host::BridgeCoordinator;
using shelfsync::host::MemoryGateway;
using shelfsync::host::Position;
using shelfsync::host::SubmitResult;
using shelfsync::test::FakeLink;
using shelfsync::test::slot;

namespace {

const char kSeed[] =
    "{ \"firmware_version\": 3,"
    "  \"devices\": ["
    "    { \"address\": \"ShelfSync-A1\", \"row\": 1, \"bottom_level\": 1,"
    "      \"left_column\": 1, \"height\": 2, \"width\": 2 },"
    "    { \"address\": \"ShelfSync-B2\", \"row\": 1, \"bottom_level\": 1,"
    "      \"left_column\": 3, \"height\": 2, \"width\": 2 } ],"
    "  \"items\": ["
    "    { \"id\": 100, \"name\": \"M8 bolts\", \"row\": 1, \"level\": 1,"
    "      \"column\": 1, \"stock\": 5, \"min_stock\": 2 },"
    "    { \"id\": 101, \"name\": \"M8 nuts\", \"row\": 1, \"level\": 1,"
    "      \"column\": 2, \"stock\": 12, \"min_stock\": 4 },"
    "    { \"id\": 300, \"name\": \"washers\", \"row\": 1, \"level\": 2,"
    "      \"column\": 3, \"stock\": 80, \"min_stock\": 20 } ] }";

Position at(uint8_t row, uint8_t level, uint8_t column) {
  Position p;
  p.row = row;
  p.level = level;
  p.column = column;
  return p;
}

// One shelf display (ShelfSync-A1) talking to a bridge over a fake link.
struct ShelfSystem {
  test::FakeDeviceHardware hw;
  device::DeviceHardware wiring;
  std::unique_ptr<DeviceController> dev;

  MemoryGateway backend;
  test::FakeScanner scanner;
  test::FakeLinkFactory links;
  BridgeCoordinator bridge;

  uint32_t now;
  // Bytes from the bridge to the device are lost while set.
  bool drop_downlink;

  ShelfSystem()
      : hw(),
        wiring{hw.storage, hw.radio, hw.display, hw.firmware, hw.platform},
        dev(new DeviceController(wiring)),
        backend(),
        scanner(),
        links(),
        bridge(scanner, links, backend),
        now(0),
        drop_downlink(false) {
    std::string error;
    TEST_ASSERT(backend.loadInventory(kSeed, error));
    scanner.show(TEST_DEVICE_A);
  }

  FakeLink* link() {
    auto it = links.links.find(TEST_DEVICE_A);
    return it == links.links.end() ? nullptr : it->second;
  }

  void exchange() {
    FakeLink* l = link();
    if (l == nullptr) {
      return;
    }
    if (drop_downlink) {
      l->tx.clear();
    }
    test::pump(hw.radio, *l);
  }

  void step(uint32_t ms) {
    now += ms;
    hw.platform.now_ms = now;
    FakeLink* l = link();
    hw.radio.link_up = l != nullptr && l->isOpen();
    dev->poll(now);
    exchange();
    bridge.poll(now);
    exchange();
  }

  void run(uint32_t ms) {
    for (uint32_t t = 0; t < ms; t += 100) {
      step(100);
    }
  }

  void start() {
    dev->begin();
    bridge.begin(now);
    // The first connection attempt waits out the initial backoff.
    run(2000);
  }

  void tap(uint8_t level, uint8_t column, int8_t delta) {
    now += 400;
    hw.platform.now_ms = now;
    dev->onTap(slot(level, column), delta);
    step(0);
  }

  // Power cycle: RAM is gone, storage survives.
  void reboot() {
    dev.reset();
    hw.radio.rx.clear();
    dev.reset(new DeviceController(wiring));
    dev->begin();
  }
};

}  // namespace

static void test_device_gets_config_from_backend() {
  ShelfSystem s;
  s.start();
  TEST_ASSERT(s.dev->linked());
  TEST_ASSERT(s.bridge.session(TEST_DEVICE_A)->connected());
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items.size(), 2);
  TEST_ASSERT(s.dev->snapshot().items[1].name == "M8 nuts");
  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->deviceFirmwareVersion(),
                      TEST_RUNNING_FIRMWARE);
}

static void test_sequence_continues_after_backend_history() {
  ShelfSystem s;
  model::StockDelta earlier;
  earlier.device.assign(TEST_DEVICE_A);
  earlier.row = 1;
  earlier.slot = slot(1, 1);
  earlier.item_id = 100;
  earlier.count = 5;
  earlier.sequence = 41;
  earlier.timestamp = TEST_EPOCH;
  earlier.battery = model::kBatteryUnknown;
  TEST_ASSERT(s.backend.submitStockUpdate(earlier) == SubmitResult::ACCEPTED);

  s.start();
  s.tap(1, 2, -1);
  s.run(11000);

  TEST_ASSERT_EQ_UINT(s.backend.lastSequence(TEST_DEVICE_A), 42);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 2)), 11);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->acksSent(), 1);
}

static void test_lost_ack_is_resent_and_deduplicated() {
  ShelfSystem s;
  s.start();
  s.tap(1, 2, -1);
  s.drop_downlink = true;
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.lastSequence(TEST_DEVICE_A), 1);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 1);
  const uint32_t applied = s.backend.appliedCount();

  // The bridge hears nothing back and drops the link; the device reconnects
  // and sends the same entry again.
  for (int i = 0; i < 200 && s.bridge.session(TEST_DEVICE_A)->connected(); ++i) {
    s.step(100);
  }
  TEST_ASSERT(!s.bridge.session(TEST_DEVICE_A)->connected());
  s.drop_downlink = false;
  s.run(3000);

  TEST_ASSERT(s.dev->linked());
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.backend.appliedCount(), applied);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 2)), 11);
  TEST_ASSERT_EQ_UINT(s.dev->pendingQueue().nextSequence(), 2);
}

static void test_power_loss_after_persist() {
  ShelfSystem s;
  s.start();
  s.tap(1, 1, 1);
  s.tap(1, 1, 1);
  s.drop_downlink = true;
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 1)), 7);
  const uint32_t applied = s.backend.appliedCount();

  s.reboot();
  s.drop_downlink = false;
  s.run(1000);

  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.backend.appliedCount(), applied);
  TEST_ASSERT_EQ_UINT(s.dev->cache().count(0), 7);

  // Numbering continues where it left off.
  s.tap(1, 1, -1);
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.lastSequence(TEST_DEVICE_A), 2);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 1)), 6);
}

static void test_footprint_swap_end_to_end() {
  ShelfSystem s;
  s.start();
  s.tap(1, 1, -1);

  // Moved upstream before the change is synced.
  TEST_ASSERT(s.backend.swapFootprints(TEST_DEVICE_A, TEST_DEVICE_B));
  s.run(11000);

  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->nacksSent(), 1);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().footprint.left_column, 3);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items.size(), 1);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items[0].id, 300);
  // The refused change never reached the old slot.
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 1)), 5);

  s.tap(2, 3, -1);
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 2, 3)), 79);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
}

static void test_move_to_another_row_end_to_end() {
  ShelfSystem s;
  host::StockItem item;
  item.id = 700;
  item.name = "cable ties";
  item.stock = 30;
  item.min_stock = 5;
  TEST_ASSERT(s.backend.placeItem(at(2, 1, 1), item));
  s.start();
  s.tap(1, 1, -1);

  // Same shape one row up: level 1, column 1 now holds another item.
  TEST_ASSERT(s.backend.setFootprint(TEST_DEVICE_A, test::footprint(2, 1, 1, 2, 2)));
  s.run(11000);

  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->nacksSent(), 1);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(2, 1, 1)), 30);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 1)), 5);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().footprint.row, 2);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items.size(), 1);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items[0].id, 700);
  TEST_ASSERT_EQ_UINT(s.dev->cache().count(0), 30);

  s.tap(1, 1, -1);
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(2, 1, 1)), 29);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
}

static void test_battery_reaches_backend() {
  ShelfSystem s;
  s.hw.platform.battery = 42;
  s.start();
  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->batteryPercent(), 42);

  s.hw.platform.battery = 41;
  s.tap(1, 2, 1);
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.backend.batteryPercent(TEST_DEVICE_A), 41);
  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->batteryPercent(), 41);
}

static void test_backend_change_reaches_device() {
  ShelfSystem s;
  s.start();
  host::StockItem item;
  item.id = 102;
  item.name = "spring pins";
  item.stock = 40;
  item.min_stock = 10;
  TEST_ASSERT(s.backend.placeItem(at(1, 2, 2), item));

  // Picked up by the periodic config poll.
  s.run(SHELFSYNC_CONFIG_POLL_INTERVAL_MS);
  TEST_ASSERT_EQ_UINT(s.dev->snapshot().items.size(), 3);
  TEST_ASSERT_EQ_UINT(s.bridge.session(TEST_DEVICE_A)->configPushes(), 2);
}

static void test_upstream_outage_holds_changes() {
  ShelfSystem s;
  s.start();
  s.backend.setAvailable(false);
  s.tap(1, 2, 1);
  s.run(11000);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 1);
  TEST_ASSERT(s.dev->syncBlocked());
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 2)), 12);

  // The device keeps its local count and delivers it on the next connection.
  s.backend.setAvailable(true);
  s.bridge.session(TEST_DEVICE_A)->onDisconnected();
  s.run(3000);
  TEST_ASSERT_EQ_UINT(s.dev->pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(s.backend.stockAt(at(1, 1, 2)), 13);
}

int main() {
  RUN_TEST(test_device_gets_config_from_backend);
  RUN_TEST(test_sequence_continues_after_backend_history);
  RUN_TEST(test_lost_ack_is_resent_and_deduplicated);
  RUN_TEST(test_power_loss_after_persist);
  RUN_TEST(test_footprint_swap_end_to_end);
  RUN_TEST(test_move_to_another_row_end_to_end);
  RUN_TEST(test_battery_reaches_backend);
  RUN_TEST(test_backend_change_reaches_device);
  RUN_TEST(test_upstream_outage_holds_changes);
  printf("  -> integrated: OK\n");
  return 0;
}
