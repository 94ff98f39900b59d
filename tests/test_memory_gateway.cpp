/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>

#include "host/MemoryGateway.h"
#include "test_doubles.h"
#include "test_support.h"

using namespace shelfsync;
using shelfsync::host::MemoryGateway;
using shelfsync::host::Position;
using shelfsync::host::SubmitResult;
using shelfsync::host::UpstreamError;
using shelfsync::test::footprint;
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

// Id kSeed places at row 1, 0 for an empty cell.
uint32_t seededItem(uint8_t level, uint8_t column) {
  if (level == 1 && column == 1) return 100;
  if (level == 1 && column == 2) return 101;
  if (level == 2 && column == 3) return 300;
  return 0;
}

model::StockDelta delta(const char* device, uint32_t sequence, uint8_t level,
                        uint8_t column, uint16_t count) {
  model::StockDelta d;
  d.device.assign(device);
  d.row = 1;
  d.slot = slot(level, column);
  d.item_id = seededItem(level, column);
  d.count = count;
  d.sequence = sequence;
  d.timestamp = TEST_EPOCH;
  d.battery = model::kBatteryUnknown;
  return d;
}

void seed(MemoryGateway& backend) {
  std::string error;
  TEST_ASSERT(backend.loadInventory(kSeed, error));
}

// Fresh path in /tmp; the file itself does not exist yet.
std::string tempPath() {
  char path[] = "/tmp/shelfsync_journal_XXXXXX";
  const int fd = mkstemp(path);
  TEST_ASSERT(fd >= 0);
  close(fd);
  unlink(path);
  return path;
}

}  // namespace

static void test_seed_loads_devices_and_items() {
  MemoryGateway backend;
  seed(backend);
  TEST_ASSERT(backend.knows(TEST_DEVICE_A));
  TEST_ASSERT(backend.knows(TEST_DEVICE_B));
  TEST_ASSERT_EQ_UINT(backend.firmware().version, 3);
  TEST_ASSERT_EQ_UINT(backend.stockAt(at(1, 1, 2)), 12);
  TEST_ASSERT(backend.stockAt(at(1, 2, 2)) == -1);

  etl::expected<model::ConfigSnapshot, UpstreamError> config =
      backend.fetchConfig(TEST_DEVICE_A);
  TEST_ASSERT(config.has_value());
  const model::ConfigSnapshot& s = config.value();
  TEST_ASSERT(s.valid());
  TEST_ASSERT(s.footprint == footprint(1, 1, 1, 2, 2));
  TEST_ASSERT_EQ_UINT(s.items.size(), 2);
  TEST_ASSERT_EQ_UINT(s.items[0].id, 100);
  TEST_ASSERT(s.items[0].name == "M8 bolts");
  TEST_ASSERT_EQ_UINT(s.items[1].min_stock, 4);
  TEST_ASSERT_EQ_UINT(s.firmware.version, 3);
  TEST_ASSERT_EQ_UINT(s.last_sequence, 0);
}

static void test_bad_seed_is_reported() {
  MemoryGateway backend;
  std::string error;
  TEST_ASSERT(!backend.loadInventory("{ \"devices\": [", error));
  TEST_ASSERT(!error.empty());

  error.clear();
  TEST_ASSERT(!backend.loadInventory("[1, 2]", error));
  TEST_ASSERT(!error.empty());

  // 2x1 is not an allowed layout.
  error.clear();
  TEST_ASSERT(!backend.loadInventory(
      "{ \"devices\": [ { \"address\": \"ShelfSync-X\", \"row\": 1,"
      " \"bottom_level\": 1, \"left_column\": 1, \"height\": 2, \"width\": 1 } ] }",
      error));
  TEST_ASSERT(!error.empty());

  error.clear();
  TEST_ASSERT(!backend.loadInventoryFile("/nonexistent/shelfsync.json", error));
  TEST_ASSERT(!error.empty());
}

static void test_overlapping_footprints_rejected() {
  MemoryGateway backend;
  seed(backend);
  TEST_ASSERT(!backend.addDevice("ShelfSync-C3", footprint(1, 2, 2, 2, 2)));
  TEST_ASSERT(backend.addDevice("ShelfSync-C3", footprint(2, 2, 2, 2, 2)));
  TEST_ASSERT(!backend.setFootprint(TEST_DEVICE_A, footprint(1, 1, 2, 2, 2)));
  // Moving within its own area is fine.
  TEST_ASSERT(backend.setFootprint(TEST_DEVICE_A, footprint(1, 1, 1, 1, 1)));
}

static void test_submit_applies_and_deduplicates() {
  MemoryGateway backend;
  seed(backend);

  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 42, 1, 1, 4)) ==
              SubmitResult::ACCEPTED);
  TEST_ASSERT_EQ_UINT(backend.stockAt(at(1, 1, 1)), 4);
  TEST_ASSERT_EQ_UINT(backend.lastSequence(TEST_DEVICE_A), 42);

  // The same delta again changes nothing.
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 42, 1, 1, 4)) ==
              SubmitResult::DUPLICATE);
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 40, 1, 1, 9)) ==
              SubmitResult::DUPLICATE);
  TEST_ASSERT_EQ_UINT(backend.stockAt(at(1, 1, 1)), 4);
  TEST_ASSERT_EQ_UINT(backend.appliedCount(), 1);

  etl::expected<model::ConfigSnapshot, UpstreamError> config =
      backend.fetchConfig(TEST_DEVICE_A);
  TEST_ASSERT(config.has_value());
  TEST_ASSERT_EQ_UINT(config.value().last_sequence, 42);
  TEST_ASSERT_EQ_UINT(config.value().items[0].stock, 4);

  // Sequences are per device.
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_B, 1, 2, 3, 79)) ==
              SubmitResult::ACCEPTED);
  TEST_ASSERT_EQ_UINT(backend.stockAt(at(1, 2, 3)), 79);
}

static void test_submit_rejections() {
  MemoryGateway backend;
  seed(backend);
  // Slot owned by the other device.
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 1, 1, 3, 1)) ==
              SubmitResult::REJECTED);
  // Inside the footprint but nothing placed there.
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 2, 2, 2, 1)) ==
              SubmitResult::REJECTED);
  TEST_ASSERT(backend.submitStockUpdate(delta("ShelfSync-Z9", 1, 1, 1, 1)) ==
              SubmitResult::REJECTED);
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 3, 1, 1, 5000)) ==
              SubmitResult::REJECTED);
  TEST_ASSERT_EQ_UINT(backend.lastSequence(TEST_DEVICE_A), 0);

  backend.setAvailable(false);
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 4, 1, 1, 1)) ==
              SubmitResult::UNAVAILABLE);
  etl::expected<model::ConfigSnapshot, UpstreamError> config =
      backend.fetchConfig(TEST_DEVICE_A);
  TEST_ASSERT(!config.has_value());
  TEST_ASSERT(config.error() == UpstreamError::UNAVAILABLE);
  TEST_ASSERT(!backend.registerDevice("ShelfSync-C3"));
}

static void test_submit_checks_row_and_item() {
  MemoryGateway backend;
  seed(backend);

  // Counted against an item that is no longer at this cell.
  model::StockDelta moved = delta(TEST_DEVICE_A, 1, 1, 1, 2);
  moved.item_id = 999;
  TEST_ASSERT(backend.submitStockUpdate(moved) == SubmitResult::REJECTED);

  // Same level and column, but the device was on another row.
  model::StockDelta other_row = delta(TEST_DEVICE_A, 2, 1, 1, 2);
  other_row.row = 2;
  TEST_ASSERT(backend.submitStockUpdate(other_row) == SubmitResult::REJECTED);

  TEST_ASSERT_EQ_UINT(backend.stockAt(at(1, 1, 1)), 5);
  TEST_ASSERT_EQ_UINT(backend.lastSequence(TEST_DEVICE_A), 0);
  TEST_ASSERT_EQ_UINT(backend.appliedCount(), 0);
}

static void test_battery_is_recorded_per_device() {
  MemoryGateway backend;
  seed(backend);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_A), model::kBatteryUnknown);

  model::StockDelta d = delta(TEST_DEVICE_A, 1, 1, 1, 4);
  d.battery = 40;
  TEST_ASSERT(backend.submitStockUpdate(d) == SubmitResult::ACCEPTED);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_A), 40);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_B), model::kBatteryUnknown);

  // Recorded even when the update itself is refused or repeated.
  d = delta(TEST_DEVICE_A, 2, 2, 2, 1);
  d.battery = 35;
  TEST_ASSERT(backend.submitStockUpdate(d) == SubmitResult::REJECTED);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_A), 35);
  d = delta(TEST_DEVICE_A, 1, 1, 1, 4);
  d.battery = 34;
  TEST_ASSERT(backend.submitStockUpdate(d) == SubmitResult::DUPLICATE);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_A), 34);

  // No reading leaves the last one in place.
  d = delta(TEST_DEVICE_A, 3, 1, 2, 11);
  TEST_ASSERT(backend.submitStockUpdate(d) == SubmitResult::ACCEPTED);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent(TEST_DEVICE_A), 34);
  TEST_ASSERT_EQ_UINT(backend.batteryPercent("ShelfSync-Z9"), model::kBatteryUnknown);
}

static void test_registration_without_footprint() {
  MemoryGateway backend;
  seed(backend);
  TEST_ASSERT(!backend.fetchConfig("ShelfSync-C3").has_value());
  TEST_ASSERT(backend.fetchConfig("ShelfSync-C3").error() == UpstreamError::UNKNOWN_DEVICE);

  TEST_ASSERT(backend.registerDevice("ShelfSync-C3"));
  TEST_ASSERT(backend.knows("ShelfSync-C3"));
  TEST_ASSERT(backend.fetchConfig("ShelfSync-C3").error() == UpstreamError::UNASSIGNED);
  TEST_ASSERT(backend.submitStockUpdate(delta("ShelfSync-C3", 1, 1, 1, 1)) ==
              SubmitResult::REJECTED);

  // Registering a known device keeps its footprint.
  TEST_ASSERT(backend.registerDevice(TEST_DEVICE_A));
  TEST_ASSERT(backend.fetchConfig(TEST_DEVICE_A).has_value());

  TEST_ASSERT(!backend.registerDevice(std::string(40, 'x')));
}

static void test_footprint_swap() {
  MemoryGateway backend;
  seed(backend);
  TEST_ASSERT(backend.swapFootprints(TEST_DEVICE_A, TEST_DEVICE_B));

  etl::expected<model::ConfigSnapshot, UpstreamError> a = backend.fetchConfig(TEST_DEVICE_A);
  TEST_ASSERT(a.has_value());
  TEST_ASSERT_EQ_UINT(a.value().footprint.left_column, 3);
  TEST_ASSERT_EQ_UINT(a.value().items.size(), 1);
  TEST_ASSERT_EQ_UINT(a.value().items[0].id, 300);

  // The old slot now belongs to B.
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 1, 1, 1, 0)) ==
              SubmitResult::REJECTED);
  TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_B, 1, 1, 1, 0)) ==
              SubmitResult::ACCEPTED);

  TEST_ASSERT(!backend.swapFootprints(TEST_DEVICE_A, "ShelfSync-Z9"));
}

static void test_item_placement() {
  MemoryGateway backend;
  seed(backend);
  host::StockItem item;
  item.id = 500;
  item.name = "spring pins";
  item.stock = 3;
  item.min_stock = 1;
  TEST_ASSERT(backend.placeItem(at(1, 2, 1), item));
  TEST_ASSERT_EQ_UINT(backend.fetchConfig(TEST_DEVICE_A).value().items.size(), 3);
  TEST_ASSERT(backend.removeItem(at(1, 2, 1)));
  TEST_ASSERT(!backend.removeItem(at(1, 2, 1)));

  TEST_ASSERT(!backend.placeItem(at(7, 1, 1), item));
  item.name = "a name that is far too long";
  TEST_ASSERT(!backend.placeItem(at(1, 2, 1), item));
}

static void test_journal_replay() {
  const std::string path = tempPath();
  std::string error;
  {
    MemoryGateway backend;
    seed(backend);
    TEST_ASSERT(backend.openJournal(path, error));
    TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 7, 1, 1, 3)) ==
                SubmitResult::ACCEPTED);
    TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 8, 1, 2, 10)) ==
                SubmitResult::ACCEPTED);
    TEST_ASSERT(backend.submitStockUpdate(delta(TEST_DEVICE_A, 8, 1, 2, 10)) ==
                SubmitResult::DUPLICATE);
  }

  // Crash mid-append.
  FILE* file = fopen(path.c_str(), "a");
  TEST_ASSERT(file != nullptr);
  fputs("ShelfSync-A1 9 1 1", file);
  fclose(file);

  MemoryGateway restarted;
  seed(restarted);
  TEST_ASSERT(restarted.openJournal(path, error));
  TEST_ASSERT_EQ_UINT(restarted.lastSequence(TEST_DEVICE_A), 8);
  TEST_ASSERT_EQ_UINT(restarted.stockAt(at(1, 1, 1)), 3);
  TEST_ASSERT_EQ_UINT(restarted.stockAt(at(1, 1, 2)), 10);
  TEST_ASSERT_EQ_UINT(restarted.appliedCount(), 2);
  TEST_ASSERT(restarted.submitStockUpdate(delta(TEST_DEVICE_A, 8, 1, 2, 10)) ==
              SubmitResult::DUPLICATE);

  restarted.closeJournal();

  // An item moved in between does not inherit the old item's count.
  MemoryGateway rearranged;
  seed(rearranged);
  host::StockItem replacement;
  replacement.id = 900;
  replacement.name = "rivets";
  replacement.stock = 50;
  replacement.min_stock = 5;
  TEST_ASSERT(rearranged.placeItem(at(1, 1, 1), replacement));
  TEST_ASSERT(rearranged.openJournal(path, error));
  TEST_ASSERT_EQ_UINT(rearranged.lastSequence(TEST_DEVICE_A), 8);
  TEST_ASSERT_EQ_UINT(rearranged.stockAt(at(1, 1, 1)), 50);
  TEST_ASSERT_EQ_UINT(rearranged.stockAt(at(1, 1, 2)), 10);

  rearranged.closeJournal();
  unlink(path.c_str());
}

static void test_journal_open_failure() {
  MemoryGateway backend;
  std::string error;
  TEST_ASSERT(!backend.openJournal("/nonexistent/dir/journal.log", error));
  TEST_ASSERT(!error.empty());
}

int main() {
  RUN_TEST(test_seed_loads_devices_and_items);
  RUN_TEST(test_bad_seed_is_reported);
  RUN_TEST(test_overlapping_footprints_rejected);
  RUN_TEST(test_submit_applies_and_deduplicates);
  RUN_TEST(test_submit_rejections);
  RUN_TEST(test_submit_checks_row_and_item);
  RUN_TEST(test_battery_is_recorded_per_device);
  RUN_TEST(test_registration_without_footprint);
  RUN_TEST(test_footprint_swap);
  RUN_TEST(test_item_placement);
  RUN_TEST(test_journal_replay);
  RUN_TEST(test_journal_open_failure);
  printf("  -> memory_gateway: OK\n");
  return 0;
}
