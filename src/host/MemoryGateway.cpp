/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "MemoryGateway.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include <ArduinoJson.h>

#include "util/Log.h"

namespace shelfsync {
namespace host {

namespace {

const char kTag[] = "backend";
constexpr size_t kJournalLineSize = 128;

bool rangesOverlap(uint8_t a_start, uint8_t a_len, uint8_t b_start, uint8_t b_len) {
  return a_start < b_start + b_len && b_start < a_start + a_len;
}

bool footprintsOverlap(const model::Footprint& a, const model::Footprint& b) {
  return a.row == b.row &&
         rangesOverlap(a.bottom_level, a.height, b.bottom_level, b.height) &&
         rangesOverlap(a.left_column, a.width, b.left_column, b.width);
}

bool validPosition(const Position& p) {
  return p.row >= 1 && p.row <= model::kMaxRow && p.level >= 1 &&
         p.level <= model::kMaxLevel && p.column >= 1 &&
         p.column <= model::kMaxColumn;
}

}  // namespace

bool operator<(const Position& a, const Position& b) {
  if (a.row != b.row) return a.row < b.row;
  if (a.level != b.level) return a.level < b.level;
  return a.column < b.column;
}

MemoryGateway::MemoryGateway()
    : _devices(),
      _items(),
      _firmware(),
      _available(true),
      _applied(0),
      _journal(nullptr),
      _journal_path() {}

MemoryGateway::~MemoryGateway() { closeJournal(); }

// --- Seed ---

bool MemoryGateway::loadInventory(const std::string& json, std::string& error) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    error = std::string("inventory: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObject>()) {
    error = "inventory: top level must be an object";
    return false;
  }
  JsonObject root = doc.as<JsonObject>();
  _firmware.version = root["firmware_version"] | _firmware.version;

  for (JsonObject d : root["devices"].as<JsonArray>()) {
    const char* address = d["address"] | "";
    model::Footprint fp;
    fp.row = d["row"] | 0;
    fp.bottom_level = d["bottom_level"] | 0;
    fp.left_column = d["left_column"] | 0;
    fp.height = d["height"] | 0;
    fp.width = d["width"] | 0;
    if (address[0] == '\0' || !addDevice(address, fp)) {
      error = std::string("inventory: bad device '") + address + "'";
      return false;
    }
  }

  for (JsonObject i : root["items"].as<JsonArray>()) {
    Position position;
    position.row = i["row"] | 0;
    position.level = i["level"] | 0;
    position.column = i["column"] | 0;
    StockItem item;
    item.id = i["id"] | 0U;
    item.name = i["name"] | "";
    item.stock = i["stock"] | 0;
    item.min_stock = i["min_stock"] | 0;
    if (!placeItem(position, item)) {
      error = "inventory: bad item " + std::to_string(item.id);
      return false;
    }
  }

  SHELFSYNC_LOG_INFO(kTag, "inventory loaded: %zu devices, %zu items, firmware v%u",
                     _devices.size(), _items.size(),
                     static_cast<unsigned>(_firmware.version));
  return true;
}

bool MemoryGateway::loadInventoryFile(const std::string& path, std::string& error) {
  FILE* file = fopen(path.c_str(), "rb");
  if (file == nullptr) {
    error = path + ": " + strerror(errno);
    return false;
  }
  std::string json;
  char buffer[512];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
    json.append(buffer, n);
  }
  const bool read_error = ferror(file) != 0;
  fclose(file);
  if (read_error) {
    error = path + ": read error";
    return false;
  }
  return loadInventory(json, error);
}

// --- Journal ---

bool MemoryGateway::openJournal(const std::string& path, std::string& error) {
  closeJournal();

  FILE* replay = fopen(path.c_str(), "r");
  if (replay != nullptr) {
    char line[kJournalLineSize];
    unsigned line_no = 0;
    unsigned replayed = 0;
    while (fgets(line, sizeof(line), replay) != nullptr) {
      ++line_no;
      char device[model::kMaxDeviceIdLength + 1];
      unsigned long sequence, item_id, timestamp;
      unsigned row, level, column, count;
      if (sscanf(line, "%31s %lu %u %u %u %lu %u %lu", device, &sequence, &row,
                 &level, &column, &item_id, &count, &timestamp) != 8) {
        // A torn last line is what a crash mid-append leaves behind.
        SHELFSYNC_LOG_WARN(kTag, "%s:%u: unreadable entry skipped",
                           path.c_str(), line_no);
        continue;
      }
      Position position;
      position.row = static_cast<uint8_t>(row);
      position.level = static_cast<uint8_t>(level);
      position.column = static_cast<uint8_t>(column);
      if (sequence <= lastSequence(device)) {
        continue;
      }
      apply(device, static_cast<uint32_t>(sequence), position,
            static_cast<uint32_t>(item_id), static_cast<uint16_t>(count));
      ++replayed;
    }
    fclose(replay);
    SHELFSYNC_LOG_INFO(kTag, "journal %s: %u deltas replayed", path.c_str(),
                       replayed);
  } else if (errno != ENOENT) {
    error = path + ": " + strerror(errno);
    return false;
  }

  _journal = fopen(path.c_str(), "a");
  if (_journal == nullptr) {
    error = path + ": " + strerror(errno);
    return false;
  }
  _journal_path = path;
  return true;
}

void MemoryGateway::closeJournal() {
  if (_journal != nullptr) {
    if (fclose(_journal) != 0) {
      SHELFSYNC_LOG_WARN(kTag, "closing %s: %s", _journal_path.c_str(),
                         strerror(errno));
    }
    _journal = nullptr;
  }
}

bool MemoryGateway::appendJournal(const model::StockDelta& delta) {
  if (_journal == nullptr) {
    return true;
  }
  const int written = fprintf(_journal, "%s %lu %u %u %u %lu %u %lu\n",
                              delta.device.c_str(),
                              static_cast<unsigned long>(delta.sequence),
                              static_cast<unsigned>(delta.row),
                              static_cast<unsigned>(delta.slot.level),
                              static_cast<unsigned>(delta.slot.column),
                              static_cast<unsigned long>(delta.item_id),
                              static_cast<unsigned>(delta.count),
                              static_cast<unsigned long>(delta.timestamp));
  if (written < 0 || fflush(_journal) != 0 || fsync(fileno(_journal)) != 0) {
    SHELFSYNC_LOG_ERROR(kTag, "journal %s: %s", _journal_path.c_str(),
                        strerror(errno));
    return false;
  }
  return true;
}

// --- Devices and items ---

bool MemoryGateway::overlapsOther(const std::string& device,
                                  const model::Footprint& footprint) const {
  for (const auto& entry : _devices) {
    if (entry.first != device && entry.second.assigned &&
        footprintsOverlap(entry.second.footprint, footprint)) {
      return true;
    }
  }
  return false;
}

bool MemoryGateway::addDevice(const std::string& device,
                              const model::Footprint& footprint) {
  if (device.size() > model::kMaxDeviceIdLength) {
    return false;
  }
  return setFootprint(device, footprint);
}

bool MemoryGateway::setFootprint(const std::string& device,
                                 const model::Footprint& footprint) {
  if (!footprint.valid() || overlapsOther(device, footprint)) {
    return false;
  }
  DeviceEntry& entry = _devices[device];
  entry.footprint = footprint;
  entry.assigned = true;
  return true;
}

bool MemoryGateway::swapFootprints(const std::string& a, const std::string& b) {
  auto ia = _devices.find(a);
  auto ib = _devices.find(b);
  if (ia == _devices.end() || ib == _devices.end() || !ia->second.assigned ||
      !ib->second.assigned) {
    return false;
  }
  const model::Footprint tmp = ia->second.footprint;
  ia->second.footprint = ib->second.footprint;
  ib->second.footprint = tmp;
  SHELFSYNC_LOG_INFO(kTag, "footprints of %s and %s swapped", a.c_str(), b.c_str());
  return true;
}

bool MemoryGateway::placeItem(const Position& position, const StockItem& item) {
  if (!validPosition(position) || item.name.size() > model::kMaxNameLength ||
      item.stock > model::kMaxCount) {
    return false;
  }
  _items[position] = item;
  return true;
}

bool MemoryGateway::removeItem(const Position& position) {
  return _items.erase(position) > 0;
}

int MemoryGateway::stockAt(const Position& position) const {
  auto it = _items.find(position);
  return it == _items.end() ? -1 : static_cast<int>(it->second.stock);
}

uint32_t MemoryGateway::lastSequence(const std::string& device) const {
  auto it = _devices.find(device);
  return it == _devices.end() ? 0 : it->second.last_sequence;
}

uint8_t MemoryGateway::batteryPercent(const std::string& device) const {
  auto it = _devices.find(device);
  return it == _devices.end() ? model::kBatteryUnknown : it->second.battery;
}

bool MemoryGateway::knows(const std::string& device) const {
  return _devices.find(device) != _devices.end();
}

void MemoryGateway::apply(const std::string& device, uint32_t sequence,
                          const Position& position, uint32_t item_id,
                          uint16_t count) {
  DeviceEntry& entry = _devices[device];
  entry.last_sequence = sequence;
  // The item may have been moved since the entry was journaled.
  auto it = _items.find(position);
  if (it != _items.end() && it->second.id == item_id) {
    it->second.stock = count;
  }
  ++_applied;
}

// --- BackendGateway ---

SubmitResult MemoryGateway::submitStockUpdate(const model::StockDelta& delta) {
  if (!_available) {
    return SubmitResult::UNAVAILABLE;
  }
  const std::string device(delta.device.c_str());
  auto it = _devices.find(device);
  if (it == _devices.end() || !it->second.assigned) {
    return SubmitResult::REJECTED;
  }
  DeviceEntry& entry = it->second;
  if (delta.battery <= 100U) {
    entry.battery = delta.battery;
  }
  if (delta.sequence <= entry.last_sequence) {
    return SubmitResult::DUPLICATE;
  }
  // A count taken under an older footprint must not land on whatever now
  // occupies the same level and column.
  if (delta.row != entry.footprint.row || !entry.footprint.contains(delta.slot)) {
    return SubmitResult::REJECTED;
  }
  Position position;
  position.row = delta.row;
  position.level = delta.slot.level;
  position.column = delta.slot.column;
  auto item = _items.find(position);
  if (item == _items.end() || item->second.id != delta.item_id ||
      delta.count > model::kMaxCount) {
    return SubmitResult::REJECTED;
  }
  if (!appendJournal(delta)) {
    return SubmitResult::UNAVAILABLE;
  }
  apply(device, delta.sequence, position, delta.item_id, delta.count);
  return SubmitResult::ACCEPTED;
}

etl::expected<model::ConfigSnapshot, UpstreamError> MemoryGateway::fetchConfig(
    const std::string& device) {
  if (!_available) {
    return etl::unexpected<UpstreamError>(UpstreamError::UNAVAILABLE);
  }
  auto it = _devices.find(device);
  if (it == _devices.end()) {
    return etl::unexpected<UpstreamError>(UpstreamError::UNKNOWN_DEVICE);
  }
  if (!it->second.assigned) {
    return etl::unexpected<UpstreamError>(UpstreamError::UNASSIGNED);
  }

  model::ConfigSnapshot snapshot;
  snapshot.footprint = it->second.footprint;
  snapshot.firmware = _firmware;
  snapshot.last_sequence = it->second.last_sequence;
  for (size_t i = 0; i < snapshot.footprint.slotCount(); ++i) {
    const model::Slot slot = snapshot.footprint.slotAt(i);
    Position position;
    position.row = snapshot.footprint.row;
    position.level = slot.level;
    position.column = slot.column;
    auto item = _items.find(position);
    if (item == _items.end()) {
      continue;
    }
    model::Item out;
    out.id = item->second.id;
    out.slot = slot;
    out.min_stock = item->second.min_stock;
    out.stock = item->second.stock;
    out.name.assign(item->second.name.c_str());
    snapshot.items.push_back(out);
  }
  return snapshot;
}

bool MemoryGateway::registerDevice(const std::string& device) {
  if (!_available || device.size() > model::kMaxDeviceIdLength) {
    return false;
  }
  if (_devices.find(device) == _devices.end()) {
    _devices[device] = DeviceEntry();
    SHELFSYNC_LOG_INFO(kTag, "registered %s (no footprint yet)", device.c_str());
  }
  return true;
}

}  // namespace host
}  // namespace shelfsync
