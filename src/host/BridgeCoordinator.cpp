/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "BridgeCoordinator.h"

#include <memory>
#include <vector>

#include "util/Log.h"

namespace shelfsync {
namespace host {

namespace {

const char kTag[] = "bridge";
constexpr uint32_t kMaxTickStepMs = 1000UL;

}  // namespace

BridgeCoordinator::BridgeCoordinator(Scanner& scanner, LinkFactory& links,
                                     BackendGateway& backend)
    : _scanner(scanner),
      _links(links),
      _backend(backend),
      _firmware(nullptr),
      _devices(),
      _timers(),
      _now_ms(0),
      _last_tick_ms(0),
      _scan_due(false),
      _config_poll_due(false),
      _running(false) {}

BridgeCoordinator::~BridgeCoordinator() { shutdown(); }

void BridgeCoordinator::begin(uint32_t now_ms) {
  _timers.clear();

  // Register timers in strict order to match CoordinatorTimerId
  _cb_scan = etl::delegate<void()>::create<BridgeCoordinator, &BridgeCoordinator::onScanTimer>(*this);
  _timers.register_timer(_cb_scan, SHELFSYNC_SCAN_INTERVAL_MS, true);

  _cb_config_poll = etl::delegate<void()>::create<BridgeCoordinator, &BridgeCoordinator::onConfigPollTimer>(*this);
  _timers.register_timer(_cb_config_poll, SHELFSYNC_CONFIG_POLL_INTERVAL_MS, true);

  _timers.enable(true);
  _timers.start(scheduler::TIMER_SCAN, false);
  _timers.start(scheduler::TIMER_CONFIG_POLL, false);

  _now_ms = now_ms;
  _last_tick_ms = now_ms;
  _running = true;
  SHELFSYNC_LOG_INFO(kTag, "bridge started, scanning for %s devices",
                     SHELFSYNC_SERVICE_NAME);
  scan();
}

void BridgeCoordinator::poll(uint32_t now_ms) {
  if (!_running) {
    return;
  }
  _now_ms = now_ms;

  uint32_t delta = now_ms - _last_tick_ms;
  _last_tick_ms = now_ms;
  while (delta > 0U) {
    const uint32_t step = delta > kMaxTickStepMs ? kMaxTickStepMs : delta;
    _timers.tick(step);
    delta -= step;
  }

  if (_scan_due) {
    _scan_due = false;
    scan();
  }
  if (_config_poll_due) {
    _config_poll_due = false;
    pollConfig();
  }

  for (auto& entry : _devices) {
    entry.second.session->poll(now_ms);
  }
}

void BridgeCoordinator::shutdown() {
  if (!_running && _devices.empty()) {
    return;
  }
  _running = false;
  for (uint8_t id = 0; id < scheduler::NUMBER_OF_COORDINATOR_TIMERS; ++id) {
    _timers.stop(id);
  }
  const size_t count = _devices.size();
  // Session destructors stop their timers and close their links.
  _devices.clear();
  SHELFSYNC_LOG_INFO(kTag, "shut down, %zu sessions closed", count);
}

// --- Discovery ---

void BridgeCoordinator::scan() {
  const std::vector<Advertisement> found = _scanner.scan();
  const std::string prefix(SHELFSYNC_SERVICE_NAME);

  for (const Advertisement& ad : found) {
    if (ad.address.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    auto it = _devices.find(ad.address);
    if (it != _devices.end()) {
      it->second.last_seen_ms = _now_ms;
      it->second.session->onAdvertised(ad);
      continue;
    }

    // Registration is retried on the next scan if the backend is down.
    if (!_backend.registerDevice(ad.address)) {
      SHELFSYNC_LOG_WARN(kTag, "cannot register %s", ad.address.c_str());
      continue;
    }
    SHELFSYNC_LOG_INFO(kTag, "found new device %s (%s)", ad.address.c_str(),
                       ad.path.c_str());
    DeviceRecord record;
    record.session = std::make_unique<SessionManager>(ad, _links.create(ad), *this);
    record.last_seen_ms = _now_ms;
    record.session->begin(_now_ms);
    record.session->onAdvertised(ad);
    _devices[ad.address] = std::move(record);
  }

  removeStale();

  const size_t connected = connectedCount();
  if (connected > 0) {
    SHELFSYNC_LOG_INFO(kTag, "active connections: %zu of %zu", connected,
                       _devices.size());
  } else {
    SHELFSYNC_LOG_DEBUG(kTag, "no devices connected, scanning");
  }
}

void BridgeCoordinator::removeStale() {
  auto it = _devices.begin();
  while (it != _devices.end()) {
    const bool stale = static_cast<uint32_t>(_now_ms - it->second.last_seen_ms) >=
                       SHELFSYNC_STALE_DEVICE_MS;
    if (stale && !it->second.session->connected()) {
      SHELFSYNC_LOG_INFO(kTag, "forgetting %s", it->first.c_str());
      it = _devices.erase(it);
    } else {
      ++it;
    }
  }
}

void BridgeCoordinator::pollConfig() {
  for (auto& entry : _devices) {
    if (entry.second.session->connected()) {
      entry.second.session->notifyConfigChanged();
    }
  }
}

bool BridgeCoordinator::notifyConfigChanged(const std::string& device) {
  SessionManager* s = session(device);
  return s != nullptr && s->notifyConfigChanged();
}

size_t BridgeCoordinator::connectedCount() const {
  size_t connected = 0;
  for (const auto& entry : _devices) {
    if (entry.second.session->connected()) {
      ++connected;
    }
  }
  return connected;
}

SessionManager* BridgeCoordinator::session(const std::string& device) {
  auto it = _devices.find(device);
  return it == _devices.end() ? nullptr : it->second.session.get();
}

// --- SessionListener ---

SubmitResult BridgeCoordinator::onStockUpdate(const model::StockDelta& delta) {
  const SubmitResult result = _backend.submitStockUpdate(delta);
  if (result == SubmitResult::UNAVAILABLE || result == SubmitResult::REJECTED) {
    SHELFSYNC_LOG_WARN(kTag, "%s seq %lu not applied: %s", delta.device.c_str(),
                       static_cast<unsigned long>(delta.sequence), toString(result));
  }
  return result;
}

etl::expected<model::ConfigSnapshot, UpstreamError> BridgeCoordinator::configFor(
    const std::string& device) {
  etl::expected<model::ConfigSnapshot, UpstreamError> config =
      _backend.fetchConfig(device);
  if (config.has_value() && _firmware != nullptr &&
      config.value().firmware.version == _firmware->info().version) {
    // The backend names the version; the image on disk supplies the rest.
    config.value().firmware = _firmware->info();
  }
  return config;
}

}  // namespace host
}  // namespace shelfsync
