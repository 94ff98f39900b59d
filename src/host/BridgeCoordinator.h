/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_BRIDGE_COORDINATOR_H
#define SHELFSYNC_BRIDGE_COORDINATOR_H

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <memory>
#include <string>

#include "etl_profile.h"
#include "etl/callback_timer.h"
#include "etl/delegate.h"

#include "config/shelfsync_config.h"
#include "host/BackendGateway.h"
#include "host/FirmwareSource.h"
#include "host/HostLink.h"
#include "host/Scanner.h"
#include "host/SessionManager.h"

namespace shelfsync {

namespace scheduler {

enum CoordinatorTimerId : uint8_t {
  TIMER_SCAN = 0,
  TIMER_CONFIG_POLL = 1,
  NUMBER_OF_COORDINATOR_TIMERS = 2
};

using CoordinatorTimerService = etl::callback_timer<NUMBER_OF_COORDINATOR_TIMERS>;

}  // namespace scheduler

namespace host {

/**
 * @brief Registry of known shelf displays and their sessions.
 *
 * Scans for devices, registers new ones upstream, keeps one SessionManager
 * per registered device and turns session output into backend calls.
 * Everything runs from poll(); one loop drives all sessions.
 */
class BridgeCoordinator : public SessionListener {
 public:
  BridgeCoordinator(Scanner& scanner, LinkFactory& links, BackendGateway& backend);
  ~BridgeCoordinator() override;

  // Optional image offered to devices whose configuration names its version.
  void setFirmwareImage(const FirmwareImage* image) { _firmware = image; }

  // Scans immediately and starts the periodic timers.
  void begin(uint32_t now_ms);
  void poll(uint32_t now_ms);
  // Tears down every session. poll() does nothing afterwards.
  void shutdown();

  // Pushes fresh configuration to the device if it changed upstream.
  bool notifyConfigChanged(const std::string& device);

  size_t deviceCount() const { return _devices.size(); }
  size_t connectedCount() const;
  SessionManager* session(const std::string& device);
  bool running() const { return _running; }

  // SessionListener
  SubmitResult onStockUpdate(const model::StockDelta& delta) override;
  etl::expected<model::ConfigSnapshot, UpstreamError> configFor(
      const std::string& device) override;
  const FirmwareImage* firmwareImage() override { return _firmware; }

 private:
  struct DeviceRecord {
    std::unique_ptr<SessionManager> session;
    uint32_t last_seen_ms;
  };

  BridgeCoordinator(const BridgeCoordinator&) = delete;
  BridgeCoordinator& operator=(const BridgeCoordinator&) = delete;

  void scan();
  void pollConfig();
  void removeStale();

  void onScanTimer() { _scan_due = true; }
  void onConfigPollTimer() { _config_poll_due = true; }

  Scanner& _scanner;
  LinkFactory& _links;
  BackendGateway& _backend;
  const FirmwareImage* _firmware;

  std::map<std::string, DeviceRecord> _devices;

  scheduler::CoordinatorTimerService _timers;
  etl::delegate<void()> _cb_scan;
  etl::delegate<void()> _cb_config_poll;
  uint32_t _now_ms;
  uint32_t _last_tick_ms;
  bool _scan_due;
  bool _config_poll_due;
  bool _running;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_BRIDGE_COORDINATOR_H
