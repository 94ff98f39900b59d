/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_DEVICE_CONTROLLER_H
#define SHELFSYNC_DEVICE_CONTROLLER_H

#include <stddef.h>
#include <stdint.h>

#include "etl_profile.h"
#include "etl/delegate.h"
#include "etl/queue.h"

#include "config/shelfsync_config.h"
#include "device/DeviceHal.h"
#include "device/FirmwareUpdater.h"
#include "device/InventoryCache.h"
#include "device/PendingQueue.h"
#include "fsm/device_fsm.h"
#include "model/inventory.h"
#include "protocol/frame.h"
#include "protocol/messages.h"
#include "router/message_router.h"

namespace shelfsync {
namespace device {

struct DeviceHardware {
  Storage& storage;
  RadioLink& link;
  Display& display;
  FirmwareStore& firmware;
  Platform& platform;
};

/**
 * @brief Firmware core of a shelf display.
 *
 * Interrupt handlers call onWakeInterrupt() and onTap(); both only enqueue.
 * Everything else runs from poll() in the main loop: queued events are fed
 * to the state machine, timers are ticked, the link is read and at most one
 * outbound request is kept in flight.
 */
class DeviceController : public fsm::DeviceActions,
                         public router::IMessageHandler {
 public:
  static constexpr size_t EVENT_QUEUE_CAPACITY = SHELFSYNC_EVENT_QUEUE_CAPACITY;

  explicit DeviceController(const DeviceHardware& hardware);

  // Restores persisted state and wakes the device (boot is a wake).
  void begin();

  // ISR-safe.
  void onWakeInterrupt();
  void onTap(const model::Slot& slot, int8_t step);

  void poll(uint32_t now_ms);

  etl::fsm_state_id_t state() const { return _fsm.get_state_id(); }
  size_t pendingCount() const { return _queue.size(); }
  const model::ConfigSnapshot& snapshot() const { return _cache.snapshot(); }
  const InventoryCache& cache() const { return _cache; }
  const PendingQueue& pendingQueue() const { return _queue; }
  const FirmwareUpdater& firmwareUpdater() const { return _updater; }

  bool linked() const { return _linked; }
  bool awaitingAck() const { return _awaiting_ack; }
  bool syncBlocked() const { return _sync_blocked; }
  uint32_t droppedEvents() const { return _dropped_events; }

  // fsm::DeviceActions
  void enterSleep() override;
  void enterWake() override;
  bool hasPending() override;
  void applyTap(const model::Slot& slot, int8_t step) override;
  void flushChanges() override;
  void beginSync() override;
  bool readyToSleep() override;

  // router::IMessageHandler
  void onHeartbeat(const protocol::Heartbeat& msg) override;
  void onConfigPush(const protocol::ConfigPush& msg) override;
  void onAck(const protocol::Ack& msg) override;
  void onNack(const protocol::Nack& msg) override;
  void onFirmwareChunk(const protocol::FirmwareChunk& msg) override;
  void onUnexpected(protocol::MessageId id) override;
  void onMalformed(uint16_t message_id, protocol::FrameError error) override;

 private:
  enum class EventKind : uint8_t {
    WAKE = 0,
    TAP,
    DEBOUNCE_EXPIRED,
    INACTIVITY_EXPIRED,
    ACK_TIMEOUT,
    CONNECT_TIMEOUT,
    FIRMWARE_TIMEOUT
  };

  struct Event {
    EventKind kind;
    model::Slot slot;
    int8_t step;
    uint32_t at_ms;
  };

  void post(EventKind kind);
  void post(const Event& event);
  bool take(Event& event);
  void processEvents();
  void dispatch(const Event& event);

  void serviceLink();
  void onLinkUp();
  void onLinkDown();
  void pumpOutbound();
  void sendFront();
  void maybeStartFirmware();
  void requestFirmwareChunk();
  void finishInflight();
  void resumeDeferredSleep();

  template <typename TMessage>
  bool send(const TMessage& msg);

  // Timer callbacks only enqueue.
  void onDebounceTimer() { post(EventKind::DEBOUNCE_EXPIRED); }
  void onInactivityTimer() { post(EventKind::INACTIVITY_EXPIRED); }
  void onAckTimer() { post(EventKind::ACK_TIMEOUT); }
  void onConnectTimer() { post(EventKind::CONNECT_TIMEOUT); }
  void onFirmwareTimer() { post(EventKind::FIRMWARE_TIMEOUT); }

  RadioLink& _link;
  Display& _display;
  FirmwareStore& _firmware;
  Platform& _platform;

  PendingQueue _queue;
  InventoryCache _cache;
  FirmwareUpdater _updater;
  fsm::DeviceFsm _fsm;
  router::MessageRouter _router;
  protocol::FrameStream _stream;
  protocol::Frame _rx_frame;
  uint8_t _tx_buffer[protocol::MAX_WIRE_FRAME_SIZE];

  // ETL callback_timer stores references to the delegates.
  scheduler::DeviceTimerService _timers;
  etl::delegate<void()> _cb_debounce;
  etl::delegate<void()> _cb_inactivity;
  etl::delegate<void()> _cb_ack;
  etl::delegate<void()> _cb_connect;
  etl::delegate<void()> _cb_firmware;
  uint32_t _last_tick_ms;

  etl::queue<Event, EVENT_QUEUE_CAPACITY> _events;
  volatile uint32_t _dropped_events;
  uint32_t _reported_drops;

  uint32_t _last_tap_ms;
  bool _has_last_tap;

  bool _linked;
  bool _advertising;
  bool _awaiting_ack;
  uint32_t _inflight_sequence;
  bool _sync_blocked;
  bool _sleep_deferred;
  bool _config_deferred;
  bool _config_request_due;
  bool _footprint_stale;

  model::FirmwareInfo _offered_firmware;
  uint16_t _heartbeat_version;
  bool _config_seen;
  bool _firmware_checked;
  bool _firmware_waiting;
  uint8_t _firmware_retries;
};

}  // namespace device
}  // namespace shelfsync

#endif  // SHELFSYNC_DEVICE_CONTROLLER_H
