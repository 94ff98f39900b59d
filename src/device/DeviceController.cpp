/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "DeviceController.h"

#include "etl/span.h"

#include "util/Log.h"

namespace shelfsync {
namespace device {

namespace {

const char kTag[] = "device";

// Larger tick deltas are split so that events raised by one timer are
// handled before the next one fires.
constexpr uint32_t kMaxTickStepMs = 1000UL;
constexpr uint8_t kMaxFirmwareRetries = 3;

}  // namespace

template <typename TMessage>
bool DeviceController::send(const TMessage& msg) {
  const size_t len = protocol::message::encodeFrame(
      msg, etl::span<uint8_t>(_tx_buffer, sizeof(_tx_buffer)));
  if (len == 0) {
    SHELFSYNC_LOG_ERROR(kTag, "cannot encode %s",
                        protocol::message::name(static_cast<uint16_t>(TMessage::ID)));
    return false;
  }
  if (_link.write(_tx_buffer, len) != len) {
    SHELFSYNC_LOG_WARN(kTag, "short write of %s",
                       protocol::message::name(static_cast<uint16_t>(TMessage::ID)));
    return false;
  }
  return true;
}

DeviceController::DeviceController(const DeviceHardware& hardware)
    : _link(hardware.link),
      _display(hardware.display),
      _firmware(hardware.firmware),
      _platform(hardware.platform),
      _queue(hardware.storage),
      _cache(hardware.storage),
      _updater(hardware.firmware),
      _fsm(*this),
      _router(),
      _stream(),
      _rx_frame(),
      _timers(),
      _last_tick_ms(0),
      _events(),
      _dropped_events(0),
      _reported_drops(0),
      _last_tap_ms(0),
      _has_last_tap(false),
      _linked(false),
      _advertising(false),
      _awaiting_ack(false),
      _inflight_sequence(0),
      _sync_blocked(false),
      _sleep_deferred(false),
      _config_deferred(false),
      _config_request_due(false),
      _footprint_stale(false),
      _offered_firmware(),
      _heartbeat_version(0),
      _config_seen(false),
      _firmware_checked(false),
      _firmware_waiting(false),
      _firmware_retries(0) {}

void DeviceController::begin() {
  _timers.clear();

  // Register timers in strict order to match DeviceTimerId
  _cb_debounce = etl::delegate<void()>::create<DeviceController, &DeviceController::onDebounceTimer>(*this);
  _timers.register_timer(_cb_debounce, SHELFSYNC_DEBOUNCE_MS, false);

  _cb_inactivity = etl::delegate<void()>::create<DeviceController, &DeviceController::onInactivityTimer>(*this);
  _timers.register_timer(_cb_inactivity, SHELFSYNC_INACTIVITY_MS, false);

  _cb_ack = etl::delegate<void()>::create<DeviceController, &DeviceController::onAckTimer>(*this);
  _timers.register_timer(_cb_ack, SHELFSYNC_ACK_TIMEOUT_MS, false);

  _cb_connect = etl::delegate<void()>::create<DeviceController, &DeviceController::onConnectTimer>(*this);
  _timers.register_timer(_cb_connect, SHELFSYNC_CONNECT_TIMEOUT_MS, false);

  _cb_firmware = etl::delegate<void()>::create<DeviceController, &DeviceController::onFirmwareTimer>(*this);
  _timers.register_timer(_cb_firmware, SHELFSYNC_FIRMWARE_CHUNK_TIMEOUT_MS, false);

  _timers.enable(true);

  if (!_queue.load()) {
    SHELFSYNC_LOG_WARN(kTag, "pending queue record lost");
  }
  if (!_cache.load()) {
    SHELFSYNC_LOG_INFO(kTag, "no stored configuration");
  }
  _cache.overlay(_queue);

  _router.setHandler(this);
  _fsm.begin();
  _last_tick_ms = _platform.millis();

  post(EventKind::WAKE);
}

// --- Event queue ---

void DeviceController::onWakeInterrupt() { post(EventKind::WAKE); }

void DeviceController::onTap(const model::Slot& slot, int8_t step) {
  Event event;
  event.kind = EventKind::TAP;
  event.slot = slot;
  event.step = step < 0 ? -1 : 1;
  event.at_ms = _platform.millis();
  post(event);
}

void DeviceController::post(EventKind kind) {
  Event event;
  event.kind = kind;
  event.slot.level = 0;
  event.slot.column = 0;
  event.step = 0;
  event.at_ms = 0;
  post(event);
}

void DeviceController::post(const Event& event) {
  SHELFSYNC_ATOMIC_BLOCK {
    if (_events.full()) {
      _dropped_events = _dropped_events + 1;
    } else {
      _events.push(event);
    }
  }
}

bool DeviceController::take(Event& event) {
  bool found = false;
  SHELFSYNC_ATOMIC_BLOCK {
    if (!_events.empty()) {
      event = _events.front();
      _events.pop();
      found = true;
    }
  }
  return found;
}

void DeviceController::processEvents() {
  Event event;
  while (take(event)) {
    dispatch(event);
  }
  if (_dropped_events != _reported_drops) {
    SHELFSYNC_LOG_WARN(kTag, "event queue overflow, %lu dropped",
                       static_cast<unsigned long>(_dropped_events - _reported_drops));
    _reported_drops = _dropped_events;
  }
}

void DeviceController::dispatch(const Event& event) {
  const etl::fsm_state_id_t before = _fsm.get_state_id();

  switch (event.kind) {
    case EventKind::WAKE:
      _fsm.wake();
      break;

    case EventKind::TAP:
      if (_has_last_tap &&
          static_cast<uint32_t>(event.at_ms - _last_tap_ms) < SHELFSYNC_TAP_RATE_LIMIT_MS) {
        break;
      }
      _has_last_tap = true;
      _last_tap_ms = event.at_ms;
      _fsm.tap(event.slot, event.step);
      break;

    case EventKind::DEBOUNCE_EXPIRED:
      _fsm.debounceExpired();
      break;

    case EventKind::INACTIVITY_EXPIRED:
      _fsm.inactivityExpired();
      break;

    case EventKind::ACK_TIMEOUT:
      if (_awaiting_ack) {
        SHELFSYNC_LOG_WARN(kTag, "no ack for seq %lu, holding queue",
                           static_cast<unsigned long>(_inflight_sequence));
        _sync_blocked = true;
        finishInflight();
      }
      break;

    case EventKind::CONNECT_TIMEOUT:
      if (!_linked && _fsm.isAwake()) {
        SHELFSYNC_LOG_WARN(kTag, "no bridge within %lu ms, radio off",
                           static_cast<unsigned long>(SHELFSYNC_CONNECT_TIMEOUT_MS));
        _link.stopAdvertising();
        _advertising = false;
      }
      break;

    case EventKind::FIRMWARE_TIMEOUT:
      if (_firmware_waiting) {
        if (++_firmware_retries > kMaxFirmwareRetries) {
          SHELFSYNC_LOG_WARN(kTag, "firmware download stalled");
          _updater.abort();
          _firmware_waiting = false;
        } else {
          requestFirmwareChunk();
        }
      }
      break;
  }

  const etl::fsm_state_id_t after = _fsm.get_state_id();
  if (after != before) {
    SHELFSYNC_LOG_INFO(kTag, "%s -> %s", fsm::stateName(before),
                       fsm::stateName(after));
  }
}

// --- Main loop ---

void DeviceController::poll(uint32_t now_ms) {
  processEvents();

  uint32_t delta = now_ms - _last_tick_ms;
  _last_tick_ms = now_ms;
  while (delta > 0U) {
    const uint32_t step = delta > kMaxTickStepMs ? kMaxTickStepMs : delta;
    _timers.tick(step);
    delta -= step;
    processEvents();
  }

  if (_fsm.isSleeping()) {
    return;
  }
  serviceLink();
  processEvents();
  pumpOutbound();
}

// --- fsm::DeviceActions ---

void DeviceController::enterSleep() {
  for (uint8_t id = 0; id < scheduler::NUMBER_OF_DEVICE_TIMERS; ++id) {
    _timers.stop(id);
  }
  if (_firmware_waiting) {
    _updater.abort();
    _firmware_waiting = false;
  }
  _link.stopAdvertising();
  _advertising = false;
  _linked = false;
  _sleep_deferred = false;
  _stream.reset();
  _display.sleep();
  SHELFSYNC_LOG_INFO(kTag, "sleeping with %u pending",
                     static_cast<unsigned>(_queue.size()));
  _platform.deepSleep();
}

void DeviceController::enterWake() {
  _firmware_checked = false;
  _firmware_retries = 0;
  _sync_blocked = false;
  _display.renderGrid(_cache);
  _timers.start(scheduler::TIMER_INACTIVITY, false);
  // The bridge may connect at any time while awake to push configuration.
  _link.startAdvertising();
  _advertising = true;
}

bool DeviceController::hasPending() { return !_queue.empty(); }

void DeviceController::applyTap(const model::Slot& slot, int8_t step) {
  _timers.start(scheduler::TIMER_DEBOUNCE, false);
  _timers.start(scheduler::TIMER_INACTIVITY, false);
  // The user is back: a sleep waiting on an ack is cancelled.
  _sleep_deferred = false;

  uint16_t count = 0;
  if (!_cache.adjust(slot, step, count)) {
    SHELFSYNC_LOG_DEBUG(kTag, "tap on empty slot E%u-K%u",
                        static_cast<unsigned>(slot.level),
                        static_cast<unsigned>(slot.column));
    return;
  }
  const model::Item& item = _cache.item(_cache.indexOf(slot));
  _display.renderCount(slot, count, count < item.min_stock);
}

void DeviceController::flushChanges() {
  bool failed = false;
  for (size_t i = 0; i < _cache.itemCount(); ++i) {
    if (!_cache.isDirty(i)) {
      continue;
    }
    const model::Item& item = _cache.item(i);
    const etl::expected<model::StockChange, StorageError> result =
        _queue.append(_cache.footprint().row, item, _cache.count(i),
                      _platform.epochSeconds());
    if (!result.has_value()) {
      SHELFSYNC_LOG_WARN(kTag, "cannot record %s: %s",
                         model::locationCode(_cache.footprint().row, item.slot).c_str(),
                         toString(result.error()));
      failed = true;
      continue;
    }
    _cache.commit(i);
    SHELFSYNC_LOG_INFO(kTag, "recorded %s = %u (seq %lu)",
                       model::locationCode(_cache.footprint().row, item.slot).c_str(),
                       static_cast<unsigned>(result.value().count),
                       static_cast<unsigned long>(result.value().sequence));
  }
  if (failed) {
    _timers.start(scheduler::TIMER_DEBOUNCE, false);
    return;
  }
  resumeDeferredSleep();
}

void DeviceController::beginSync() {
  if (_linked) {
    return;
  }
  if (!_advertising) {
    _link.startAdvertising();
    _advertising = true;
  }
  _timers.start(scheduler::TIMER_CONNECT_TIMEOUT, false);
}

bool DeviceController::readyToSleep() {
  _sleep_deferred = false;
  if (_cache.hasDirty()) {
    // Counts still inside the debounce window are recorded before sleeping.
    flushChanges();
  }
  if (_awaiting_ack || _cache.hasDirty()) {
    _sleep_deferred = true;
    return false;
  }
  return true;
}

void DeviceController::resumeDeferredSleep() {
  if (_sleep_deferred && !_awaiting_ack && !_cache.hasDirty()) {
    _sleep_deferred = false;
    post(EventKind::INACTIVITY_EXPIRED);
  }
}

// --- Link ---

void DeviceController::serviceLink() {
  const bool up = _link.connected();
  if (up && !_linked) {
    onLinkUp();
  } else if (!up && _linked) {
    onLinkDown();
  }
  if (!_linked) {
    return;
  }

  while (_link.available() > 0) {
    const int byte = _link.read();
    if (byte < 0) {
      break;
    }
    const protocol::FrameStream::Result result =
        _stream.consume(static_cast<uint8_t>(byte), _rx_frame);
    if (result == protocol::FrameStream::Result::FRAME_READY) {
      _router.route(_rx_frame);
    } else if (result == protocol::FrameStream::Result::ERROR) {
      SHELFSYNC_LOG_DEBUG(kTag, "dropped frame: %s",
                          protocol::toString(_stream.lastError()));
    }
  }
}

void DeviceController::onLinkUp() {
  _linked = true;
  _sync_blocked = false;
  _stream.reset();
  _timers.stop(scheduler::TIMER_CONNECT_TIMEOUT);
  SHELFSYNC_LOG_INFO(kTag, "bridge connected, %u pending",
                     static_cast<unsigned>(_queue.size()));
  if (!_queue.sequenceConfirmed()) {
    _config_request_due = true;
  }

  protocol::Heartbeat hello;
  hello.firmware_version = _firmware.runningVersion();
  hello.battery = _platform.batteryPercent();
  send(hello);
}

void DeviceController::onLinkDown() {
  _linked = false;
  _stream.reset();
  if (_awaiting_ack) {
    // The entry stays queued and is resent on the next connection.
    finishInflight();
  }
  if (_firmware_waiting) {
    _timers.stop(scheduler::TIMER_FIRMWARE_TIMEOUT);
    _updater.abort();
    _firmware_waiting = false;
  }
  SHELFSYNC_LOG_INFO(kTag, "bridge disconnected, %u pending",
                     static_cast<unsigned>(_queue.size()));
}

void DeviceController::pumpOutbound() {
  if (!_linked || _awaiting_ack || _firmware_waiting) {
    return;
  }
  // Numbering lost with a corrupt record waits for the backend's floor.
  if (!_queue.empty() && !_sync_blocked && _queue.sequenceConfirmed()) {
    sendFront();
    return;
  }
  if (_config_request_due) {
    protocol::ConfigRequest request;
    if (send(request)) {
      _config_request_due = false;
    }
    return;
  }
  if (_queue.empty()) {
    maybeStartFirmware();
  }
}

void DeviceController::sendFront() {
  protocol::StockUpdate update;
  update.change = _queue.front();
  update.battery = _platform.batteryPercent();
  if (!send(update)) {
    return;
  }
  _awaiting_ack = true;
  _inflight_sequence = update.change.sequence;
  _timers.start(scheduler::TIMER_ACK_TIMEOUT, false);
  SHELFSYNC_LOG_DEBUG(kTag, "sent seq %lu",
                      static_cast<unsigned long>(_inflight_sequence));
}

void DeviceController::finishInflight() {
  _timers.stop(scheduler::TIMER_ACK_TIMEOUT);
  _awaiting_ack = false;
  resumeDeferredSleep();
}

void DeviceController::maybeStartFirmware() {
  if (_firmware_checked || !_config_seen) {
    return;
  }
  if (_heartbeat_version > _offered_firmware.version) {
    // Heard of a newer image than the last snapshot describes.
    _config_request_due = true;
    _config_seen = false;
    return;
  }
  _firmware_checked = true;
  if (!_updater.isUpdate(_offered_firmware)) {
    return;
  }
  if (!_updater.start(_offered_firmware)) {
    SHELFSYNC_LOG_WARN(kTag, "firmware update not started: %s",
                       toString(_updater.lastError()));
    return;
  }
  _firmware_retries = 0;
  requestFirmwareChunk();
}

void DeviceController::requestFirmwareChunk() {
  const protocol::FirmwareRequest request = _updater.nextRequest();
  _firmware_waiting = send(request);
  if (_firmware_waiting) {
    _timers.start(scheduler::TIMER_FIRMWARE_TIMEOUT, false);
  }
}

// --- router::IMessageHandler ---

void DeviceController::onHeartbeat(const protocol::Heartbeat& msg) {
  if (msg.firmware_version > _heartbeat_version) {
    _heartbeat_version = msg.firmware_version;
  }
  protocol::Heartbeat reply;
  reply.firmware_version = _firmware.runningVersion();
  reply.battery = _platform.batteryPercent();
  send(reply);
}

void DeviceController::onConfigPush(const protocol::ConfigPush& msg) {
  const model::ConfigSnapshot& snapshot = msg.snapshot;

  // Any snapshot answers an outstanding ConfigRequest.
  _config_request_due = false;
  if (!_queue.advanceSequence(snapshot.last_sequence)) {
    SHELFSYNC_LOG_WARN(kTag, "config rejected: bad sequence floor");
    return;
  }
  _offered_firmware = snapshot.firmware;
  _config_seen = true;

  if (!snapshot.valid()) {
    SHELFSYNC_LOG_WARN(kTag, "config rejected: items outside footprint");
    return;
  }

  if (_cache.hasDirty() || (!_queue.empty() && !_footprint_stale)) {
    // Local changes first; fetched again once the queue drains.
    _config_deferred = true;
    SHELFSYNC_LOG_DEBUG(kTag, "config deferred, %u pending",
                        static_cast<unsigned>(_queue.size()));
    return;
  }

  if (_footprint_stale) {
    _queue.purgeUnmapped(snapshot);
    _footprint_stale = false;
    _sync_blocked = false;
  }

  if (!_cache.apply(snapshot)) {
    return;
  }
  _cache.overlay(_queue);
  _config_deferred = false;
  _display.renderGrid(_cache);
  SHELFSYNC_LOG_INFO(kTag, "config applied: R%u, %u items",
                     static_cast<unsigned>(snapshot.footprint.row),
                     static_cast<unsigned>(snapshot.items.size()));
}

void DeviceController::onAck(const protocol::Ack& msg) {
  // A late ack after a timeout is still a durable acceptance.
  if (!_queue.acknowledge(msg.sequence)) {
    SHELFSYNC_LOG_DEBUG(kTag, "stale ack %lu",
                        static_cast<unsigned long>(msg.sequence));
    return;
  }
  if (_awaiting_ack && msg.sequence == _inflight_sequence) {
    finishInflight();
  }
  if (_queue.empty() && _config_deferred) {
    _config_deferred = false;
    _config_request_due = true;
  }
}

void DeviceController::onNack(const protocol::Nack& msg) {
  if (!_awaiting_ack || msg.sequence != _inflight_sequence) {
    return;
  }
  SHELFSYNC_LOG_WARN(kTag, "seq %lu refused: %s",
                     static_cast<unsigned long>(msg.sequence),
                     protocol::message::toString(msg.reason));
  switch (msg.reason) {
    case protocol::NackReason::MALFORMED:
      // Never accepted however often it is sent; the backend's counts
      // come back with the next snapshot.
      if (_queue.acknowledge(msg.sequence)) {
        _config_request_due = true;
      }
      break;
    case protocol::NackReason::SLOT_OUTSIDE_FOOTPRINT:
      _sync_blocked = true;
      _footprint_stale = true;
      _config_request_due = true;
      break;
    case protocol::NackReason::UPSTREAM_UNAVAILABLE:
      _sync_blocked = true;
      break;
  }
  finishInflight();
}

void DeviceController::onFirmwareChunk(const protocol::FirmwareChunk& msg) {
  const FirmwareUpdater::Progress progress = _updater.onChunk(msg);
  switch (progress) {
    case FirmwareUpdater::Progress::IGNORED:
      break;
    case FirmwareUpdater::Progress::IN_PROGRESS:
      _firmware_retries = 0;
      requestFirmwareChunk();
      break;
    case FirmwareUpdater::Progress::COMPLETE:
    case FirmwareUpdater::Progress::FAILED:
      _timers.stop(scheduler::TIMER_FIRMWARE_TIMEOUT);
      _firmware_waiting = false;
      break;
  }
}

void DeviceController::onUnexpected(protocol::MessageId id) {
  SHELFSYNC_LOG_DEBUG(kTag, "ignoring %s",
                      protocol::message::name(static_cast<uint16_t>(id)));
}

void DeviceController::onMalformed(uint16_t message_id, protocol::FrameError error) {
  SHELFSYNC_LOG_DEBUG(kTag, "bad %s payload: %s",
                      protocol::message::name(message_id),
                      protocol::toString(error));
}

}  // namespace device
}  // namespace shelfsync
