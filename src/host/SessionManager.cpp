/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "SessionManager.h"

namespace shelfsync {
namespace host {

namespace {

const char kTag[] = "session";
constexpr uint32_t kMaxTickStepMs = 1000UL;
constexpr size_t kReadChunk = 256;

}  // namespace

SessionManager::SessionManager(const Advertisement& device,
                               std::unique_ptr<HostLink> link,
                               SessionListener& listener)
    : _device(device),
      _device_id(device.address.c_str()),
      _link(std::move(link)),
      _listener(listener),
      _fsm(*this),
      _router(),
      _stream(),
      _rx_frame(),
      _timers(),
      _last_tick_ms(0),
      _events(),
      _backoff_ms(SHELFSYNC_BACKOFF_INITIAL_MS),
      _link_lost_posted(false),
      _has_digest(false),
      _pushed_digest(0),
      _pushed_firmware(0),
      _device_firmware(0),
      _battery(model::kBatteryUnknown),
      _malformed_frames(0),
      _acks_sent(0),
      _nacks_sent(0),
      _config_pushes(0) {}

SessionManager::~SessionManager() {
  for (uint8_t id = 0; id < scheduler::NUMBER_OF_SESSION_TIMERS; ++id) {
    _timers.stop(id);
  }
  _timers.clear();
  if (_link) {
    _link->close();
  }
}

void SessionManager::begin(uint32_t now_ms) {
  _timers.clear();

  // Register timers in strict order to match SessionTimerId
  _cb_retry = etl::delegate<void()>::create<SessionManager, &SessionManager::onRetryTimer>(*this);
  _timers.register_timer(_cb_retry, SHELFSYNC_BACKOFF_INITIAL_MS, false);

  _cb_heartbeat_tx = etl::delegate<void()>::create<SessionManager, &SessionManager::onHeartbeatTxTimer>(*this);
  _timers.register_timer(_cb_heartbeat_tx, SHELFSYNC_HEARTBEAT_INTERVAL_MS, true);

  _cb_heartbeat_rx = etl::delegate<void()>::create<SessionManager, &SessionManager::onHeartbeatRxTimer>(*this);
  _timers.register_timer(_cb_heartbeat_rx, SHELFSYNC_HEARTBEAT_TIMEOUT_MS, false);

  _timers.enable(true);

  _router.setHandler(this);
  _fsm.begin();
  _last_tick_ms = now_ms;
}

// --- Contract ---

void SessionManager::onAdvertised(const Advertisement& device) {
  if (device.path != _device.path) {
    SHELFSYNC_LOG_INFO(kTag, "%s moved to %s", _device.address.c_str(),
                       device.path.c_str());
    _device.path = device.path;
  }
  post(EventKind::ADVERTISED);
}

void SessionManager::onDisconnected() { post(EventKind::LINK_LOST); }

void SessionManager::onReceived(const protocol::Frame& frame) {
  if (!_fsm.isConnected()) {
    return;
  }
  // Any valid frame proves the device is alive.
  _timers.start(scheduler::TIMER_HEARTBEAT_RX, false);
  if (_router.route(frame) != protocol::FrameError::NONE) {
    ++_malformed_frames;
  }
}

bool SessionManager::notifyConfigChanged() {
  if (!_fsm.isConnected()) {
    return false;
  }
  return pushConfig(false);
}

// --- Main loop ---

void SessionManager::poll(uint32_t now_ms) {
  processEvents();

  uint32_t delta = now_ms - _last_tick_ms;
  _last_tick_ms = now_ms;
  while (delta > 0U) {
    const uint32_t step = delta > kMaxTickStepMs ? kMaxTickStepMs : delta;
    _timers.tick(step);
    delta -= step;
    processEvents();
  }

  serviceLink();
  processEvents();
}

void SessionManager::post(EventKind kind) {
  if (kind == EventKind::LINK_LOST) {
    // One loss per connection is enough.
    if (_link_lost_posted) {
      return;
    }
    _link_lost_posted = true;
  }
  if (_events.full()) {
    SHELFSYNC_LOG_WARN(kTag, "%s: event queue full", _device.address.c_str());
    return;
  }
  _events.push(kind);
}

void SessionManager::processEvents() {
  while (!_events.empty()) {
    const EventKind kind = _events.front();
    _events.pop();
    dispatch(kind);
  }
}

void SessionManager::dispatch(EventKind kind) {
  const etl::fsm_state_id_t before = _fsm.get_state_id();

  switch (kind) {
    case EventKind::ADVERTISED:
      _fsm.advertised();
      break;
    case EventKind::RETRY_DUE:
      _fsm.retryDue();
      break;
    case EventKind::LINK_LOST:
      _link_lost_posted = false;
      _fsm.linkLost();
      break;
    case EventKind::HEARTBEAT_DUE:
      if (_fsm.isConnected()) {
        sendHeartbeat();
      }
      break;
    case EventKind::SILENCE:
      if (_fsm.isConnected()) {
        SHELFSYNC_LOG_WARN(kTag, "%s: silent for %lu ms", _device.address.c_str(),
                           static_cast<unsigned long>(SHELFSYNC_HEARTBEAT_TIMEOUT_MS));
        _fsm.linkLost();
      }
      break;
  }

  const etl::fsm_state_id_t after = _fsm.get_state_id();
  if (after != before) {
    SHELFSYNC_LOG_INFO(kTag, "%s: %s -> %s", _device.address.c_str(),
                       fsm::sessionStateName(before), fsm::sessionStateName(after));
  }
}

void SessionManager::serviceLink() {
  if (!_fsm.isConnected()) {
    return;
  }
  uint8_t buffer[kReadChunk];
  for (;;) {
    const long n = _link->read(buffer, sizeof(buffer));
    if (n < 0) {
      post(EventKind::LINK_LOST);
      return;
    }
    if (n == 0) {
      return;
    }
    for (long i = 0; i < n; ++i) {
      const protocol::FrameStream::Result result = _stream.consume(buffer[i], _rx_frame);
      if (result == protocol::FrameStream::Result::FRAME_READY) {
        onReceived(_rx_frame);
      } else if (result == protocol::FrameStream::Result::ERROR) {
        ++_malformed_frames;
        SHELFSYNC_LOG_DEBUG(kTag, "%s: dropped frame: %s", _device.address.c_str(),
                            protocol::toString(_stream.lastError()));
      }
    }
    if (!_fsm.isConnected()) {
      return;
    }
  }
}

// --- fsm::SessionActions ---

bool SessionManager::connect() {
  if (!_link->open()) {
    SHELFSYNC_LOG_DEBUG(kTag, "%s: connect failed", _device.address.c_str());
    return false;
  }
  _backoff_ms = SHELFSYNC_BACKOFF_INITIAL_MS;
  return true;
}

void SessionManager::enterConnected() {
  _stream.reset();
  _link_lost_posted = false;
  _has_digest = false;
  _timers.stop(scheduler::TIMER_RETRY);
  _timers.start(scheduler::TIMER_HEARTBEAT_TX, false);
  _timers.start(scheduler::TIMER_HEARTBEAT_RX, false);
  SHELFSYNC_LOG_INFO(kTag, "%s: connected", _device.address.c_str());
  // The device resyncs on every connection.
  pushConfig(true);
}

void SessionManager::enterDisconnected() {
  _timers.stop(scheduler::TIMER_HEARTBEAT_TX);
  _timers.stop(scheduler::TIMER_HEARTBEAT_RX);
  _link->close();
  // Nothing is buffered on the bridge; a partial frame is simply dropped.
  _stream.reset();
  _has_digest = false;

  _timers.set_period(scheduler::TIMER_RETRY, _backoff_ms);
  _timers.start(scheduler::TIMER_RETRY, false);
  SHELFSYNC_LOG_DEBUG(kTag, "%s: retry in %lu ms", _device.address.c_str(),
                      static_cast<unsigned long>(_backoff_ms));
  _backoff_ms = _backoff_ms >= SHELFSYNC_BACKOFF_MAX_MS / 2
                    ? SHELFSYNC_BACKOFF_MAX_MS
                    : _backoff_ms * 2;
}

// --- Outbound ---

bool SessionManager::pushConfig(bool force) {
  const etl::expected<model::ConfigSnapshot, UpstreamError> config =
      _listener.configFor(_device.address);
  if (!config.has_value()) {
    SHELFSYNC_LOG_WARN(kTag, "%s: no config: %s", _device.address.c_str(),
                       toString(config.error()));
    return false;
  }
  const uint32_t digest = protocol::message::configDigest(config.value());
  if (!force && _has_digest && digest == _pushed_digest) {
    return false;
  }
  protocol::ConfigPush push;
  push.snapshot = config.value();
  if (!send(push)) {
    return false;
  }
  _has_digest = true;
  _pushed_digest = digest;
  _pushed_firmware = push.snapshot.firmware.version;
  ++_config_pushes;
  SHELFSYNC_LOG_INFO(kTag, "%s: config pushed (%u items, digest %08lx)",
                     _device.address.c_str(),
                     static_cast<unsigned>(push.snapshot.items.size()),
                     static_cast<unsigned long>(digest));
  return true;
}

void SessionManager::sendHeartbeat() {
  protocol::Heartbeat heartbeat;
  heartbeat.firmware_version = _pushed_firmware;
  heartbeat.battery = model::kBatteryUnknown;
  send(heartbeat);
}

void SessionManager::noteBattery(uint8_t percent) {
  if (percent == _battery || percent > 100U) {
    return;
  }
  const bool was_low = _battery != model::kBatteryUnknown &&
                       _battery < SHELFSYNC_LOW_BATTERY_PERCENT;
  _battery = percent;
  if (percent < SHELFSYNC_LOW_BATTERY_PERCENT) {
    if (!was_low) {
      SHELFSYNC_LOG_WARN(kTag, "%s: battery low (%u%%)", _device.address.c_str(),
                         static_cast<unsigned>(percent));
    }
    return;
  }
  SHELFSYNC_LOG_DEBUG(kTag, "%s: battery %u%%", _device.address.c_str(),
                      static_cast<unsigned>(percent));
}

// --- router::IMessageHandler ---

void SessionManager::onHeartbeat(const protocol::Heartbeat& msg) {
  if (msg.firmware_version != _device_firmware) {
    SHELFSYNC_LOG_INFO(kTag, "%s: running firmware v%u", _device.address.c_str(),
                       static_cast<unsigned>(msg.firmware_version));
    _device_firmware = msg.firmware_version;
  }
  noteBattery(msg.battery);
}

void SessionManager::onStockUpdate(const protocol::StockUpdate& msg) {
  noteBattery(msg.battery);
  if (!model::wellFormed(msg.change)) {
    // Resending cannot fix it, so the device is told to drop it.
    protocol::Nack nack;
    nack.sequence = msg.change.sequence;
    nack.reason = protocol::NackReason::MALFORMED;
    if (send(nack)) {
      ++_nacks_sent;
    }
    SHELFSYNC_LOG_WARN(kTag, "%s: seq %lu malformed (item %lu, count %u)",
                       _device.address.c_str(),
                       static_cast<unsigned long>(msg.change.sequence),
                       static_cast<unsigned long>(msg.change.item_id),
                       static_cast<unsigned>(msg.change.count));
    return;
  }

  model::StockDelta delta;
  delta.device = _device_id;
  delta.row = msg.change.row;
  delta.slot = msg.change.slot;
  delta.item_id = msg.change.item_id;
  delta.count = msg.change.count;
  delta.sequence = msg.change.sequence;
  delta.timestamp = msg.change.timestamp;
  delta.battery = msg.battery;

  const SubmitResult result = _listener.onStockUpdate(delta);
  switch (result) {
    case SubmitResult::ACCEPTED:
    case SubmitResult::DUPLICATE: {
      protocol::Ack ack;
      ack.sequence = delta.sequence;
      if (send(ack)) {
        ++_acks_sent;
      }
      break;
    }
    case SubmitResult::REJECTED:
    case SubmitResult::UNAVAILABLE: {
      protocol::Nack nack;
      nack.sequence = delta.sequence;
      nack.reason = result == SubmitResult::REJECTED
                        ? protocol::NackReason::SLOT_OUTSIDE_FOOTPRINT
                        : protocol::NackReason::UPSTREAM_UNAVAILABLE;
      if (send(nack)) {
        ++_nacks_sent;
      }
      break;
    }
  }
  SHELFSYNC_LOG_INFO(kTag, "%s: seq %lu %s item %lu = %u: %s", _device.address.c_str(),
                     static_cast<unsigned long>(delta.sequence),
                     model::locationCode(delta.row, delta.slot).c_str(),
                     static_cast<unsigned long>(delta.item_id),
                     static_cast<unsigned>(delta.count), toString(result));
}

void SessionManager::onConfigRequest(const protocol::ConfigRequest&) {
  pushConfig(true);
}

void SessionManager::onFirmwareRequest(const protocol::FirmwareRequest& msg) {
  const FirmwareImage* image = _listener.firmwareImage();
  if (image == nullptr || image->info().version != msg.version ||
      msg.offset >= image->info().image_size) {
    SHELFSYNC_LOG_DEBUG(kTag, "%s: cannot serve v%u at %lu", _device.address.c_str(),
                        static_cast<unsigned>(msg.version),
                        static_cast<unsigned long>(msg.offset));
    return;
  }
  protocol::FirmwareChunk chunk;
  chunk.version = msg.version;
  chunk.offset = msg.offset;
  const size_t want = msg.length < protocol::kFirmwareChunkSize
                          ? msg.length
                          : protocol::kFirmwareChunkSize;
  chunk.data.resize(want);
  const size_t got = image->read(msg.offset, chunk.data.data(), want);
  chunk.data.resize(got);
  if (got == 0) {
    return;
  }
  send(chunk);
}

void SessionManager::onUnexpected(protocol::MessageId id) {
  SHELFSYNC_LOG_DEBUG(kTag, "%s: ignoring %s", _device.address.c_str(),
                      protocol::message::name(static_cast<uint16_t>(id)));
}

void SessionManager::onMalformed(uint16_t message_id, protocol::FrameError error) {
  SHELFSYNC_LOG_DEBUG(kTag, "%s: bad %s payload: %s", _device.address.c_str(),
                      protocol::message::name(message_id), protocol::toString(error));
}

}  // namespace host
}  // namespace shelfsync
