/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_SESSION_MANAGER_H
#define SHELFSYNC_SESSION_MANAGER_H

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>

#include "etl_profile.h"
#include "etl/delegate.h"
#include "etl/expected.h"
#include "etl/queue.h"

#include "config/shelfsync_config.h"
#include "fsm/session_fsm.h"
#include "host/BackendGateway.h"
#include "host/FirmwareSource.h"
#include "host/HostLink.h"
#include "model/inventory.h"
#include "protocol/frame.h"
#include "protocol/messages.h"
#include "router/message_router.h"
#include "util/Log.h"

namespace shelfsync {
namespace host {

// What a session needs from the rest of the bridge.
class SessionListener {
 public:
  virtual ~SessionListener() {}
  // Must return ACCEPTED or DUPLICATE only once the delta is durable.
  virtual SubmitResult onStockUpdate(const model::StockDelta& delta) = 0;
  virtual etl::expected<model::ConfigSnapshot, UpstreamError> configFor(
      const std::string& device) = 0;
  // Image served to devices; nullptr if none.
  virtual const FirmwareImage* firmwareImage() = 0;
};

/**
 * @brief One device session on the bridge.
 *
 * Owns its link, its timers and its receive buffer. Driven by poll() from
 * the coordinator loop; nothing here blocks on the device. Link failures
 * discovered while handling a message are queued and acted on in poll(),
 * never from inside a state action.
 */
class SessionManager : public fsm::SessionActions,
                       public router::IMessageHandler {
 public:
  SessionManager(const Advertisement& device, std::unique_ptr<HostLink> link,
                 SessionListener& listener);
  ~SessionManager() override;

  void begin(uint32_t now_ms);

  void onAdvertised(const Advertisement& device);
  void onDisconnected();
  void poll(uint32_t now_ms);

  // Pushes configuration if it differs from what the device last got.
  bool notifyConfigChanged();

  template <typename TMessage>
  bool send(const TMessage& msg);

  // Feeds one complete frame as if it had arrived on the link.
  void onReceived(const protocol::Frame& frame);

  const std::string& address() const { return _device.address; }
  etl::fsm_state_id_t state() const { return _fsm.get_state_id(); }
  bool connected() const { return _fsm.isConnected(); }
  uint32_t backoffMs() const { return _backoff_ms; }
  uint16_t deviceFirmwareVersion() const { return _device_firmware; }
  // model::kBatteryUnknown until the device reports one.
  uint8_t batteryPercent() const { return _battery; }

  uint32_t malformedFrames() const { return _malformed_frames; }
  uint32_t acksSent() const { return _acks_sent; }
  uint32_t nacksSent() const { return _nacks_sent; }
  uint32_t configPushes() const { return _config_pushes; }

  // fsm::SessionActions
  bool connect() override;
  void enterConnected() override;
  void enterDisconnected() override;

  // router::IMessageHandler
  void onHeartbeat(const protocol::Heartbeat& msg) override;
  void onStockUpdate(const protocol::StockUpdate& msg) override;
  void onConfigRequest(const protocol::ConfigRequest& msg) override;
  void onFirmwareRequest(const protocol::FirmwareRequest& msg) override;
  void onUnexpected(protocol::MessageId id) override;
  void onMalformed(uint16_t message_id, protocol::FrameError error) override;

 private:
  enum class EventKind : uint8_t {
    ADVERTISED = 0,
    RETRY_DUE,
    LINK_LOST,
    HEARTBEAT_DUE,
    SILENCE
  };

  static constexpr size_t EVENT_QUEUE_CAPACITY = 8;

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  void post(EventKind kind);
  void processEvents();
  void dispatch(EventKind kind);
  void serviceLink();
  bool pushConfig(bool force);
  void sendHeartbeat();
  void noteBattery(uint8_t percent);

  void onRetryTimer() { post(EventKind::RETRY_DUE); }
  void onHeartbeatTxTimer() { post(EventKind::HEARTBEAT_DUE); }
  void onHeartbeatRxTimer() { post(EventKind::SILENCE); }

  Advertisement _device;
  model::DeviceId _device_id;
  std::unique_ptr<HostLink> _link;
  SessionListener& _listener;

  fsm::SessionFsm _fsm;
  router::MessageRouter _router;
  protocol::FrameStream _stream;
  protocol::Frame _rx_frame;
  uint8_t _tx_buffer[protocol::MAX_WIRE_FRAME_SIZE];

  scheduler::SessionTimerService _timers;
  etl::delegate<void()> _cb_retry;
  etl::delegate<void()> _cb_heartbeat_tx;
  etl::delegate<void()> _cb_heartbeat_rx;
  uint32_t _last_tick_ms;

  etl::queue<EventKind, EVENT_QUEUE_CAPACITY> _events;

  uint32_t _backoff_ms;
  bool _link_lost_posted;
  bool _has_digest;
  uint32_t _pushed_digest;
  uint16_t _pushed_firmware;
  uint16_t _device_firmware;
  uint8_t _battery;

  uint32_t _malformed_frames;
  uint32_t _acks_sent;
  uint32_t _nacks_sent;
  uint32_t _config_pushes;
};

template <typename TMessage>
bool SessionManager::send(const TMessage& msg) {
  if (!_fsm.isConnected()) {
    return false;
  }
  const size_t len = protocol::message::encodeFrame(
      msg, etl::span<uint8_t>(_tx_buffer, sizeof(_tx_buffer)));
  if (len == 0) {
    SHELFSYNC_LOG_ERROR("session", "%s: cannot encode %s", _device.address.c_str(),
                        protocol::message::name(static_cast<uint16_t>(TMessage::ID)));
    return false;
  }
  if (!_link->write(_tx_buffer, len)) {
    post(EventKind::LINK_LOST);
    return false;
  }
  return true;
}

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_SESSION_MANAGER_H
