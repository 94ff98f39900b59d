/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
/**
 * @file message_router.h
 * @brief ETL-based dispatch of decoded frames to a message handler.
 *
 * The router decodes the frame payload for the frame's message id and
 * forwards the typed message. Both ends of the link use it: the device
 * implements the bridge-to-device handlers, the session implements the
 * device-to-bridge ones, and anything a side does not expect ends in
 * onUnexpected().
 */
#ifndef SHELFSYNC_MESSAGE_ROUTER_H
#define SHELFSYNC_MESSAGE_ROUTER_H

#include "etl_profile.h"
#include "etl/message.h"
#include "etl/message_router.h"

#include "protocol/frame.h"
#include "protocol/messages.h"

namespace shelfsync {
namespace router {

enum RouteId : etl::message_id_t {
  ROUTE_HEARTBEAT = 0,
  ROUTE_STOCK_UPDATE = 1,
  ROUTE_CONFIG_PUSH = 2,
  ROUTE_CONFIG_REQUEST = 3,
  ROUTE_ACK = 4,
  ROUTE_NACK = 5,
  ROUTE_FIRMWARE_REQUEST = 6,
  ROUTE_FIRMWARE_CHUNK = 7,
  NUMBER_OF_ROUTES = 8
};

// Messages carry a pointer to the decoded value to avoid copying large
// payloads (ConfigPush, FirmwareChunk) through the router.
template <etl::message_id_t Id, typename TPayload>
struct Routed : public etl::message<Id> {
  const TPayload* payload;
  explicit Routed(const TPayload& p) : payload(&p) {}
};

typedef Routed<ROUTE_HEARTBEAT, protocol::Heartbeat> MsgHeartbeat;
typedef Routed<ROUTE_STOCK_UPDATE, protocol::StockUpdate> MsgStockUpdate;
typedef Routed<ROUTE_CONFIG_PUSH, protocol::ConfigPush> MsgConfigPush;
typedef Routed<ROUTE_CONFIG_REQUEST, protocol::ConfigRequest> MsgConfigRequest;
typedef Routed<ROUTE_ACK, protocol::Ack> MsgAck;
typedef Routed<ROUTE_NACK, protocol::Nack> MsgNack;
typedef Routed<ROUTE_FIRMWARE_REQUEST, protocol::FirmwareRequest> MsgFirmwareRequest;
typedef Routed<ROUTE_FIRMWARE_CHUNK, protocol::FirmwareChunk> MsgFirmwareChunk;

class IMessageHandler {
 public:
  virtual ~IMessageHandler() {}

  virtual void onHeartbeat(const protocol::Heartbeat&) {
    onUnexpected(protocol::MessageId::HEARTBEAT);
  }
  virtual void onStockUpdate(const protocol::StockUpdate&) {
    onUnexpected(protocol::MessageId::STOCK_UPDATE);
  }
  virtual void onConfigPush(const protocol::ConfigPush&) {
    onUnexpected(protocol::MessageId::CONFIG_PUSH);
  }
  virtual void onConfigRequest(const protocol::ConfigRequest&) {
    onUnexpected(protocol::MessageId::CONFIG_REQUEST);
  }
  virtual void onAck(const protocol::Ack&) {
    onUnexpected(protocol::MessageId::ACK);
  }
  virtual void onNack(const protocol::Nack&) {
    onUnexpected(protocol::MessageId::NACK);
  }
  virtual void onFirmwareRequest(const protocol::FirmwareRequest&) {
    onUnexpected(protocol::MessageId::FIRMWARE_REQUEST);
  }
  virtual void onFirmwareChunk(const protocol::FirmwareChunk&) {
    onUnexpected(protocol::MessageId::FIRMWARE_CHUNK);
  }

  // A well-formed message this side never receives.
  virtual void onUnexpected(protocol::MessageId id) = 0;

  // Frame passed CRC but its payload did not decode.
  virtual void onMalformed(uint16_t message_id, protocol::FrameError error) = 0;
};

class MessageRouter : public etl::message_router<MessageRouter,
                                                 MsgHeartbeat,
                                                 MsgStockUpdate,
                                                 MsgConfigPush,
                                                 MsgConfigRequest,
                                                 MsgAck,
                                                 MsgNack,
                                                 MsgFirmwareRequest,
                                                 MsgFirmwareChunk>
{
 public:
  MessageRouter()
      : message_router(ROUTER_ID), _handler(nullptr) {}

  void setHandler(IMessageHandler* handler) { _handler = handler; }

  // Returns the decode result; the handler has been called either way.
  protocol::FrameError route(const protocol::Frame& frame) {
    using namespace protocol;
    switch (static_cast<MessageId>(frame.header.message_id)) {
      case MessageId::HEARTBEAT:        return dispatch<Heartbeat, MsgHeartbeat>(frame);
      case MessageId::STOCK_UPDATE:     return dispatch<StockUpdate, MsgStockUpdate>(frame);
      case MessageId::CONFIG_PUSH:      return dispatch<ConfigPush, MsgConfigPush>(frame);
      case MessageId::CONFIG_REQUEST:   return dispatch<ConfigRequest, MsgConfigRequest>(frame);
      case MessageId::ACK:              return dispatch<Ack, MsgAck>(frame);
      case MessageId::NACK:             return dispatch<Nack, MsgNack>(frame);
      case MessageId::FIRMWARE_REQUEST: return dispatch<FirmwareRequest, MsgFirmwareRequest>(frame);
      case MessageId::FIRMWARE_CHUNK:   return dispatch<FirmwareChunk, MsgFirmwareChunk>(frame);
    }
    if (_handler) {
      _handler->onMalformed(frame.header.message_id, FrameError::UNKNOWN_MESSAGE);
    }
    return FrameError::UNKNOWN_MESSAGE;
  }

  // ETL message handlers - dispatch to IMessageHandler
  void on_receive(const MsgHeartbeat& msg)       { if (_handler) _handler->onHeartbeat(*msg.payload); }
  void on_receive(const MsgStockUpdate& msg)     { if (_handler) _handler->onStockUpdate(*msg.payload); }
  void on_receive(const MsgConfigPush& msg)      { if (_handler) _handler->onConfigPush(*msg.payload); }
  void on_receive(const MsgConfigRequest& msg)   { if (_handler) _handler->onConfigRequest(*msg.payload); }
  void on_receive(const MsgAck& msg)             { if (_handler) _handler->onAck(*msg.payload); }
  void on_receive(const MsgNack& msg)            { if (_handler) _handler->onNack(*msg.payload); }
  void on_receive(const MsgFirmwareRequest& msg) { if (_handler) _handler->onFirmwareRequest(*msg.payload); }
  void on_receive(const MsgFirmwareChunk& msg)   { if (_handler) _handler->onFirmwareChunk(*msg.payload); }

  void on_receive_unknown(const etl::imessage&) {}

 private:
  template <typename TPayload, typename TMessage>
  protocol::FrameError dispatch(const protocol::Frame& frame) {
    TPayload payload;
    const protocol::FrameError error = protocol::message::decodeInto(frame, payload);
    if (error != protocol::FrameError::NONE) {
      if (_handler) {
        _handler->onMalformed(frame.header.message_id, error);
      }
      return error;
    }
    receive(TMessage(payload));
    return protocol::FrameError::NONE;
  }

  static constexpr etl::message_router_id_t ROUTER_ID = 1;
  IMessageHandler* _handler;
};

}  // namespace router
}  // namespace shelfsync

#endif  // SHELFSYNC_MESSAGE_ROUTER_H
