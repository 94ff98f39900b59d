/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
/**
 * @file session_fsm.h
 * @brief ETL-based state machine of one bridge-to-device session.
 *
 * States:
 *   - Discovered (0): Known from a scan, never connected.
 *   - Connecting (1): Transient. Opens the link.
 *   - Connected (2): Link open, heartbeats running.
 *   - Disconnected (3): Link closed, retry timer armed with backoff.
 *
 * Events:
 *   - EvAdvertised: Seen by a scan → Connecting (only from Discovered)
 *   - EvRetryDue: Backoff elapsed → Connecting
 *   - EvLinkLost: Read/write failure or heartbeat silence → Disconnected
 */
#ifndef SHELFSYNC_SESSION_FSM_H
#define SHELFSYNC_SESSION_FSM_H

#include "etl_profile.h"
#include "etl/callback_timer.h"
#include "etl/fsm.h"
#include "etl/message.h"

namespace shelfsync {
namespace fsm {

class SessionFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum SessionStateId : etl::fsm_state_id_t {
  STATE_DISCOVERED = 0,
  STATE_CONNECTING = 1,
  STATE_CONNECTED = 2,
  STATE_DISCONNECTED = 3,
  NUMBER_OF_SESSION_STATES = 4
};

// ============================================================================
// Event IDs
// ============================================================================
enum SessionEventId : etl::message_id_t {
  EVENT_ADVERTISED = 0,
  EVENT_RETRY_DUE = 1,
  EVENT_LINK_LOST = 2
};

struct EvAdvertised : public etl::message<EVENT_ADVERTISED> {};
struct EvRetryDue : public etl::message<EVENT_RETRY_DUE> {};
struct EvLinkLost : public etl::message<EVENT_LINK_LOST> {};

class SessionActions {
 public:
  virtual ~SessionActions() {}
  // Opens the transport. False schedules a retry.
  virtual bool connect() = 0;
  virtual void enterConnected() = 0;
  virtual void enterDisconnected() = 0;
};

// ============================================================================
// States
// ============================================================================
class StateDiscovered : public etl::fsm_state<SessionFsm, StateDiscovered,
                                              STATE_DISCOVERED, EvAdvertised>
{
public:
  etl::fsm_state_id_t on_event(const EvAdvertised&) { return STATE_CONNECTING; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateConnecting : public etl::fsm_state<SessionFsm, StateConnecting,
                                              STATE_CONNECTING>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateConnected : public etl::fsm_state<SessionFsm, StateConnected,
                                             STATE_CONNECTED, EvLinkLost>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const EvLinkLost&) { return STATE_DISCONNECTED; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateDisconnected : public etl::fsm_state<SessionFsm, StateDisconnected,
                                                STATE_DISCONNECTED, EvRetryDue>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const EvRetryDue&) { return STATE_CONNECTING; }
  // Advertisements do not shortcut the backoff.
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

// ============================================================================
// FSM Class
// ============================================================================
class SessionFsm : public etl::fsm
{
public:
  explicit SessionFsm(SessionActions& actions)
    : etl::fsm(FSM_ID)
    , actions_(actions)
    , state_list_{}
  {
  }

  void begin() {
    state_list_[STATE_DISCOVERED] = &state_discovered_;
    state_list_[STATE_CONNECTING] = &state_connecting_;
    state_list_[STATE_CONNECTED] = &state_connected_;
    state_list_[STATE_DISCONNECTED] = &state_disconnected_;
    set_states(state_list_, NUMBER_OF_SESSION_STATES);
    start(false);
  }

  SessionActions& actions() { return actions_; }

  bool isConnected() const { return get_state_id() == STATE_CONNECTED; }

  void advertised() { receive(EvAdvertised()); }
  void retryDue() { receive(EvRetryDue()); }
  void linkLost() { receive(EvLinkLost()); }

private:
  static constexpr etl::message_router_id_t FSM_ID = 2;

  SessionActions& actions_;
  StateDiscovered state_discovered_;
  StateConnecting state_connecting_;
  StateConnected state_connected_;
  StateDisconnected state_disconnected_;
  etl::ifsm_state* state_list_[NUMBER_OF_SESSION_STATES];
};

inline etl::fsm_state_id_t StateConnecting::on_enter_state() {
  return get_fsm_context().actions().connect() ? STATE_CONNECTED
                                               : STATE_DISCONNECTED;
}

inline etl::fsm_state_id_t StateConnected::on_enter_state() {
  get_fsm_context().actions().enterConnected();
  return STATE_CONNECTED;
}

inline etl::fsm_state_id_t StateDisconnected::on_enter_state() {
  get_fsm_context().actions().enterDisconnected();
  return STATE_DISCONNECTED;
}

inline const char* sessionStateName(etl::fsm_state_id_t id) {
  switch (id) {
    case STATE_DISCOVERED:   return "DISCOVERED";
    case STATE_CONNECTING:   return "CONNECTING";
    case STATE_CONNECTED:    return "CONNECTED";
    case STATE_DISCONNECTED: return "DISCONNECTED";
    default:                 return "?";
  }
}

}  // namespace fsm

namespace scheduler {

enum SessionTimerId : uint8_t {
  TIMER_RETRY = 0,
  TIMER_HEARTBEAT_TX = 1,
  TIMER_HEARTBEAT_RX = 2,
  NUMBER_OF_SESSION_TIMERS = 3
};

using SessionTimerService = etl::callback_timer<NUMBER_OF_SESSION_TIMERS>;

}  // namespace scheduler
}  // namespace shelfsync

#endif  // SHELFSYNC_SESSION_FSM_H
