/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
/**
 * @file device_fsm.h
 * @brief ETL-based state machine of the shelf display.
 *
 * States:
 *   - Sleep (0): Panel holds its image, radio off. Only wake/touch counts.
 *   - Wake (1): Transient. Renders the grid and arms the inactivity timer.
 *   - Active (2): Taps adjust counts and restart the debounce timer.
 *   - Debounce (3): Transient. Records changed counts in the pending queue.
 *   - Syncing (4): Link up, draining the pending queue.
 *
 * Events:
 *   - EvWake: Wake interrupt → Wake
 *   - EvTap: Count step → Active (from Sleep it only wakes the device)
 *   - EvDebounceExpired: 10 s without taps → Debounce
 *   - EvInactivityExpired: 90 s idle → Sleep, once nothing is in flight
 *
 * The machine only decides transitions. Side effects are delegated to
 * DeviceActions, implemented by the DeviceController, which never feeds
 * events back in from inside an action.
 */
#ifndef SHELFSYNC_DEVICE_FSM_H
#define SHELFSYNC_DEVICE_FSM_H

#include "etl_profile.h"
#include "etl/callback_timer.h"
#include "etl/fsm.h"
#include "etl/message.h"

#include "model/inventory.h"

namespace shelfsync {
namespace fsm {

class DeviceFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum DeviceStateId : etl::fsm_state_id_t {
  STATE_SLEEP = 0,
  STATE_WAKE = 1,
  STATE_ACTIVE = 2,
  STATE_DEBOUNCE = 3,
  STATE_SYNCING = 4,
  NUMBER_OF_DEVICE_STATES = 5
};

// ============================================================================
// Event IDs
// ============================================================================
enum DeviceEventId : etl::message_id_t {
  EVENT_WAKE = 0,
  EVENT_TAP = 1,
  EVENT_DEBOUNCE_EXPIRED = 2,
  EVENT_INACTIVITY_EXPIRED = 3
};

struct EvWake : public etl::message<EVENT_WAKE> {};

struct EvTap : public etl::message<EVENT_TAP> {
  model::Slot slot;
  int8_t step;
  EvTap(const model::Slot& s, int8_t st) : slot(s), step(st) {}
};

struct EvDebounceExpired : public etl::message<EVENT_DEBOUNCE_EXPIRED> {};
struct EvInactivityExpired : public etl::message<EVENT_INACTIVITY_EXPIRED> {};

// ============================================================================
// Side effects requested by the states
// ============================================================================
class DeviceActions {
 public:
  virtual ~DeviceActions() {}
  virtual void enterSleep() = 0;
  virtual void enterWake() = 0;
  virtual bool hasPending() = 0;
  virtual void applyTap(const model::Slot& slot, int8_t step) = 0;
  virtual void flushChanges() = 0;
  virtual void beginSync() = 0;
  // False while a StockUpdate awaits its Ack/Nack/timeout or a changed
  // count could not be recorded.
  virtual bool readyToSleep() = 0;
};

// ============================================================================
// States
// ============================================================================
class StateSleep : public etl::fsm_state<DeviceFsm, StateSleep, STATE_SLEEP,
                                         EvWake, EvTap>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const EvWake&) { return STATE_WAKE; }
  etl::fsm_state_id_t on_event(const EvTap&) { return STATE_WAKE; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateWake : public etl::fsm_state<DeviceFsm, StateWake, STATE_WAKE>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateActive : public etl::fsm_state<DeviceFsm, StateActive, STATE_ACTIVE,
                                          EvTap, EvDebounceExpired, EvInactivityExpired>
{
public:
  etl::fsm_state_id_t on_enter_state() { return STATE_ACTIVE; }
  etl::fsm_state_id_t on_event(const EvTap& ev);
  etl::fsm_state_id_t on_event(const EvDebounceExpired&) { return STATE_DEBOUNCE; }
  etl::fsm_state_id_t on_event(const EvInactivityExpired&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateDebounce : public etl::fsm_state<DeviceFsm, StateDebounce, STATE_DEBOUNCE>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

class StateSyncing : public etl::fsm_state<DeviceFsm, StateSyncing, STATE_SYNCING,
                                           EvTap, EvDebounceExpired, EvInactivityExpired>
{
public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const EvTap& ev);
  // A failed record is retried by the next debounce expiry.
  etl::fsm_state_id_t on_event(const EvDebounceExpired&) { return STATE_DEBOUNCE; }
  etl::fsm_state_id_t on_event(const EvInactivityExpired&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) { return No_State_Change; }
};

// ============================================================================
// FSM Class
// ============================================================================
class DeviceFsm : public etl::fsm
{
public:
  explicit DeviceFsm(DeviceActions& actions)
    : etl::fsm(FSM_ID)
    , actions_(actions)
    , state_list_{}
  {
  }

  // Starts in Sleep without running its entry action; the caller wakes
  // the machine explicitly.
  void begin() {
    state_list_[STATE_SLEEP] = &state_sleep_;
    state_list_[STATE_WAKE] = &state_wake_;
    state_list_[STATE_ACTIVE] = &state_active_;
    state_list_[STATE_DEBOUNCE] = &state_debounce_;
    state_list_[STATE_SYNCING] = &state_syncing_;
    set_states(state_list_, NUMBER_OF_DEVICE_STATES);
    start(false);
  }

  DeviceActions& actions() { return actions_; }

  bool isSleeping() const { return get_state_id() == STATE_SLEEP; }
  bool isAwake() const { return !isSleeping(); }

  void wake() { receive(EvWake()); }
  void tap(const model::Slot& slot, int8_t step) { receive(EvTap(slot, step)); }
  void debounceExpired() { receive(EvDebounceExpired()); }
  void inactivityExpired() { receive(EvInactivityExpired()); }

private:
  static constexpr etl::message_router_id_t FSM_ID = 0;

  DeviceActions& actions_;
  StateSleep state_sleep_;
  StateWake state_wake_;
  StateActive state_active_;
  StateDebounce state_debounce_;
  StateSyncing state_syncing_;
  etl::ifsm_state* state_list_[NUMBER_OF_DEVICE_STATES];
};

// ============================================================================
// State actions (need the complete DeviceFsm)
// ============================================================================
inline etl::fsm_state_id_t StateSleep::on_enter_state() {
  get_fsm_context().actions().enterSleep();
  return STATE_SLEEP;
}

inline etl::fsm_state_id_t StateWake::on_enter_state() {
  DeviceActions& actions = get_fsm_context().actions();
  actions.enterWake();
  return actions.hasPending() ? STATE_SYNCING : STATE_ACTIVE;
}

inline etl::fsm_state_id_t StateActive::on_event(const EvTap& ev) {
  get_fsm_context().actions().applyTap(ev.slot, ev.step);
  return No_State_Change;
}

inline etl::fsm_state_id_t StateActive::on_event(const EvInactivityExpired&) {
  return get_fsm_context().actions().readyToSleep() ? STATE_SLEEP
                                                    : No_State_Change;
}

inline etl::fsm_state_id_t StateDebounce::on_enter_state() {
  get_fsm_context().actions().flushChanges();
  return STATE_SYNCING;
}

inline etl::fsm_state_id_t StateSyncing::on_enter_state() {
  get_fsm_context().actions().beginSync();
  return STATE_SYNCING;
}

inline etl::fsm_state_id_t StateSyncing::on_event(const EvTap& ev) {
  get_fsm_context().actions().applyTap(ev.slot, ev.step);
  return STATE_ACTIVE;
}

inline etl::fsm_state_id_t StateSyncing::on_event(const EvInactivityExpired&) {
  return get_fsm_context().actions().readyToSleep() ? STATE_SLEEP
                                                    : No_State_Change;
}

inline const char* stateName(etl::fsm_state_id_t id) {
  switch (id) {
    case STATE_SLEEP:    return "SLEEP";
    case STATE_WAKE:     return "WAKE";
    case STATE_ACTIVE:   return "ACTIVE";
    case STATE_DEBOUNCE: return "DEBOUNCE";
    case STATE_SYNCING:  return "SYNCING";
    default:             return "?";
  }
}

}  // namespace fsm

// ============================================================================
// Timer IDs - registered in this order by the DeviceController
// ============================================================================
namespace scheduler {

enum DeviceTimerId : uint8_t {
  TIMER_DEBOUNCE = 0,
  TIMER_INACTIVITY = 1,
  TIMER_ACK_TIMEOUT = 2,
  TIMER_CONNECT_TIMEOUT = 3,
  TIMER_FIRMWARE_TIMEOUT = 4,
  NUMBER_OF_DEVICE_TIMERS = 5
};

using DeviceTimerService = etl::callback_timer<NUMBER_OF_DEVICE_TIMERS>;

}  // namespace scheduler
}  // namespace shelfsync

#endif  // SHELFSYNC_DEVICE_FSM_H
