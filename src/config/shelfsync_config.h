/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#pragma once

// Compile-time configuration shared by the shelf firmware and the bridge.
//
// These are *not* wire-format constants (see protocol/frame.h for those).
// They control timing, queue sizing and other implementation details and can
// be overridden from the build system with -D.

// --- Device: input and power ---

// Quiet period after the last tap before changes are recorded.
#ifndef SHELFSYNC_DEBOUNCE_MS
#define SHELFSYNC_DEBOUNCE_MS 10000UL
#endif

// Idle time after which the device goes back to sleep.
#ifndef SHELFSYNC_INACTIVITY_MS
#define SHELFSYNC_INACTIVITY_MS 90000UL
#endif

// Touch controller bounce: taps closer than this are ignored.
#ifndef SHELFSYNC_TAP_RATE_LIMIT_MS
#define SHELFSYNC_TAP_RATE_LIMIT_MS 350UL
#endif

// Upper bound of a displayed stock count.
#ifndef SHELFSYNC_MAX_STOCK_COUNT
#define SHELFSYNC_MAX_STOCK_COUNT 999U
#endif

// --- Device: synchronization ---

#ifndef SHELFSYNC_ACK_TIMEOUT_MS
#define SHELFSYNC_ACK_TIMEOUT_MS 5000UL
#endif

#ifndef SHELFSYNC_CONNECT_TIMEOUT_MS
#define SHELFSYNC_CONNECT_TIMEOUT_MS 20000UL
#endif

#ifndef SHELFSYNC_FIRMWARE_CHUNK_TIMEOUT_MS
#define SHELFSYNC_FIRMWARE_CHUNK_TIMEOUT_MS 3000UL
#endif

// Unacknowledged deltas kept in non-volatile storage.
#ifndef SHELFSYNC_PENDING_QUEUE_CAPACITY
#define SHELFSYNC_PENDING_QUEUE_CAPACITY 32U
#endif

// Device event queue (ISR -> main loop).
#ifndef SHELFSYNC_EVENT_QUEUE_CAPACITY
#define SHELFSYNC_EVENT_QUEUE_CAPACITY 16U
#endif

// --- Bridge: sessions ---

#ifndef SHELFSYNC_HEARTBEAT_INTERVAL_MS
#define SHELFSYNC_HEARTBEAT_INTERVAL_MS 5000UL
#endif

#ifndef SHELFSYNC_HEARTBEAT_TIMEOUT_MS
#define SHELFSYNC_HEARTBEAT_TIMEOUT_MS 15000UL
#endif

#ifndef SHELFSYNC_BACKOFF_INITIAL_MS
#define SHELFSYNC_BACKOFF_INITIAL_MS 1000UL
#endif

#ifndef SHELFSYNC_BACKOFF_MAX_MS
#define SHELFSYNC_BACKOFF_MAX_MS 60000UL
#endif

// Reported battery below this is logged as a warning.
#ifndef SHELFSYNC_LOW_BATTERY_PERCENT
#define SHELFSYNC_LOW_BATTERY_PERCENT 20U
#endif

// --- Bridge: coordinator ---

#ifndef SHELFSYNC_SCAN_INTERVAL_MS
#define SHELFSYNC_SCAN_INTERVAL_MS 5000UL
#endif

#ifndef SHELFSYNC_CONFIG_POLL_INTERVAL_MS
#define SHELFSYNC_CONFIG_POLL_INTERVAL_MS 30000UL
#endif

// Devices neither connected nor advertised for this long are forgotten.
#ifndef SHELFSYNC_STALE_DEVICE_MS
#define SHELFSYNC_STALE_DEVICE_MS 600000UL
#endif

// Advertised name prefix used for discovery.
#ifndef SHELFSYNC_SERVICE_NAME
#define SHELFSYNC_SERVICE_NAME "ShelfSync"
#endif

#ifndef SHELFSYNC_LINK_BAUDRATE
#define SHELFSYNC_LINK_BAUDRATE 115200UL
#endif

// --- Logging ---

// 0 = errors only, 3 = debug.
#ifndef SHELFSYNC_LOG_LEVEL
#define SHELFSYNC_LOG_LEVEL 2
#endif

// --- Interrupt protection for state shared with ISRs ---

#if defined(ARDUINO_ARCH_AVR)
  #include <util/atomic.h>
  #define SHELFSYNC_ATOMIC_BLOCK ATOMIC_BLOCK(ATOMIC_RESTORESTATE)
#elif defined(ARDUINO)
  #include <Arduino.h>
namespace shelfsync {
struct InterruptGuard {
  InterruptGuard() : _done(false) { noInterrupts(); }
  ~InterruptGuard() { interrupts(); }
  bool once() {
    const bool first = !_done;
    _done = true;
    return first;
  }
  bool _done;
};
}  // namespace shelfsync
  #define SHELFSYNC_ATOMIC_BLOCK \
    for (shelfsync::InterruptGuard _shelfsync_guard; _shelfsync_guard.once();)
#else
  #define SHELFSYNC_ATOMIC_BLOCK
#endif
