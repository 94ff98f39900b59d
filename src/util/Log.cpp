/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "Log.h"

#include <stdio.h>
#include <string.h>

#include "etl_profile.h"
#include "etl/error_handler.h"
#include "etl/exception.h"

#if defined(ARDUINO)
  #include <Arduino.h>
#else
  #include <unistd.h>
#endif

namespace shelfsync {
namespace log {

namespace {

constexpr size_t kLineCapacity = 192;

#if defined(ARDUINO)

void defaultSink(Level lvl, const char* tag, const char* message) {
#if defined(SHELFSYNC_DEBUG_LOG)
  Serial.print('[');
  Serial.print(tag);
  Serial.print("] ");
  Serial.print(levelName(lvl));
  Serial.print(' ');
  Serial.println(message);
#else
  (void)lvl;
  (void)tag;
  (void)message;
#endif
}

#else

void write_all(const char* data, size_t len) {
  while (len > 0) {
    const ssize_t written = ::write(2, data, len);
    if (written <= 0) {
      return;
    }
    data += static_cast<size_t>(written);
    len -= static_cast<size_t>(written);
  }
}

void defaultSink(Level lvl, const char* tag, const char* message) {
  char line[kLineCapacity + 32];
  const int n = snprintf(line, sizeof(line), "[%s] %s %s\n", tag,
                         levelName(lvl), message);
  if (n <= 0) {
    return;
  }
  const size_t len = static_cast<size_t>(n) < sizeof(line)
                         ? static_cast<size_t>(n)
                         : sizeof(line) - 1;
  write_all(line, len);
}

#endif

Sink g_sink = defaultSink;
// Debug output is compiled in on the host but off until asked for.
Level g_level = static_cast<Level>(SHELFSYNC_LOG_LEVEL > 2 ? 2 : SHELFSYNC_LOG_LEVEL);

void onEtlError(const etl::exception& e) {
  write(Level::ERROR, "etl", "%s (%s:%d)", e.what(), e.file_name(),
        static_cast<int>(e.line_number()));
}

}  // namespace

void setSink(Sink sink) { g_sink = sink ? sink : defaultSink; }

void resetSink() { g_sink = defaultSink; }

void setLevel(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool enabled(Level lvl) {
  return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(g_level);
}

const char* levelName(Level lvl) {
  switch (lvl) {
    case Level::ERROR: return "E";
    case Level::WARN:  return "W";
    case Level::INFO:  return "I";
    case Level::DEBUG: return "D";
  }
  return "?";
}

void vwrite(Level lvl, const char* tag, const char* fmt, va_list args) {
  if (!enabled(lvl)) {
    return;
  }
  char message[kLineCapacity];
  const int n = vsnprintf(message, sizeof(message), fmt, args);
  if (n < 0) {
    return;
  }
  g_sink(lvl, tag ? tag : "-", message);
}

void write(Level lvl, const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vwrite(lvl, tag, fmt, args);
  va_end(args);
}

void installEtlErrorHandler() {
  static etl::error_handler::free_function handler(onEtlError);
  etl::error_handler::set_callback(handler);
}

}  // namespace log
}  // namespace shelfsync
