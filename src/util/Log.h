/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_LOG_H
#define SHELFSYNC_LOG_H

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

#include "config/shelfsync_config.h"

namespace shelfsync {
namespace log {

enum class Level : uint8_t {
  ERROR = 0,
  WARN = 1,
  INFO = 2,
  DEBUG = 3
};

// A sink receives one fully formatted line without trailing newline.
typedef void (*Sink)(Level level, const char* tag, const char* message);

void setSink(Sink sink);
void resetSink();
void setLevel(Level level);
Level level();

bool enabled(Level level);

void write(Level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void vwrite(Level level, const char* tag, const char* fmt, va_list args);

// Routes etl::error_handler reports (container overflow, bad index, ...)
// into the log at ERROR level.
void installEtlErrorHandler();

const char* levelName(Level level);

}  // namespace log
}  // namespace shelfsync

#define SHELFSYNC_LOG_AT(lvl, num, tag, ...)              \
  do {                                                    \
    if (SHELFSYNC_LOG_LEVEL >= (num)) {                   \
      ::shelfsync::log::write((lvl), (tag), __VA_ARGS__); \
    }                                                     \
  } while (0)

#define SHELFSYNC_LOG_ERROR(tag, ...) \
  SHELFSYNC_LOG_AT(::shelfsync::log::Level::ERROR, 0, tag, __VA_ARGS__)
#define SHELFSYNC_LOG_WARN(tag, ...) \
  SHELFSYNC_LOG_AT(::shelfsync::log::Level::WARN, 1, tag, __VA_ARGS__)
#define SHELFSYNC_LOG_INFO(tag, ...) \
  SHELFSYNC_LOG_AT(::shelfsync::log::Level::INFO, 2, tag, __VA_ARGS__)
#define SHELFSYNC_LOG_DEBUG(tag, ...) \
  SHELFSYNC_LOG_AT(::shelfsync::log::Level::DEBUG, 3, tag, __VA_ARGS__)

#endif  // SHELFSYNC_LOG_H
