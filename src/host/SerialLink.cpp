/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "SerialLink.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "util/Log.h"

namespace shelfsync {
namespace host {

namespace {

const char kTag[] = "serial";
// Longest a single write() waits for the driver buffer to drain.
constexpr int kDrainWaitMs = 10;

bool toSpeed(unsigned long baudrate, speed_t& speed) {
  switch (baudrate) {
    case 9600:   speed = B9600;   return true;
    case 19200:  speed = B19200;  return true;
    case 38400:  speed = B38400;  return true;
    case 57600:  speed = B57600;  return true;
    case 115200: speed = B115200; return true;
    case 230400: speed = B230400; return true;
    default:     return false;
  }
}

}  // namespace

bool SerialLink::supportedBaudrate(unsigned long baudrate) {
  speed_t speed;
  return toSpeed(baudrate, speed);
}

SerialLink::SerialLink(const std::string& path, unsigned long baudrate)
    : _path(path), _baudrate(baudrate), _fd(-1) {}

SerialLink::~SerialLink() { close(); }

bool SerialLink::open() {
  if (_fd >= 0) {
    return true;
  }
  if (!supportedBaudrate(_baudrate)) {
    SHELFSYNC_LOG_ERROR(kTag, "%s: unsupported baud rate %lu", _path.c_str(),
                        _baudrate);
    return false;
  }
  _fd = ::open(_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (_fd < 0) {
    SHELFSYNC_LOG_DEBUG(kTag, "open %s: %s", _path.c_str(), strerror(errno));
    return false;
  }
  if (!configure()) {
    SHELFSYNC_LOG_WARN(kTag, "configure %s: %s", _path.c_str(), strerror(errno));
    close();
    return false;
  }
  tcflush(_fd, TCIOFLUSH);
  return true;
}

bool SerialLink::configure() {
  struct termios tio;
  if (tcgetattr(_fd, &tio) != 0) {
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  speed_t speed;
  if (!toSpeed(_baudrate, speed)) {
    errno = EINVAL;
    return false;
  }
  if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0) {
    return false;
  }
  return tcsetattr(_fd, TCSANOW, &tio) == 0;
}

void SerialLink::close() {
  if (_fd < 0) {
    return;
  }
  if (::close(_fd) != 0) {
    SHELFSYNC_LOG_DEBUG(kTag, "close %s: %s", _path.c_str(), strerror(errno));
  }
  _fd = -1;
}

long SerialLink::read(uint8_t* buffer, size_t capacity) {
  if (_fd < 0) {
    return -1;
  }
  const ssize_t n = ::read(_fd, buffer, capacity);
  if (n > 0) {
    return static_cast<long>(n);
  }
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
    return 0;
  }
  // EOF on a tty means the remote end hung up.
  SHELFSYNC_LOG_DEBUG(kTag, "%s closed: %s", _path.c_str(),
                      n == 0 ? "hangup" : strerror(errno));
  return -1;
}

bool SerialLink::write(const uint8_t* data, size_t len) {
  if (_fd < 0) {
    return false;
  }
  size_t written = 0;
  bool waited = false;
  while (written < len) {
    const ssize_t n = ::write(_fd, data + written, len - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && !waited) {
      // One short wait per frame; a peer that stays full is dropped so the
      // other sessions keep running.
      waited = true;
      struct pollfd fds;
      fds.fd = _fd;
      fds.events = POLLOUT;
      fds.revents = 0;
      if (poll(&fds, 1, kDrainWaitMs) > 0) {
        continue;
      }
    }
    SHELFSYNC_LOG_WARN(kTag, "write %s failed after %zu/%zu bytes",
                       _path.c_str(), written, len);
    return false;
  }
  return true;
}

std::unique_ptr<HostLink> SerialLinkFactory::create(const Advertisement& device) {
  return std::unique_ptr<HostLink>(new SerialLink(device.path, _baudrate));
}

}  // namespace host
}  // namespace shelfsync
