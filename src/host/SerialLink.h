/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_SERIAL_LINK_H
#define SHELFSYNC_SERIAL_LINK_H

#include <memory>
#include <string>

#include "host/HostLink.h"

namespace shelfsync {
namespace host {

// Serial device node (RFCOMM or UART bridge), raw mode, non-blocking.
class SerialLink : public HostLink {
 public:
  SerialLink(const std::string& path, unsigned long baudrate);
  ~SerialLink() override;

  bool open() override;
  void close() override;
  bool isOpen() const override { return _fd >= 0; }
  long read(uint8_t* buffer, size_t capacity) override;
  bool write(const uint8_t* data, size_t len) override;

  const std::string& path() const { return _path; }

  static bool supportedBaudrate(unsigned long baudrate);

 private:
  SerialLink(const SerialLink&) = delete;
  SerialLink& operator=(const SerialLink&) = delete;

  bool configure();

  std::string _path;
  unsigned long _baudrate;
  int _fd;
};

class SerialLinkFactory : public LinkFactory {
 public:
  explicit SerialLinkFactory(unsigned long baudrate) : _baudrate(baudrate) {}
  std::unique_ptr<HostLink> create(const Advertisement& device) override;

 private:
  unsigned long _baudrate;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_SERIAL_LINK_H
