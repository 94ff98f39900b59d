/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_HOST_LINK_H
#define SHELFSYNC_HOST_LINK_H

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>

namespace shelfsync {
namespace host {

// A device as seen by discovery.
struct Advertisement {
  std::string address;  // stable identity, e.g. "ShelfSync-A1"
  std::string path;     // where to open the link
};

/**
 * @brief Non-blocking byte link to one device.
 *
 * read() returns the number of bytes read, 0 if nothing is pending and -1
 * once the link is gone. write() either queues all bytes or fails.
 */
class HostLink {
 public:
  virtual ~HostLink() {}
  virtual bool open() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  virtual long read(uint8_t* buffer, size_t capacity) = 0;
  virtual bool write(const uint8_t* data, size_t len) = 0;
};

class LinkFactory {
 public:
  virtual ~LinkFactory() {}
  virtual std::unique_ptr<HostLink> create(const Advertisement& device) = 0;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_HOST_LINK_H
