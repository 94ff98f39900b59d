/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_SCANNER_H
#define SHELFSYNC_SCANNER_H

#include <string>
#include <vector>

#include "host/HostLink.h"

namespace shelfsync {
namespace host {

// One discovery pass. Must not block on device I/O.
class Scanner {
 public:
  virtual ~Scanner() {}
  virtual std::vector<Advertisement> scan() = 0;
};

// Lists device nodes in a directory (e.g. /dev/serial/by-id) whose names
// contain the service name. The identity is the node name from the service
// name onwards.
class DirectoryScanner : public Scanner {
 public:
  DirectoryScanner(const std::string& directory, const std::string& service_name);

  std::vector<Advertisement> scan() override;

 private:
  std::string _directory;
  std::string _service_name;
  bool _warned;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_SCANNER_H
