/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "Scanner.h"

#include <dirent.h>
#include <errno.h>
#include <string.h>

#include <algorithm>

#include "model/inventory.h"
#include "util/Log.h"

namespace shelfsync {
namespace host {

namespace {
const char kTag[] = "scan";
}  // namespace

DirectoryScanner::DirectoryScanner(const std::string& directory,
                                   const std::string& service_name)
    : _directory(directory), _service_name(service_name), _warned(false) {}

std::vector<Advertisement> DirectoryScanner::scan() {
  std::vector<Advertisement> found;
  DIR* dir = opendir(_directory.c_str());
  if (dir == nullptr) {
    // The directory disappears when the last adapter is unplugged.
    if (!_warned) {
      SHELFSYNC_LOG_WARN(kTag, "cannot list %s: %s", _directory.c_str(),
                         strerror(errno));
      _warned = true;
    }
    return found;
  }
  _warned = false;

  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    const std::string name(entry->d_name);
    const size_t at = name.find(_service_name);
    if (at == std::string::npos) {
      continue;
    }
    // "usb-ShelfSync-A1" is advertised as "ShelfSync-A1".
    const std::string address = name.substr(at);
    if (address.size() > model::kMaxDeviceIdLength) {
      SHELFSYNC_LOG_DEBUG(kTag, "skipping %s: name too long", name.c_str());
      continue;
    }
    Advertisement ad;
    ad.address = address;
    ad.path = _directory + "/" + name;
    found.push_back(ad);
  }
  closedir(dir);

  std::sort(found.begin(), found.end(),
            [](const Advertisement& a, const Advertisement& b) {
              return a.address < b.address;
            });
  return found;
}

}  // namespace host
}  // namespace shelfsync
