/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <string>

#include "config/shelfsync_config.h"
#include "host/BridgeCoordinator.h"
#include "host/FirmwareSource.h"
#include "host/MemoryGateway.h"
#include "host/Scanner.h"
#include "host/SerialLink.h"
#include "util/Log.h"

using namespace shelfsync;

namespace {

const char kTag[] = "main";
constexpr useconds_t kLoopSleepUs = 10000;

volatile sig_atomic_t g_stop = 0;

void onSignal(int) { g_stop = 1; }

uint32_t millis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint32_t>((ts.tv_sec * 1000) + (ts.tv_nsec / 1000000));
}

struct Options {
  std::string scan_dir;
  std::string inventory;
  std::string journal;
  std::string firmware;
  unsigned long firmware_version;
  bool verbose;
};

void usage(const char* argv0) {
  fprintf(stderr,
          "usage: %s [options]\n"
          "  --scan-dir DIR          device nodes to scan (default /dev/serial/by-id)\n"
          "  --inventory FILE        JSON inventory seed\n"
          "  --journal FILE          durable log of accepted stock updates\n"
          "  --firmware FILE         firmware image served to devices\n"
          "  --firmware-version N    version of that image\n"
          "  --verbose               debug logging\n",
          argv0);
}

bool parseOptions(int argc, char** argv, Options& options) {
  static const struct option kLongOptions[] = {
      {"scan-dir", required_argument, nullptr, 's'},
      {"inventory", required_argument, nullptr, 'i'},
      {"journal", required_argument, nullptr, 'j'},
      {"firmware", required_argument, nullptr, 'f'},
      {"firmware-version", required_argument, nullptr, 'V'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  options.scan_dir = "/dev/serial/by-id";
  options.firmware_version = 0;
  options.verbose = false;

  int opt;
  while ((opt = getopt_long(argc, argv, "s:i:j:f:V:vh", kLongOptions, nullptr)) != -1) {
    switch (opt) {
      case 's': options.scan_dir = optarg; break;
      case 'i': options.inventory = optarg; break;
      case 'j': options.journal = optarg; break;
      case 'f': options.firmware = optarg; break;
      case 'V': {
        char* end = nullptr;
        options.firmware_version = strtoul(optarg, &end, 10);
        if (end == optarg || *end != '\0' || options.firmware_version == 0 ||
            options.firmware_version > 0xFFFFUL) {
          fprintf(stderr, "invalid firmware version '%s'\n", optarg);
          return false;
        }
        break;
      }
      case 'v': options.verbose = true; break;
      default: return false;
    }
  }
  if (optind != argc) {
    fprintf(stderr, "unexpected argument '%s'\n", argv[optind]);
    return false;
  }
  if (!options.firmware.empty() && options.firmware_version == 0) {
    fprintf(stderr, "--firmware needs --firmware-version\n");
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  if (!parseOptions(argc, argv, options)) {
    usage(argv[0]);
    return 2;
  }

  log::installEtlErrorHandler();
  if (options.verbose) {
    log::setLevel(log::Level::DEBUG);
  }

  host::MemoryGateway backend;
  std::string error;
  if (!options.inventory.empty() && !backend.loadInventoryFile(options.inventory, error)) {
    SHELFSYNC_LOG_ERROR(kTag, "%s", error.c_str());
    return 1;
  }
  if (!options.journal.empty() && !backend.openJournal(options.journal, error)) {
    SHELFSYNC_LOG_ERROR(kTag, "%s", error.c_str());
    return 1;
  }

  host::FileFirmwareImage image;
  const bool have_image = !options.firmware.empty();
  if (have_image) {
    if (!image.load(options.firmware,
                    static_cast<uint16_t>(options.firmware_version), error)) {
      SHELFSYNC_LOG_ERROR(kTag, "%s", error.c_str());
      return 1;
    }
    if (backend.firmware().version == 0) {
      backend.setFirmware(image.info());
    }
  }

  host::DirectoryScanner scanner(options.scan_dir, SHELFSYNC_SERVICE_NAME);
  if (!host::SerialLink::supportedBaudrate(SHELFSYNC_LINK_BAUDRATE)) {
    SHELFSYNC_LOG_ERROR(kTag, "unsupported link baud rate %lu",
                        static_cast<unsigned long>(SHELFSYNC_LINK_BAUDRATE));
    return 1;
  }
  host::SerialLinkFactory links(SHELFSYNC_LINK_BAUDRATE);
  host::BridgeCoordinator bridge(scanner, links, backend);
  if (have_image) {
    bridge.setFirmwareImage(&image);
  }

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = onSignal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  signal(SIGPIPE, SIG_IGN);

  bridge.begin(millis());
  while (!g_stop) {
    bridge.poll(millis());
    usleep(kLoopSleepUs);
  }

  SHELFSYNC_LOG_INFO(kTag, "stopping");
  bridge.shutdown();
  backend.closeJournal();
  return 0;
}
