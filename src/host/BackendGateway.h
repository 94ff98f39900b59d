/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#ifndef SHELFSYNC_BACKEND_GATEWAY_H
#define SHELFSYNC_BACKEND_GATEWAY_H

#include <stdint.h>

#include <string>

#include "etl_profile.h"
#include "etl/expected.h"

#include "model/inventory.h"

namespace shelfsync {
namespace host {

enum class SubmitResult : uint8_t {
  ACCEPTED = 0,
  DUPLICATE,    // (device, sequence) already applied; not an error
  REJECTED,     // slot not owned by the device or holds no item
  UNAVAILABLE   // not durable, the device must retry later
};

enum class UpstreamError : uint8_t {
  UNAVAILABLE = 0,
  UNKNOWN_DEVICE,
  UNASSIGNED    // registered but no footprint yet
};

const char* toString(SubmitResult result);
const char* toString(UpstreamError error);

/**
 * @brief The backend as seen by the bridge.
 *
 * submitStockUpdate() must be idempotent per (device, sequence) and must
 * only return ACCEPTED once the change is durable.
 */
class BackendGateway {
 public:
  virtual ~BackendGateway() {}

  virtual SubmitResult submitStockUpdate(const model::StockDelta& delta) = 0;

  virtual etl::expected<model::ConfigSnapshot, UpstreamError> fetchConfig(
      const std::string& device) = 0;

  // Makes the device known upstream. Registering twice is not an error.
  virtual bool registerDevice(const std::string& device) = 0;
};

}  // namespace host
}  // namespace shelfsync

#endif  // SHELFSYNC_BACKEND_GATEWAY_H
