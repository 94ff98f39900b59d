/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "BackendGateway.h"

namespace shelfsync {
namespace host {

const char* toString(SubmitResult result) {
  switch (result) {
    case SubmitResult::ACCEPTED:    return "accepted";
    case SubmitResult::DUPLICATE:   return "duplicate";
    case SubmitResult::REJECTED:    return "rejected";
    case SubmitResult::UNAVAILABLE: return "unavailable";
  }
  return "?";
}

const char* toString(UpstreamError error) {
  switch (error) {
    case UpstreamError::UNAVAILABLE:    return "unavailable";
    case UpstreamError::UNKNOWN_DEVICE: return "unknown device";
    case UpstreamError::UNASSIGNED:     return "no footprint assigned";
  }
  return "?";
}

}  // namespace host
}  // namespace shelfsync
