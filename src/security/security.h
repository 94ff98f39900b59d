/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
/**
 * @file security.h
 * @brief Digest helpers for firmware image verification.
 */
#ifndef SHELFSYNC_SECURITY_H
#define SHELFSYNC_SECURITY_H

#include <stddef.h>
#include <stdint.h>

#include <SHA256.h>

namespace shelfsync {
namespace security {

constexpr size_t SHA256_DIGEST_SIZE = 32;

/**
 * @brief Securely zero memory, resistant to compiler optimization.
 */
inline void secure_zero(void* buf, size_t len) {
  volatile uint8_t* p = static_cast<volatile uint8_t*>(buf);
  while (len--) {
    *p++ = 0;
  }
#if defined(__GNUC__) || defined(__clang__)
  asm volatile("" ::: "memory");
#endif
}

/**
 * @brief Timing-safe memory comparison.
 */
inline bool timing_safe_equal(const uint8_t* a, const uint8_t* b, size_t len) {
  volatile uint8_t result = 0;
  for (size_t i = 0; i < len; i++) {
    result |= a[i] ^ b[i];
  }
  return result == 0;
}

// One-shot SHA-256.
inline void sha256(const uint8_t* data, size_t len, uint8_t* out_digest) {
  SHA256 hash;
  hash.reset();
  hash.update(data, len);
  hash.finalize(out_digest, SHA256_DIGEST_SIZE);
}

// Known answer test for the SHA-256 implementation, run before the first
// digest check so a broken build never activates an image.
bool run_sha256_self_test();

}  // namespace security
}  // namespace shelfsync

#endif  // SHELFSYNC_SECURITY_H
