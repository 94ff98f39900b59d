/*
 * This file is part of ShelfSync.
 * (C) 2025 The ShelfSync contributors
 */
#include "security.h"

namespace shelfsync {
namespace security {

namespace {

const uint8_t kat_sha256_msg[] = {'a', 'b', 'c'};
const uint8_t kat_sha256_expected[] = {
    0xBA, 0x78, 0x16, 0xBF, 0x8F, 0x01, 0xCF, 0xEA, 0x41, 0x41, 0x40,
    0xDE, 0x5D, 0xAE, 0x22, 0x23, 0xB0, 0x03, 0x61, 0xA3, 0x96, 0x17,
    0x7A, 0x9C, 0xB4, 0x10, 0xFF, 0x61, 0xF2, 0x00, 0x15, 0xAD};

}  // namespace

bool run_sha256_self_test() {
  uint8_t actual[SHA256_DIGEST_SIZE];
  sha256(kat_sha256_msg, sizeof(kat_sha256_msg), actual);
  return timing_safe_equal(actual, kat_sha256_expected, SHA256_DIGEST_SIZE);
}

}  // namespace security
}  // namespace shelfsync
