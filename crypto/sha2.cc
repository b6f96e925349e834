// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "crypto/sha2.h"

#include <stdint.h>
#include <string.h>

#include <algorithm>

#include <openssl/sha.h>

#include "crypto/openssl_util.h"

namespace crypto {

void SHA256HashString(std::string_view str, void* output, size_t len) {
  OpenSSLErrStackTracer err_tracer(FROM_HERE);
  uint8_t digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const uint8_t*>(str.data()), str.size(), digest);
  memcpy(output, digest, std::min(len, sizeof(digest)));
}

std::string SHA256HashString(std::string_view str) {
  std::string output(kSHA256Length, 0);
  SHA256HashString(str, &output[0], output.size());
  return output;
}

}  // namespace crypto
