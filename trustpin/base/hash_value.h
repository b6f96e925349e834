// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_BASE_HASH_VALUE_H_
#define TRUSTPIN_BASE_HASH_VALUE_H_

#include <stddef.h>
#include <string.h>

#include <string>
#include <string_view>
#include <vector>

#include "trustpin/base/trustpin_export.h"

namespace trustpin {

struct TRUSTPIN_EXPORT SHA256HashValue {
  unsigned char data[32];
};

inline bool operator==(const SHA256HashValue& lhs, const SHA256HashValue& rhs) {
  return memcmp(lhs.data, rhs.data, sizeof(lhs.data)) == 0;
}

inline bool operator!=(const SHA256HashValue& lhs, const SHA256HashValue& rhs) {
  return !(lhs == rhs);
}

inline bool operator<(const SHA256HashValue& lhs, const SHA256HashValue& rhs) {
  return memcmp(lhs.data, rhs.data, sizeof(lhs.data)) < 0;
}

enum HashValueTag {
  HASH_VALUE_SHA256,
};

class TRUSTPIN_EXPORT HashValue {
 public:
  explicit HashValue(const SHA256HashValue& hash);
  explicit HashValue(HashValueTag tag) : tag_(tag) {}
  HashValue() : tag_(HASH_VALUE_SHA256) {}

  // Serializes the HashValue to a string in the form of
  // <hash-name>"/"<base64-hash-value>
  // (eg: "sha256/...")
  // This is the notation HTTP Public Key Pinning uses for pins, and the one
  // that appears in the failure logs of rejected evaluations. If an invalid
  // HashValue is supplied (eg: an unknown hash tag), returns
  // "unknown"/<base64>
  std::string ToString() const;

  size_t size() const;
  unsigned char* data();
  const unsigned char* data() const;

  HashValueTag tag() const { return tag_; }

 private:
  HashValueTag tag_;

  union {
    SHA256HashValue sha256;
  } fingerprint;
};

inline bool operator==(const HashValue& lhs, const HashValue& rhs) {
  return lhs.tag() == rhs.tag() &&
         memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

inline bool operator!=(const HashValue& lhs, const HashValue& rhs) {
  return !(lhs == rhs);
}

typedef std::vector<HashValue> HashValueVector;

}  // namespace trustpin

#endif  // TRUSTPIN_BASE_HASH_VALUE_H_
