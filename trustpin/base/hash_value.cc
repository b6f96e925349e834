// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/base/hash_value.h"

#include "base/base64.h"
#include "base/logging.h"

namespace trustpin {

namespace {

const char kSHA256Prefix[] = "sha256/";

}  // namespace

HashValue::HashValue(const SHA256HashValue& hash)
    : HashValue(HASH_VALUE_SHA256) {
  fingerprint.sha256 = hash;
}

std::string HashValue::ToString() const {
  std::string base64_str;
  base::Base64Encode(
      std::string_view(reinterpret_cast<const char*>(data()), size()),
      &base64_str);
  switch (tag_) {
    case HASH_VALUE_SHA256:
      return kSHA256Prefix + base64_str;
  }

  NOTREACHED() << "Unknown HashValueTag " << tag_;
  return std::string("unknown/" + base64_str);
}

size_t HashValue::size() const {
  switch (tag_) {
    case HASH_VALUE_SHA256:
      return sizeof(fingerprint.sha256.data);
  }

  NOTREACHED() << "Unknown HashValueTag " << tag_;
  // While an invalid tag should not happen, return a non-zero length
  // to avoid compiler warnings when the result of size() is
  // used with functions like memset.
  return sizeof(fingerprint.sha256.data);
}

unsigned char* HashValue::data() {
  return const_cast<unsigned char*>(const_cast<const HashValue*>(this)->data());
}

const unsigned char* HashValue::data() const {
  switch (tag_) {
    case HASH_VALUE_SHA256:
      return fingerprint.sha256.data;
  }

  NOTREACHED() << "Unknown HashValueTag " << tag_;
  return nullptr;
}

}  // namespace trustpin
