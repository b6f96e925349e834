// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/base/hash_value.h"

#include <string.h>

#include <string>

#include "gtest/gtest.h"

namespace trustpin {

TEST(HashValueTest, SHA256) {
  SHA256HashValue sha256;
  for (size_t i = 0; i < sizeof(sha256.data); ++i)
    sha256.data[i] = static_cast<unsigned char>(i);

  HashValue hash(sha256);
  EXPECT_EQ(HASH_VALUE_SHA256, hash.tag());
  ASSERT_EQ(32u, hash.size());
  EXPECT_EQ(0, memcmp(sha256.data, hash.data(), hash.size()));
  EXPECT_EQ("sha256/AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=",
            hash.ToString());
}

TEST(HashValueTest, DefaultIsSHA256) {
  HashValue hash;
  EXPECT_EQ(HASH_VALUE_SHA256, hash.tag());
  EXPECT_EQ(32u, hash.size());
}

TEST(HashValueTest, Equality) {
  SHA256HashValue a;
  SHA256HashValue b;
  memset(a.data, 1, sizeof(a.data));
  memset(b.data, 1, sizeof(b.data));
  EXPECT_EQ(HashValue(a), HashValue(b));

  b.data[31] = 2;
  EXPECT_NE(HashValue(a), HashValue(b));
  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
}

}  // namespace trustpin
