// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/base64.h"

#include <stdint.h>
#include <string.h>

#include <string>

#include "gtest/gtest.h"

namespace base {

TEST(Base64Test, Basic) {
  const std::string kText = "hello world";
  const std::string kBase64Text = "aGVsbG8gd29ybGQ=";

  std::string encoded;
  std::string decoded;
  bool ok;

  Base64Encode(kText, &encoded);
  EXPECT_EQ(kBase64Text, encoded);

  ok = Base64Decode(encoded, &decoded);
  EXPECT_TRUE(ok);
  EXPECT_EQ(kText, decoded);
}

TEST(Base64Test, Binary) {
  const uint8_t kData[] = {0x00, 0x01, 0xFE, 0xFF};

  std::string encoded;
  Base64Encode(std::string_view(reinterpret_cast<const char*>(kData),
                                sizeof(kData)),
               &encoded);
  EXPECT_EQ("AAH+/w==", encoded);

  std::string decoded;
  EXPECT_TRUE(Base64Decode(encoded, &decoded));
  ASSERT_EQ(sizeof(kData), decoded.size());
  EXPECT_EQ(0, memcmp(kData, decoded.data(), sizeof(kData)));
}

TEST(Base64Test, Empty) {
  std::string encoded = "unchanged";
  Base64Encode(std::string(), &encoded);
  EXPECT_EQ("", encoded);

  std::string decoded = "unchanged";
  EXPECT_TRUE(Base64Decode(std::string(), &decoded));
  EXPECT_EQ("", decoded);
}

TEST(Base64Test, InPlace) {
  const std::string kText = "hello world";
  const std::string kBase64Text = "aGVsbG8gd29ybGQ=";
  std::string text(kText);

  Base64Encode(text, &text);
  EXPECT_EQ(kBase64Text, text);

  bool ok = Base64Decode(text, &text);
  EXPECT_TRUE(ok);
  EXPECT_EQ(text, kText);
}

TEST(Base64Test, RejectsMalformedInput) {
  std::string decoded;
  EXPECT_FALSE(Base64Decode("aGVsbG8", &decoded));
  EXPECT_FALSE(Base64Decode("aG=sbG8=", &decoded));
  EXPECT_FALSE(Base64Decode("aGVs\nbG8=", &decoded));
  EXPECT_FALSE(Base64Decode("a===", &decoded));
}

}  // namespace base
