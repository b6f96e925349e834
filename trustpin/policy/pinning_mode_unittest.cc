// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/pinning_mode.h"

#include "gtest/gtest.h"

namespace trustpin {

TEST(PinningModeTest, RoundTripsNames) {
  for (PinningMode mode : {PinningMode::kNone, PinningMode::kPublicKey,
                           PinningMode::kCertificate}) {
    PinningMode parsed = PinningMode::kNone;
    ASSERT_TRUE(PinningModeFromString(PinningModeToString(mode), &parsed));
    EXPECT_EQ(mode, parsed);
  }
  EXPECT_STREQ("public-key", PinningModeToString(PinningMode::kPublicKey));
}

TEST(PinningModeTest, RejectsUnknownNames) {
  PinningMode mode = PinningMode::kCertificate;
  EXPECT_FALSE(PinningModeFromString("", &mode));
  EXPECT_FALSE(PinningModeFromString("Certificate", &mode));
  EXPECT_FALSE(PinningModeFromString("publickey", &mode));
  EXPECT_EQ(PinningMode::kCertificate, mode);
}

}  // namespace trustpin
