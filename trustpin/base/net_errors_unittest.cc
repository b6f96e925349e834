// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/base/net_errors.h"

#include "gtest/gtest.h"

namespace trustpin {

TEST(NetErrorsTest, ErrorToString) {
  EXPECT_EQ("OK", ErrorToShortString(OK));
  EXPECT_EQ("ERR_CERT_INVALID", ErrorToShortString(ERR_CERT_INVALID));
  EXPECT_EQ("ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN",
            ErrorToShortString(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN));
  EXPECT_EQ("trustpin::ERR_EMPTY_PINNED_CERTIFICATES",
            ErrorToString(ERR_EMPTY_PINNED_CERTIFICATES));
}

TEST(NetErrorsTest, IsCertificateError) {
  EXPECT_TRUE(IsCertificateError(ERR_CERT_COMMON_NAME_INVALID));
  EXPECT_TRUE(IsCertificateError(ERR_CERT_DATE_INVALID));
  EXPECT_TRUE(IsCertificateError(ERR_CERT_AUTHORITY_INVALID));
  EXPECT_TRUE(IsCertificateError(ERR_CERT_CHAIN_TOO_LONG));
  EXPECT_TRUE(IsCertificateError(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN));

  EXPECT_FALSE(IsCertificateError(OK));
  EXPECT_FALSE(IsCertificateError(ERR_CERT_END));
  EXPECT_FALSE(IsCertificateError(ERR_INVALID_PINNED_CERTIFICATE));
  EXPECT_FALSE(IsCertificateError(ERR_FILE_NOT_FOUND));
}

TEST(NetErrorsTest, IsPolicyConfigurationError) {
  EXPECT_TRUE(IsPolicyConfigurationError(ERR_INVALID_PINNED_CERTIFICATE));
  EXPECT_TRUE(IsPolicyConfigurationError(ERR_EMPTY_PINNED_CERTIFICATES));
  EXPECT_TRUE(IsPolicyConfigurationError(ERR_INVALID_ARGUMENT));
  EXPECT_FALSE(IsPolicyConfigurationError(ERR_CERT_INVALID));
  EXPECT_FALSE(IsPolicyConfigurationError(OK));
}

}  // namespace trustpin
