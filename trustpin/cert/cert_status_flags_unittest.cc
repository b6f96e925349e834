// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/cert_status_flags.h"

#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"

namespace trustpin {

TEST(CertStatusFlagsTest, MapNetErrorToCertStatus) {
  EXPECT_EQ(CERT_STATUS_DATE_INVALID,
            MapNetErrorToCertStatus(ERR_CERT_DATE_INVALID));
  EXPECT_EQ(CERT_STATUS_AUTHORITY_INVALID,
            MapNetErrorToCertStatus(ERR_CERT_AUTHORITY_INVALID));
  EXPECT_EQ(CERT_STATUS_INVALID,
            MapNetErrorToCertStatus(ERR_CERT_CONTAINS_ERRORS));
  EXPECT_EQ(0u, MapNetErrorToCertStatus(OK));
  EXPECT_EQ(0u, MapNetErrorToCertStatus(ERR_FILE_NOT_FOUND));
}

TEST(CertStatusFlagsTest, MapCertStatusToNetErrorPicksMostSerious) {
  EXPECT_EQ(ERR_CERT_INVALID,
            MapCertStatusToNetError(CERT_STATUS_INVALID |
                                    CERT_STATUS_DATE_INVALID));
  EXPECT_EQ(ERR_CERT_REVOKED,
            MapCertStatusToNetError(CERT_STATUS_REVOKED |
                                    CERT_STATUS_AUTHORITY_INVALID));
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            MapCertStatusToNetError(CERT_STATUS_AUTHORITY_INVALID |
                                    CERT_STATUS_COMMON_NAME_INVALID |
                                    CERT_STATUS_DATE_INVALID));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            MapCertStatusToNetError(CERT_STATUS_COMMON_NAME_INVALID |
                                    CERT_STATUS_DATE_INVALID));
  EXPECT_EQ(ERR_CERT_DATE_INVALID,
            MapCertStatusToNetError(CERT_STATUS_DATE_INVALID));
}

TEST(CertStatusFlagsTest, IsCertStatusError) {
  EXPECT_FALSE(IsCertStatusError(0));
  EXPECT_FALSE(IsCertStatusError(CERT_STATUS_IS_ANCHORED_BY_PIN));
  EXPECT_TRUE(IsCertStatusError(CERT_STATUS_DATE_INVALID |
                                CERT_STATUS_IS_ANCHORED_BY_PIN));
}

TEST(CertStatusFlagsTest, CertStatusToString) {
  EXPECT_EQ("OK", CertStatusToString(0));
  EXPECT_EQ("DATE_INVALID", CertStatusToString(CERT_STATUS_DATE_INVALID));
  EXPECT_EQ("COMMON_NAME_INVALID|AUTHORITY_INVALID",
            CertStatusToString(CERT_STATUS_AUTHORITY_INVALID |
                               CERT_STATUS_COMMON_NAME_INVALID));
}

}  // namespace trustpin
