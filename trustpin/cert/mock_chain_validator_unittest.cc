// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/mock_chain_validator.h"

#include <string>

#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

class MockChainValidatorTest : public testing::Test {
 protected:
  MockChainValidatorTest() : builder_("mock.example.com") {}

  void SetUp() override {
    cert_ = builder_.BuildSelfSigned();
    ASSERT_TRUE(cert_);
    CertificateList certs;
    certs.push_back(cert_);
    trust_ = ServerTrust::CreateFromCertificates(certs);
    validator_ = base::MakeRefCounted<MockChainValidator>();
  }

  CertBuilder builder_;
  scoped_refptr<X509Certificate> cert_;
  ServerTrust trust_;
  scoped_refptr<MockChainValidator> validator_;
};

TEST_F(MockChainValidatorTest, DefaultResult) {
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_INVALID, validator_->Validate(trust_, "mock.example.com",
                                                   CertificateList(), &result));
  EXPECT_EQ(CERT_STATUS_INVALID, result.cert_status);
  ASSERT_EQ(1u, result.verified_chain.size());
  EXPECT_TRUE(result.verified_chain[0]->Equals(cert_.get()));

  validator_->set_default_result(OK);
  EXPECT_EQ(OK, validator_->Validate(trust_, "mock.example.com",
                                     CertificateList(), &result));
  EXPECT_EQ(0u, result.cert_status);
  EXPECT_EQ(2, validator_->call_count());
}

TEST_F(MockChainValidatorTest, ResultForCertAndHost) {
  ChainValidationResult expired;
  expired.cert_status = CERT_STATUS_DATE_INVALID;
  validator_->AddResultForCertAndHost(cert_, "*.example.com", expired,
                                      ERR_CERT_DATE_INVALID);

  CertificateList anchors;
  anchors.push_back(cert_);
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_DATE_INVALID,
            validator_->Validate(trust_, "mock.example.com", anchors, &result));
  EXPECT_EQ(CERT_STATUS_DATE_INVALID, result.cert_status);
  EXPECT_EQ("mock.example.com", validator_->last_hostname());
  EXPECT_EQ(1u, validator_->last_additional_trust_anchors().size());

  // Other hosts fall through to the default.
  EXPECT_EQ(ERR_CERT_INVALID, validator_->Validate(trust_, "example.net",
                                                   CertificateList(), &result));
  EXPECT_TRUE(validator_->last_additional_trust_anchors().empty());
}

TEST_F(MockChainValidatorTest, StatusAndReturnValueAgree) {
  // A rule that reports an error bit with OK is reconciled to the error.
  ChainValidationResult revoked;
  revoked.cert_status = CERT_STATUS_REVOKED;
  validator_->AddResultForCert(cert_, revoked, OK);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_REVOKED, validator_->Validate(trust_, std::string(),
                                                   CertificateList(), &result));
}

}  // namespace

}  // namespace trustpin
