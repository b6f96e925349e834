// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/x509_util.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace x509_util {

namespace {

class X509UtilTest : public testing::Test {
 protected:
  X509UtilTest() : root_builder_("Util Root"), leaf_builder_("util.test") {}

  void SetUp() override {
    root_builder_.set_is_ca(true);
    root_ = root_builder_.BuildSelfSigned();
    ASSERT_TRUE(root_);
    leaf_ = leaf_builder_.BuildSignedBy(root_builder_);
    ASSERT_TRUE(leaf_);
  }

  CertBuilder root_builder_;
  CertBuilder leaf_builder_;
  scoped_refptr<X509Certificate> root_;
  scoped_refptr<X509Certificate> leaf_;
};

TEST_F(X509UtilTest, X509RoundTrip) {
  crypto::ScopedX509 handle = CreateX509FromCertificate(*leaf_);
  ASSERT_TRUE(handle);

  std::string der;
  ASSERT_TRUE(GetDEREncoded(handle.get(), &der));
  EXPECT_EQ(leaf_->der_encoded(), der);

  scoped_refptr<X509Certificate> copy = CreateCertificateFromX509(handle.get());
  ASSERT_TRUE(copy);
  EXPECT_TRUE(copy->Equals(leaf_.get()));
}

TEST_F(X509UtilTest, ParseDERCertChain) {
  std::vector<std::string> der_certs;
  der_certs.push_back(leaf_->der_encoded());
  der_certs.push_back(root_->der_encoded());

  CertificateList certs;
  ASSERT_TRUE(ParseDERCertChain(der_certs, &certs));
  ASSERT_EQ(2u, certs.size());
  EXPECT_TRUE(certs[0]->Equals(leaf_.get()));
  EXPECT_TRUE(certs[1]->Equals(root_.get()));

  // Empty input yields an empty chain.
  EXPECT_TRUE(ParseDERCertChain(std::vector<std::string>(), &certs));
  EXPECT_TRUE(certs.empty());
}

TEST_F(X509UtilTest, ParseDERCertChainIsAllOrNothing) {
  std::vector<std::string> der_certs;
  der_certs.push_back(leaf_->der_encoded());
  der_certs.push_back("not a certificate");
  der_certs.push_back(root_->der_encoded());

  CertificateList certs;
  certs.push_back(root_);
  EXPECT_FALSE(ParseDERCertChain(der_certs, &certs));
  EXPECT_TRUE(certs.empty());
}

TEST_F(X509UtilTest, SPKIHashes) {
  CertificateList certs;
  certs.push_back(leaf_);
  certs.push_back(root_);

  HashValueVector hashes = GetSPKIHashes(certs);
  ASSERT_EQ(2u, hashes.size());
  EXPECT_EQ(leaf_->CalculateSPKIHash(), hashes[0]);
  EXPECT_EQ(root_->CalculateSPKIHash(), hashes[1]);

  EXPECT_EQ(hashes[0].ToString() + "," + hashes[1].ToString(),
            HashesToBase64String(hashes));
  EXPECT_EQ("", HashesToBase64String(HashValueVector()));
}

}  // namespace

}  // namespace x509_util

}  // namespace trustpin
