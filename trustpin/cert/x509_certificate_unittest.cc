// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/x509_certificate.h"

#include <memory>
#include <string>

#include "crypto/sha2.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "trustpin/cert/pem.h"
#include "trustpin/test/cert_builder.h"

using testing::HasSubstr;

namespace trustpin {

namespace {

class X509CertificateTest : public testing::Test {
 protected:
  void SetUp() override {
    root_builder_ = std::make_unique<CertBuilder>("Test Root CA");
    root_builder_->set_is_ca(true);
    root_ = root_builder_->BuildSelfSigned();
    ASSERT_TRUE(root_);

    leaf_builder_ = std::make_unique<CertBuilder>("www.example.com");
    leaf_builder_->AddDNSName("www.example.com");
    leaf_ = leaf_builder_->BuildSignedBy(*root_builder_);
    ASSERT_TRUE(leaf_);
  }

  std::unique_ptr<CertBuilder> root_builder_;
  std::unique_ptr<CertBuilder> leaf_builder_;
  scoped_refptr<X509Certificate> root_;
  scoped_refptr<X509Certificate> leaf_;
};

TEST_F(X509CertificateTest, CreateFromBytes) {
  scoped_refptr<X509Certificate> cert =
      X509Certificate::CreateFromBytes(leaf_->der_encoded());
  ASSERT_TRUE(cert);
  EXPECT_EQ(leaf_->der_encoded(), cert->der_encoded());
  EXPECT_TRUE(cert->Equals(leaf_.get()));
  EXPECT_FALSE(cert->Equals(root_.get()));
}

TEST_F(X509CertificateTest, RejectsMalformedInput) {
  EXPECT_FALSE(X509Certificate::CreateFromBytes(std::string_view()));
  EXPECT_FALSE(X509Certificate::CreateFromBytes("garbage"));

  const std::string& der = leaf_->der_encoded();
  EXPECT_FALSE(X509Certificate::CreateFromBytes(der.substr(0, der.size() - 1)));
  EXPECT_FALSE(X509Certificate::CreateFromBytes(der + "x"));
  EXPECT_FALSE(X509Certificate::CreateFromBytes(der + root_->der_encoded()));
}

TEST_F(X509CertificateTest, ParsesCertificateWithBadSignature) {
  // Flipping a signature bit keeps the DER shape intact. Signatures are
  // checked by the chain validator, not the codec.
  std::string der = leaf_->der_encoded();
  der[der.size() - 1] ^= 0x01;
  EXPECT_TRUE(X509Certificate::CreateFromBytes(der));
}

TEST_F(X509CertificateTest, PublicKeyBytesFollowTheKey) {
  // Same key, new certificate.
  CertBuilder renewed("www.example.com");
  renewed.UseKeyOf(*leaf_builder_);
  renewed.AddDNSName("www.example.com");
  scoped_refptr<X509Certificate> renewed_cert =
      renewed.BuildSignedBy(*root_builder_);
  ASSERT_TRUE(renewed_cert);

  EXPECT_NE(leaf_->der_encoded(), renewed_cert->der_encoded());
  EXPECT_EQ(leaf_->public_key_bytes(), renewed_cert->public_key_bytes());
  EXPECT_EQ(leaf_->CalculateSPKIHash(), renewed_cert->CalculateSPKIHash());

  // New key.
  EXPECT_NE(leaf_->public_key_bytes(), root_->public_key_bytes());
  EXPECT_NE(leaf_->CalculateSPKIHash(), root_->CalculateSPKIHash());
}

TEST_F(X509CertificateTest, CalculateSPKIHash) {
  HashValue hash = leaf_->CalculateSPKIHash();
  EXPECT_EQ(HASH_VALUE_SHA256, hash.tag());
  std::string expected = crypto::SHA256HashString(leaf_->public_key_bytes());
  EXPECT_EQ(expected, std::string(reinterpret_cast<const char*>(hash.data()),
                                  hash.size()));
}

TEST_F(X509CertificateTest, CalculateFingerprint256) {
  SHA256HashValue fingerprint = leaf_->CalculateFingerprint256();
  std::string expected = crypto::SHA256HashString(leaf_->der_encoded());
  EXPECT_EQ(expected,
            std::string(reinterpret_cast<const char*>(fingerprint.data),
                        sizeof(fingerprint.data)));
  EXPECT_NE(fingerprint, root_->CalculateFingerprint256());
}

TEST_F(X509CertificateTest, IsSelfSigned) {
  EXPECT_TRUE(root_->IsSelfSigned());
  EXPECT_FALSE(leaf_->IsSelfSigned());
}

TEST_F(X509CertificateTest, GetSubjectDisplayName) {
  EXPECT_THAT(leaf_->GetSubjectDisplayName(), HasSubstr("CN=www.example.com"));
  EXPECT_THAT(root_->GetSubjectDisplayName(), HasSubstr("CN=Test Root CA"));
}

TEST_F(X509CertificateTest, CreateCertificateListFromPEMSequence) {
  std::string pem = "junk before\n" +
                    PEMEncode(leaf_->der_encoded(), "CERTIFICATE") +
                    PEMEncode(root_->der_encoded(), "CERTIFICATE");

  CertificateList certs = X509Certificate::CreateCertificateListFromBytes(
      pem.data(), pem.size(), X509Certificate::FORMAT_AUTO);
  ASSERT_EQ(2u, certs.size());
  EXPECT_TRUE(certs[0]->Equals(leaf_.get()));
  EXPECT_TRUE(certs[1]->Equals(root_.get()));

  certs = X509Certificate::CreateCertificateListFromBytes(
      pem.data(), pem.size(), X509Certificate::FORMAT_SINGLE_CERTIFICATE);
  ASSERT_EQ(1u, certs.size());
  EXPECT_TRUE(certs[0]->Equals(leaf_.get()));
}

TEST_F(X509CertificateTest, CreateCertificateListFromDER) {
  const std::string& der = leaf_->der_encoded();
  CertificateList certs = X509Certificate::CreateCertificateListFromBytes(
      der.data(), der.size(), X509Certificate::FORMAT_AUTO);
  ASSERT_EQ(1u, certs.size());
  EXPECT_TRUE(certs[0]->Equals(leaf_.get()));

  certs = X509Certificate::CreateCertificateListFromBytes(
      der.data(), der.size(), X509Certificate::FORMAT_PEM_CERT_SEQUENCE);
  EXPECT_TRUE(certs.empty());
}

TEST_F(X509CertificateTest, PEMSequenceStopsAtFirstBadBlock) {
  std::string pem = PEMEncode(leaf_->der_encoded(), "CERTIFICATE") +
                    PEMEncode("not a certificate", "CERTIFICATE") +
                    PEMEncode(root_->der_encoded(), "CERTIFICATE");
  CertificateList certs = X509Certificate::CreateCertificateListFromBytes(
      pem.data(), pem.size(), X509Certificate::FORMAT_PEM_CERT_SEQUENCE);
  ASSERT_EQ(1u, certs.size());
  EXPECT_TRUE(certs[0]->Equals(leaf_.get()));
}

}  // namespace

}  // namespace trustpin
