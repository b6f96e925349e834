// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/security_policy.h"

#include <string>
#include <vector>

#include "base/files/file_util.h"
#include "base/files/scoped_temp_dir.h"
#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

class SecurityPolicyTest : public testing::Test {
 protected:
  SecurityPolicyTest() : cert_builder_("pinned.example.com") {}

  void SetUp() override {
    cert_ = cert_builder_.BuildSelfSigned();
    ASSERT_TRUE(cert_);
  }

  void TearDown() override {
    SecurityPolicy::SetDefaultCertificateBundlePath(base::FilePath());
  }

  std::vector<std::string> Pins() const {
    return std::vector<std::string>(1, cert_->der_encoded());
  }

  CertBuilder cert_builder_;
  scoped_refptr<X509Certificate> cert_;
};

TEST_F(SecurityPolicyTest, Default) {
  scoped_refptr<SecurityPolicy> policy = SecurityPolicy::Default();
  ASSERT_TRUE(policy);
  EXPECT_EQ(PinningMode::kNone, policy->pinning_mode());
  EXPECT_TRUE(policy->pinned_certificates().empty());
  EXPECT_FALSE(policy->allow_invalid_certificates());
  EXPECT_TRUE(policy->validates_domain_name());

  // Shared.
  EXPECT_EQ(policy.get(), SecurityPolicy::Default().get());
}

TEST_F(SecurityPolicyTest, BuilderDefaultsMatchDefaultPolicy) {
  int error = ERR_FAILED;
  scoped_refptr<SecurityPolicy> policy = SecurityPolicy::Builder().Build(&error);
  ASSERT_TRUE(policy);
  EXPECT_EQ(OK, error);
  EXPECT_EQ(SecurityPolicy::Default()->ToString(), policy->ToString());
}

TEST_F(SecurityPolicyTest, BuilderSetsEveryField) {
  int error = ERR_FAILED;
  scoped_refptr<SecurityPolicy> policy =
      SecurityPolicy::Builder()
          .set_pinning_mode(PinningMode::kPublicKey)
          .set_pinned_certificates(Pins())
          .set_allow_invalid_certificates(true)
          .set_validates_domain_name(false)
          .Build(&error);
  ASSERT_TRUE(policy);
  EXPECT_EQ(OK, error);
  EXPECT_EQ(PinningMode::kPublicKey, policy->pinning_mode());
  EXPECT_EQ(1u, policy->pinned_certificates().size());
  EXPECT_TRUE(policy->allow_invalid_certificates());
  EXPECT_FALSE(policy->validates_domain_name());
  EXPECT_EQ(
      "mode=public-key pins=1 allow_invalid=true validates_domain_name=false",
      policy->ToString());
}

TEST_F(SecurityPolicyTest, PinningRequiresCertificates) {
  for (PinningMode mode : {PinningMode::kPublicKey, PinningMode::kCertificate}) {
    int error = OK;
    EXPECT_FALSE(SecurityPolicy::CreateWithPinningModeAndCertificates(
        mode, std::vector<std::string>(), &error));
    EXPECT_EQ(ERR_EMPTY_PINNED_CERTIFICATES, error);
  }

  int error = ERR_FAILED;
  EXPECT_TRUE(SecurityPolicy::CreateWithPinningModeAndCertificates(
      PinningMode::kNone, std::vector<std::string>(), &error));
  EXPECT_EQ(OK, error);
}

TEST_F(SecurityPolicyTest, RejectsMalformedPins) {
  std::vector<std::string> der_certs = Pins();
  der_certs.push_back(std::string("\x30\x03\x02\x01\x01", 5));

  int error = OK;
  EXPECT_FALSE(SecurityPolicy::CreateWithPinningModeAndCertificates(
      PinningMode::kCertificate, der_certs, &error));
  EXPECT_EQ(ERR_INVALID_PINNED_CERTIFICATE, error);

  // Pins are parsed even when they will never be compared.
  error = OK;
  EXPECT_FALSE(SecurityPolicy::CreateWithPinningModeAndCertificates(
      PinningMode::kNone, der_certs, &error));
  EXPECT_EQ(ERR_INVALID_PINNED_CERTIFICATE, error);
}

TEST_F(SecurityPolicyTest, WithPinnedCertificatesReplacesSet) {
  int error = ERR_FAILED;
  scoped_refptr<SecurityPolicy> policy =
      SecurityPolicy::CreateWithPinningModeAndCertificates(
          PinningMode::kCertificate, Pins(), &error);
  ASSERT_TRUE(policy);

  CertBuilder other_builder("other.example.com");
  scoped_refptr<X509Certificate> other = other_builder.BuildSelfSigned();
  ASSERT_TRUE(other);

  scoped_refptr<SecurityPolicy> replaced = policy->WithPinnedCertificates(
      std::vector<std::string>(1, other->der_encoded()), &error);
  ASSERT_TRUE(replaced);
  EXPECT_EQ(OK, error);
  EXPECT_EQ(PinningMode::kCertificate, replaced->pinning_mode());
  EXPECT_TRUE(replaced->pinned_certificates().Matches(*other));
  EXPECT_FALSE(replaced->pinned_certificates().Matches(*cert_));

  // The original is unchanged.
  EXPECT_TRUE(policy->pinned_certificates().Matches(*cert_));
  EXPECT_FALSE(policy->pinned_certificates().Matches(*other));

  // Replacing with nothing violates the invariant again.
  EXPECT_FALSE(
      policy->WithPinnedCertificates(std::vector<std::string>(), &error));
  EXPECT_EQ(ERR_EMPTY_PINNED_CERTIFICATES, error);
}

TEST_F(SecurityPolicyTest, WithFlagsCopies) {
  scoped_refptr<SecurityPolicy> policy = SecurityPolicy::Default();

  scoped_refptr<SecurityPolicy> permissive =
      policy->WithAllowInvalidCertificates(true);
  EXPECT_TRUE(permissive->allow_invalid_certificates());
  EXPECT_TRUE(permissive->validates_domain_name());
  EXPECT_FALSE(policy->allow_invalid_certificates());

  scoped_refptr<SecurityPolicy> nameless =
      permissive->WithValidatesDomainName(false);
  EXPECT_TRUE(nameless->allow_invalid_certificates());
  EXPECT_FALSE(nameless->validates_domain_name());
  EXPECT_TRUE(permissive->validates_domain_name());
}

TEST_F(SecurityPolicyTest, BuilderFromPolicy) {
  int error = ERR_FAILED;
  scoped_refptr<SecurityPolicy> policy =
      SecurityPolicy::Builder()
          .set_pinning_mode(PinningMode::kCertificate)
          .set_pinned_certificates(Pins())
          .set_validates_domain_name(false)
          .Build(&error);
  ASSERT_TRUE(policy);

  scoped_refptr<SecurityPolicy> copy =
      SecurityPolicy::Builder(*policy).Build(&error);
  ASSERT_TRUE(copy);
  EXPECT_EQ(policy->ToString(), copy->ToString());
  EXPECT_TRUE(copy->pinned_certificates().Matches(*cert_));
}

TEST_F(SecurityPolicyTest, CreateWithPinningModeUsesDefaultBundle) {
  int error = ERR_FAILED;

  // Nothing registered: only kNone can be satisfied.
  EXPECT_TRUE(
      SecurityPolicy::CreateWithPinningMode(PinningMode::kNone, &error));
  EXPECT_EQ(OK, error);
  EXPECT_FALSE(
      SecurityPolicy::CreateWithPinningMode(PinningMode::kPublicKey, &error));
  EXPECT_EQ(ERR_EMPTY_PINNED_CERTIFICATES, error);

  base::ScopedTempDir bundle;
  ASSERT_TRUE(bundle.CreateUniqueTempDir());
  const std::string& der = cert_->der_encoded();
  ASSERT_EQ(static_cast<int>(der.size()),
            base::WriteFile(bundle.GetPath().Append("pinned.cer"), der.data(),
                            static_cast<int>(der.size())));

  SecurityPolicy::SetDefaultCertificateBundlePath(bundle.GetPath());
  EXPECT_EQ(bundle.GetPath(), SecurityPolicy::GetDefaultCertificateBundlePath());

  std::vector<std::string> der_certs;
  EXPECT_EQ(OK, SecurityPolicy::GetDefaultPinnedCertificates(&der_certs));
  ASSERT_EQ(1u, der_certs.size());
  EXPECT_EQ(der, der_certs[0]);

  scoped_refptr<SecurityPolicy> policy =
      SecurityPolicy::CreateWithPinningMode(PinningMode::kCertificate, &error);
  ASSERT_TRUE(policy);
  EXPECT_EQ(OK, error);
  EXPECT_TRUE(policy->pinned_certificates().Matches(*cert_));

  // kNone ignores the bundle.
  policy = SecurityPolicy::CreateWithPinningMode(PinningMode::kNone, &error);
  ASSERT_TRUE(policy);
  EXPECT_TRUE(policy->pinned_certificates().empty());
}

TEST_F(SecurityPolicyTest, CreateWithPinningModeMissingBundle) {
  base::ScopedTempDir temp_dir;
  ASSERT_TRUE(temp_dir.CreateUniqueTempDir());
  SecurityPolicy::SetDefaultCertificateBundlePath(
      temp_dir.GetPath().Append("missing"));

  int error = OK;
  EXPECT_FALSE(
      SecurityPolicy::CreateWithPinningMode(PinningMode::kPublicKey, &error));
  EXPECT_EQ(ERR_FILE_NOT_FOUND, error);
}

}  // namespace

}  // namespace trustpin
