// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/chain_validator_openssl.h"

#include <stdlib.h>

#include <string>
#include <vector>

#include <openssl/x509.h>

#include "base/files/file_util.h"
#include "base/files/scoped_temp_dir.h"
#include "base/macros.h"
#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/pem.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

const int64_t kOneDay = 24 * 60 * 60;

// Sets an environment variable for the lifetime of the object.
class ScopedEnvironmentVariable {
 public:
  ScopedEnvironmentVariable(const char* name, const std::string& value)
      : name_(name) {
    const char* old_value = getenv(name);
    had_value_ = old_value != nullptr;
    if (had_value_)
      old_value_ = old_value;
    setenv(name, value.c_str(), 1);
  }

  ~ScopedEnvironmentVariable() {
    if (had_value_)
      setenv(name_, old_value_.c_str(), 1);
    else
      unsetenv(name_);
  }

 private:
  const char* const name_;
  bool had_value_;
  std::string old_value_;

  DISALLOW_COPY_AND_ASSIGN(ScopedEnvironmentVariable);
};

// Builds a three level PKI:
//   Test Root -> Test Intermediate -> www.example.com
// The root is trusted through Config::root_certs, never through the system
// store.
class OpenSSLChainValidatorTest : public testing::Test {
 protected:
  OpenSSLChainValidatorTest()
      : root_builder_("Test Root"),
        intermediate_builder_("Test Intermediate"),
        leaf_builder_("www.example.com") {}

  void SetUp() override {
    root_builder_.set_is_ca(true);
    intermediate_builder_.set_is_ca(true);
    leaf_builder_.AddDNSName("www.example.com");
    leaf_builder_.AddDNSName("*.example.org");
    leaf_builder_.AddIPAddress("127.0.0.1");
    leaf_builder_.AddIPAddress("::1");

    root_ = root_builder_.BuildSelfSigned();
    intermediate_ = intermediate_builder_.BuildSignedBy(root_builder_);
    leaf_ = leaf_builder_.BuildSignedBy(intermediate_builder_);
    ASSERT_TRUE(root_);
    ASSERT_TRUE(intermediate_);
    ASSERT_TRUE(leaf_);

    OpenSSLChainValidator::Config config;
    config.use_system_roots = false;
    config.root_certs.push_back(root_);
    validator_ = base::MakeRefCounted<OpenSSLChainValidator>(config);

    OpenSSLChainValidator::Config empty_config;
    empty_config.use_system_roots = false;
    untrusting_validator_ =
        base::MakeRefCounted<OpenSSLChainValidator>(empty_config);
  }

  ServerTrust FullChain() const {
    CertificateList certs;
    certs.push_back(leaf_);
    certs.push_back(intermediate_);
    return ServerTrust::CreateFromCertificates(certs);
  }

  CertBuilder root_builder_;
  CertBuilder intermediate_builder_;
  CertBuilder leaf_builder_;
  scoped_refptr<X509Certificate> root_;
  scoped_refptr<X509Certificate> intermediate_;
  scoped_refptr<X509Certificate> leaf_;
  scoped_refptr<ChainValidator> validator_;
  scoped_refptr<ChainValidator> untrusting_validator_;
};

TEST_F(OpenSSLChainValidatorTest, SupportsAdditionalTrustAnchors) {
  EXPECT_TRUE(validator_->SupportsAdditionalTrustAnchors());
}

TEST_F(OpenSSLChainValidatorTest, ValidChain) {
  ChainValidationResult result;
  EXPECT_EQ(OK, validator_->Validate(FullChain(), "www.example.com",
                                     CertificateList(), &result));
  EXPECT_EQ(0u, result.cert_status);

  ASSERT_EQ(3u, result.verified_chain.size());
  EXPECT_TRUE(result.verified_chain[0]->Equals(leaf_.get()));
  EXPECT_TRUE(result.verified_chain[1]->Equals(intermediate_.get()));
  EXPECT_TRUE(result.verified_chain[2]->Equals(root_.get()));
}

TEST_F(OpenSSLChainValidatorTest, ChainIncludingRoot) {
  CertificateList certs;
  certs.push_back(leaf_);
  certs.push_back(intermediate_);
  certs.push_back(root_);

  ChainValidationResult result;
  EXPECT_EQ(OK, validator_->Validate(ServerTrust::CreateFromCertificates(certs),
                                     "www.example.com", CertificateList(),
                                     &result));
  EXPECT_EQ(3u, result.verified_chain.size());
}

TEST_F(OpenSSLChainValidatorTest, EmptyHostnameSkipsNameCheck) {
  ChainValidationResult result;
  EXPECT_EQ(OK, validator_->Validate(FullChain(), std::string(),
                                     CertificateList(), &result));
}

TEST_F(OpenSSLChainValidatorTest, HostnameMismatch) {
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            validator_->Validate(FullChain(), "www.example.net",
                                 CertificateList(), &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_COMMON_NAME_INVALID);
  // The chain itself was still built.
  EXPECT_EQ(3u, result.verified_chain.size());
}

TEST_F(OpenSSLChainValidatorTest, WildcardNames) {
  ChainValidationResult result;
  EXPECT_EQ(OK, validator_->Validate(FullChain(), "foo.example.org",
                                     CertificateList(), &result));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            validator_->Validate(FullChain(), "a.b.example.org",
                                 CertificateList(), &result));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            validator_->Validate(FullChain(), "example.org", CertificateList(),
                                 &result));
}

TEST_F(OpenSSLChainValidatorTest, IPAddresses) {
  ChainValidationResult result;
  EXPECT_EQ(OK, validator_->Validate(FullChain(), "127.0.0.1",
                                     CertificateList(), &result));
  EXPECT_EQ(OK, validator_->Validate(FullChain(), "[::1]", CertificateList(),
                                     &result));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            validator_->Validate(FullChain(), "127.0.0.2", CertificateList(),
                                 &result));
}

TEST_F(OpenSSLChainValidatorTest, UnknownRoot) {
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            untrusting_validator_->Validate(FullChain(), "www.example.com",
                                            CertificateList(), &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_AUTHORITY_INVALID);
}

TEST_F(OpenSSLChainValidatorTest, MissingIntermediate) {
  CertificateList certs;
  certs.push_back(leaf_);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            validator_->Validate(ServerTrust::CreateFromCertificates(certs),
                                 "www.example.com", CertificateList(),
                                 &result));
}

TEST_F(OpenSSLChainValidatorTest, ExpiredLeaf) {
  CertBuilder expired_builder("www.example.com");
  expired_builder.AddDNSName("www.example.com");
  expired_builder.SetValidity(-10 * kOneDay, -kOneDay);
  scoped_refptr<X509Certificate> expired =
      expired_builder.BuildSignedBy(intermediate_builder_);
  ASSERT_TRUE(expired);

  CertificateList certs;
  certs.push_back(expired);
  certs.push_back(intermediate_);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_DATE_INVALID,
            validator_->Validate(ServerTrust::CreateFromCertificates(certs),
                                 "www.example.com", CertificateList(),
                                 &result));
  EXPECT_EQ(CERT_STATUS_DATE_INVALID, result.cert_status);
}

TEST_F(OpenSSLChainValidatorTest, NotYetValidLeaf) {
  CertBuilder future_builder("www.example.com");
  future_builder.AddDNSName("www.example.com");
  future_builder.SetValidity(kOneDay, 10 * kOneDay);
  scoped_refptr<X509Certificate> future =
      future_builder.BuildSignedBy(intermediate_builder_);
  ASSERT_TRUE(future);

  CertificateList certs;
  certs.push_back(future);
  certs.push_back(intermediate_);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_DATE_INVALID,
            validator_->Validate(ServerTrust::CreateFromCertificates(certs),
                                 "www.example.com", CertificateList(),
                                 &result));
}

TEST_F(OpenSSLChainValidatorTest, MultipleErrorsReportMostSerious) {
  CertBuilder expired_builder("www.example.com");
  expired_builder.AddDNSName("www.example.com");
  expired_builder.SetValidity(-10 * kOneDay, -kOneDay);
  scoped_refptr<X509Certificate> expired =
      expired_builder.BuildSignedBy(intermediate_builder_);
  ASSERT_TRUE(expired);

  CertificateList certs;
  certs.push_back(expired);
  certs.push_back(intermediate_);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            untrusting_validator_->Validate(
                ServerTrust::CreateFromCertificates(certs), "www.example.net",
                CertificateList(), &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_AUTHORITY_INVALID);
  EXPECT_TRUE(result.cert_status & CERT_STATUS_DATE_INVALID);
  EXPECT_TRUE(result.cert_status & CERT_STATUS_COMMON_NAME_INVALID);
}

TEST_F(OpenSSLChainValidatorTest, LeafSignatureMismatch) {
  // Issued under the intermediate's name but signed by an unrelated key.
  CertBuilder impostor_ca("Test Intermediate");
  impostor_ca.set_is_ca(true);
  scoped_refptr<X509Certificate> forged =
      leaf_builder_.BuildSignedBy(impostor_ca);
  ASSERT_TRUE(forged);

  CertificateList certs;
  certs.push_back(forged);
  certs.push_back(intermediate_);

  ChainValidationResult result;
  int rv = validator_->Validate(ServerTrust::CreateFromCertificates(certs),
                                "www.example.com", CertificateList(), &result);
  EXPECT_NE(OK, rv);
  EXPECT_TRUE(IsCertificateError(rv));
  EXPECT_TRUE(IsCertStatusError(result.cert_status));
}

TEST_F(OpenSSLChainValidatorTest, EmptyChain) {
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_INVALID,
            validator_->Validate(ServerTrust(), "www.example.com",
                                 CertificateList(), &result));
  EXPECT_EQ(CERT_STATUS_INVALID, result.cert_status);
  EXPECT_TRUE(result.verified_chain.empty());
}

TEST_F(OpenSSLChainValidatorTest, MalformedElementRejectsChain) {
  std::vector<std::string> der_certs;
  der_certs.push_back(leaf_->der_encoded());
  der_certs.push_back("junk");

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_INVALID,
            validator_->Validate(ServerTrust(der_certs), "www.example.com",
                                 CertificateList(), &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_INVALID);
  EXPECT_TRUE(result.verified_chain.empty());
}

TEST_F(OpenSSLChainValidatorTest, AdditionalTrustAnchorRoot) {
  CertificateList anchors;
  anchors.push_back(root_);

  ChainValidationResult result;
  EXPECT_EQ(OK, untrusting_validator_->Validate(FullChain(), "www.example.com",
                                                anchors, &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_IS_ANCHORED_BY_PIN);
  EXPECT_EQ(3u, result.verified_chain.size());
}

TEST_F(OpenSSLChainValidatorTest, AdditionalTrustAnchorIntermediate) {
  CertificateList anchors;
  anchors.push_back(intermediate_);

  ChainValidationResult result;
  EXPECT_EQ(OK, untrusting_validator_->Validate(FullChain(), "www.example.com",
                                                anchors, &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_IS_ANCHORED_BY_PIN);
  ASSERT_EQ(2u, result.verified_chain.size());
  EXPECT_TRUE(result.verified_chain[1]->Equals(intermediate_.get()));
}

TEST_F(OpenSSLChainValidatorTest, AdditionalTrustAnchorSelfSignedLeaf) {
  CertBuilder self_signed_builder("self.example.com");
  self_signed_builder.AddDNSName("self.example.com");
  scoped_refptr<X509Certificate> self_signed =
      self_signed_builder.BuildSelfSigned();
  ASSERT_TRUE(self_signed);

  CertificateList certs;
  certs.push_back(self_signed);
  ServerTrust trust = ServerTrust::CreateFromCertificates(certs);

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            untrusting_validator_->Validate(trust, "self.example.com",
                                            CertificateList(), &result));

  EXPECT_EQ(OK, untrusting_validator_->Validate(trust, "self.example.com",
                                                certs, &result));
  EXPECT_TRUE(result.cert_status & CERT_STATUS_IS_ANCHORED_BY_PIN);
}

TEST_F(OpenSSLChainValidatorTest, AnchorsDoNotLeakBetweenCalls) {
  CertificateList anchors;
  anchors.push_back(root_);

  ChainValidationResult result;
  EXPECT_EQ(OK, untrusting_validator_->Validate(FullChain(), "www.example.com",
                                                anchors, &result));
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            untrusting_validator_->Validate(FullChain(), "www.example.com",
                                            CertificateList(), &result));
}

TEST_F(OpenSSLChainValidatorTest, ResultIsResetBetweenCalls) {
  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID,
            validator_->Validate(FullChain(), "www.example.net",
                                 CertificateList(), &result));
  EXPECT_EQ(OK, validator_->Validate(FullChain(), "www.example.com",
                                     CertificateList(), &result));
  EXPECT_EQ(0u, result.cert_status);
}

TEST_F(OpenSSLChainValidatorTest, SystemRootsAreReadOnce) {
  base::ScopedTempDir temp_dir;
  ASSERT_TRUE(temp_dir.CreateUniqueTempDir());
  base::FilePath cert_file = temp_dir.GetPath().Append("roots.pem");
  base::FilePath cert_dir = temp_dir.GetPath().Append("certs");
  ASSERT_TRUE(base::CreateDirectory(cert_dir));
  std::string pem = PEMEncode(root_->der_encoded(), "CERTIFICATE");
  const int pem_size = static_cast<int>(pem.size());
  ASSERT_EQ(pem_size, base::WriteFile(cert_file, pem.data(), pem_size));

  scoped_refptr<OpenSSLChainValidator> system_validator;
  {
    ScopedEnvironmentVariable file_env(X509_get_default_cert_file_env(),
                                       cert_file.value());
    ScopedEnvironmentVariable dir_env(X509_get_default_cert_dir_env(),
                                      cert_dir.value());
    system_validator = base::MakeRefCounted<OpenSSLChainValidator>(
        OpenSSLChainValidator::Config());
  }
  ASSERT_EQ(1u, system_validator->system_roots().size());
  EXPECT_TRUE(system_validator->system_roots()[0]->Equals(root_.get()));

  ChainValidationResult result;
  EXPECT_EQ(OK, system_validator->Validate(FullChain(), "www.example.com",
                                           CertificateList(), &result));

  // Later changes to the file are not picked up.
  ASSERT_EQ(0, base::WriteFile(cert_file, "", 0));
  EXPECT_EQ(OK, system_validator->Validate(FullChain(), "www.example.com",
                                           CertificateList(), &result));
}

TEST_F(OpenSSLChainValidatorTest, MissingSystemRootsFile) {
  base::ScopedTempDir temp_dir;
  ASSERT_TRUE(temp_dir.CreateUniqueTempDir());

  scoped_refptr<OpenSSLChainValidator> system_validator;
  {
    ScopedEnvironmentVariable file_env(
        X509_get_default_cert_file_env(),
        temp_dir.GetPath().Append("missing.pem").value());
    ScopedEnvironmentVariable dir_env(X509_get_default_cert_dir_env(),
                                      temp_dir.GetPath().value());
    system_validator = base::MakeRefCounted<OpenSSLChainValidator>(
        OpenSSLChainValidator::Config());
  }
  EXPECT_TRUE(system_validator->system_roots().empty());

  ChainValidationResult result;
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID,
            system_validator->Validate(FullChain(), "www.example.com",
                                       CertificateList(), &result));
}

TEST_F(OpenSSLChainValidatorTest, NoSystemRootsWhenDisabled) {
  OpenSSLChainValidator::Config config;
  config.use_system_roots = false;
  scoped_refptr<OpenSSLChainValidator> system_validator =
      base::MakeRefCounted<OpenSSLChainValidator>(config);
  EXPECT_TRUE(system_validator->system_roots().empty());
}

}  // namespace

}  // namespace trustpin
