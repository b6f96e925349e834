// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/policy_config.h"

#include <string>
#include <vector>

#include "base/command_line.h"
#include "base/files/file_util.h"
#include "base/files/scoped_temp_dir.h"
#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/chain_validator.h"
#include "trustpin/cert/pem.h"
#include "trustpin/policy/security_policy.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

base::CommandLine MakeCommandLine(const std::vector<std::string>& args) {
  base::CommandLine::StringVector argv;
  argv.push_back("trustpin_verify");
  argv.insert(argv.end(), args.begin(), args.end());
  return base::CommandLine(argv);
}

class PolicyConfigTest : public testing::Test {
 protected:
  PolicyConfigTest() : cert_builder_("pinned.example.com") {}

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    cert_ = cert_builder_.BuildSelfSigned();
    ASSERT_TRUE(cert_);
  }

  base::FilePath WriteTempFile(const std::string& name,
                               const std::string& data) {
    base::FilePath path = temp_dir_.GetPath().Append(name);
    EXPECT_EQ(static_cast<int>(data.size()),
              base::WriteFile(path, data.data(), static_cast<int>(data.size())));
    return path;
  }

  base::ScopedTempDir temp_dir_;
  CertBuilder cert_builder_;
  scoped_refptr<X509Certificate> cert_;
};

TEST_F(PolicyConfigTest, Defaults) {
  PolicyConfig config;
  ASSERT_EQ(OK, ParsePolicyConfig(MakeCommandLine({}), &config));
  EXPECT_EQ(PinningMode::kNone, config.pinning_mode);
  EXPECT_TRUE(config.pinned_certs_dir.empty());
  EXPECT_FALSE(config.allow_invalid_certificates);
  EXPECT_TRUE(config.validates_domain_name);
  EXPECT_TRUE(config.use_system_roots);
  EXPECT_TRUE(config.ca_file.empty());
  EXPECT_TRUE(config.ca_dir.empty());
}

TEST_F(PolicyConfigTest, ParsesAllSwitches) {
  PolicyConfig config;
  ASSERT_EQ(OK, ParsePolicyConfig(
                    MakeCommandLine({"--pinning-mode=certificate",
                                     "--pinned-certs-dir=/etc/pins",
                                     "--allow-invalid-certificates",
                                     "--no-validate-domain-name",
                                     "--no-system-roots",
                                     "--ca-file=/etc/roots.pem",
                                     "--ca-dir=/etc/ssl/certs"}),
                    &config));
  EXPECT_EQ(PinningMode::kCertificate, config.pinning_mode);
  EXPECT_EQ(base::FilePath("/etc/pins"), config.pinned_certs_dir);
  EXPECT_TRUE(config.allow_invalid_certificates);
  EXPECT_FALSE(config.validates_domain_name);
  EXPECT_FALSE(config.use_system_roots);
  EXPECT_EQ(base::FilePath("/etc/roots.pem"), config.ca_file);
  EXPECT_EQ(base::FilePath("/etc/ssl/certs"), config.ca_dir);
}

TEST_F(PolicyConfigTest, RejectsBadPinningSettings) {
  PolicyConfig config;
  config.allow_invalid_certificates = true;
  EXPECT_EQ(ERR_INVALID_ARGUMENT,
            ParsePolicyConfig(MakeCommandLine({"--pinning-mode=spki"}),
                              &config));
  EXPECT_EQ(ERR_INVALID_ARGUMENT,
            ParsePolicyConfig(MakeCommandLine({"--pinning-mode=public-key"}),
                              &config));
  // Left untouched on failure.
  EXPECT_TRUE(config.allow_invalid_certificates);
}

TEST_F(PolicyConfigTest, CreateSecurityPolicyFromConfig) {
  ASSERT_TRUE(base::CreateDirectory(temp_dir_.GetPath().Append("pins")));
  WriteTempFile("pins/server.der", cert_->der_encoded());

  PolicyConfig config;
  config.pinning_mode = PinningMode::kPublicKey;
  config.pinned_certs_dir = temp_dir_.GetPath().Append("pins");
  config.validates_domain_name = false;

  int error = ERR_FAILED;
  scoped_refptr<SecurityPolicy> policy =
      CreateSecurityPolicyFromConfig(config, &error);
  ASSERT_TRUE(policy);
  EXPECT_EQ(OK, error);
  EXPECT_EQ(PinningMode::kPublicKey, policy->pinning_mode());
  EXPECT_TRUE(policy->pinned_certificates().Matches(*cert_));
  EXPECT_FALSE(policy->validates_domain_name());
}

TEST_F(PolicyConfigTest, CreateSecurityPolicyFromEmptyBundle) {
  PolicyConfig config;
  config.pinning_mode = PinningMode::kCertificate;
  config.pinned_certs_dir = temp_dir_.GetPath();

  int error = OK;
  EXPECT_FALSE(CreateSecurityPolicyFromConfig(config, &error));
  EXPECT_EQ(ERR_EMPTY_PINNED_CERTIFICATES, error);

  config.pinned_certs_dir = temp_dir_.GetPath().Append("missing");
  EXPECT_FALSE(CreateSecurityPolicyFromConfig(config, &error));
  EXPECT_EQ(ERR_FILE_NOT_FOUND, error);
}

TEST_F(PolicyConfigTest, CreateChainValidatorFromConfig) {
  PolicyConfig config;
  config.use_system_roots = false;
  config.ca_file = WriteTempFile(
      "roots.pem", PEMEncode(cert_->der_encoded(), "CERTIFICATE"));

  int error = ERR_FAILED;
  scoped_refptr<ChainValidator> validator =
      CreateChainValidatorFromConfig(config, &error);
  ASSERT_TRUE(validator);
  EXPECT_EQ(OK, error);
}

TEST_F(PolicyConfigTest, CreateChainValidatorFromBadCaFile) {
  PolicyConfig config;
  config.ca_file = temp_dir_.GetPath().Append("missing.pem");

  int error = OK;
  EXPECT_FALSE(CreateChainValidatorFromConfig(config, &error));
  EXPECT_EQ(ERR_FILE_NOT_FOUND, error);

  config.ca_file = WriteTempFile("empty.pem", "no certificates here");
  EXPECT_FALSE(CreateChainValidatorFromConfig(config, &error));
  EXPECT_EQ(ERR_INVALID_ARGUMENT, error);
}

}  // namespace

}  // namespace trustpin
