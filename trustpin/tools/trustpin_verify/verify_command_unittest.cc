// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/tools/trustpin_verify/verify_command.h"

#include <string>
#include <vector>

#include "base/command_line.h"
#include "base/files/file_util.h"
#include "base/files/scoped_temp_dir.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "trustpin/cert/pem.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/test/cert_builder.h"

using testing::HasSubstr;
using testing::StartsWith;

namespace trustpin {

namespace {

class VerifyCommandTest : public testing::Test {
 protected:
  VerifyCommandTest()
      : server_builder_("pinned.example.com"),
        other_builder_("other.example.com") {
    server_builder_.AddDNSName("pinned.example.com");
    other_builder_.AddDNSName("pinned.example.com");
  }

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    server_ = server_builder_.BuildSelfSigned();
    ASSERT_TRUE(server_);
    other_ = other_builder_.BuildSelfSigned();
    ASSERT_TRUE(other_);

    pins_dir_ = temp_dir_.GetPath().Append("pins");
    ASSERT_TRUE(base::CreateDirectory(pins_dir_));
    WriteTempFile("pins/server.der", server_->der_encoded());
    server_chain_ = WriteTempFile(
        "server.pem", PEMEncode(server_->der_encoded(), "CERTIFICATE"));
    other_chain_ = WriteTempFile(
        "other.pem", PEMEncode(other_->der_encoded(), "CERTIFICATE"));
  }

  base::FilePath WriteTempFile(const std::string& name,
                               const std::string& data) {
    base::FilePath path = temp_dir_.GetPath().Append(name);
    const int size = static_cast<int>(data.size());
    EXPECT_EQ(size, base::WriteFile(path, data.data(), size));
    return path;
  }

  // A command line that never consults the default trust store.
  base::CommandLine MakeCommandLine() {
    base::CommandLine command_line(base::FilePath("trustpin_verify"));
    command_line.AppendSwitch("no-system-roots");
    return command_line;
  }

  base::CommandLine MakePinningCommandLine(const std::string& mode,
                                           const std::string& host) {
    base::CommandLine command_line = MakeCommandLine();
    command_line.AppendSwitchASCII("pinning-mode", mode);
    command_line.AppendSwitchPath("pinned-certs-dir", pins_dir_);
    command_line.AppendSwitchASCII("host", host);
    return command_line;
  }

  base::ScopedTempDir temp_dir_;
  CertBuilder server_builder_;
  CertBuilder other_builder_;
  scoped_refptr<X509Certificate> server_;
  scoped_refptr<X509Certificate> other_;
  base::FilePath pins_dir_;
  base::FilePath server_chain_;
  base::FilePath other_chain_;
};

TEST_F(VerifyCommandTest, Help) {
  base::CommandLine command_line = MakeCommandLine();
  command_line.AppendSwitch("help");
  std::string output;
  EXPECT_EQ(kVerifyExitAccept, RunVerify(command_line, &output));
  EXPECT_EQ(kVerifyUsage, output);
}

TEST_F(VerifyCommandTest, AcceptsPinnedSelfSignedCertificate) {
  base::CommandLine command_line =
      MakePinningCommandLine("certificate", "pinned.example.com");
  command_line.AppendArg(server_chain_.value());

  std::string output;
  EXPECT_EQ(kVerifyExitAccept, RunVerify(command_line, &output));
  EXPECT_EQ("accept\n", output);
}

TEST_F(VerifyCommandTest, RejectsWrongHost) {
  base::CommandLine command_line =
      MakePinningCommandLine("certificate", "www.example.net");
  command_line.AppendArg(server_chain_.value());

  std::string output;
  EXPECT_EQ(kVerifyExitReject, RunVerify(command_line, &output));
  EXPECT_THAT(output, StartsWith("reject: ERR_CERT_COMMON_NAME_INVALID "));
  EXPECT_EQ('\n', output.back());
}

TEST_F(VerifyCommandTest, RejectsUnpinnedKey) {
  base::CommandLine command_line =
      MakePinningCommandLine("public-key", "pinned.example.com");
  command_line.AppendSwitch("allow-invalid-certificates");
  command_line.AppendArg(other_chain_.value());

  std::string output;
  EXPECT_EQ(kVerifyExitReject, RunVerify(command_line, &output));
  EXPECT_THAT(output,
              StartsWith("reject: ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN "));
  EXPECT_THAT(output, HasSubstr("CN=other.example.com"));
}

TEST_F(VerifyCommandTest, NoPinningToleratesGarbageWhenInvalidAllowed) {
  base::CommandLine command_line = MakeCommandLine();
  command_line.AppendSwitch("allow-invalid-certificates");
  command_line.AppendSwitchASCII("host", "pinned.example.com");
  command_line.AppendArg(WriteTempFile("junk.bin", "not a certificate").value());

  std::string output;
  EXPECT_EQ(kVerifyExitAccept, RunVerify(command_line, &output));
  EXPECT_EQ("accept\n", output);
}

TEST_F(VerifyCommandTest, NoChainFile) {
  std::string output;
  EXPECT_EQ(kVerifyExitConfigurationError,
            RunVerify(MakeCommandLine(), &output));
  EXPECT_TRUE(output.empty());
}

TEST_F(VerifyCommandTest, UnknownPinningMode) {
  base::CommandLine command_line =
      MakePinningCommandLine("spki", "pinned.example.com");
  command_line.AppendArg(server_chain_.value());

  std::string output;
  EXPECT_EQ(kVerifyExitConfigurationError, RunVerify(command_line, &output));
  EXPECT_TRUE(output.empty());
}

TEST_F(VerifyCommandTest, PinningModeWithoutPinnedCertificates) {
  base::CommandLine command_line = MakeCommandLine();
  command_line.AppendSwitchASCII("pinning-mode", "certificate");
  command_line.AppendSwitchPath("pinned-certs-dir",
                                temp_dir_.GetPath().Append("missing"));
  command_line.AppendArg(server_chain_.value());
  std::string output;
  EXPECT_EQ(kVerifyExitConfigurationError, RunVerify(command_line, &output));

  base::FilePath empty_dir = temp_dir_.GetPath().Append("empty");
  ASSERT_TRUE(base::CreateDirectory(empty_dir));
  command_line.AppendSwitchPath("pinned-certs-dir", empty_dir);
  EXPECT_EQ(kVerifyExitConfigurationError, RunVerify(command_line, &output));
  EXPECT_TRUE(output.empty());
}

TEST_F(VerifyCommandTest, MissingChainFile) {
  base::CommandLine command_line =
      MakePinningCommandLine("certificate", "pinned.example.com");
  command_line.AppendArg(temp_dir_.GetPath().Append("missing.pem").value());

  std::string output;
  EXPECT_EQ(kVerifyExitConfigurationError, RunVerify(command_line, &output));
  EXPECT_TRUE(output.empty());
}

}  // namespace

}  // namespace trustpin
