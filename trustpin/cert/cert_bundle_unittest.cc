// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/cert_bundle.h"

#include <string>
#include <vector>

#include "base/files/file_util.h"
#include "base/files/scoped_temp_dir.h"
#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/pem.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

class CertBundleTest : public testing::Test {
 protected:
  CertBundleTest() : first_builder_("first.test"), second_builder_("second.test") {}

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    first_ = first_builder_.BuildSelfSigned();
    second_ = second_builder_.BuildSelfSigned();
    ASSERT_TRUE(first_);
    ASSERT_TRUE(second_);
  }

  void WriteBundleFile(const std::string& name, const std::string& data) {
    base::FilePath path = temp_dir_.GetPath().Append(name);
    ASSERT_EQ(static_cast<int>(data.size()),
              base::WriteFile(path, data.data(), static_cast<int>(data.size())));
  }

  base::ScopedTempDir temp_dir_;
  CertBuilder first_builder_;
  CertBuilder second_builder_;
  scoped_refptr<X509Certificate> first_;
  scoped_refptr<X509Certificate> second_;
};

TEST_F(CertBundleTest, HasCertificateFileExtension) {
  EXPECT_TRUE(HasCertificateFileExtension(base::FilePath("/a/server.cer")));
  EXPECT_TRUE(HasCertificateFileExtension(base::FilePath("/a/server.CRT")));
  EXPECT_TRUE(HasCertificateFileExtension(base::FilePath("server.der")));
  EXPECT_FALSE(HasCertificateFileExtension(base::FilePath("/a/server.pem")));
  EXPECT_FALSE(HasCertificateFileExtension(base::FilePath("/a/cer")));
  EXPECT_FALSE(HasCertificateFileExtension(base::FilePath("/a.crt/readme")));
}

TEST_F(CertBundleTest, LoadsDERAndPEMFiles) {
  WriteBundleFile("a.cer", first_->der_encoded());
  WriteBundleFile("b.crt", PEMEncode(second_->der_encoded(), "CERTIFICATE"));

  std::vector<std::string> der_certs;
  EXPECT_EQ(OK, CertificatesInBundle(temp_dir_.GetPath(), &der_certs));
  ASSERT_EQ(2u, der_certs.size());
  // Files are visited in path order.
  EXPECT_EQ(first_->der_encoded(), der_certs[0]);
  EXPECT_EQ(second_->der_encoded(), der_certs[1]);
}

TEST_F(CertBundleTest, SkipsOtherFiles) {
  WriteBundleFile("a.der", first_->der_encoded());
  WriteBundleFile("notes.txt", second_->der_encoded());
  WriteBundleFile("broken.cer", "this is not a certificate");
  ASSERT_TRUE(base::CreateDirectory(temp_dir_.GetPath().Append("nested.crt")));

  std::vector<std::string> der_certs;
  EXPECT_EQ(OK, CertificatesInBundle(temp_dir_.GetPath(), &der_certs));
  ASSERT_EQ(1u, der_certs.size());
  EXPECT_EQ(first_->der_encoded(), der_certs[0]);
}

TEST_F(CertBundleTest, RemovesDuplicates) {
  WriteBundleFile("a.cer", first_->der_encoded());
  WriteBundleFile("copy.der", first_->der_encoded());

  std::vector<std::string> der_certs;
  der_certs.push_back(first_->der_encoded());
  EXPECT_EQ(OK, CertificatesInBundle(temp_dir_.GetPath(), &der_certs));
  EXPECT_EQ(1u, der_certs.size());
}

TEST_F(CertBundleTest, EmptyDirectory) {
  std::vector<std::string> der_certs;
  EXPECT_EQ(OK, CertificatesInBundle(temp_dir_.GetPath(), &der_certs));
  EXPECT_TRUE(der_certs.empty());
}

TEST_F(CertBundleTest, MissingDirectory) {
  std::vector<std::string> der_certs;
  EXPECT_EQ(ERR_FILE_NOT_FOUND,
            CertificatesInBundle(temp_dir_.GetPath().Append("missing"),
                                 &der_certs));
  EXPECT_TRUE(der_certs.empty());
}

}  // namespace

}  // namespace trustpin
