// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/asn1_util.h"

#include <stdint.h>

#include <string>

#include <openssl/x509.h>

#include "crypto/scoped_openssl_types.h"
#include "gtest/gtest.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/cert/x509_util.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

std::string EncodePublicKey(EVP_PKEY* key) {
  int len = i2d_PUBKEY(key, nullptr);
  EXPECT_GT(len, 0);
  std::string der(static_cast<size_t>(len), '\0');
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&der[0]);
  EXPECT_EQ(len, i2d_PUBKEY(key, &ptr));
  return der;
}

class Asn1UtilTest : public testing::Test {
 protected:
  void SetUp() override {
    CertBuilder builder("asn1.example");
    builder.AddDNSName("asn1.example");
    cert_ = builder.BuildSelfSigned();
    ASSERT_TRUE(cert_);
    key_der_ = EncodePublicKey(builder.key());
  }

  const std::string& der() const { return cert_->der_encoded(); }

  scoped_refptr<X509Certificate> cert_;
  std::string key_der_;
};

TEST_F(Asn1UtilTest, ExtractSPKIFromDERCert) {
  std::string_view spki;
  ASSERT_TRUE(asn1::ExtractSPKIFromDERCert(der(), &spki));
  // The SPKI is the encoding of the key the certificate was built for.
  EXPECT_EQ(key_der_, spki);
  // And it is a view into the certificate itself.
  EXPECT_GE(spki.data(), der().data());
  EXPECT_LE(spki.data() + spki.size(), der().data() + der().size());
}

TEST_F(Asn1UtilTest, ExtractSubjectFromDERCert) {
  std::string_view subject;
  ASSERT_TRUE(asn1::ExtractSubjectFromDERCert(der(), &subject));

  crypto::ScopedX509 handle = x509_util::CreateX509FromCertificate(*cert_);
  ASSERT_TRUE(handle);
  X509_NAME* name = X509_get_subject_name(handle.get());
  int len = i2d_X509_NAME(name, nullptr);
  ASSERT_GT(len, 0);
  std::string expected(static_cast<size_t>(len), '\0');
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&expected[0]);
  ASSERT_EQ(len, i2d_X509_NAME(name, &ptr));
  EXPECT_EQ(expected, subject);
}

TEST_F(Asn1UtilTest, ExtractSubjectPublicKeyFromSPKI) {
  std::string_view spki;
  ASSERT_TRUE(asn1::ExtractSPKIFromDERCert(der(), &spki));
  std::string_view spk;
  ASSERT_TRUE(asn1::ExtractSubjectPublicKeyFromSPKI(spki, &spk));
  // An uncompressed P-256 point, preceded by the BIT STRING unused-bits
  // octet.
  ASSERT_EQ(66u, spk.size());
  EXPECT_EQ(0x00, spk[0]);
  EXPECT_EQ(0x04, spk[1]);
}

TEST_F(Asn1UtilTest, IsStrictDERCertificate) {
  EXPECT_TRUE(asn1::IsStrictDERCertificate(der()));
}

TEST_F(Asn1UtilTest, RejectsTrailingData) {
  std::string with_trailer = der() + '\0';
  std::string_view spki;
  EXPECT_FALSE(asn1::ExtractSPKIFromDERCert(with_trailer, &spki));
  EXPECT_FALSE(asn1::IsStrictDERCertificate(with_trailer));
}

TEST_F(Asn1UtilTest, RejectsTruncation) {
  for (size_t len : {size_t(0), size_t(1), der().size() / 2,
                     der().size() - 1}) {
    SCOPED_TRACE(len);
    std::string_view spki;
    EXPECT_FALSE(
        asn1::ExtractSPKIFromDERCert(std::string_view(der()).substr(0, len),
                                     &spki));
  }
}

TEST_F(Asn1UtilTest, RejectsIndefiniteLengthOuterSequence) {
  // Re-encode the outer SEQUENCE with the BER indefinite form.
  std::string_view inner(der());
  ASSERT_EQ(0x30, static_cast<uint8_t>(inner[0]));
  ASSERT_EQ(0x82, static_cast<uint8_t>(inner[1]));
  inner.remove_prefix(4);
  std::string ber("\x30\x80", 2);
  ber.append(inner.data(), inner.size());
  ber.append(2, '\0');

  std::string_view spki;
  EXPECT_FALSE(asn1::ExtractSPKIFromDERCert(ber, &spki));
  EXPECT_FALSE(X509Certificate::CreateFromBytes(ber));
}

TEST(Asn1UtilNoCertTest, RejectsGarbage) {
  std::string_view out;
  EXPECT_FALSE(asn1::ExtractSPKIFromDERCert("", &out));
  EXPECT_FALSE(asn1::ExtractSPKIFromDERCert("not a certificate", &out));
  EXPECT_FALSE(asn1::ExtractSubjectFromDERCert(std::string("\x30\x00", 2),
                                               &out));
  EXPECT_FALSE(asn1::ExtractSubjectPublicKeyFromSPKI("", &out));
}

}  // namespace

}  // namespace trustpin
