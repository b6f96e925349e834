// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/pinned_certificate_set.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/test/cert_builder.h"

namespace trustpin {

namespace {

class PinnedCertificateSetTest : public testing::Test {
 protected:
  PinnedCertificateSetTest()
      : pinned_builder_("pinned.example.com"),
        other_builder_("other.example.com") {}

  void SetUp() override {
    pinned_ = pinned_builder_.BuildSelfSigned();
    ASSERT_TRUE(pinned_);
    other_ = other_builder_.BuildSelfSigned();
    ASSERT_TRUE(other_);

    // Same key as |pinned_|, different certificate.
    CertBuilder renewed_builder("pinned.example.com");
    renewed_builder.UseKeyOf(pinned_builder_);
    renewed_ = renewed_builder.BuildSelfSigned();
    ASSERT_TRUE(renewed_);
  }

  std::vector<std::string> Pins() const {
    return std::vector<std::string>(1, pinned_->der_encoded());
  }

  CertBuilder pinned_builder_;
  CertBuilder other_builder_;
  scoped_refptr<X509Certificate> pinned_;
  scoped_refptr<X509Certificate> other_;
  scoped_refptr<X509Certificate> renewed_;
};

TEST_F(PinnedCertificateSetTest, DefaultIsEmptyNone) {
  PinnedCertificateSet set;
  EXPECT_EQ(PinningMode::kNone, set.mode());
  EXPECT_TRUE(set.empty());
  EXPECT_FALSE(set.Matches(*pinned_));
}

TEST_F(PinnedCertificateSetTest, CertificateModeMatchesExactBytes) {
  PinnedCertificateSet set;
  ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kCertificate, Pins(),
                                             &set));
  EXPECT_EQ(PinningMode::kCertificate, set.mode());
  EXPECT_EQ(1u, set.size());
  EXPECT_TRUE(set.Matches(*pinned_));
  EXPECT_FALSE(set.Matches(*renewed_));
  EXPECT_FALSE(set.Matches(*other_));
}

TEST_F(PinnedCertificateSetTest, PublicKeyModeMatchesSameKey) {
  PinnedCertificateSet set;
  ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kPublicKey, Pins(),
                                             &set));
  EXPECT_TRUE(set.Matches(*pinned_));
  EXPECT_TRUE(set.Matches(*renewed_));
  EXPECT_FALSE(set.Matches(*other_));
}

TEST_F(PinnedCertificateSetTest, NoneModeNeverMatches) {
  PinnedCertificateSet set;
  ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kNone, Pins(), &set));
  EXPECT_EQ(1u, set.size());
  EXPECT_FALSE(set.Matches(*pinned_));
}

TEST_F(PinnedCertificateSetTest, MatchesAnyPosition) {
  PinnedCertificateSet set;
  ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kCertificate, Pins(),
                                             &set));
  CertificateList chain;
  chain.push_back(other_);
  EXPECT_FALSE(set.MatchesAny(chain));
  chain.push_back(pinned_);
  EXPECT_TRUE(set.MatchesAny(chain));
  EXPECT_FALSE(set.MatchesAny(CertificateList()));
}

TEST_F(PinnedCertificateSetTest, DropsDuplicates) {
  std::vector<std::string> der_certs;
  der_certs.push_back(pinned_->der_encoded());
  der_certs.push_back(other_->der_encoded());
  der_certs.push_back(pinned_->der_encoded());

  PinnedCertificateSet set;
  ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kCertificate,
                                             der_certs, &set));
  ASSERT_EQ(2u, set.size());
  std::vector<std::string> encoded = set.GetDEREncodedCertificates();
  ASSERT_EQ(2u, encoded.size());
  EXPECT_EQ(pinned_->der_encoded(), encoded[0]);
  EXPECT_EQ(other_->der_encoded(), encoded[1]);

  HashValueVector hashes = set.GetSPKIHashes();
  ASSERT_EQ(2u, hashes.size());
  EXPECT_EQ(pinned_->CalculateSPKIHash(), hashes[0]);
}

TEST_F(PinnedCertificateSetTest, RejectsMalformedPinInEveryMode) {
  std::vector<std::string> der_certs = Pins();
  der_certs.push_back("not DER");

  for (PinningMode mode : {PinningMode::kNone, PinningMode::kPublicKey,
                           PinningMode::kCertificate}) {
    PinnedCertificateSet set;
    ASSERT_EQ(OK, PinnedCertificateSet::Create(PinningMode::kPublicKey,
                                               Pins(), &set));
    EXPECT_EQ(ERR_INVALID_PINNED_CERTIFICATE,
              PinnedCertificateSet::Create(mode, der_certs, &set));
    // Left untouched.
    EXPECT_EQ(PinningMode::kPublicKey, set.mode());
    EXPECT_EQ(1u, set.size());
  }
}

}  // namespace

}  // namespace trustpin
