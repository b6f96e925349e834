// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/server_trust_evaluator.h"

#include <string>
#include <thread>
#include <vector>

#include "base/strings/string_number_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "trustpin/base/hash_value.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/chain_validator_openssl.h"
#include "trustpin/cert/mock_chain_validator.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/policy/security_policy.h"
#include "trustpin/test/cert_builder.h"

using testing::HasSubstr;
using testing::Not;

namespace trustpin {

namespace {

const int64_t kOneDay = 24 * 60 * 60;

// A small PKI shared by the tests:
//   Test Root -> Test Intermediate -> www.example.com (key K)
// plus a renewal of the leaf with K, an attacker leaf with another key K'
// issued by the same intermediate, and a self-signed server certificate.
class ServerTrustEvaluatorTest : public testing::Test {
 protected:
  ServerTrustEvaluatorTest()
      : root_builder_("Test Root"),
        intermediate_builder_("Test Intermediate"),
        leaf_builder_("www.example.com"),
        renewed_builder_("www.example.com"),
        attacker_builder_("www.example.com"),
        self_signed_builder_("self.example.com") {}

  void SetUp() override {
    root_builder_.set_is_ca(true);
    intermediate_builder_.set_is_ca(true);
    leaf_builder_.AddDNSName("www.example.com");
    renewed_builder_.AddDNSName("www.example.com");
    renewed_builder_.UseKeyOf(leaf_builder_);
    attacker_builder_.AddDNSName("www.example.com");
    self_signed_builder_.AddDNSName("self.example.com");

    root_ = root_builder_.BuildSelfSigned();
    intermediate_ = intermediate_builder_.BuildSignedBy(root_builder_);
    leaf_ = leaf_builder_.BuildSignedBy(intermediate_builder_);
    renewed_ = renewed_builder_.BuildSignedBy(intermediate_builder_);
    attacker_ = attacker_builder_.BuildSignedBy(intermediate_builder_);
    self_signed_ = self_signed_builder_.BuildSelfSigned();
    ASSERT_TRUE(root_);
    ASSERT_TRUE(intermediate_);
    ASSERT_TRUE(leaf_);
    ASSERT_TRUE(renewed_);
    ASSERT_TRUE(attacker_);
    ASSERT_TRUE(self_signed_);

    mock_validator_ = base::MakeRefCounted<MockChainValidator>();

    // Stands in for the system trust store.
    OpenSSLChainValidator::Config config;
    config.use_system_roots = false;
    config.root_certs.push_back(root_);
    openssl_validator_ = base::MakeRefCounted<OpenSSLChainValidator>(config);
  }

  static ServerTrust Chain(const scoped_refptr<X509Certificate>& leaf,
                           const scoped_refptr<X509Certificate>& issuer) {
    CertificateList certs;
    certs.push_back(leaf);
    if (issuer)
      certs.push_back(issuer);
    return ServerTrust::CreateFromCertificates(certs);
  }

  static std::vector<std::string> Pins(
      const scoped_refptr<X509Certificate>& cert) {
    return std::vector<std::string>(1, cert->der_encoded());
  }

  static scoped_refptr<SecurityPolicy> MakePolicy(
      PinningMode mode,
      const std::vector<std::string>& pins,
      bool allow_invalid) {
    int error = ERR_FAILED;
    scoped_refptr<SecurityPolicy> policy =
        SecurityPolicy::Builder()
            .set_pinning_mode(mode)
            .set_pinned_certificates(pins)
            .set_allow_invalid_certificates(allow_invalid)
            .Build(&error);
    EXPECT_EQ(OK, error);
    return policy;
  }

  // Makes the mock report |rv| with |cert_status| for chains led by |leaf|,
  // with |verified_chain| as the chain it built.
  void AddMockResult(const scoped_refptr<X509Certificate>& leaf,
                     const CertificateList& verified_chain,
                     CertStatus cert_status,
                     int rv) {
    ChainValidationResult result;
    result.verified_chain = verified_chain;
    result.cert_status = cert_status;
    mock_validator_->AddResultForCert(leaf, result, rv);
  }

  CertBuilder root_builder_;
  CertBuilder intermediate_builder_;
  CertBuilder leaf_builder_;
  CertBuilder renewed_builder_;
  CertBuilder attacker_builder_;
  CertBuilder self_signed_builder_;

  scoped_refptr<X509Certificate> root_;
  scoped_refptr<X509Certificate> intermediate_;
  scoped_refptr<X509Certificate> leaf_;
  scoped_refptr<X509Certificate> renewed_;
  scoped_refptr<X509Certificate> attacker_;
  scoped_refptr<X509Certificate> self_signed_;

  scoped_refptr<MockChainValidator> mock_validator_;
  scoped_refptr<ChainValidator> openssl_validator_;
};

// Evaluation with a mock validator.

TEST_F(ServerTrustEvaluatorTest, EmptyChainRejectedInAllModes) {
  const PinningMode kModes[] = {PinningMode::kNone, PinningMode::kPublicKey,
                                PinningMode::kCertificate};
  for (PinningMode mode : kModes) {
    for (bool allow_invalid : {false, true}) {
      std::vector<std::string> pins;
      if (mode != PinningMode::kNone)
        pins = Pins(leaf_);
      ServerTrustEvaluator evaluator(MakePolicy(mode, pins, allow_invalid),
                                     mock_validator_);
      ServerTrustEvaluator::EvaluationDetails details;
      EXPECT_FALSE(
          evaluator.Evaluate(ServerTrust(), "www.example.com", &details));
      EXPECT_EQ(ERR_CERT_INVALID, details.net_error);
      EXPECT_FALSE(details.failure_log.empty());
    }
  }
  EXPECT_EQ(0, mock_validator_->call_count());
}

TEST_F(ServerTrustEvaluatorTest, OverlongChainRejected) {
  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kNone, std::vector<std::string>(), true),
      mock_validator_);

  std::vector<std::string> der_certs(
      ServerTrustEvaluator::kMaxServerChainLength, leaf_->der_encoded());
  EXPECT_TRUE(evaluator.Evaluate(ServerTrust(der_certs), "www.example.com"));

  der_certs.push_back(intermediate_->der_encoded());
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(
      evaluator.Evaluate(ServerTrust(der_certs), "www.example.com", &details));
  EXPECT_EQ(ERR_CERT_CHAIN_TOO_LONG, details.net_error);
  EXPECT_EQ(1, mock_validator_->call_count());
}

TEST_F(ServerTrustEvaluatorTest, NoneModeFollowsValidator) {
  ServerTrustEvaluator evaluator(SecurityPolicy::Default(), mock_validator_);

  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_TRUE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                 "www.example.com", &details));
  EXPECT_EQ(OK, details.net_error);
  EXPECT_EQ(0u, details.cert_status);
  EXPECT_TRUE(details.failure_log.empty());

  mock_validator_->set_default_result(ERR_CERT_DATE_INVALID);
  EXPECT_FALSE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_CERT_DATE_INVALID, details.net_error);
  EXPECT_EQ(CERT_STATUS_DATE_INVALID, details.cert_status);
  EXPECT_THAT(details.failure_log, HasSubstr("DATE_INVALID"));
}

TEST_F(ServerTrustEvaluatorTest, NoneModeHostSpecificVerdicts) {
  ChainValidationResult ok_result;
  mock_validator_->AddResultForCertAndHost(leaf_, "*.example.com", ok_result,
                                           OK);
  ChainValidationResult bad_name;
  bad_name.cert_status = CERT_STATUS_COMMON_NAME_INVALID;
  mock_validator_->AddResultForCertAndHost(
      leaf_, "*", bad_name, ERR_CERT_COMMON_NAME_INVALID);

  ServerTrustEvaluator evaluator(SecurityPolicy::Default(), mock_validator_);
  ServerTrust trust = Chain(leaf_, intermediate_);
  EXPECT_TRUE(evaluator.Evaluate(trust, "www.example.com"));

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(trust, "evil.com", &details));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, NoneModeAllowInvalidAcceptsAnything) {
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kNone, std::vector<std::string>(), true),
      mock_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_TRUE(evaluator.Evaluate(Chain(attacker_, nullptr), "evil.com",
                                 &details));
  EXPECT_EQ(OK, details.net_error);
  // The validator's verdict is still reported.
  EXPECT_EQ(CERT_STATUS_INVALID, details.cert_status);

  std::vector<std::string> junk(1, "junk");
  EXPECT_TRUE(evaluator.Evaluate(ServerTrust(junk), "evil.com"));
}

TEST_F(ServerTrustEvaluatorTest, HostnamePolicy) {
  mock_validator_->set_default_result(OK);
  ServerTrust trust = Chain(leaf_, intermediate_);

  ServerTrustEvaluator validating(SecurityPolicy::Default(), mock_validator_);
  EXPECT_TRUE(validating.Evaluate(trust, "www.example.com"));
  EXPECT_EQ("www.example.com", mock_validator_->last_hostname());

  // A missing hostname disables the check rather than failing it.
  EXPECT_TRUE(validating.Evaluate(trust, std::string()));
  EXPECT_EQ("", mock_validator_->last_hostname());

  ServerTrustEvaluator not_validating(
      SecurityPolicy::Default()->WithValidatesDomainName(false),
      mock_validator_);
  EXPECT_TRUE(not_validating.Evaluate(trust, "www.example.com"));
  EXPECT_EQ("", mock_validator_->last_hostname());
}

TEST_F(ServerTrustEvaluatorTest, TrustAnchorsFollowMode) {
  mock_validator_->set_default_result(OK);
  ServerTrust trust = Chain(leaf_, intermediate_);

  ServerTrustEvaluator certificate_mode(
      MakePolicy(PinningMode::kCertificate, Pins(intermediate_), false),
      mock_validator_);
  EXPECT_TRUE(certificate_mode.Evaluate(trust, "www.example.com"));
  CertificateList anchors = mock_validator_->last_additional_trust_anchors();
  ASSERT_EQ(1u, anchors.size());
  EXPECT_TRUE(anchors[0]->Equals(intermediate_.get()));

  ServerTrustEvaluator public_key_mode(
      MakePolicy(PinningMode::kPublicKey, Pins(intermediate_), false),
      mock_validator_);
  EXPECT_TRUE(public_key_mode.Evaluate(trust, "www.example.com"));
  EXPECT_TRUE(mock_validator_->last_additional_trust_anchors().empty());

  ServerTrustEvaluator none_mode(SecurityPolicy::Default(), mock_validator_);
  EXPECT_TRUE(none_mode.Evaluate(trust, "www.example.com"));
  EXPECT_TRUE(mock_validator_->last_additional_trust_anchors().empty());
}

TEST_F(ServerTrustEvaluatorTest, PublicKeyModeRequiresPinnedKey) {
  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      mock_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(attacker_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
  EXPECT_EQ(0u, details.cert_status);
  EXPECT_THAT(details.failure_log,
              HasSubstr(attacker_->CalculateSPKIHash().ToString()));
  EXPECT_THAT(details.failure_log,
              HasSubstr(leaf_->CalculateSPKIHash().ToString()));

  EXPECT_TRUE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                 "www.example.com", &details));
  EXPECT_TRUE(evaluator.Evaluate(Chain(renewed_, intermediate_),
                                 "www.example.com", &details));
  EXPECT_TRUE(details.failure_log.empty());
}

TEST_F(ServerTrustEvaluatorTest, PinMatchesAtAnyPosition) {
  mock_validator_->set_default_result(OK);
  for (PinningMode mode : {PinningMode::kPublicKey, PinningMode::kCertificate}) {
    ServerTrustEvaluator evaluator(MakePolicy(mode, Pins(intermediate_), false),
                                   mock_validator_);
    EXPECT_TRUE(
        evaluator.Evaluate(Chain(attacker_, intermediate_), "www.example.com"));
    EXPECT_FALSE(evaluator.Evaluate(Chain(attacker_, nullptr),
                                    "www.example.com"));
  }
}

TEST_F(ServerTrustEvaluatorTest, CertificateModeRequiresExactCertificate) {
  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kCertificate, Pins(leaf_), false),
      mock_validator_);

  EXPECT_TRUE(
      evaluator.Evaluate(Chain(leaf_, intermediate_), "www.example.com"));
  // Same key, different bytes.
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(renewed_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
  EXPECT_THAT(details.failure_log, HasSubstr("pinned certificate"));
}

TEST_F(ServerTrustEvaluatorTest, PinsMatchAgainstValidatedChain) {
  // The validator built a path through the root, which the server never
  // sent.
  CertificateList built;
  built.push_back(attacker_);
  built.push_back(intermediate_);
  built.push_back(root_);
  AddMockResult(attacker_, built, 0, OK);

  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(root_), false),
      mock_validator_);
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(attacker_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, ValidationFailureIsFatalWithoutAllowInvalid) {
  mock_validator_->set_default_result(ERR_CERT_AUTHORITY_INVALID);
  for (PinningMode mode : {PinningMode::kPublicKey, PinningMode::kCertificate}) {
    ServerTrustEvaluator evaluator(MakePolicy(mode, Pins(leaf_), false),
                                   mock_validator_);
    ServerTrustEvaluator::EvaluationDetails details;
    EXPECT_FALSE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                    "www.example.com", &details));
    EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID, details.net_error);
    EXPECT_EQ(CERT_STATUS_AUTHORITY_INVALID, details.cert_status);
  }
}

TEST_F(ServerTrustEvaluatorTest, AllowInvalidStillEnforcesPins) {
  mock_validator_->set_default_result(ERR_CERT_DATE_INVALID);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), true), mock_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(attacker_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
  EXPECT_EQ(CERT_STATUS_DATE_INVALID, details.cert_status);

  EXPECT_TRUE(evaluator.Evaluate(Chain(renewed_, intermediate_),
                                 "www.example.com", &details));
  EXPECT_EQ(OK, details.net_error);
  EXPECT_EQ(CERT_STATUS_DATE_INVALID, details.cert_status);
}

TEST_F(ServerTrustEvaluatorTest, PublicKeyFallsBackToPresentedChain) {
  // The validator refuses to build any chain.
  AddMockResult(renewed_, CertificateList(), CERT_STATUS_AUTHORITY_INVALID,
                ERR_CERT_AUTHORITY_INVALID);
  AddMockResult(attacker_, CertificateList(), CERT_STATUS_AUTHORITY_INVALID,
                ERR_CERT_AUTHORITY_INVALID);

  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), true), mock_validator_);
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(renewed_, intermediate_), "www.example.com"));
  EXPECT_FALSE(
      evaluator.Evaluate(Chain(attacker_, intermediate_), "www.example.com"));

  // Without allow-invalid the failed verdict wins before any fallback.
  ServerTrustEvaluator strict(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      mock_validator_);
  EXPECT_FALSE(
      strict.Evaluate(Chain(renewed_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, FallbackRejectsMalformedPresentedChain) {
  AddMockResult(renewed_, CertificateList(), CERT_STATUS_AUTHORITY_INVALID,
                ERR_CERT_AUTHORITY_INVALID);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), true), mock_validator_);

  std::vector<std::string> der_certs;
  der_certs.push_back(renewed_->der_encoded());
  der_certs.push_back("\x30\x80");

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(ServerTrust(der_certs), "www.example.com",
                                  &details));
  EXPECT_EQ(ERR_CERT_INVALID, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, CertificateModeDoesNotFallBack) {
  AddMockResult(leaf_, CertificateList(), CERT_STATUS_AUTHORITY_INVALID,
                ERR_CERT_AUTHORITY_INVALID);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kCertificate, Pins(leaf_), true),
      mock_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, MalformedServerInputIsRejected) {
  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator evaluator(SecurityPolicy::Default(), mock_validator_);

  const char* const kInputs[] = {"", "\x30", "\x30\x82\xff\xff", "garbage"};
  for (const char* input : kInputs) {
    std::vector<std::string> der_certs(1, input);
    ServerTrustEvaluator::EvaluationDetails details;
    EXPECT_FALSE(evaluator.Evaluate(ServerTrust(der_certs), "www.example.com",
                                    &details));
    EXPECT_EQ(ERR_CERT_INVALID, details.net_error);
  }
}

TEST_F(ServerTrustEvaluatorTest, FailureLogIdentifiesLeaf) {
  mock_validator_->set_default_result(ERR_CERT_AUTHORITY_INVALID);
  ServerTrustEvaluator evaluator(SecurityPolicy::Default(), mock_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(self_signed_, nullptr),
                                  "self.example.com", &details));
  SHA256HashValue fingerprint = self_signed_->CalculateFingerprint256();
  EXPECT_THAT(details.failure_log,
              HasSubstr("SHA-256 fingerprint " +
                        base::HexEncode(fingerprint.data,
                                        sizeof(fingerprint.data))));
  EXPECT_THAT(details.failure_log,
              HasSubstr(self_signed_->GetSubjectDisplayName()));
  EXPECT_THAT(details.failure_log, HasSubstr(", self-signed."));

  EXPECT_FALSE(evaluator.Evaluate(Chain(leaf_, intermediate_),
                                  "www.example.com", &details));
  fingerprint = leaf_->CalculateFingerprint256();
  EXPECT_THAT(details.failure_log,
              HasSubstr(base::HexEncode(fingerprint.data,
                                        sizeof(fingerprint.data))));
  EXPECT_THAT(details.failure_log, Not(HasSubstr("self-signed")));

  // An unparseable leaf is not described.
  std::vector<std::string> der_certs(1, "garbage");
  EXPECT_FALSE(evaluator.Evaluate(ServerTrust(der_certs), "www.example.com",
                                  &details));
  EXPECT_THAT(details.failure_log, Not(HasSubstr("Leaf:")));
}

TEST_F(ServerTrustEvaluatorTest, EvaluationIsRepeatable) {
  mock_validator_->set_default_result(OK);
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      mock_validator_);
  ServerTrust trust = Chain(attacker_, intermediate_);

  ServerTrustEvaluator::EvaluationDetails first;
  ServerTrustEvaluator::EvaluationDetails second;
  EXPECT_FALSE(evaluator.Evaluate(trust, "www.example.com", &first));
  EXPECT_FALSE(evaluator.Evaluate(trust, "www.example.com", &second));
  EXPECT_EQ(first.net_error, second.net_error);
  EXPECT_EQ(first.cert_status, second.cert_status);
  EXPECT_EQ(first.failure_log, second.failure_log);

  // A policy rebuilt from the same inputs decides the same way.
  ServerTrustEvaluator rebuilt(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      mock_validator_);
  ServerTrustEvaluator::EvaluationDetails third;
  EXPECT_FALSE(rebuilt.Evaluate(trust, "www.example.com", &third));
  EXPECT_EQ(first.failure_log, third.failure_log);
}

// End to end with the OpenSSL validator.

TEST_F(ServerTrustEvaluatorTest, DefaultPolicyValidChain) {
  ServerTrustEvaluator evaluator(SecurityPolicy::Default(),
                                 openssl_validator_);
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(leaf_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, DefaultPolicyHostnameMismatch) {
  ServerTrustEvaluator evaluator(SecurityPolicy::Default(),
                                 openssl_validator_);
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(leaf_, intermediate_), "evil.com",
                                  &details));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID, details.net_error);

  // Unless the name check is switched off.
  ServerTrustEvaluator lenient(
      SecurityPolicy::Default()->WithValidatesDomainName(false),
      openssl_validator_);
  EXPECT_TRUE(lenient.Evaluate(Chain(leaf_, intermediate_), "evil.com"));
}

TEST_F(ServerTrustEvaluatorTest, DefaultPolicyUntrustedRoot) {
  CertBuilder rogue_root("Rogue Root");
  rogue_root.set_is_ca(true);
  CertBuilder rogue_leaf("www.example.com");
  rogue_leaf.AddDNSName("www.example.com");
  scoped_refptr<X509Certificate> cert = rogue_leaf.BuildSignedBy(rogue_root);
  ASSERT_TRUE(cert);

  ServerTrustEvaluator evaluator(SecurityPolicy::Default(),
                                 openssl_validator_);
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(
      evaluator.Evaluate(Chain(cert, nullptr), "www.example.com", &details));
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, PublicKeyPinningRotatedCertificate) {
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      openssl_validator_);
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(renewed_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, PublicKeyPinningRejectsOtherKey) {
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      openssl_validator_);
  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(attacker_, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
  // The chain itself was fine.
  EXPECT_EQ(0u, details.cert_status);
}

TEST_F(ServerTrustEvaluatorTest, PublicKeyPinningOnRootKey) {
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(root_), false),
      openssl_validator_);
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(attacker_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, CertificatePinningSelfSigned) {
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kCertificate, Pins(self_signed_), false),
      openssl_validator_);
  ServerTrust trust = Chain(self_signed_, nullptr);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_TRUE(evaluator.Evaluate(trust, "self.example.com", &details));
  EXPECT_TRUE(details.cert_status & CERT_STATUS_IS_ANCHORED_BY_PIN);

  EXPECT_FALSE(evaluator.Evaluate(trust, "other.example.com", &details));
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID, details.net_error);

  // Without the pin the same certificate is untrusted.
  ServerTrustEvaluator unpinned(SecurityPolicy::Default(), openssl_validator_);
  EXPECT_FALSE(unpinned.Evaluate(trust, "self.example.com", &details));
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, CertificatePinningPrivateIntermediate) {
  OpenSSLChainValidator::Config config;
  config.use_system_roots = false;
  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kCertificate, Pins(intermediate_), false),
      base::MakeRefCounted<OpenSSLChainValidator>(config));
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(leaf_, intermediate_), "www.example.com"));
  EXPECT_TRUE(
      evaluator.Evaluate(Chain(attacker_, intermediate_), "www.example.com"));
}

TEST_F(ServerTrustEvaluatorTest, AllowInvalidPinningStillEnforced) {
  CertBuilder expired_builder("www.example.com");
  expired_builder.AddDNSName("www.example.com");
  expired_builder.SetValidity(-10 * kOneDay, -kOneDay);
  scoped_refptr<X509Certificate> expired_other_key =
      expired_builder.BuildSignedBy(intermediate_builder_);
  expired_builder.UseKeyOf(leaf_builder_);
  scoped_refptr<X509Certificate> expired_pinned_key =
      expired_builder.BuildSignedBy(intermediate_builder_);
  ASSERT_TRUE(expired_other_key);
  ASSERT_TRUE(expired_pinned_key);

  ServerTrustEvaluator evaluator(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), true),
      openssl_validator_);

  ServerTrustEvaluator::EvaluationDetails details;
  EXPECT_FALSE(evaluator.Evaluate(Chain(expired_other_key, intermediate_),
                                  "www.example.com", &details));
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, details.net_error);
  EXPECT_TRUE(details.cert_status & CERT_STATUS_DATE_INVALID);

  EXPECT_TRUE(evaluator.Evaluate(Chain(expired_pinned_key, intermediate_),
                                 "www.example.com", &details));

  ServerTrustEvaluator strict(
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false),
      openssl_validator_);
  EXPECT_FALSE(strict.Evaluate(Chain(expired_pinned_key, intermediate_),
                               "www.example.com", &details));
  EXPECT_EQ(ERR_CERT_DATE_INVALID, details.net_error);
}

TEST_F(ServerTrustEvaluatorTest, ConcurrentEvaluationMatchesSequential) {
  scoped_refptr<SecurityPolicy> policy =
      MakePolicy(PinningMode::kPublicKey, Pins(leaf_), false);
  const ServerTrustEvaluator evaluator(policy, openssl_validator_);

  struct Case {
    ServerTrust trust;
    std::string hostname;
  };
  std::vector<Case> cases;
  cases.push_back({Chain(leaf_, intermediate_), "www.example.com"});
  cases.push_back({Chain(renewed_, intermediate_), "www.example.com"});
  cases.push_back({Chain(attacker_, intermediate_), "www.example.com"});
  cases.push_back({Chain(leaf_, intermediate_), "evil.com"});
  cases.push_back({Chain(self_signed_, nullptr), "self.example.com"});
  cases.push_back({ServerTrust(), "www.example.com"});

  std::vector<int> expected;
  for (const Case& c : cases) {
    ServerTrustEvaluator::EvaluationDetails details;
    evaluator.Evaluate(c.trust, c.hostname, &details);
    expected.push_back(details.net_error);
  }

  const int kThreads = 8;
  const int kIterations = 20;
  std::vector<std::vector<int>> observed(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&cases, &evaluator, &observed, t]() {
      for (int i = 0; i < kIterations; ++i) {
        for (const Case& c : cases) {
          ServerTrustEvaluator::EvaluationDetails details;
          evaluator.Evaluate(c.trust, c.hostname, &details);
          observed[t].push_back(details.net_error);
        }
      }
    });
  }
  for (std::thread& thread : threads)
    thread.join();

  for (int t = 0; t < kThreads; ++t) {
    ASSERT_EQ(cases.size() * kIterations, observed[t].size());
    for (size_t i = 0; i < observed[t].size(); ++i)
      EXPECT_EQ(expected[i % cases.size()], observed[t][i]);
  }
  EXPECT_EQ(OK, expected[0]);
  EXPECT_EQ(OK, expected[1]);
  EXPECT_EQ(ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN, expected[2]);
  EXPECT_EQ(ERR_CERT_COMMON_NAME_INVALID, expected[3]);
  EXPECT_EQ(ERR_CERT_AUTHORITY_INVALID, expected[4]);
  EXPECT_EQ(ERR_CERT_INVALID, expected[5]);
}

}  // namespace

}  // namespace trustpin
