// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/server_trust_evaluator.h"

#include <utility>

#include "base/logging.h"
#include "base/strings/string_number_conversions.h"
#include "trustpin/base/hash_value.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/cert/x509_util.h"

namespace trustpin {

namespace {

// Identifies the presented leaf in a failure log, or returns an empty string
// if it does not parse.
std::string DescribeLeaf(const ServerTrust& trust) {
  if (trust.empty())
    return std::string();
  scoped_refptr<X509Certificate> leaf =
      X509Certificate::CreateFromBytes(trust.der_certs()[0]);
  if (!leaf)
    return std::string();
  SHA256HashValue fingerprint = leaf->CalculateFingerprint256();
  std::string description =
      " Leaf: " + leaf->GetSubjectDisplayName() + ", SHA-256 fingerprint " +
      base::HexEncode(fingerprint.data, sizeof(fingerprint.data));
  if (leaf->IsSelfSigned())
    description += ", self-signed";
  return description + ".";
}

}  // namespace

ServerTrustEvaluator::EvaluationDetails::EvaluationDetails()
    : net_error(OK), cert_status(0) {}

ServerTrustEvaluator::EvaluationDetails::EvaluationDetails(
    const EvaluationDetails& other) = default;

ServerTrustEvaluator::EvaluationDetails::~EvaluationDetails() = default;

ServerTrustEvaluator::ServerTrustEvaluator(
    scoped_refptr<SecurityPolicy> policy,
    scoped_refptr<ChainValidator> validator)
    : policy_(std::move(policy)), validator_(std::move(validator)) {
  DCHECK(policy_);
  DCHECK(validator_);
}

ServerTrustEvaluator::~ServerTrustEvaluator() = default;

bool ServerTrustEvaluator::Evaluate(const ServerTrust& trust,
                                    const std::string& hostname) const {
  EvaluationDetails details;
  return Evaluate(trust, hostname, &details);
}

bool ServerTrustEvaluator::Evaluate(const ServerTrust& trust,
                                    const std::string& hostname,
                                    EvaluationDetails* details) const {
  *details = EvaluationDetails();
  details->net_error = DoEvaluate(trust, hostname, details);
  if (details->net_error != OK) {
    details->failure_log += DescribeLeaf(trust);
    VLOG(1) << "Rejecting server \"" << hostname << "\" ("
            << policy_->ToString()
            << "): " << ErrorToShortString(details->net_error) << ". "
            << details->failure_log;
    return false;
  }
  details->failure_log.clear();
  return true;
}

int ServerTrustEvaluator::DoEvaluate(const ServerTrust& trust,
                                     const std::string& hostname,
                                     EvaluationDetails* details) const {
  if (trust.empty()) {
    details->failure_log = "The server presented no certificates.";
    return ERR_CERT_INVALID;
  }
  if (trust.size() > kMaxServerChainLength) {
    details->failure_log = "The server presented " +
                           base::NumberToString(trust.size()) +
                           " certificates, more than the limit of " +
                           base::NumberToString(kMaxServerChainLength) + ".";
    return ERR_CERT_CHAIN_TOO_LONG;
  }

  const PinningMode mode = policy_->pinning_mode();

  // A missing hostname disables the name check instead of failing it.
  const std::string validated_hostname =
      policy_->validates_domain_name() ? hostname : std::string();

  // Pinned certificates extend trust in certificate mode, so a self-signed
  // or privately issued server certificate can validate.
  CertificateList additional_trust_anchors;
  if (mode == PinningMode::kCertificate)
    additional_trust_anchors = policy_->pinned_certificates().certificates();

  ChainValidationResult result;
  int rv = validator_->Validate(trust, validated_hostname,
                                additional_trust_anchors, &result);
  details->cert_status = result.cert_status;

  if (rv != OK) {
    if (!policy_->allow_invalid_certificates()) {
      details->failure_log = "Chain validation failed: " +
                             CertStatusToString(result.cert_status) + ".";
      return rv;
    }
    VLOG(1) << "Ignoring chain validation failure "
            << CertStatusToString(result.cert_status)
            << " because invalid certificates are allowed";
  }

  if (mode == PinningMode::kNone)
    return OK;

  return CheckPins(trust, result, details);
}

int ServerTrustEvaluator::CheckPins(const ServerTrust& trust,
                                    const ChainValidationResult& result,
                                    EvaluationDetails* details) const {
  const PinnedCertificateSet& pins = policy_->pinned_certificates();

  CertificateList chain = result.verified_chain;
  if (chain.empty() && pins.mode() == PinningMode::kPublicKey) {
    // The validator built no chain at all; fall back to the certificates
    // the server sent. Any malformed element rejects.
    if (!x509_util::ParseDERCertChain(trust.der_certs(), &chain)) {
      details->failure_log = "The server chain could not be parsed.";
      return ERR_CERT_INVALID;
    }
  }

  if (pins.MatchesAny(chain))
    return OK;

  details->failure_log =
      std::string("No certificate in the chain matches a pinned ") +
      (pins.mode() == PinningMode::kCertificate ? "certificate"
                                                : "public key") +
      ". Chain: " +
      x509_util::HashesToBase64String(x509_util::GetSPKIHashes(chain)) +
      "; pinned: " +
      x509_util::HashesToBase64String(pins.GetSPKIHashes()) + ".";
  return ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN;
}

}  // namespace trustpin
