// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/mock_chain_validator.h"

#include <utility>

#include "base/logging.h"
#include "base/strings/pattern.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/cert/x509_util.h"

namespace trustpin {

struct MockChainValidator::Rule {
  Rule(scoped_refptr<X509Certificate> cert_arg,
       const std::string& hostname_arg,
       const ChainValidationResult& result_arg,
       int rv_arg)
      : cert(std::move(cert_arg)),
        hostname(hostname_arg),
        result(result_arg),
        rv(rv_arg) {
    DCHECK(cert);
  }

  scoped_refptr<X509Certificate> cert;
  std::string hostname;
  ChainValidationResult result;
  int rv;
};

MockChainValidator::MockChainValidator()
    : default_result_(ERR_CERT_INVALID), call_count_(0) {}

MockChainValidator::~MockChainValidator() = default;

bool MockChainValidator::SupportsAdditionalTrustAnchors() const {
  return true;
}

int MockChainValidator::ValidateInternal(
    const ServerTrust& trust,
    const std::string& hostname,
    const CertificateList& additional_trust_anchors,
    ChainValidationResult* result) {
  {
    base::AutoLock lock(lock_);
    ++call_count_;
    last_hostname_ = hostname;
    last_additional_trust_anchors_ = additional_trust_anchors;
  }

  for (const Rule& rule : rules_) {
    // Check just the leaf. Intermediates will be ignored.
    if (rule.cert->der_encoded() != trust.der_certs()[0])
      continue;
    if (!base::MatchPattern(hostname, rule.hostname))
      continue;
    *result = rule.result;
    return rule.rv;
  }

  // Fall through to the default.
  if (!x509_util::ParseDERCertChain(trust.der_certs(),
                                    &result->verified_chain)) {
    result->cert_status = CERT_STATUS_INVALID;
    return ERR_CERT_INVALID;
  }
  result->cert_status = MapNetErrorToCertStatus(default_result_);
  return default_result_;
}

void MockChainValidator::AddResultForCert(
    scoped_refptr<X509Certificate> cert,
    const ChainValidationResult& result,
    int rv) {
  AddResultForCertAndHost(std::move(cert), "*", result, rv);
}

void MockChainValidator::AddResultForCertAndHost(
    scoped_refptr<X509Certificate> cert,
    const std::string& host_pattern,
    const ChainValidationResult& result,
    int rv) {
  rules_.push_back(Rule(std::move(cert), host_pattern, result, rv));
}

int MockChainValidator::call_count() const {
  base::AutoLock lock(lock_);
  return call_count_;
}

std::string MockChainValidator::last_hostname() const {
  base::AutoLock lock(lock_);
  return last_hostname_;
}

CertificateList MockChainValidator::last_additional_trust_anchors() const {
  base::AutoLock lock(lock_);
  return last_additional_trust_anchors_;
}

}  // namespace trustpin
