// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_MOCK_CHAIN_VALIDATOR_H_
#define TRUSTPIN_CERT_MOCK_CHAIN_VALIDATOR_H_

#include <list>
#include <string>

#include "base/synchronization/lock.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/chain_validator.h"

namespace trustpin {

class MockChainValidator : public ChainValidator {
 public:
  // Creates a new MockChainValidator. By default, any call to Validate() will
  // result in the cert status being flagged as CERT_STATUS_INVALID and return
  // an ERR_CERT_INVALID network error code, with the presented chain reported
  // as the verified chain. This behaviour can be overridden by calling
  // set_default_result() to change the default return value for Validate()
  // or by calling one of the AddResult*() methods to specifically handle a
  // certificate or certificate and host.
  MockChainValidator();

  bool SupportsAdditionalTrustAnchors() const override;

  // Sets the default return value for Validate() for certificates/hosts that
  // do not have explicit results added via the AddResult*() methods.
  void set_default_result(int default_result) {
    default_result_ = default_result;
  }

  // Adds a rule that will cause any call to Validate() for a chain whose leaf
  // is |cert| to return rv, copying |result| into the validation result.
  // Note: Only the leaf is checked. Any intermediate certificates will be
  // ignored.
  void AddResultForCert(scoped_refptr<X509Certificate> cert,
                        const ChainValidationResult& result,
                        int rv);

  // Same as AddResultForCert(), but further restricts it to only return for
  // hostnames that match |host_pattern|.
  void AddResultForCertAndHost(scoped_refptr<X509Certificate> cert,
                               const std::string& host_pattern,
                               const ChainValidationResult& result,
                               int rv);

  // Details of the calls seen so far.
  int call_count() const;
  std::string last_hostname() const;
  CertificateList last_additional_trust_anchors() const;

 protected:
  ~MockChainValidator() override;

 private:
  struct Rule;
  typedef std::list<Rule> RuleList;

  int ValidateInternal(const ServerTrust& trust,
                       const std::string& hostname,
                       const CertificateList& additional_trust_anchors,
                       ChainValidationResult* result) override;

  int default_result_;
  RuleList rules_;

  mutable base::Lock lock_;
  int call_count_;
  std::string last_hostname_;
  CertificateList last_additional_trust_anchors_;

  DISALLOW_COPY_AND_ASSIGN(MockChainValidator);
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_MOCK_CHAIN_VALIDATOR_H_
