// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_POLICY_SERVER_TRUST_EVALUATOR_H_
#define TRUSTPIN_POLICY_SERVER_TRUST_EVALUATOR_H_

#include <stddef.h>

#include <string>

#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/chain_validator.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/policy/security_policy.h"

namespace trustpin {

class ChainValidationResult;

// Decides whether a server that presented a given chain should be trusted,
// by combining chain validation with the pinning rules of a SecurityPolicy.
//
// Evaluate() keeps no state between calls and may run on several threads at
// once, provided the ChainValidator supports that (all the validators in
// this project do).
class TRUSTPIN_EXPORT ServerTrustEvaluator {
 public:
  // Why an evaluation came out the way it did.
  struct TRUSTPIN_EXPORT EvaluationDetails {
    EvaluationDetails();
    EvaluationDetails(const EvaluationDetails& other);
    ~EvaluationDetails();

    // OK when the server is trusted. Otherwise the reason for rejection,
    // e.g. a certificate error from the validator or
    // ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN.
    int net_error;

    // The status the validator reported, 0 if it was never consulted.
    CertStatus cert_status;

    // A human readable account of a rejection. Empty on success.
    std::string failure_log;
  };

  // Chains longer than this are rejected without validation.
  static constexpr size_t kMaxServerChainLength = 32;

  ServerTrustEvaluator(scoped_refptr<SecurityPolicy> policy,
                       scoped_refptr<ChainValidator> validator);
  ~ServerTrustEvaluator();

  // Returns true if |trust| should be accepted for |hostname|. An empty
  // |hostname| means the hostname is unknown; the name check is then
  // skipped rather than failed. Malformed or hostile input is rejected,
  // never fatal.
  bool Evaluate(const ServerTrust& trust, const std::string& hostname) const;

  // As above, and fills in |details|.
  bool Evaluate(const ServerTrust& trust,
                const std::string& hostname,
                EvaluationDetails* details) const;

  const SecurityPolicy& policy() const { return *policy_; }

 private:
  // Runs the decision procedure. Returns OK to accept.
  int DoEvaluate(const ServerTrust& trust,
                 const std::string& hostname,
                 EvaluationDetails* details) const;

  // Compares the chain against the pins. |result| is the validator's
  // output; the presented chain stands in for it when it is empty.
  int CheckPins(const ServerTrust& trust,
                const ChainValidationResult& result,
                EvaluationDetails* details) const;

  const scoped_refptr<SecurityPolicy> policy_;
  const scoped_refptr<ChainValidator> validator_;

  DISALLOW_COPY_AND_ASSIGN(ServerTrustEvaluator);
};

}  // namespace trustpin

#endif  // TRUSTPIN_POLICY_SERVER_TRUST_EVALUATOR_H_
