// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_CHAIN_VALIDATOR_H_
#define TRUSTPIN_CERT_CHAIN_VALIDATOR_H_

#include <string>

#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

class ChainValidationResult;
class ServerTrust;

// Class to perform chain building and path validation of a server chain,
// including the hostname check. Implementations must be safe to call from
// several threads at once.
class TRUSTPIN_EXPORT ChainValidator
    : public base::RefCountedThreadSafe<ChainValidator> {
 public:
  // Validates |trust| as an SSL server chain. Returns OK if the chain is
  // trusted or an error code upon failure.
  //
  // If |hostname| is not empty, the leaf must be valid for it. If it is
  // empty, no name check is performed.
  //
  // |additional_trust_anchors| lists certificates that are trusted for this
  // call only, in addition to the anchors known to the implementation.
  //
  // |*result| is always filled out regardless of the return value. If the
  // chain has multiple errors, the corresponding status flags are set in
  // |result->cert_status|, and the error code for the most serious error is
  // returned. OK is returned exactly when no error flag is set.
  int Validate(const ServerTrust& trust,
               const std::string& hostname,
               const CertificateList& additional_trust_anchors,
               ChainValidationResult* result);

  // Returns true if the implementation supports passing additional trust
  // anchors to the Validate() call. The |additional_trust_anchors| parameter
  // passed to Validate() is ignored when this returns false.
  virtual bool SupportsAdditionalTrustAnchors() const = 0;

 protected:
  ChainValidator();
  virtual ~ChainValidator();

 private:
  friend class base::RefCountedThreadSafe<ChainValidator>;

  // Performs the actual validation using the desired underlying
  // implementation.
  //
  // On entry, |result| is reset and |trust| is known to be non-empty.
  // Implementations fill in |result->verified_chain| and
  // |result->cert_status|. If an error code is returned,
  // |result->cert_status| should be non-zero.
  virtual int ValidateInternal(const ServerTrust& trust,
                               const std::string& hostname,
                               const CertificateList& additional_trust_anchors,
                               ChainValidationResult* result) = 0;

  DISALLOW_COPY_AND_ASSIGN(ChainValidator);
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_CHAIN_VALIDATOR_H_
