// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_CHAIN_VALIDATION_RESULT_H_
#define TRUSTPIN_CERT_CHAIN_VALIDATION_RESULT_H_

#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

// The result of validating a server chain.
class TRUSTPIN_EXPORT ChainValidationResult {
 public:
  ChainValidationResult();
  ChainValidationResult(const ChainValidationResult& other);
  ~ChainValidationResult();

  ChainValidationResult& operator=(const ChainValidationResult& other);

  void Reset();

  // The certificates the validator inspected, leaf at index 0, in order of
  // issuance. Filled in even when validation fails, as far as the validator
  // got. Empty if the presented chain could not be parsed at all.
  CertificateList verified_chain;

  // Bitmask of CERT_STATUS_* from trustpin/cert/cert_status_flags.h.
  CertStatus cert_status;
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_CHAIN_VALIDATION_RESULT_H_
