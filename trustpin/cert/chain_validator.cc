// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/chain_validator.h"

#include "base/logging.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/server_trust.h"

namespace trustpin {

ChainValidator::ChainValidator() = default;

ChainValidator::~ChainValidator() = default;

int ChainValidator::Validate(const ServerTrust& trust,
                             const std::string& hostname,
                             const CertificateList& additional_trust_anchors,
                             ChainValidationResult* result) {
  result->Reset();

  if (trust.empty()) {
    result->cert_status |= CERT_STATUS_INVALID;
    return ERR_CERT_INVALID;
  }

  int rv = ValidateInternal(
      trust, hostname,
      SupportsAdditionalTrustAnchors() ? additional_trust_anchors
                                       : CertificateList(),
      result);

  // Keep the returned code and the status bits in agreement, so callers may
  // rely on either.
  if (rv != OK && !IsCertStatusError(result->cert_status)) {
    result->cert_status |= MapNetErrorToCertStatus(rv);
    if (!IsCertStatusError(result->cert_status))
      result->cert_status |= CERT_STATUS_INVALID;
  }
  if (IsCertStatusError(result->cert_status))
    rv = MapCertStatusToNetError(result->cert_status);
  DCHECK(rv == OK || IsCertificateError(rv))
      << ErrorToShortString(rv);

  DVLOG(2) << "Chain of " << trust.size() << " validated for \"" << hostname
           << "\": " << ErrorToShortString(rv) << " ("
           << CertStatusToString(result->cert_status) << ")";
  return rv;
}

}  // namespace trustpin
