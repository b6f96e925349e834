// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/cert_status_flags.h"

#include "base/logging.h"
#include "trustpin/base/net_errors.h"

namespace trustpin {

CertStatus MapNetErrorToCertStatus(int error) {
  switch (error) {
    case ERR_CERT_COMMON_NAME_INVALID:
      return CERT_STATUS_COMMON_NAME_INVALID;
    case ERR_CERT_DATE_INVALID:
      return CERT_STATUS_DATE_INVALID;
    case ERR_CERT_AUTHORITY_INVALID:
      return CERT_STATUS_AUTHORITY_INVALID;
    case ERR_CERT_REVOKED:
      return CERT_STATUS_REVOKED;
    case ERR_CERT_WEAK_SIGNATURE_ALGORITHM:
      return CERT_STATUS_WEAK_SIGNATURE_ALGORITHM;
    case ERR_CERT_CHAIN_TOO_LONG:
      return CERT_STATUS_CHAIN_TOO_LONG;
    case ERR_CERT_INVALID:
    case ERR_CERT_CONTAINS_ERRORS:
      return CERT_STATUS_INVALID;
    default:
      return 0;
  }
}

int MapCertStatusToNetError(CertStatus cert_status) {
  // A certificate may have multiple errors.  We report the most
  // serious error.

  // Unrecoverable errors
  if (cert_status & CERT_STATUS_INVALID)
    return ERR_CERT_INVALID;
  if (cert_status & CERT_STATUS_REVOKED)
    return ERR_CERT_REVOKED;
  if (cert_status & CERT_STATUS_CHAIN_TOO_LONG)
    return ERR_CERT_CHAIN_TOO_LONG;

  // Recoverable errors
  if (cert_status & CERT_STATUS_AUTHORITY_INVALID)
    return ERR_CERT_AUTHORITY_INVALID;
  if (cert_status & CERT_STATUS_COMMON_NAME_INVALID)
    return ERR_CERT_COMMON_NAME_INVALID;
  if (cert_status & CERT_STATUS_WEAK_SIGNATURE_ALGORITHM)
    return ERR_CERT_WEAK_SIGNATURE_ALGORITHM;
  if (cert_status & CERT_STATUS_DATE_INVALID)
    return ERR_CERT_DATE_INVALID;

  NOTREACHED() << "Unknown cert status flags " << cert_status;
  return ERR_UNEXPECTED;
}

std::string CertStatusToString(CertStatus cert_status) {
  std::string result;
#define CERT_STATUS_FLAG(label, value)  \
  if (cert_status & CERT_STATUS_##label) { \
    if (!result.empty())                 \
      result += "|";                     \
    result += #label;                    \
  }
#include "trustpin/cert/cert_status_flags_list.h"
#undef CERT_STATUS_FLAG
  return result.empty() ? std::string("OK") : result;
}

}  // namespace trustpin
