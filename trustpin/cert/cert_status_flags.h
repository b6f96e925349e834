// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_CERT_STATUS_FLAGS_H_
#define TRUSTPIN_CERT_CERT_STATUS_FLAGS_H_

#include <stdint.h>

#include <string>

#include "trustpin/base/trustpin_export.h"

namespace trustpin {

// Bitmask of status flags of a certificate chain, representing what a chain
// validator found wrong with it (the error bits) plus informational bits.
typedef uint32_t CertStatus;

// NOTE: Because these names have appeared in bug reports, we preserve them as
// MACRO_STYLE for continuity, instead of renaming them to kConstantStyle as
// befits most static consts.
#define CERT_STATUS_FLAG(label, value) \
    CertStatus static const CERT_STATUS_##label = value;
#include "trustpin/cert/cert_status_flags_list.h"
#undef CERT_STATUS_FLAG

static const CertStatus CERT_STATUS_ALL_ERRORS = 0xFFFF;

// Returns true if the specified cert status has an error set.
static inline bool IsCertStatusError(CertStatus status) {
  return (CERT_STATUS_ALL_ERRORS & status) != 0;
}

// Maps a network error code to the equivalent certificate status flag. If
// the error code is not a certificate error, it is mapped to 0.
// Note: It is not safe to go net::Error -> CertStatus -> net::Error.
TRUSTPIN_EXPORT CertStatus MapNetErrorToCertStatus(int error);

// Maps the most serious certificate error in the certificate status flags
// to the equivalent network error code.
TRUSTPIN_EXPORT int MapCertStatusToNetError(CertStatus cert_status);

// Returns a "|"-separated list of the flag names set in |cert_status|, for
// failure logs.
TRUSTPIN_EXPORT std::string CertStatusToString(CertStatus cert_status);

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_CERT_STATUS_FLAGS_H_
