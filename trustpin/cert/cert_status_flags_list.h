// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// This is the list of CertStatus flags and their values.
//
// Defines:
// CERT_STATUS_FLAG(label, value)
//   Where label is the name of the flag and value is its bit.

// This file intentionally does not have header guards, it's included
// inside a macro to generate values.
// no-include-guard-because-multiply-included

// Bits 0 to 15 are for errors.
CERT_STATUS_FLAG(COMMON_NAME_INVALID, 1 << 0)
CERT_STATUS_FLAG(DATE_INVALID, 1 << 1)
CERT_STATUS_FLAG(AUTHORITY_INVALID, 1 << 2)
// 1 << 3 is reserved for ERR_CERT_CONTAINS_ERRORS (not used)
// 1 << 4 is reserved for ERR_CERT_NO_REVOCATION_MECHANISM
// 1 << 5 is reserved for ERR_CERT_UNABLE_TO_CHECK_REVOCATION
CERT_STATUS_FLAG(REVOKED, 1 << 6)
CERT_STATUS_FLAG(INVALID, 1 << 7)
CERT_STATUS_FLAG(WEAK_SIGNATURE_ALGORITHM, 1 << 8)
CERT_STATUS_FLAG(CHAIN_TOO_LONG, 1 << 9)

// Bits 16 to 31 are for non-error statuses.
CERT_STATUS_FLAG(IS_ANCHORED_BY_PIN, 1 << 16)
