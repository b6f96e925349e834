// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_ASN1_UTIL_H_
#define TRUSTPIN_CERT_ASN1_UTIL_H_

#include <string_view>

#include "trustpin/base/trustpin_export.h"

namespace trustpin {

namespace asn1 {

// ExtractSubjectFromDERCert parses the DER encoded certificate in |cert| and
// extracts the bytes of the X.501 Subject. On successful return, |subject_out|
// is set to contain the Subject, pointing into |cert|.
TRUSTPIN_EXPORT_PRIVATE bool ExtractSubjectFromDERCert(
    std::string_view cert,
    std::string_view* subject_out);

// ExtractSPKIFromDERCert parses the DER encoded certificate in |cert| and
// extracts the bytes of the SubjectPublicKeyInfo. On successful return,
// |spki_out| is set to contain the SPKI, pointing into |cert|.
//
// The SPKI is lifted verbatim from |cert|, so two certificates carry the same
// public key exactly when the returned byte ranges are equal.
TRUSTPIN_EXPORT_PRIVATE bool ExtractSPKIFromDERCert(std::string_view cert,
                                                    std::string_view* spki_out);

// ExtractSubjectPublicKeyFromSPKI parses the DER encoded SubjectPublicKeyInfo
// in |spki| and extracts the bytes of the SubjectPublicKey. On successful
// return, |spk_out| is set to contain the public key, pointing into |spki|.
TRUSTPIN_EXPORT_PRIVATE bool ExtractSubjectPublicKeyFromSPKI(
    std::string_view spki,
    std::string_view* spk_out);

// Returns true if |cert| is a single DER TLV (a SEQUENCE with definite,
// minimally encoded lengths at every level down to the SubjectPublicKeyInfo)
// with no trailing data.
TRUSTPIN_EXPORT_PRIVATE bool IsStrictDERCertificate(std::string_view cert);

}  // namespace asn1

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_ASN1_UTIL_H_
