// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_X509_UTIL_H_
#define TRUSTPIN_CERT_X509_UTIL_H_

#include <string>
#include <vector>

#include <openssl/x509.h>

#include "base/compiler_specific.h"
#include "base/memory/ref_counted.h"
#include "crypto/scoped_openssl_types.h"
#include "trustpin/base/hash_value.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

namespace x509_util {

// Returns a freshly parsed crypto library handle for |cert|. The caller owns
// the handle, so it may be handed to a verification context without sharing
// state with other threads.
TRUSTPIN_EXPORT crypto::ScopedX509 CreateX509FromCertificate(
    const X509Certificate& cert);

// Serializes |cert| to DER. Returns false if |cert| cannot be encoded.
TRUSTPIN_EXPORT bool GetDEREncoded(X509* cert, std::string* der_encoded);

// Creates an X509Certificate from the crypto library handle |cert|. Returns
// NULL if |cert| cannot be encoded or its encoding is rejected by
// X509Certificate::CreateFromBytes.
TRUSTPIN_EXPORT scoped_refptr<X509Certificate> CreateCertificateFromX509(
    X509* cert);

// Parses every element of |der_certs|, preserving order, into |certs|.
// Returns false, leaving |certs| empty, if any element fails to parse.
TRUSTPIN_EXPORT bool ParseDERCertChain(const std::vector<std::string>& der_certs,
                                       CertificateList* certs)
    WARN_UNUSED_RESULT;

// Returns the SPKI hashes of |certs|, in order.
TRUSTPIN_EXPORT HashValueVector GetSPKIHashes(const CertificateList& certs);

// Joins the "sha256/<base64>" form of every hash in |hashes| with ",".
TRUSTPIN_EXPORT std::string HashesToBase64String(const HashValueVector& hashes);

}  // namespace x509_util

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_X509_UTIL_H_
