// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_X509_CERTIFICATE_H_
#define TRUSTPIN_CERT_X509_CERTIFICATE_H_

#include <stddef.h>

#include <string>
#include <string_view>
#include <vector>

#include <openssl/x509.h>

#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "crypto/scoped_openssl_types.h"
#include "trustpin/base/hash_value.h"
#include "trustpin/base/trustpin_export.h"

namespace trustpin {

class X509Certificate;

typedef std::vector<scoped_refptr<X509Certificate> > CertificateList;

// X509Certificate represents a single X.509 certificate, held in its DER
// encoding. Instances are immutable once created and may be shared between
// threads.
//
// The bytes are checked by the project's own strict DER reader and then by
// the crypto library before an instance is handed out, so every live
// X509Certificate is known to parse.
class TRUSTPIN_EXPORT X509Certificate
    : public base::RefCountedThreadSafe<X509Certificate> {
 public:
  enum Format {
    // The data contains a single DER-encoded certificate, or a PEM-encoded
    // DER certificate with the PEM encoding block name of "CERTIFICATE".
    // Any subsequent blocks will be ignored.
    FORMAT_SINGLE_CERTIFICATE = 1 << 0,

    // The data contains a sequence of one or more PEM-encoded, DER
    // certificates, with the PEM encoding block name of "CERTIFICATE".
    // All PEM blocks will be parsed, until the first error is encountered.
    FORMAT_PEM_CERT_SEQUENCE = 1 << 1,

    // Automatically detect the format.
    FORMAT_AUTO = FORMAT_SINGLE_CERTIFICATE | FORMAT_PEM_CERT_SEQUENCE,
  };

  // Create an X509Certificate from the DER-encoded representation.
  // Returns NULL on failure: when the bytes are not exactly one
  // well-formed DER certificate with no trailing data.
  static scoped_refptr<X509Certificate> CreateFromBytes(const char* data,
                                                        size_t length);
  static scoped_refptr<X509Certificate> CreateFromBytes(std::string_view der);

  // Parses all of the certificates possible from |data|. |format| is a
  // bit-wise OR of Format, indicating the possible formats the
  // certificates may have been serialized as. If an error occurs, an empty
  // collection will be returned.
  static CertificateList CreateCertificateListFromBytes(const char* data,
                                                        size_t length,
                                                        int format);

  // Returns the full DER encoding of the certificate.
  const std::string& der_encoded() const { return der_encoded_; }

  // Returns the SubjectPublicKeyInfo exactly as it is encoded inside
  // der_encoded(). Two certificates hold the same public key for pinning
  // purposes if and only if these bytes are equal.
  std::string_view public_key_bytes() const { return spki_; }

  // Returns a one-line, human readable rendering of the subject, for logs.
  std::string GetSubjectDisplayName() const;

  // Returns true if the certificate is self-issued and verifies under its
  // own public key.
  bool IsSelfSigned() const;

  // Returns true if |other| has the same DER encoding as this certificate.
  bool Equals(const X509Certificate* other) const;

  // Calculates the SHA-256 fingerprint of the certificate.
  SHA256HashValue CalculateFingerprint256() const;

  // Calculates the SHA-256 hash of public_key_bytes(), the value HTTP Public
  // Key Pinning uses to name a key.
  HashValue CalculateSPKIHash() const;

 private:
  friend class base::RefCountedThreadSafe<X509Certificate>;

  explicit X509Certificate(std::string der_encoded);
  ~X509Certificate();

  // Parses |der_encoded_| and fills in the remaining members. Returns false
  // if the certificate is not well formed.
  bool Initialize();

  const std::string der_encoded_;

  // Views into |der_encoded_|.
  std::string_view spki_;
  std::string_view subject_;

  crypto::ScopedX509 cert_handle_;

  DISALLOW_COPY_AND_ASSIGN(X509Certificate);
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_X509_CERTIFICATE_H_
