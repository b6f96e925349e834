// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/x509_certificate.h"

#include <stdint.h>
#include <string.h>

#include <utility>

#include <openssl/evp.h>

#include "base/logging.h"
#include "crypto/openssl_util.h"
#include "crypto/sha2.h"
#include "trustpin/cert/asn1_util.h"
#include "trustpin/cert/pem.h"

namespace trustpin {

namespace {

// The PEM block header used for DER certificates
const char kCertificateHeader[] = "CERTIFICATE";

}  // namespace

// static
scoped_refptr<X509Certificate> X509Certificate::CreateFromBytes(
    const char* data,
    size_t length) {
  return CreateFromBytes(std::string_view(data, length));
}

// static
scoped_refptr<X509Certificate> X509Certificate::CreateFromBytes(
    std::string_view der) {
  scoped_refptr<X509Certificate> cert(new X509Certificate(std::string(der)));
  if (!cert->Initialize())
    return nullptr;
  return cert;
}

// static
CertificateList X509Certificate::CreateCertificateListFromBytes(
    const char* data,
    size_t length,
    int format) {
  CertificateList certificates;

  // Check to see if it is in a PEM-encoded form. PEM text never parses as
  // DER, so this check is performed first.
  std::string_view data_string(data, length);
  std::vector<std::string> pem_headers;
  pem_headers.push_back(kCertificateHeader);

  PEMTokenizer pem_tokenizer(data_string, pem_headers);
  while (pem_tokenizer.GetNext()) {
    scoped_refptr<X509Certificate> cert =
        CreateFromBytes(pem_tokenizer.data());
    // A block that fails to parse ends the sequence.
    if (!cert)
      break;
    certificates.push_back(std::move(cert));
    if (!(format & FORMAT_PEM_CERT_SEQUENCE))
      break;
  }

  if (!certificates.empty())
    return certificates;

  // Fall back to treating |data| as the binary representation of a single
  // certificate, if it failed to parse as a PEM certificate/chain.
  if (format & FORMAT_SINGLE_CERTIFICATE) {
    scoped_refptr<X509Certificate> cert = CreateFromBytes(data, length);
    if (cert)
      certificates.push_back(std::move(cert));
  }

  return certificates;
}

std::string X509Certificate::GetSubjectDisplayName() const {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  const uint8_t* data = reinterpret_cast<const uint8_t*>(subject_.data());
  crypto::ScopedX509_NAME subject(
      d2i_X509_NAME(nullptr, &data, static_cast<long>(subject_.size())));
  char buffer[256];
  if (!subject || !X509_NAME_oneline(subject.get(), buffer, sizeof(buffer)))
    return std::string();
  return std::string(buffer);
}

bool X509Certificate::IsSelfSigned() const {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  X509* cert = cert_handle_.get();
  if (X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)))
    return false;
  crypto::ScopedEVP_PKEY key(X509_get_pubkey(cert));
  if (!key)
    return false;
  return X509_verify(cert, key.get()) == 1;
}

bool X509Certificate::Equals(const X509Certificate* other) const {
  return der_encoded_ == other->der_encoded_;
}

SHA256HashValue X509Certificate::CalculateFingerprint256() const {
  SHA256HashValue sha256;
  crypto::SHA256HashString(der_encoded_, sha256.data, sizeof(sha256.data));
  return sha256;
}

HashValue X509Certificate::CalculateSPKIHash() const {
  SHA256HashValue sha256;
  crypto::SHA256HashString(spki_, sha256.data, sizeof(sha256.data));
  return HashValue(sha256);
}

X509Certificate::X509Certificate(std::string der_encoded)
    : der_encoded_(std::move(der_encoded)) {}

X509Certificate::~X509Certificate() = default;

bool X509Certificate::Initialize() {
  // The DER structure is checked first so that the crypto library is only
  // ever handed input that is already known to be a single, strictly encoded
  // certificate.
  if (!asn1::IsStrictDERCertificate(der_encoded_))
    return false;
  if (!asn1::ExtractSPKIFromDERCert(der_encoded_, &spki_) ||
      !asn1::ExtractSubjectFromDERCert(der_encoded_, &subject_)) {
    return false;
  }

  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  const uint8_t* data = reinterpret_cast<const uint8_t*>(der_encoded_.data());
  const uint8_t* const end = data + der_encoded_.size();
  cert_handle_.reset(
      d2i_X509(nullptr, &data, static_cast<long>(der_encoded_.size())));
  if (!cert_handle_ || data != end) {
    cert_handle_.reset();
    return false;
  }
  return true;
}

}  // namespace trustpin
