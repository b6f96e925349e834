// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/x509_util.h"

#include <stdint.h>

#include <utility>

#include "base/logging.h"
#include "crypto/openssl_util.h"

namespace trustpin {

namespace x509_util {

crypto::ScopedX509 CreateX509FromCertificate(const X509Certificate& cert) {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  const std::string& der = cert.der_encoded();
  const uint8_t* data = reinterpret_cast<const uint8_t*>(der.data());
  crypto::ScopedX509 handle(
      d2i_X509(nullptr, &data, static_cast<long>(der.size())));
  // |cert| was accepted by the same parser when it was created.
  DCHECK(handle);
  return handle;
}

bool GetDEREncoded(X509* cert, std::string* der_encoded) {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  int length = i2d_X509(cert, nullptr);
  if (length <= 0)
    return false;
  der_encoded->resize(static_cast<size_t>(length));
  uint8_t* ptr = reinterpret_cast<uint8_t*>(&(*der_encoded)[0]);
  if (i2d_X509(cert, &ptr) != length) {
    der_encoded->clear();
    return false;
  }
  return true;
}

scoped_refptr<X509Certificate> CreateCertificateFromX509(X509* cert) {
  std::string der;
  if (!GetDEREncoded(cert, &der))
    return nullptr;
  return X509Certificate::CreateFromBytes(der);
}

bool ParseDERCertChain(const std::vector<std::string>& der_certs,
                       CertificateList* certs) {
  CertificateList parsed;
  parsed.reserve(der_certs.size());
  for (size_t i = 0; i < der_certs.size(); ++i) {
    scoped_refptr<X509Certificate> cert =
        X509Certificate::CreateFromBytes(der_certs[i]);
    if (!cert) {
      DVLOG(1) << "Certificate " << i << " of " << der_certs.size()
               << " in the chain is malformed";
      certs->clear();
      return false;
    }
    parsed.push_back(std::move(cert));
  }
  certs->swap(parsed);
  return true;
}

HashValueVector GetSPKIHashes(const CertificateList& certs) {
  HashValueVector hashes;
  hashes.reserve(certs.size());
  for (const auto& cert : certs)
    hashes.push_back(cert->CalculateSPKIHash());
  return hashes;
}

std::string HashesToBase64String(const HashValueVector& hashes) {
  std::string str;
  for (size_t i = 0; i != hashes.size(); ++i) {
    if (i != 0)
      str += ",";
    str += hashes[i].ToString();
  }
  return str;
}

}  // namespace x509_util

}  // namespace trustpin
