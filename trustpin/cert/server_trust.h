// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_SERVER_TRUST_H_
#define TRUSTPIN_CERT_SERVER_TRUST_H_

#include <stddef.h>

#include <string>
#include <vector>

#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

// The certificate chain a server presented during the TLS handshake, leaf
// first, exactly as received. Nothing is parsed until a ChainValidator
// interprets it, so a ServerTrust may hold malformed or hostile input.
class TRUSTPIN_EXPORT ServerTrust {
 public:
  ServerTrust();
  explicit ServerTrust(std::vector<std::string> der_certs);
  ServerTrust(const ServerTrust& other);
  ServerTrust(ServerTrust&& other);
  ~ServerTrust();

  ServerTrust& operator=(const ServerTrust& other);
  ServerTrust& operator=(ServerTrust&& other);

  // Builds a ServerTrust from already parsed certificates, leaf first.
  static ServerTrust CreateFromCertificates(const CertificateList& certs);

  // The DER encodings of the presented certificates. Element 0 is the leaf.
  const std::vector<std::string>& der_certs() const { return der_certs_; }

  size_t size() const { return der_certs_.size(); }
  bool empty() const { return der_certs_.empty(); }

 private:
  std::vector<std::string> der_certs_;
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_SERVER_TRUST_H_
