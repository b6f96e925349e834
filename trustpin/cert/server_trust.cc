// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/server_trust.h"

#include <utility>

namespace trustpin {

ServerTrust::ServerTrust() = default;

ServerTrust::ServerTrust(std::vector<std::string> der_certs)
    : der_certs_(std::move(der_certs)) {}

ServerTrust::ServerTrust(const ServerTrust& other) = default;

ServerTrust::ServerTrust(ServerTrust&& other) = default;

ServerTrust::~ServerTrust() = default;

ServerTrust& ServerTrust::operator=(const ServerTrust& other) = default;

ServerTrust& ServerTrust::operator=(ServerTrust&& other) = default;

// static
ServerTrust ServerTrust::CreateFromCertificates(const CertificateList& certs) {
  std::vector<std::string> der_certs;
  der_certs.reserve(certs.size());
  for (const auto& cert : certs)
    der_certs.push_back(cert->der_encoded());
  return ServerTrust(std::move(der_certs));
}

}  // namespace trustpin
