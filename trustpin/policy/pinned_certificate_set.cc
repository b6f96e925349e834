// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/pinned_certificate_set.h"

#include <utility>

#include "base/logging.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/x509_util.h"

namespace trustpin {

namespace {

// Returns the bytes of |cert| that are compared under |mode|.
std::string_view ComparisonBytes(PinningMode mode,
                                 const X509Certificate& cert) {
  switch (mode) {
    case PinningMode::kCertificate:
      return cert.der_encoded();
    case PinningMode::kPublicKey:
      return cert.public_key_bytes();
    case PinningMode::kNone:
      break;
  }
  return std::string_view();
}

}  // namespace

PinnedCertificateSet::PinnedCertificateSet() : mode_(PinningMode::kNone) {}

PinnedCertificateSet::PinnedCertificateSet(const PinnedCertificateSet& other) =
    default;

PinnedCertificateSet::~PinnedCertificateSet() = default;

PinnedCertificateSet& PinnedCertificateSet::operator=(
    const PinnedCertificateSet& other) = default;

// static
int PinnedCertificateSet::Create(PinningMode mode,
                                 const std::vector<std::string>& der_certs,
                                 PinnedCertificateSet* out) {
  PinnedCertificateSet set;
  set.mode_ = mode;

  std::set<std::string> seen;
  for (size_t i = 0; i < der_certs.size(); ++i) {
    if (!seen.insert(der_certs[i]).second)
      continue;
    scoped_refptr<X509Certificate> cert =
        X509Certificate::CreateFromBytes(der_certs[i]);
    if (!cert) {
      LOG(ERROR) << "Pinned certificate " << i << " is not a well formed "
                 << "DER X.509 certificate";
      return ERR_INVALID_PINNED_CERTIFICATE;
    }
    if (mode != PinningMode::kNone)
      set.comparison_set_.emplace(ComparisonBytes(mode, *cert));
    set.certificates_.push_back(std::move(cert));
  }

  *out = std::move(set);
  return OK;
}

std::vector<std::string> PinnedCertificateSet::GetDEREncodedCertificates()
    const {
  std::vector<std::string> der_certs;
  der_certs.reserve(certificates_.size());
  for (const auto& cert : certificates_)
    der_certs.push_back(cert->der_encoded());
  return der_certs;
}

bool PinnedCertificateSet::Matches(const X509Certificate& cert) const {
  if (mode_ == PinningMode::kNone)
    return false;
  return comparison_set_.find(std::string(ComparisonBytes(mode_, cert))) !=
         comparison_set_.end();
}

bool PinnedCertificateSet::MatchesAny(const CertificateList& chain) const {
  for (const auto& cert : chain) {
    if (Matches(*cert))
      return true;
  }
  return false;
}

HashValueVector PinnedCertificateSet::GetSPKIHashes() const {
  return x509_util::GetSPKIHashes(certificates_);
}

}  // namespace trustpin
