// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_POLICY_PINNED_CERTIFICATE_SET_H_
#define TRUSTPIN_POLICY_PINNED_CERTIFICATE_SET_H_

#include <stddef.h>

#include <set>
#include <string>
#include <vector>

#include "base/compiler_specific.h"
#include "trustpin/base/hash_value.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/policy/pinning_mode.h"

namespace trustpin {

// The pinned certificates of a policy, together with the byte strings a
// server certificate is compared against under the policy's mode: the DER
// encodings in PinningMode::kCertificate, the SubjectPublicKeyInfos in
// PinningMode::kPublicKey, nothing in PinningMode::kNone.
//
// A set is immutable once created and may be read from several threads.
class TRUSTPIN_EXPORT PinnedCertificateSet {
 public:
  // An empty set for PinningMode::kNone.
  PinnedCertificateSet();
  PinnedCertificateSet(const PinnedCertificateSet& other);
  ~PinnedCertificateSet();

  PinnedCertificateSet& operator=(const PinnedCertificateSet& other);

  // Parses every element of |der_certs| and prepares the comparison set for
  // |mode|. Duplicates are dropped. Returns OK, or
  // ERR_INVALID_PINNED_CERTIFICATE, leaving |out| untouched, if any element
  // is not a well formed certificate. Elements are parsed whatever the
  // mode.
  static int Create(PinningMode mode,
                    const std::vector<std::string>& der_certs,
                    PinnedCertificateSet* out) WARN_UNUSED_RESULT;

  PinningMode mode() const { return mode_; }

  // The distinct pinned certificates, in the order first supplied.
  const CertificateList& certificates() const { return certificates_; }

  // The DER encodings of certificates().
  std::vector<std::string> GetDEREncodedCertificates() const;

  // Returns true if |cert| matches a pin under mode(). Always false in
  // PinningMode::kNone.
  bool Matches(const X509Certificate& cert) const;

  // Returns true if any element of |chain| matches a pin.
  bool MatchesAny(const CertificateList& chain) const;

  // The SPKI hashes of certificates(), for logs.
  HashValueVector GetSPKIHashes() const;

  size_t size() const { return certificates_.size(); }
  bool empty() const { return certificates_.empty(); }

 private:
  PinningMode mode_;
  CertificateList certificates_;
  std::set<std::string> comparison_set_;
};

}  // namespace trustpin

#endif  // TRUSTPIN_POLICY_PINNED_CERTIFICATE_SET_H_
