// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_TEST_CERT_BUILDER_H_
#define TRUSTPIN_TEST_CERT_BUILDER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include <openssl/evp.h>

#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "crypto/scoped_openssl_types.h"
#include "trustpin/cert/x509_certificate.h"

namespace trustpin {

// CertBuilder produces X.509 certificates for tests at run time, so tests do
// not depend on checked in certificates expiring. Keys are EC P-256 and
// signatures ECDSA with SHA-256.
//
//   CertBuilder root("Test Root");
//   root.set_is_ca(true);
//   CertBuilder leaf("example.com");
//   leaf.AddDNSName("example.com");
//   scoped_refptr<X509Certificate> root_cert = root.BuildSelfSigned();
//   scoped_refptr<X509Certificate> leaf_cert = leaf.BuildSignedBy(root);
//
// The Build*() methods return NULL if the crypto library fails.
class CertBuilder {
 public:
  // Creates a builder with a freshly generated key and |common_name| as the
  // subject CN.
  explicit CertBuilder(const std::string& common_name);
  ~CertBuilder();

  // Whether the certificate is a CA. Defaults to false.
  void set_is_ca(bool is_ca) { is_ca_ = is_ca; }

  // Validity relative to now, in seconds. Defaults to one day ago until
  // thirty days ahead. Negative values lie in the past.
  void SetValidity(int64_t not_before_offset, int64_t not_after_offset);

  // Subject alternative names.
  void AddDNSName(const std::string& dns_name);
  void AddIPAddress(const std::string& ip_address);

  // Replaces the key with the one |other| uses, e.g. to model a certificate
  // renewed with the same key.
  void UseKeyOf(const CertBuilder& other);

  // Replaces the key with a freshly generated one.
  void GenerateKey();

  // Builds a certificate signed with the builder's own key.
  scoped_refptr<X509Certificate> BuildSelfSigned();

  // Builds a certificate issued by |issuer|: issuer name from its CN, signed
  // with its key.
  scoped_refptr<X509Certificate> BuildSignedBy(const CertBuilder& issuer);

  const std::string& common_name() const { return common_name_; }
  EVP_PKEY* key() const { return key_.get(); }

 private:
  scoped_refptr<X509Certificate> Build(const std::string& issuer_name,
                                       EVP_PKEY* issuer_key,
                                       bool self_signed);

  const std::string common_name_;
  crypto::ScopedEVP_PKEY key_;
  bool is_ca_;
  int64_t not_before_offset_;
  int64_t not_after_offset_;
  std::vector<std::string> subject_alt_names_;

  DISALLOW_COPY_AND_ASSIGN(CertBuilder);
};

}  // namespace trustpin

#endif  // TRUSTPIN_TEST_CERT_BUILDER_H_
