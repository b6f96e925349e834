// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_CERT_CHAIN_VALIDATOR_OPENSSL_H_
#define TRUSTPIN_CERT_CHAIN_VALIDATOR_OPENSSL_H_

#include <string>

#include "base/files/file_path.h"
#include "crypto/scoped_openssl_types.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/cert/chain_validator.h"

namespace trustpin {

// Performs chain validation with the crypto library's X509_verify_cert().
// A fresh X509_STORE is assembled for every call from the configured roots
// and the per-call additional trust anchors, so anchors never leak between
// calls and concurrent calls share no library state.
//
// The library's default certificate file is read once, at construction.
// Its default hashed directory is consulted lazily on every call.
class TRUSTPIN_EXPORT OpenSSLChainValidator : public ChainValidator {
 public:
  struct TRUSTPIN_EXPORT Config {
    Config();
    Config(const Config& other);
    ~Config();

    // Whether the library's default certificate locations are trusted. The
    // SSL_CERT_FILE and SSL_CERT_DIR environment variables override them.
    bool use_system_roots = true;

    // Extra trusted roots, e.g. the contents of --ca-file.
    CertificateList root_certs;

    // A hashed certificate directory in the c_rehash layout. Ignored when
    // empty.
    base::FilePath ca_dir;
  };

  // The deepest chain the library will build, leaf and anchor included.
  static constexpr int kMaxVerifyDepth = 16;

  explicit OpenSSLChainValidator(const Config& config);

  bool SupportsAdditionalTrustAnchors() const override;

  // The roots read from the default certificate file. Empty unless
  // |use_system_roots| is set.
  const CertificateList& system_roots() const { return system_roots_; }

 protected:
  ~OpenSSLChainValidator() override;

 private:
  int ValidateInternal(const ServerTrust& trust,
                       const std::string& hostname,
                       const CertificateList& additional_trust_anchors,
                       ChainValidationResult* result) override;

  // Returns a store holding the configured roots and |additional_anchors|,
  // or NULL if the library could not allocate one.
  crypto::ScopedX509_STORE CreateTrustStore(
      const CertificateList& additional_anchors) const;

  const Config config_;

  const CertificateList system_roots_;
  const std::string system_cert_dir_;

  DISALLOW_COPY_AND_ASSIGN(OpenSSLChainValidator);
};

}  // namespace trustpin

#endif  // TRUSTPIN_CERT_CHAIN_VALIDATOR_OPENSSL_H_
