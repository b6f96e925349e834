// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/test/cert_builder.h"

#include <string.h>

#include <atomic>

#include <openssl/asn1.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "base/logging.h"
#include "crypto/openssl_util.h"
#include "trustpin/cert/x509_util.h"

namespace trustpin {

namespace {

const int64_t kOneDay = 24 * 60 * 60;

using ScopedX509_EXTENSION =
    crypto::ScopedOpenSSL<X509_EXTENSION, X509_EXTENSION_free>;
using ScopedX509_NAME = crypto::ScopedOpenSSL<X509_NAME, X509_NAME_free>;

long NextSerialNumber() {
  static std::atomic<long> serial(1);
  return serial++;
}

crypto::ScopedEVP_PKEY GenerateP256Key() {
  crypto::ScopedEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(),
                                             NID_X9_62_prime256v1) <= 0) {
    return nullptr;
  }
  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &key) <= 0)
    return nullptr;
  return crypto::ScopedEVP_PKEY(key);
}

bool AddCommonName(X509_NAME* name, const std::string& common_name) {
  return X509_NAME_add_entry_by_txt(
             name, "CN", MBSTRING_ASC,
             reinterpret_cast<const unsigned char*>(common_name.c_str()), -1,
             -1, 0) == 1;
}

bool AddExtension(X509* cert,
                  X509V3_CTX* v3_ctx,
                  int nid,
                  const std::string& value) {
  ScopedX509_EXTENSION extension(
      X509V3_EXT_conf_nid(nullptr, v3_ctx, nid, value.c_str()));
  if (!extension) {
    LOG(ERROR) << "Unable to encode extension " << OBJ_nid2sn(nid) << "="
               << value;
    return false;
  }
  return X509_add_ext(cert, extension.get(), -1) == 1;
}

}  // namespace

CertBuilder::CertBuilder(const std::string& common_name)
    : common_name_(common_name),
      is_ca_(false),
      not_before_offset_(-kOneDay),
      not_after_offset_(30 * kOneDay) {
  crypto::EnsureOpenSSLInit();
  GenerateKey();
}

CertBuilder::~CertBuilder() = default;

void CertBuilder::SetValidity(int64_t not_before_offset,
                              int64_t not_after_offset) {
  not_before_offset_ = not_before_offset;
  not_after_offset_ = not_after_offset;
}

void CertBuilder::AddDNSName(const std::string& dns_name) {
  subject_alt_names_.push_back("DNS:" + dns_name);
}

void CertBuilder::AddIPAddress(const std::string& ip_address) {
  subject_alt_names_.push_back("IP:" + ip_address);
}

void CertBuilder::UseKeyOf(const CertBuilder& other) {
  EVP_PKEY_up_ref(other.key_.get());
  key_.reset(other.key_.get());
}

void CertBuilder::GenerateKey() {
  key_ = GenerateP256Key();
  CHECK(key_) << "EC key generation failed";
}

scoped_refptr<X509Certificate> CertBuilder::BuildSelfSigned() {
  return Build(common_name_, key_.get(), true);
}

scoped_refptr<X509Certificate> CertBuilder::BuildSignedBy(
    const CertBuilder& issuer) {
  return Build(issuer.common_name_, issuer.key_.get(), false);
}

scoped_refptr<X509Certificate> CertBuilder::Build(
    const std::string& issuer_name,
    EVP_PKEY* issuer_key,
    bool self_signed) {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);

  crypto::ScopedX509 cert(X509_new());
  ScopedX509_NAME issuer(X509_NAME_new());
  if (!cert || !issuer)
    return nullptr;

  if (!X509_set_version(cert.get(), 2) ||
      !ASN1_INTEGER_set(X509_get_serialNumber(cert.get()),
                        NextSerialNumber()) ||
      !X509_gmtime_adj(X509_getm_notBefore(cert.get()), not_before_offset_) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), not_after_offset_) ||
      !AddCommonName(X509_get_subject_name(cert.get()), common_name_) ||
      !AddCommonName(issuer.get(), issuer_name) ||
      !X509_set_issuer_name(cert.get(), issuer.get()) ||
      !X509_set_pubkey(cert.get(), key_.get())) {
    return nullptr;
  }

  X509V3_CTX v3_ctx;
  memset(&v3_ctx, 0, sizeof(v3_ctx));
  X509V3_set_ctx(&v3_ctx, cert.get(), cert.get(), nullptr, nullptr, 0);

  std::string key_usage = is_ca_ ? "critical,keyCertSign,cRLSign"
                                 : "critical,digitalSignature";
  if (self_signed && !is_ca_)
    key_usage += ",keyCertSign";

  if (!AddExtension(cert.get(), &v3_ctx, NID_basic_constraints,
                    is_ca_ ? "critical,CA:TRUE" : "critical,CA:FALSE") ||
      !AddExtension(cert.get(), &v3_ctx, NID_key_usage, key_usage) ||
      !AddExtension(cert.get(), &v3_ctx, NID_subject_key_identifier,
                    "hash")) {
    return nullptr;
  }
  if (!is_ca_ &&
      !AddExtension(cert.get(), &v3_ctx, NID_ext_key_usage, "serverAuth")) {
    return nullptr;
  }
  if (!subject_alt_names_.empty()) {
    std::string san;
    for (const std::string& name : subject_alt_names_) {
      if (!san.empty())
        san += ",";
      san += name;
    }
    if (!AddExtension(cert.get(), &v3_ctx, NID_subject_alt_name, san))
      return nullptr;
  }

  if (!X509_sign(cert.get(), issuer_key, EVP_sha256()))
    return nullptr;

  return x509_util::CreateCertificateFromX509(cert.get());
}

}  // namespace trustpin
