// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/cert/chain_validator_openssl.h"

#include <stdlib.h>

#include <utility>

#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include "base/logging.h"
#include "base/macros.h"
#include "crypto/openssl_util.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_status_flags.h"
#include "trustpin/cert/chain_validation_result.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/cert/x509_util.h"

namespace trustpin {

namespace {

CertStatus MapX509ErrorToCertStatus(int err) {
  switch (err) {
    case X509_V_OK:
      return 0;
    case X509_V_ERR_CERT_NOT_YET_VALID:
    case X509_V_ERR_CERT_HAS_EXPIRED:
      return CERT_STATUS_DATE_INVALID;
    case X509_V_ERR_HOSTNAME_MISMATCH:
    case X509_V_ERR_IP_ADDRESS_MISMATCH:
      return CERT_STATUS_COMMON_NAME_INVALID;
    case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
    case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
    case X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE:
    case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
    case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
    case X509_V_ERR_CERT_UNTRUSTED:
    case X509_V_ERR_INVALID_CA:
      return CERT_STATUS_AUTHORITY_INVALID;
    case X509_V_ERR_CERT_REVOKED:
      return CERT_STATUS_REVOKED;
    case X509_V_ERR_CERT_CHAIN_TOO_LONG:
      return CERT_STATUS_CHAIN_TOO_LONG;
    default:
      return CERT_STATUS_INVALID;
  }
}

// Records every error the library reports and lets it carry on, so the
// chain is built as far as possible and all failures are reflected in the
// status.
int VerifyCallback(int ok, X509_STORE_CTX* ctx) {
  if (!ok) {
    CertStatus* cert_status =
        static_cast<CertStatus*>(X509_STORE_CTX_get_app_data(ctx));
    int err = X509_STORE_CTX_get_error(ctx);
    DVLOG(1) << "X509 verify error " << err << " at depth "
             << X509_STORE_CTX_get_error_depth(ctx) << ": "
             << X509_verify_cert_error_string(err);
    *cert_status |= MapX509ErrorToCertStatus(err);
  }
  return 1;
}

// Constrains |param| to |hostname|, which may be a DNS name or an IP
// literal. Returns false if the library rejects the name.
bool SetExpectedHost(X509_VERIFY_PARAM* param, const std::string& hostname) {
  std::string host = hostname;
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  if (X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str()))
    return true;
  X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
  return X509_VERIFY_PARAM_set1_host(param, host.data(), host.size()) == 1;
}

// Returns the value of the environment variable |env|, or |fallback| if it
// is unset.
std::string GetDefaultLocation(const char* env, const char* fallback) {
  const char* value = getenv(env);
  return value ? value : fallback;
}

CertificateList LoadDefaultCertFile() {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);
  const std::string file = GetDefaultLocation(X509_get_default_cert_file_env(),
                                              X509_get_default_cert_file());
  CertificateList roots;
  crypto::ScopedX509_STORE store(X509_STORE_new());
  if (!store ||
      !X509_STORE_load_locations(store.get(), file.c_str(), nullptr)) {
    LOG(WARNING) << "Unable to load the default certificate file " << file;
    return roots;
  }

  STACK_OF(X509_OBJECT)* objects = X509_STORE_get0_objects(store.get());
  for (size_t i = 0; i < static_cast<size_t>(sk_X509_OBJECT_num(objects));
       ++i) {
    X509_OBJECT* object = sk_X509_OBJECT_value(objects, i);
    if (X509_OBJECT_get_type(object) != X509_LU_X509)
      continue;
    scoped_refptr<X509Certificate> root =
        x509_util::CreateCertificateFromX509(X509_OBJECT_get0_X509(object));
    if (!root) {
      DVLOG(1) << "Skipping a malformed root in " << file;
      continue;
    }
    roots.push_back(std::move(root));
  }
  VLOG(1) << "Loaded " << roots.size() << " roots from " << file;
  return roots;
}

bool IsAnchor(const X509Certificate* cert, const CertificateList& anchors) {
  for (const auto& anchor : anchors) {
    if (anchor->Equals(cert))
      return true;
  }
  return false;
}

}  // namespace

OpenSSLChainValidator::Config::Config() = default;

OpenSSLChainValidator::Config::Config(const Config& other) = default;

OpenSSLChainValidator::Config::~Config() = default;

OpenSSLChainValidator::OpenSSLChainValidator(const Config& config)
    : config_(config),
      system_roots_(config.use_system_roots ? LoadDefaultCertFile()
                                            : CertificateList()),
      system_cert_dir_(config.use_system_roots
                           ? GetDefaultLocation(X509_get_default_cert_dir_env(),
                                                X509_get_default_cert_dir())
                           : std::string()) {
  crypto::EnsureOpenSSLInit();
}

OpenSSLChainValidator::~OpenSSLChainValidator() = default;

bool OpenSSLChainValidator::SupportsAdditionalTrustAnchors() const {
  return true;
}

crypto::ScopedX509_STORE OpenSSLChainValidator::CreateTrustStore(
    const CertificateList& additional_anchors) const {
  crypto::ScopedX509_STORE store(X509_STORE_new());
  if (!store)
    return nullptr;

  // Directories are only registered here; they are read on lookup.
  for (const std::string& dir : {system_cert_dir_, config_.ca_dir.value()}) {
    if (!dir.empty() &&
        !X509_STORE_load_locations(store.get(), nullptr, dir.c_str())) {
      DVLOG(1) << "Unable to use certificate directory " << dir;
    }
  }

  for (const CertificateList* certs :
       {&system_roots_, &config_.root_certs, &additional_anchors}) {
    for (const auto& cert : *certs) {
      crypto::ScopedX509 handle = x509_util::CreateX509FromCertificate(*cert);
      // A certificate already in the store is not an error.
      if (!handle || !X509_STORE_add_cert(store.get(), handle.get())) {
        DVLOG(1) << "Trust anchor not added: "
                 << cert->GetSubjectDisplayName();
      }
    }
  }
  return store;
}

int OpenSSLChainValidator::ValidateInternal(
    const ServerTrust& trust,
    const std::string& hostname,
    const CertificateList& additional_trust_anchors,
    ChainValidationResult* result) {
  crypto::OpenSSLErrStackTracer err_tracer(FROM_HERE);

  // Server input is never trusted to parse; a malformed element poisons the
  // whole chain.
  CertificateList presented;
  if (!x509_util::ParseDERCertChain(trust.der_certs(), &presented)) {
    result->cert_status |= CERT_STATUS_INVALID;
    return ERR_CERT_INVALID;
  }

  crypto::ScopedX509_STORE store = CreateTrustStore(additional_trust_anchors);
  if (!store)
    return ERR_FAILED;

  crypto::ScopedX509 leaf = x509_util::CreateX509FromCertificate(*presented[0]);
  crypto::ScopedX509Stack untrusted(sk_X509_new_null());
  if (!leaf || !untrusted)
    return ERR_FAILED;
  for (size_t i = 1; i < presented.size(); ++i) {
    crypto::ScopedX509 intermediate =
        x509_util::CreateX509FromCertificate(*presented[i]);
    if (!intermediate || !sk_X509_push(untrusted.get(), intermediate.get()))
      return ERR_FAILED;
    ignore_result(intermediate.release());
  }

  crypto::ScopedX509_STORE_CTX ctx(X509_STORE_CTX_new());
  if (!ctx ||
      !X509_STORE_CTX_init(ctx.get(), store.get(), leaf.get(),
                           untrusted.get())) {
    return ERR_FAILED;
  }

  X509_VERIFY_PARAM* param = X509_STORE_CTX_get0_param(ctx.get());
  X509_VERIFY_PARAM_set_depth(param, kMaxVerifyDepth);
  X509_VERIFY_PARAM_set_purpose(param, X509_PURPOSE_SSL_SERVER);
  // Lets a pinned intermediate or leaf terminate the path.
  if (!additional_trust_anchors.empty())
    X509_VERIFY_PARAM_set_flags(param, X509_V_FLAG_PARTIAL_CHAIN);
  if (!hostname.empty() && !SetExpectedHost(param, hostname)) {
    DVLOG(1) << "Unusable hostname \"" << hostname << "\"";
    result->cert_status |= CERT_STATUS_COMMON_NAME_INVALID;
  }

  CertStatus cert_status = 0;
  X509_STORE_CTX_set_app_data(ctx.get(), &cert_status);
  X509_STORE_CTX_set_verify_cb(ctx.get(), VerifyCallback);

  int verify_rv = X509_verify_cert(ctx.get());
  result->cert_status |= cert_status;
  if (verify_rv <= 0 && !IsCertStatusError(result->cert_status))
    result->cert_status |= CERT_STATUS_INVALID;

  crypto::ScopedX509Stack chain(X509_STORE_CTX_get1_chain(ctx.get()));
  if (chain) {
    const size_t chain_length = sk_X509_num(chain.get());
    for (size_t i = 0; i < chain_length; ++i) {
      scoped_refptr<X509Certificate> cert =
          x509_util::CreateCertificateFromX509(sk_X509_value(chain.get(), i));
      if (!cert) {
        result->verified_chain.clear();
        result->cert_status |= CERT_STATUS_INVALID;
        break;
      }
      result->verified_chain.push_back(std::move(cert));
    }
  }

  if (!result->verified_chain.empty() &&
      IsAnchor(result->verified_chain.back().get(),
               additional_trust_anchors)) {
    result->cert_status |= CERT_STATUS_IS_ANCHORED_BY_PIN;
  }

  if (IsCertStatusError(result->cert_status))
    return MapCertStatusToNetError(result->cert_status);
  return OK;
}

}  // namespace trustpin
