// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/security_policy.h"

#include <utility>

#include "base/logging.h"
#include "base/strings/string_number_conversions.h"
#include "base/synchronization/lock.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_bundle.h"

namespace trustpin {

namespace {

base::Lock& GetBundlePathLock() {
  static base::Lock* lock = new base::Lock;
  return *lock;
}

// Guarded by GetBundlePathLock().
base::FilePath* g_default_bundle_path = nullptr;

}  // namespace

SecurityPolicy::Builder::Builder()
    : mode_(PinningMode::kNone),
      allow_invalid_certificates_(false),
      validates_domain_name_(true) {}

SecurityPolicy::Builder::Builder(const SecurityPolicy& policy)
    : mode_(policy.pinning_mode()),
      pinned_certificates_(
          policy.pinned_certificates().GetDEREncodedCertificates()),
      allow_invalid_certificates_(policy.allow_invalid_certificates()),
      validates_domain_name_(policy.validates_domain_name()) {}

SecurityPolicy::Builder::Builder(const Builder& other) = default;

SecurityPolicy::Builder::~Builder() = default;

SecurityPolicy::Builder& SecurityPolicy::Builder::set_pinning_mode(
    PinningMode mode) {
  mode_ = mode;
  return *this;
}

SecurityPolicy::Builder& SecurityPolicy::Builder::set_pinned_certificates(
    std::vector<std::string> der_certs) {
  pinned_certificates_ = std::move(der_certs);
  return *this;
}

SecurityPolicy::Builder&
SecurityPolicy::Builder::set_allow_invalid_certificates(bool allow) {
  allow_invalid_certificates_ = allow;
  return *this;
}

SecurityPolicy::Builder& SecurityPolicy::Builder::set_validates_domain_name(
    bool validates) {
  validates_domain_name_ = validates;
  return *this;
}

scoped_refptr<SecurityPolicy> SecurityPolicy::Builder::Build(
    int* error) const {
  PinnedCertificateSet pinned;
  *error = PinnedCertificateSet::Create(mode_, pinned_certificates_, &pinned);
  if (*error != OK)
    return nullptr;

  if (mode_ != PinningMode::kNone && pinned.empty()) {
    LOG(ERROR) << "Pinning mode " << PinningModeToString(mode_)
               << " requires at least one pinned certificate";
    *error = ERR_EMPTY_PINNED_CERTIFICATES;
    return nullptr;
  }

  return base::WrapRefCounted(new SecurityPolicy(
      std::move(pinned), allow_invalid_certificates_, validates_domain_name_));
}

SecurityPolicy::SecurityPolicy(PinnedCertificateSet pinned_certificates,
                               bool allow_invalid_certificates,
                               bool validates_domain_name)
    : pinned_certificates_(std::move(pinned_certificates)),
      allow_invalid_certificates_(allow_invalid_certificates),
      validates_domain_name_(validates_domain_name) {
  LOG_IF(WARNING, allow_invalid_certificates_ &&
                      pinned_certificates_.mode() == PinningMode::kNone)
      << "Invalid certificates are allowed without pinning; every server "
      << "will be trusted. Use this configuration for development only.";
}

SecurityPolicy::~SecurityPolicy() = default;

// static
scoped_refptr<SecurityPolicy> SecurityPolicy::Default() {
  static const scoped_refptr<SecurityPolicy>* const policy =
      new scoped_refptr<SecurityPolicy>(base::WrapRefCounted(
          new SecurityPolicy(PinnedCertificateSet(), false, true)));
  return *policy;
}

// static
scoped_refptr<SecurityPolicy> SecurityPolicy::CreateWithPinningMode(
    PinningMode mode,
    int* error) {
  std::vector<std::string> der_certs;
  if (mode != PinningMode::kNone) {
    *error = GetDefaultPinnedCertificates(&der_certs);
    if (*error != OK)
      return nullptr;
  }
  return CreateWithPinningModeAndCertificates(mode, std::move(der_certs),
                                              error);
}

// static
scoped_refptr<SecurityPolicy>
SecurityPolicy::CreateWithPinningModeAndCertificates(
    PinningMode mode,
    std::vector<std::string> der_certs,
    int* error) {
  return Builder()
      .set_pinning_mode(mode)
      .set_pinned_certificates(std::move(der_certs))
      .Build(error);
}

// static
void SecurityPolicy::SetDefaultCertificateBundlePath(
    const base::FilePath& path) {
  base::AutoLock lock(GetBundlePathLock());
  if (!g_default_bundle_path)
    g_default_bundle_path = new base::FilePath();
  *g_default_bundle_path = path;
}

// static
base::FilePath SecurityPolicy::GetDefaultCertificateBundlePath() {
  base::AutoLock lock(GetBundlePathLock());
  return g_default_bundle_path ? *g_default_bundle_path : base::FilePath();
}

// static
int SecurityPolicy::GetDefaultPinnedCertificates(
    std::vector<std::string>* der_certs) {
  base::FilePath bundle_path = GetDefaultCertificateBundlePath();
  if (bundle_path.empty())
    return OK;
  return CertificatesInBundle(bundle_path, der_certs);
}

scoped_refptr<SecurityPolicy> SecurityPolicy::WithPinnedCertificates(
    std::vector<std::string> der_certs,
    int* error) const {
  return Builder(*this).set_pinned_certificates(std::move(der_certs))
      .Build(error);
}

scoped_refptr<SecurityPolicy> SecurityPolicy::WithAllowInvalidCertificates(
    bool allow) const {
  return base::WrapRefCounted(new SecurityPolicy(
      pinned_certificates_, allow, validates_domain_name_));
}

scoped_refptr<SecurityPolicy> SecurityPolicy::WithValidatesDomainName(
    bool validates) const {
  return base::WrapRefCounted(new SecurityPolicy(
      pinned_certificates_, allow_invalid_certificates_, validates));
}

std::string SecurityPolicy::ToString() const {
  std::string str = "mode=";
  str += PinningModeToString(pinning_mode());
  str += " pins=" + base::NumberToString(pinned_certificates_.size());
  str += " allow_invalid=";
  str += allow_invalid_certificates_ ? "true" : "false";
  str += " validates_domain_name=";
  str += validates_domain_name_ ? "true" : "false";
  return str;
}

}  // namespace trustpin
