// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_POLICY_SECURITY_POLICY_H_
#define TRUSTPIN_POLICY_SECURITY_POLICY_H_

#include <string>
#include <vector>

#include "base/files/file_path.h"
#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/policy/pinned_certificate_set.h"
#include "trustpin/policy/pinning_mode.h"

namespace trustpin {

// SecurityPolicy describes how a server's certificate chain is judged: the
// pinning mode, the pinned certificates, whether a chain the validator
// rejects may still be accepted, and whether the hostname is checked.
//
// A SecurityPolicy never changes after it is built, so one instance may be
// shared by any number of connections and threads. The With*() methods and
// Builder produce new instances.
//
// Construction fails, returning NULL and an error code, when a pinned
// certificate does not parse (ERR_INVALID_PINNED_CERTIFICATE) or when a
// pinning mode other than PinningMode::kNone is requested without any
// pinned certificates (ERR_EMPTY_PINNED_CERTIFICATES).
class TRUSTPIN_EXPORT SecurityPolicy
    : public base::RefCountedThreadSafe<SecurityPolicy> {
 public:
  class TRUSTPIN_EXPORT Builder {
   public:
    // Starts from the default policy.
    Builder();
    // Starts from the settings of |policy|.
    explicit Builder(const SecurityPolicy& policy);
    Builder(const Builder& other);
    ~Builder();

    Builder& set_pinning_mode(PinningMode mode);
    Builder& set_pinned_certificates(std::vector<std::string> der_certs);
    Builder& set_allow_invalid_certificates(bool allow);
    Builder& set_validates_domain_name(bool validates);

    // Returns the policy, or NULL with |*error| set if the settings violate
    // an invariant. |*error| is OK on success.
    scoped_refptr<SecurityPolicy> Build(int* error) const;

   private:
    PinningMode mode_;
    std::vector<std::string> pinned_certificates_;
    bool allow_invalid_certificates_;
    bool validates_domain_name_;
  };

  // Returns the shared default policy: no pinning, invalid chains rejected,
  // hostname validated. Every call returns the same instance.
  static scoped_refptr<SecurityPolicy> Default();

  // Creates a policy for |mode| pinning the certificates found in the
  // default certificate bundle. PinningMode::kNone pins nothing.
  static scoped_refptr<SecurityPolicy> CreateWithPinningMode(PinningMode mode,
                                                             int* error);

  // Creates a policy for |mode| pinning |der_certs|.
  static scoped_refptr<SecurityPolicy> CreateWithPinningModeAndCertificates(
      PinningMode mode,
      std::vector<std::string> der_certs,
      int* error);

  // Registers the directory CreateWithPinningMode() takes its certificates
  // from. An empty path clears the registration. Safe to call from any
  // thread, but policies already created are unaffected.
  static void SetDefaultCertificateBundlePath(const base::FilePath& path);
  static base::FilePath GetDefaultCertificateBundlePath();

  // Reads the certificates of the default certificate bundle into
  // |der_certs|. With no bundle registered the set is empty and OK is
  // returned.
  static int GetDefaultPinnedCertificates(std::vector<std::string>* der_certs);

  // Returns a copy of this policy with the pinned set replaced by
  // |der_certs|, or NULL with |*error| set.
  scoped_refptr<SecurityPolicy> WithPinnedCertificates(
      std::vector<std::string> der_certs,
      int* error) const;

  // Returns a copy of this policy with one flag changed. These cannot fail.
  scoped_refptr<SecurityPolicy> WithAllowInvalidCertificates(bool allow) const;
  scoped_refptr<SecurityPolicy> WithValidatesDomainName(bool validates) const;

  PinningMode pinning_mode() const { return pinned_certificates_.mode(); }
  const PinnedCertificateSet& pinned_certificates() const {
    return pinned_certificates_;
  }
  bool allow_invalid_certificates() const {
    return allow_invalid_certificates_;
  }
  bool validates_domain_name() const { return validates_domain_name_; }

  // Returns a one-line description of the settings, for logs.
  std::string ToString() const;

 private:
  friend class base::RefCountedThreadSafe<SecurityPolicy>;

  SecurityPolicy(PinnedCertificateSet pinned_certificates,
                 bool allow_invalid_certificates,
                 bool validates_domain_name);
  ~SecurityPolicy();

  const PinnedCertificateSet pinned_certificates_;
  const bool allow_invalid_certificates_;
  const bool validates_domain_name_;

  DISALLOW_COPY_AND_ASSIGN(SecurityPolicy);
};

}  // namespace trustpin

#endif  // TRUSTPIN_POLICY_SECURITY_POLICY_H_
