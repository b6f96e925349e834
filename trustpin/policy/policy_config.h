// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_POLICY_POLICY_CONFIG_H_
#define TRUSTPIN_POLICY_POLICY_CONFIG_H_

#include "base/compiler_specific.h"
#include "base/files/file_path.h"
#include "base/memory/ref_counted.h"
#include "trustpin/base/trustpin_export.h"
#include "trustpin/policy/pinning_mode.h"

namespace base {
class CommandLine;
}

namespace trustpin {

class ChainValidator;
class SecurityPolicy;

// Settings for a SecurityPolicy and the ChainValidator it is evaluated
// with, as given on a command line.
struct TRUSTPIN_EXPORT PolicyConfig {
  PolicyConfig();
  PolicyConfig(const PolicyConfig& other);
  ~PolicyConfig();

  PinningMode pinning_mode;
  base::FilePath pinned_certs_dir;
  bool allow_invalid_certificates;
  bool validates_domain_name;

  bool use_system_roots;
  base::FilePath ca_file;
  base::FilePath ca_dir;
};

// Fills |config| from the switches in policy_switches.h. Returns OK, or
// ERR_INVALID_ARGUMENT for an unknown pinning mode or a pinning mode other
// than none without --pinned-certs-dir.
TRUSTPIN_EXPORT int ParsePolicyConfig(const base::CommandLine& command_line,
                                      PolicyConfig* config)
    WARN_UNUSED_RESULT;

// Builds the policy |config| describes, loading the pinned certificates from
// |config.pinned_certs_dir|. Returns NULL with |*error| set on failure.
TRUSTPIN_EXPORT scoped_refptr<SecurityPolicy> CreateSecurityPolicyFromConfig(
    const PolicyConfig& config,
    int* error);

// Builds the validator |config| describes. Returns NULL with |*error| set if
// |config.ca_file| cannot be read or holds no certificates.
TRUSTPIN_EXPORT scoped_refptr<ChainValidator> CreateChainValidatorFromConfig(
    const PolicyConfig& config,
    int* error);

}  // namespace trustpin

#endif  // TRUSTPIN_POLICY_POLICY_CONFIG_H_
