// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/policy_config.h"

#include <string>
#include <utility>
#include <vector>

#include "base/command_line.h"
#include "base/files/file_util.h"
#include "base/logging.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/cert_bundle.h"
#include "trustpin/cert/chain_validator_openssl.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/policy/policy_switches.h"
#include "trustpin/policy/security_policy.h"

namespace trustpin {

namespace {

// Upper bound on the size of --ca-file.
const size_t kMaxCaFileSize = 16 * 1024 * 1024;

}  // namespace

PolicyConfig::PolicyConfig()
    : pinning_mode(PinningMode::kNone),
      allow_invalid_certificates(false),
      validates_domain_name(true),
      use_system_roots(true) {}

PolicyConfig::PolicyConfig(const PolicyConfig& other) = default;

PolicyConfig::~PolicyConfig() = default;

int ParsePolicyConfig(const base::CommandLine& command_line,
                      PolicyConfig* config) {
  PolicyConfig parsed;

  if (command_line.HasSwitch(switches::kPinningMode)) {
    std::string mode =
        command_line.GetSwitchValueASCII(switches::kPinningMode);
    if (!PinningModeFromString(mode, &parsed.pinning_mode)) {
      LOG(ERROR) << "Unknown pinning mode \"" << mode
                 << "\"; expected none, public-key or certificate";
      return ERR_INVALID_ARGUMENT;
    }
  }
  parsed.pinned_certs_dir =
      command_line.GetSwitchValuePath(switches::kPinnedCertsDir);
  if (parsed.pinning_mode != PinningMode::kNone &&
      parsed.pinned_certs_dir.empty()) {
    LOG(ERROR) << "--" << switches::kPinningMode << "="
               << PinningModeToString(parsed.pinning_mode) << " requires --"
               << switches::kPinnedCertsDir;
    return ERR_INVALID_ARGUMENT;
  }

  parsed.allow_invalid_certificates =
      command_line.HasSwitch(switches::kAllowInvalidCertificates);
  parsed.validates_domain_name =
      !command_line.HasSwitch(switches::kNoValidateDomainName);
  parsed.use_system_roots = !command_line.HasSwitch(switches::kNoSystemRoots);
  parsed.ca_file = command_line.GetSwitchValuePath(switches::kCaFile);
  parsed.ca_dir = command_line.GetSwitchValuePath(switches::kCaDir);

  *config = parsed;
  return OK;
}

scoped_refptr<SecurityPolicy> CreateSecurityPolicyFromConfig(
    const PolicyConfig& config,
    int* error) {
  std::vector<std::string> der_certs;
  if (config.pinning_mode != PinningMode::kNone) {
    *error = CertificatesInBundle(config.pinned_certs_dir, &der_certs);
    if (*error != OK)
      return nullptr;
  }
  return SecurityPolicy::Builder()
      .set_pinning_mode(config.pinning_mode)
      .set_pinned_certificates(std::move(der_certs))
      .set_allow_invalid_certificates(config.allow_invalid_certificates)
      .set_validates_domain_name(config.validates_domain_name)
      .Build(error);
}

scoped_refptr<ChainValidator> CreateChainValidatorFromConfig(
    const PolicyConfig& config,
    int* error) {
  OpenSSLChainValidator::Config validator_config;
  validator_config.use_system_roots = config.use_system_roots;
  validator_config.ca_dir = config.ca_dir;

  if (!config.ca_file.empty()) {
    std::string contents;
    if (!base::ReadFileToStringWithMaxSize(config.ca_file, &contents,
                                           kMaxCaFileSize)) {
      LOG(ERROR) << "Unable to read " << config.ca_file;
      *error = ERR_FILE_NOT_FOUND;
      return nullptr;
    }
    validator_config.root_certs =
        X509Certificate::CreateCertificateListFromBytes(
            contents.data(), contents.size(), X509Certificate::FORMAT_AUTO);
    if (validator_config.root_certs.empty()) {
      LOG(ERROR) << config.ca_file << " holds no certificates";
      *error = ERR_INVALID_ARGUMENT;
      return nullptr;
    }
  }

  *error = OK;
  return base::MakeRefCounted<OpenSSLChainValidator>(validator_config);
}

}  // namespace trustpin
