// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/tools/trustpin_verify/verify_command.h"

#include <utility>
#include <vector>

#include "base/command_line.h"
#include "base/files/file_path.h"
#include "base/files/file_util.h"
#include "base/logging.h"
#include "trustpin/base/net_errors.h"
#include "trustpin/cert/chain_validator.h"
#include "trustpin/cert/server_trust.h"
#include "trustpin/cert/x509_certificate.h"
#include "trustpin/policy/policy_config.h"
#include "trustpin/policy/policy_switches.h"
#include "trustpin/policy/security_policy.h"
#include "trustpin/policy/server_trust_evaluator.h"

namespace trustpin {

namespace {

// Largest chain file read.
const size_t kMaxChainFileSize = 4 * 1024 * 1024;

int ConfigurationError(int rv) {
  DCHECK(IsPolicyConfigurationError(rv)) << ErrorToShortString(rv);
  LOG(ERROR) << ErrorToString(rv);
  return kVerifyExitConfigurationError;
}

// Appends the certificates in |path| to |der_certs|. A file that does not
// parse as certificates is passed on as a single raw element, so that the
// evaluator sees what a hostile server would send.
bool AppendChainFile(const base::FilePath& path,
                     std::vector<std::string>* der_certs) {
  std::string contents;
  if (!base::ReadFileToStringWithMaxSize(path, &contents, kMaxChainFileSize)) {
    LOG(ERROR) << "Unable to read " << path;
    return false;
  }
  CertificateList certs = X509Certificate::CreateCertificateListFromBytes(
      contents.data(), contents.size(), X509Certificate::FORMAT_AUTO);
  if (certs.empty()) {
    VLOG(1) << path << " holds no well formed certificate";
    der_certs->push_back(contents);
    return true;
  }
  for (const auto& cert : certs)
    der_certs->push_back(cert->der_encoded());
  return true;
}

}  // namespace

const char kVerifyUsage[] =
    "Usage: trustpin_verify [switches] --host=NAME CHAIN_FILE...\n"
    "\n"
    "Evaluates the certificate chain in CHAIN_FILE... (PEM or DER, leaf\n"
    "first) and prints \"accept\" or \"reject: <reason>\".\n"
    "\n"
    "  --host=NAME                   hostname the client meant to reach\n"
    "  --pinning-mode=MODE           none (default), public-key or certificate\n"
    "  --pinned-certs-dir=DIR        *.cer, *.crt and *.der files to pin\n"
    "  --allow-invalid-certificates  tolerate chains the validator rejects\n"
    "  --no-validate-domain-name     skip the hostname check\n"
    "  --ca-file=FILE                additional trusted roots\n"
    "  --ca-dir=DIR                  hashed directory of trusted roots\n"
    "  --no-system-roots             ignore the default trust store\n"
    "  --v=N                         verbose logging level\n"
    "  --log-file=PATH               also log to PATH\n"
    "\n"
    "Exit status: 0 accept, 1 reject, 2 configuration error.\n";

int RunVerify(const base::CommandLine& command_line, std::string* output) {
  if (command_line.HasSwitch(switches::kHelp)) {
    output->append(kVerifyUsage);
    return kVerifyExitAccept;
  }

  base::CommandLine::StringVector args = command_line.GetArgs();
  if (args.empty()) {
    LOG(ERROR) << "No chain file given. Run "
               << command_line.GetProgram().BaseName() << " --"
               << switches::kHelp << " for usage.";
    return kVerifyExitConfigurationError;
  }

  PolicyConfig config;
  int rv = ParsePolicyConfig(command_line, &config);
  if (rv != OK)
    return ConfigurationError(rv);

  scoped_refptr<SecurityPolicy> policy =
      CreateSecurityPolicyFromConfig(config, &rv);
  if (!policy)
    return ConfigurationError(rv);

  scoped_refptr<ChainValidator> validator =
      CreateChainValidatorFromConfig(config, &rv);
  if (!validator)
    return ConfigurationError(rv);

  std::vector<std::string> der_certs;
  for (const std::string& arg : args) {
    if (!AppendChainFile(base::FilePath(arg), &der_certs))
      return kVerifyExitConfigurationError;
  }

  VLOG(1) << "Evaluating " << der_certs.size() << " certificates with "
          << policy->ToString();

  ServerTrustEvaluator evaluator(policy, validator);
  ServerTrustEvaluator::EvaluationDetails details;
  if (evaluator.Evaluate(ServerTrust(std::move(der_certs)),
                         command_line.GetSwitchValueASCII(switches::kHost),
                         &details)) {
    output->append("accept\n");
    return kVerifyExitAccept;
  }

  output->append("reject: " + ErrorToShortString(details.net_error));
  if (!details.failure_log.empty())
    output->append(" " + details.failure_log);
  output->append("\n");
  return kVerifyExitReject;
}

}  // namespace trustpin
