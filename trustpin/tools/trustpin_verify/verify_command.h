// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_TOOLS_TRUSTPIN_VERIFY_VERIFY_COMMAND_H_
#define TRUSTPIN_TOOLS_TRUSTPIN_VERIFY_VERIFY_COMMAND_H_

#include <string>

namespace base {
class CommandLine;
}

namespace trustpin {

// RunVerify returns the value main() should return.
enum VerifyExitCode {
  kVerifyExitAccept = 0,
  kVerifyExitReject = 1,
  kVerifyExitConfigurationError = 2,
};

extern const char kVerifyUsage[];

// Evaluates the certificate chain named by the arguments of |command_line|
// against the policy its switches describe. The verdict, "accept" or
// "reject: <error> <failure log>", is appended to |output| as one line.
// Configuration problems are logged and append nothing. --help appends the
// usage text instead.
int RunVerify(const base::CommandLine& command_line, std::string* output);

}  // namespace trustpin

#endif  // TRUSTPIN_TOOLS_TRUSTPIN_VERIFY_VERIFY_COMMAND_H_
