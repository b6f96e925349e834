// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// trustpin_verify evaluates a server certificate chain read from files
// against a pinning policy given on the command line, the way a TLS client
// would when the server presents that chain.

#include <stdio.h>

#include <string>

#include "base/command_line.h"
#include "base/logging.h"
#include "base/strings/string_number_conversions.h"
#include "trustpin/policy/policy_switches.h"
#include "trustpin/tools/trustpin_verify/verify_command.h"

namespace {

bool InitLoggingFromCommandLine(const base::CommandLine& command_line) {
  if (command_line.HasSwitch(switches::kV)) {
    int vlog_level = 0;
    if (!base::StringToInt(command_line.GetSwitchValueASCII(switches::kV),
                           &vlog_level) ||
        vlog_level < 0) {
      fprintf(stderr, "Invalid --%s value\n", switches::kV);
      return false;
    }
    logging::SetVlogLevel(vlog_level);
  }

  logging::LoggingSettings settings;
  std::string log_file = command_line.GetSwitchValueASCII(switches::kLogFile);
  if (!log_file.empty()) {
    settings.logging_dest = logging::LOG_TO_ALL;
    settings.log_file_path = log_file.c_str();
  }
  if (!logging::InitLogging(settings)) {
    fprintf(stderr, "Unable to open log file %s\n", log_file.c_str());
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  base::CommandLine::Init(argc, argv);
  const base::CommandLine& command_line =
      *base::CommandLine::ForCurrentProcess();

  if (!InitLoggingFromCommandLine(command_line))
    return trustpin::kVerifyExitConfigurationError;

  std::string output;
  int rv = trustpin::RunVerify(command_line, &output);
  fputs(output.c_str(), stdout);
  return rv;
}
