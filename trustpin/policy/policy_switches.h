// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// Defines the command-line switches understood by PolicyConfig.

#ifndef TRUSTPIN_POLICY_POLICY_SWITCHES_H_
#define TRUSTPIN_POLICY_POLICY_SWITCHES_H_

#include "trustpin/base/trustpin_export.h"

namespace switches {

TRUSTPIN_EXPORT extern const char kAllowInvalidCertificates[];
TRUSTPIN_EXPORT extern const char kCaDir[];
TRUSTPIN_EXPORT extern const char kCaFile[];
TRUSTPIN_EXPORT extern const char kHelp[];
TRUSTPIN_EXPORT extern const char kHost[];
TRUSTPIN_EXPORT extern const char kLogFile[];
TRUSTPIN_EXPORT extern const char kNoSystemRoots[];
TRUSTPIN_EXPORT extern const char kNoValidateDomainName[];
TRUSTPIN_EXPORT extern const char kPinnedCertsDir[];
TRUSTPIN_EXPORT extern const char kPinningMode[];
TRUSTPIN_EXPORT extern const char kV[];

}  // namespace switches

#endif  // TRUSTPIN_POLICY_POLICY_SWITCHES_H_
