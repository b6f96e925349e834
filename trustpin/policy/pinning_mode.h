// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_POLICY_PINNING_MODE_H_
#define TRUSTPIN_POLICY_PINNING_MODE_H_

#include <string_view>

#include "base/compiler_specific.h"
#include "trustpin/base/trustpin_export.h"

namespace trustpin {

// What the server chain is compared against, in addition to path
// validation.
enum class PinningMode {
  // Trust is decided by the chain validator alone.
  kNone,
  // Some certificate in the chain must carry a pinned SubjectPublicKeyInfo.
  kPublicKey,
  // Some certificate in the chain must be byte-equal to a pinned
  // certificate. The pinned certificates also act as trust anchors.
  kCertificate,
};

// Returns "none", "public-key" or "certificate".
TRUSTPIN_EXPORT const char* PinningModeToString(PinningMode mode);

// Parses the names returned by PinningModeToString(). Returns false for
// anything else.
TRUSTPIN_EXPORT bool PinningModeFromString(std::string_view name,
                                           PinningMode* mode)
    WARN_UNUSED_RESULT;

}  // namespace trustpin

#endif  // TRUSTPIN_POLICY_PINNING_MODE_H_
