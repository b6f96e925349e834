// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/pinning_mode.h"

#include "base/logging.h"

namespace trustpin {

const char* PinningModeToString(PinningMode mode) {
  switch (mode) {
    case PinningMode::kNone:
      return "none";
    case PinningMode::kPublicKey:
      return "public-key";
    case PinningMode::kCertificate:
      return "certificate";
  }
  NOTREACHED();
  return "none";
}

bool PinningModeFromString(std::string_view name, PinningMode* mode) {
  for (PinningMode candidate : {PinningMode::kNone, PinningMode::kPublicKey,
                                PinningMode::kCertificate}) {
    if (name == PinningModeToString(candidate)) {
      *mode = candidate;
      return true;
    }
  }
  return false;
}

}  // namespace trustpin
