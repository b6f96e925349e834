// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/policy/policy_switches.h"

namespace switches {

// Accept chains the validator rejects. Pinning, if any, is still enforced.
const char kAllowInvalidCertificates[] = "allow-invalid-certificates";

// Directory of trusted roots in the c_rehash layout.
const char kCaDir[] = "ca-dir";

// PEM or DER file of trusted roots.
const char kCaFile[] = "ca-file";

const char kHelp[] = "help";

// The hostname the client intended to reach.
const char kHost[] = "host";

// Write log messages to this file as well as stderr.
const char kLogFile[] = "log-file";

// Do not trust the crypto library's default certificate locations.
const char kNoSystemRoots[] = "no-system-roots";

// Skip the hostname check.
const char kNoValidateDomainName[] = "no-validate-domain-name";

// Directory scanned for pinned certificates (*.cer, *.crt, *.der).
const char kPinnedCertsDir[] = "pinned-certs-dir";

// One of "none", "public-key" or "certificate".
const char kPinningMode[] = "pinning-mode";

// Gives the default maximal active V-logging level; 0 is the default.
const char kV[] = "v";

}  // namespace switches
