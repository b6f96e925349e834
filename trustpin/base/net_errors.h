// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TRUSTPIN_BASE_NET_ERRORS_H_
#define TRUSTPIN_BASE_NET_ERRORS_H_

#include <string>

#include "trustpin/base/trustpin_export.h"

namespace trustpin {

// Error values are negative.
enum Error {
  // No error.
  OK = 0,

#define NET_ERROR(label, value) ERR_ ## label = value,
#include "trustpin/base/net_error_list.h"
#undef NET_ERROR

  // The value of the first certificate error code.
  ERR_CERT_BEGIN = ERR_CERT_COMMON_NAME_INVALID,
};

// Returns a textual representation of the error code for logging purposes.
TRUSTPIN_EXPORT std::string ErrorToString(int error);

// Same as above, but leaves off the leading "trustpin::".
TRUSTPIN_EXPORT std::string ErrorToShortString(int error);

// Returns true if |error| is a certificate error code.
TRUSTPIN_EXPORT bool IsCertificateError(int error);

// Returns true if |error| is raised while constructing a pinning policy
// rather than while evaluating a server.
TRUSTPIN_EXPORT bool IsPolicyConfigurationError(int error);

}  // namespace trustpin

#endif  // TRUSTPIN_BASE_NET_ERRORS_H_
