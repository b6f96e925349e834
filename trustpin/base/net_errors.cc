// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "trustpin/base/net_errors.h"

#include "base/logging.h"

namespace trustpin {

std::string ErrorToString(int error) {
  return "trustpin::" + ErrorToShortString(error);
}

std::string ErrorToShortString(int error) {
  if (error == 0)
    return "OK";

  const char* error_string;
  switch (error) {
#define NET_ERROR(label, value) \
  case ERR_ ## label: \
    error_string = # label; \
    break;
#include "trustpin/base/net_error_list.h"
#undef NET_ERROR
  default:
    NOTREACHED() << "Unknown error " << error;
    error_string = "<unknown>";
  }
  return std::string("ERR_") + error_string;
}

bool IsCertificateError(int error) {
  // Certificate errors are negative integers from ERR_CERT_BEGIN
  // (inclusive) to ERR_CERT_END (exclusive) in *decreasing* order.
  // ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN is currently an exception to this
  // rule.
  return (error <= ERR_CERT_BEGIN && error > ERR_CERT_END) ||
         (error == ERR_SSL_PINNED_KEY_NOT_IN_CERT_CHAIN);
}

bool IsPolicyConfigurationError(int error) {
  switch (error) {
    case ERR_INVALID_PINNED_CERTIFICATE:
    case ERR_EMPTY_PINNED_CERTIFICATES:
    case ERR_FILE_NOT_FOUND:
    case ERR_INVALID_ARGUMENT:
      return true;
    default:
      return false;
  }
}

}  // namespace trustpin
