// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/strings/string_util.h"

namespace base {

const char kWhitespaceASCII[] = "\x09\x0A\x0B\x0C\x0D\x20";

std::string ToLowerASCII(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  for (char c : str)
    ret.push_back(ToLowerASCII(c));
  return ret;
}

bool LowerCaseEqualsASCII(std::string_view str,
                          std::string_view lowercase_ascii) {
  if (str.size() != lowercase_ascii.size())
    return false;
  for (size_t i = 0; i < str.size(); i++) {
    if (ToLowerASCII(str[i]) != lowercase_ascii[i])
      return false;
  }
  return true;
}

bool IsStringASCII(std::string_view str) {
  for (char c : str) {
    if (static_cast<unsigned char>(c) > 0x7F)
      return false;
  }
  return true;
}

}  // namespace base
