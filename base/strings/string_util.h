// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// This file defines utility functions for working with strings.

#ifndef BASE_STRINGS_STRING_UTIL_H_
#define BASE_STRINGS_STRING_UTIL_H_

#include <stddef.h>

#include <string>
#include <string_view>

#include "base/base_export.h"

namespace base {

// ASCII-specific tolower.  The standard library's tolower is locale sensitive,
// so we don't want to use it here.
inline char ToLowerASCII(char c) {
  return (c >= 'A' && c <= 'Z') ? (c + ('a' - 'A')) : c;
}

// Converts the given string to it's ASCII-lowercase equivalent.
BASE_EXPORT std::string ToLowerASCII(std::string_view str);

// Compare the lower-case form of the given string against the given
// previously-lower-cased ASCII string (typically a constant).
BASE_EXPORT bool LowerCaseEqualsASCII(std::string_view str,
                                      std::string_view lowercase_ascii);

// Returns true if the specified string has only ASCII characters.
BASE_EXPORT bool IsStringASCII(std::string_view str);

// The ASCII whitespace characters.
BASE_EXPORT extern const char kWhitespaceASCII[];

}  // namespace base

#endif  // BASE_STRINGS_STRING_UTIL_H_
