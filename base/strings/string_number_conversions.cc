// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/strings/string_number_conversions.h"

#include <stdint.h>

#include <limits>

namespace base {

namespace {

bool IsAsciiWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

bool IsAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::string NumberToString(int value) {
  return std::to_string(value);
}

std::string NumberToString(size_t value) {
  return std::to_string(value);
}

bool StringToInt(std::string_view input, int* output) {
  *output = 0;
  bool valid = true;

  auto begin = input.begin();
  auto end = input.end();
  while (begin != end && IsAsciiWhitespace(*begin)) {
    valid = false;
    ++begin;
  }

  bool negative = false;
  if (begin != end && *begin == '-') {
    negative = true;
    ++begin;
  } else if (begin != end && *begin == '+') {
    ++begin;
  }

  if (begin == end || !IsAsciiDigit(*begin))
    return false;

  int64_t value = 0;
  for (; begin != end; ++begin) {
    if (!IsAsciiDigit(*begin))
      return false;
    value = value * 10 + (*begin - '0');
    if (!negative && value > std::numeric_limits<int>::max()) {
      *output = std::numeric_limits<int>::max();
      return false;
    }
    if (negative && -value < std::numeric_limits<int>::min()) {
      *output = std::numeric_limits<int>::min();
      return false;
    }
    *output = static_cast<int>(negative ? -value : value);
  }
  return valid;
}

std::string HexEncode(const void* bytes, size_t size) {
  static const char kHexChars[] = "0123456789ABCDEF";

  // Each input byte creates two output hex characters.
  std::string ret(size * 2, '\0');

  for (size_t i = 0; i < size; ++i) {
    char b = reinterpret_cast<const char*>(bytes)[i];
    ret[(i * 2)] = kHexChars[(b >> 4) & 0xf];
    ret[(i * 2) + 1] = kHexChars[b & 0xf];
  }
  return ret;
}

}  // namespace base
