// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/strings/pattern.h"

namespace base {

namespace {

bool IsWildcard(char c) {
  return c == '*' || c == '?';
}

// Advances |pattern| past the literal at its front, honouring the escape
// character. Returns the literal.
char NextLiteral(std::string_view* pattern) {
  if ((*pattern)[0] == '\\' && pattern->size() > 1) {
    char c = (*pattern)[1];
    pattern->remove_prefix(2);
    return c;
  }
  char c = (*pattern)[0];
  pattern->remove_prefix(1);
  return c;
}

bool MatchPatternT(std::string_view eval,
                   std::string_view pattern,
                   int depth) {
  const int kMaxDepth = 16;
  if (depth > kMaxDepth)
    return false;

  // Eat all the matching chars.
  while (!pattern.empty() && !eval.empty() && !IsWildcard(pattern[0])) {
    std::string_view before = pattern;
    char literal = NextLiteral(&pattern);
    if (literal != eval[0]) {
      pattern = before;
      break;
    }
    eval.remove_prefix(1);
  }

  // Reached the end of both strings, all is good.
  if (eval.empty() && pattern.empty())
    return true;

  // We're at the end of the pattern but not the string.
  if (pattern.empty())
    return false;

  if (!IsWildcard(pattern[0])) {
    // A literal remains but the string is exhausted, or they differ.
    return false;
  }

  // '?' consumes zero or one character.
  if (pattern[0] == '?') {
    std::string_view rest = pattern.substr(1);
    if (MatchPatternT(eval, rest, depth + 1))
      return true;
    return !eval.empty() && MatchPatternT(eval.substr(1), rest, depth + 1);
  }

  // '*': skip consecutive stars, then try every suffix of |eval|.
  while (!pattern.empty() && pattern[0] == '*')
    pattern.remove_prefix(1);
  if (pattern.empty())
    return true;
  for (size_t i = 0; i <= eval.size(); ++i) {
    if (MatchPatternT(eval.substr(i), pattern, depth + 1))
      return true;
  }
  return false;
}

}  // namespace

bool MatchPattern(std::string_view eval, std::string_view pattern) {
  return MatchPatternT(eval, pattern, 0);
}

}  // namespace base
