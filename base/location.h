// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_LOCATION_H_
#define BASE_LOCATION_H_

#include <string>

#include "base/base_export.h"

namespace base {

// Location provides basic info where of an object was constructed, or was
// significantly brought to life.
class BASE_EXPORT Location {
 public:
  Location();
  Location(const Location& other);

  // Constructor should be called with long-lived strings, such as __FILE__.
  // It does not copy them.
  Location(const char* function_name, const char* file_name, int line_number);

  // Will be nullptr for default initialized Location objects.
  const char* function_name() const { return function_name_; }
  const char* file_name() const { return file_name_; }

  // Will be -1 for default initialized Location objects.
  int line_number() const { return line_number_; }

  bool has_source_info() const { return function_name_ && file_name_; }

  // Returns "function@file:line", or "unknown" without source info.
  std::string ToString() const;

 private:
  const char* function_name_ = nullptr;
  const char* file_name_ = nullptr;
  int line_number_ = -1;
};

#define FROM_HERE ::base::Location(__func__, __FILE__, __LINE__)

}  // namespace base

#endif  // BASE_LOCATION_H_
